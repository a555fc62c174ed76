#pragma once

#include "mhsa/config/attention_config.hpp"
#include "mhsa/core/tensor.hpp"
#include "mhsa/models/dropout.hpp"
#include "mhsa/models/linear.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mhsa {

// Multi-head self-attention block (ViT style).
//
// Maps [batch, seq_len, hidden_size] to the same shape through a packed qkv
// projection, scaled dot-product attention per head, a head merge, an output
// projection and output dropout.
//
// forward() only reads the parameters. The attention snapshot and the dropout
// generators are shared mutable state: concurrent forward calls need external
// locking when save_attention is set or dropout is active.
class SelfAttentionBlock {
public:
    explicit SelfAttentionBlock(const AttentionConfig& config);
    SelfAttentionBlock(size_t hidden_size, size_t num_heads, float dropout_rate = 0.0f,
                       bool qkv_bias = false, bool save_attention = false,
                       std::optional<size_t> head_dim = std::nullopt);

    Tensor forward(const Tensor& input) const;

    // Dropout is only applied in training mode. Blocks start in evaluation mode.
    void set_training(bool training);
    bool is_training() const { return training_; }

    void set_backend(AttentionBackend backend) { backend_ = backend; }
    AttentionBackend backend() const { return backend_; }

    // Softmax weights [batch, heads, seq_len, seq_len] of the last manual forward,
    // captured before weight dropout. Empty unless save_attention is set.
    const Tensor& attention_weights() const { return attention_weights_; }

    const AttentionConfig& config() const { return config_; }
    size_t hidden_size() const { return config_.hidden_size; }
    size_t num_heads() const { return config_.num_heads; }
    size_t head_dim() const { return head_dim_; }
    size_t inner_dim() const { return inner_dim_; }
    float scale() const { return scale_; }

    std::vector<Tensor*> parameters();
    Linear& qkv() { return *qkv_; }
    const Linear& qkv() const { return *qkv_; }
    Linear& out_proj() { return *out_proj_; }
    const Linear& out_proj() const { return *out_proj_; }

    void enable_debug_logging(bool enable) { debug_logging_ = enable; }
    void print_summary() const;

    bool save(const std::string& filename) const;
    bool load(const std::string& filename);

    template <class Archive>
    void serialize(Archive& archive) {
        archive(cereal::make_nvp("qkv", *qkv_), cereal::make_nvp("out_proj", *out_proj_));
    }

private:
    void check_input(const Tensor& input) const;
    Tensor attend_manual(const Tensor& q, const Tensor& k, const Tensor& v) const;
    Tensor attend_fused(const Tensor& q, const Tensor& k, const Tensor& v) const;

    AttentionConfig config_;
    size_t head_dim_;
    size_t inner_dim_;
    float scale_;
    AttentionBackend backend_;
    bool training_ = false;
    bool debug_logging_ = false;

    std::unique_ptr<Linear> qkv_;
    std::unique_ptr<Linear> out_proj_;
    std::unique_ptr<Dropout> drop_weights_;
    std::unique_ptr<Dropout> drop_output_;

    mutable Tensor attention_weights_;
};

} // namespace mhsa
