#include "mhsa/models/self_attention_block.hpp"
#include "mhsa/ops/attention_ops.hpp"
#include <cereal/archives/binary.hpp>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <random>

namespace mhsa {

namespace {

AttentionConfig validated(const AttentionConfig& config) {
    config.validate();
    return config;
}

std::uint32_t base_seed(const AttentionConfig& config) {
    if (config.seed) return *config.seed;
    std::random_device rd;
    return rd();
}

bool same_shapes(const Linear& a, const Linear& b) {
    return a.weight().shape() == b.weight().shape() &&
           a.has_bias() == b.has_bias() &&
           (!a.has_bias() || a.bias().shape() == b.bias().shape());
}

AttentionConfig make_config(size_t hidden_size, size_t num_heads, float dropout_rate,
                            bool qkv_bias, bool save_attention, std::optional<size_t> head_dim) {
    AttentionConfig config;
    config.hidden_size = hidden_size;
    config.num_heads = num_heads;
    config.dropout_rate = dropout_rate;
    config.qkv_bias = qkv_bias;
    config.save_attention = save_attention;
    config.head_dim = head_dim;
    return config;
}

} // anonymous namespace

SelfAttentionBlock::SelfAttentionBlock(const AttentionConfig& config)
    : config_(validated(config)),
      head_dim_(config_.resolved_head_dim()),
      inner_dim_(config_.inner_dim()),
      scale_(1.0f / std::sqrt(static_cast<float>(head_dim_))),
      backend_(config_.backend) {

    const std::uint32_t seed = base_seed(config_);
    std::mt19937 init_gen(seed);

    qkv_ = std::make_unique<Linear>(config_.hidden_size, inner_dim_ * 3, config_.qkv_bias, init_gen);
    out_proj_ = std::make_unique<Linear>(inner_dim_, config_.hidden_size, true, init_gen);

    // Independent streams for the two dropout stages
    drop_weights_ = std::make_unique<Dropout>(config_.dropout_rate, seed + 1u);
    drop_output_ = std::make_unique<Dropout>(config_.dropout_rate, seed + 2u);
}

SelfAttentionBlock::SelfAttentionBlock(size_t hidden_size, size_t num_heads, float dropout_rate,
                                       bool qkv_bias, bool save_attention,
                                       std::optional<size_t> head_dim)
    : SelfAttentionBlock(make_config(hidden_size, num_heads, dropout_rate, qkv_bias,
                                     save_attention, head_dim)) {}

void SelfAttentionBlock::set_training(bool training) {
    training_ = training;
    drop_weights_->set_training(training);
    drop_output_->set_training(training);
}

std::vector<Tensor*> SelfAttentionBlock::parameters() {
    std::vector<Tensor*> params = qkv_->parameters();

    auto out_params = out_proj_->parameters();
    params.insert(params.end(), out_params.begin(), out_params.end());

    return params;
}

void SelfAttentionBlock::print_summary() const {
    std::cout << "Initialized SelfAttentionBlock with:\n";
    std::cout << "  hidden_size: " << config_.hidden_size << "\n";
    std::cout << "  num_heads: " << config_.num_heads << "\n";
    std::cout << "  head_dim: " << head_dim_ << "\n";
    std::cout << "  inner_dim: " << inner_dim_ << "\n";
    std::cout << "  dropout: " << config_.dropout_rate << "\n";
    std::cout << "  qkv_bias: " << (config_.qkv_bias ? "true" : "false") << "\n";
    std::cout << "  save_attention: " << (config_.save_attention ? "true" : "false") << "\n";
    std::cout << "  backend: " << to_string(backend_) << "\n";
}

void SelfAttentionBlock::check_input(const Tensor& input) const {
    if (input.ndim() != 3) {
        throw ShapeMismatch("SelfAttentionBlock expects input of shape [batch, seq_len, " +
                            std::to_string(config_.hidden_size) + "], got " +
                            shape_to_string(input.shape()));
    }
    if (input.dim(2) != config_.hidden_size) {
        throw ShapeMismatch("SelfAttentionBlock expects feature dimension " +
                            std::to_string(config_.hidden_size) + ", got " +
                            shape_to_string(input.shape()));
    }
}

Tensor SelfAttentionBlock::forward(const Tensor& input) const {
    check_input(input);

    // [b, t, 3 * inner] -> q, k, v of [b, h, t, d]
    auto qkv = ops::split_heads(qkv_->forward(input), config_.num_heads, head_dim_);

    Tensor context = (backend_ == AttentionBackend::Fused)
        ? attend_fused(qkv[0], qkv[1], qkv[2])
        : attend_manual(qkv[0], qkv[1], qkv[2]);

    Tensor output = out_proj_->forward(ops::merge_heads(context));
    output = drop_output_->forward(output);

    if (debug_logging_) {
        std::cout << "[SelfAttentionBlock] " << to_string(backend_)
                  << (training_ ? " train " : " eval ")
                  << shape_to_string(input.shape()) << " -> q/k/v " << shape_to_string(qkv[0].shape())
                  << " -> " << shape_to_string(output.shape()) << std::endl;
    }

    return output;
}

Tensor SelfAttentionBlock::attend_manual(const Tensor& q, const Tensor& k, const Tensor& v) const {
    Tensor weights = ops::softmax_last_axis(ops::attention_scores(q, k, scale_));

    if (config_.save_attention) {
        attention_weights_ = weights;
    }

    return ops::attention_apply(drop_weights_->forward(weights), v);
}

Tensor SelfAttentionBlock::attend_fused(const Tensor& q, const Tensor& k, const Tensor& v) const {
    return ops::scaled_dot_product_attention(q, k, v, scale_, drop_weights_->rate(), training_,
                                             drop_weights_->generator(), config_.block_size);
}

bool SelfAttentionBlock::save(const std::string& filename) const {
    std::ofstream ofs(filename, std::ios::binary);
    if (!ofs.is_open()) {
        std::cerr << "Error saving attention block: cannot open " << filename << std::endl;
        return false;
    }

    try {
        cereal::BinaryOutputArchive archive(ofs);

        std::uint64_t hidden_size = config_.hidden_size;
        std::uint64_t num_heads = config_.num_heads;
        std::uint64_t head_dim = head_dim_;
        archive(hidden_size, num_heads, head_dim, config_.qkv_bias);
        archive(*qkv_, *out_proj_);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error saving attention block: " << e.what() << std::endl;
        return false;
    }
}

bool SelfAttentionBlock::load(const std::string& filename) {
    std::ifstream ifs(filename, std::ios::binary);
    if (!ifs.is_open()) {
        std::cerr << "Error loading attention block: cannot open " << filename << std::endl;
        return false;
    }

    try {
        cereal::BinaryInputArchive archive(ifs);

        std::uint64_t hidden_size = 0;
        std::uint64_t num_heads = 0;
        std::uint64_t head_dim = 0;
        bool qkv_bias = false;
        archive(hidden_size, num_heads, head_dim, qkv_bias);

        if (hidden_size != config_.hidden_size || num_heads != config_.num_heads ||
            head_dim != head_dim_ || qkv_bias != config_.qkv_bias) {
            std::cerr << "Error loading attention block: " << filename << " holds hidden_size="
                      << hidden_size << " num_heads=" << num_heads << " head_dim=" << head_dim
                      << " qkv_bias=" << qkv_bias << ", block has hidden_size=" << config_.hidden_size
                      << " num_heads=" << config_.num_heads << " head_dim=" << head_dim_
                      << " qkv_bias=" << config_.qkv_bias << std::endl;
            return false;
        }

        // Read into copies so a truncated file leaves the block untouched
        Linear qkv = *qkv_;
        Linear out_proj = *out_proj_;
        archive(qkv, out_proj);

        if (!same_shapes(qkv, *qkv_) || !same_shapes(out_proj, *out_proj_)) {
            std::cerr << "Error loading attention block: parameter shapes in " << filename
                      << " do not match" << std::endl;
            return false;
        }

        *qkv_ = std::move(qkv);
        *out_proj_ = std::move(out_proj);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error loading attention block: " << e.what() << std::endl;
        return false;
    }
}

} // namespace mhsa
