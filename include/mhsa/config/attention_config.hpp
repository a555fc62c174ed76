#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace mhsa {

// How the block computes softmax(q k^T * scale) v.
enum class AttentionBackend {
    Manual,  // materialized score matrix, optional snapshot
    Fused    // tiled online softmax, nothing materialized
};

std::string to_string(AttentionBackend backend);
AttentionBackend backend_from_string(const std::string& name);

struct AttentionConfig {
    size_t hidden_size = 0;
    size_t num_heads = 0;
    float dropout_rate = 0.0f;
    bool qkv_bias = false;
    bool save_attention = false;
    std::optional<size_t> head_dim;

    AttentionBackend backend = AttentionBackend::Manual;
    // Fixes parameter initialization and dropout masks when set.
    std::optional<std::uint32_t> seed;
    // Query/key tile used by the fused backend.
    size_t block_size = 64;

    size_t resolved_head_dim() const {
        if (head_dim) return *head_dim;
        return num_heads == 0 ? 0 : hidden_size / num_heads;
    }
    size_t inner_dim() const { return resolved_head_dim() * num_heads; }

    // Throws InvalidConfiguration describing the first violated constraint.
    void validate() const;

    void print() const;
};

void to_json(nlohmann::json& j, const AttentionConfig& config);
void from_json(const nlohmann::json& j, AttentionConfig& config);

AttentionConfig load_attention_config(const std::string& path);
void save_attention_config(const AttentionConfig& config, const std::string& path);

} // namespace mhsa
