#pragma once

#include "mhsa/core/tensor.hpp"
#include <array>
#include <random>

namespace mhsa {
namespace ops {

// x @ weight^T + bias over the last axis of x. weight is [out, in]; an empty
// bias tensor means no bias.
Tensor linear(const Tensor& input, const Tensor& weight, const Tensor& bias = Tensor());

// einsum("bhxd,bhyd->bhxy", q, k) * scale
Tensor attention_scores(const Tensor& q, const Tensor& k, float scale);

// einsum("bhxy,bhyd->bhxd", weights, v)
Tensor attention_apply(const Tensor& weights, const Tensor& v);

Tensor softmax_last_axis(const Tensor& input);

// Inverted dropout. Identity unless training with a positive rate.
Tensor dropout(const Tensor& input, float rate, bool training, std::mt19937& gen);

// Fused softmax(q k^T * scale) v for [batch, heads, seq_len, head_dim] inputs.
//
// Queries and keys are processed in tiles of block_size rows with a running
// row max and normalizer, so the full seq_len x seq_len weight matrix is never
// built. When dropout is active each weight's contribution to the output is
// dropped and rescaled independently; the normalizer always uses the
// undropped weights.
Tensor scaled_dot_product_attention(const Tensor& q, const Tensor& k, const Tensor& v,
                                    float scale, float dropout_rate, bool training,
                                    std::mt19937& gen, size_t block_size = 64);

// [batch, seq_len, 3 * num_heads * head_dim] -> {q, k, v}, each
// [batch, num_heads, seq_len, head_dim]. The feature axis is read as
// (qkv, head, head_dim).
std::array<Tensor, 3> split_heads(const Tensor& qkv, size_t num_heads, size_t head_dim);

// [batch, num_heads, seq_len, head_dim] -> [batch, seq_len, num_heads * head_dim]
Tensor merge_heads(const Tensor& x);

} // namespace ops
} // namespace mhsa
