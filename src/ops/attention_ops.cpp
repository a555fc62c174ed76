#include "mhsa/ops/attention_ops.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace mhsa {
namespace ops {

namespace {

void require_rank(const Tensor& t, size_t rank, const char* name) {
    if (t.ndim() != rank) {
        throw ShapeMismatch(std::string(name) + " must have rank " + std::to_string(rank) +
                            ", got shape " + shape_to_string(t.shape()));
    }
}

// q/k/v style operands must agree on batch and heads.
void require_same_batch_heads(const Tensor& a, const Tensor& b, const char* what) {
    if (a.dim(0) != b.dim(0) || a.dim(1) != b.dim(1)) {
        throw ShapeMismatch(std::string(what) + ": batch/head dimensions differ, " +
                            shape_to_string(a.shape()) + " vs " + shape_to_string(b.shape()));
    }
}

void check_rate(float rate) {
    if (!(rate >= 0.0f && rate <= 1.0f)) {
        throw InvalidConfiguration("dropout rate should be between 0 and 1, got " + std::to_string(rate));
    }
}

} // anonymous namespace

Tensor linear(const Tensor& input, const Tensor& weight, const Tensor& bias) {
    require_rank(weight, 2, "linear weight");
    const size_t out_features = weight.dim(0);
    const size_t in_features = weight.dim(1);

    if (input.ndim() == 0 || input.shape().back() != in_features) {
        throw ShapeMismatch("linear expects last dimension " + std::to_string(in_features) +
                            ", got input of shape " + shape_to_string(input.shape()));
    }

    Storage out = input.data() * weight.data().transpose();

    if (!bias.empty()) {
        if (bias.size() != out_features) {
            throw ShapeMismatch("linear bias of shape " + shape_to_string(bias.shape()) +
                                " does not match " + std::to_string(out_features) + " outputs");
        }
        out.rowwise() += Eigen::Map<const Eigen::RowVectorXf>(bias.raw(), static_cast<Eigen::Index>(out_features));
    }

    std::vector<size_t> out_shape = input.shape();
    out_shape.back() = out_features;
    return Tensor::from_storage(out, out_shape);
}

Tensor attention_scores(const Tensor& q, const Tensor& k, float scale) {
    require_rank(q, 4, "query");
    require_rank(k, 4, "key");
    require_same_batch_heads(q, k, "attention_scores");
    if (q.dim(3) != k.dim(3)) {
        throw ShapeMismatch("query and key head dimensions differ: " + shape_to_string(q.shape()) +
                            " vs " + shape_to_string(k.shape()));
    }

    const size_t batch_heads = q.dim(0) * q.dim(1);
    const Eigen::Index q_len = static_cast<Eigen::Index>(q.dim(2));
    const Eigen::Index k_len = static_cast<Eigen::Index>(k.dim(2));

    Tensor scores({q.dim(0), q.dim(1), q.dim(2), k.dim(2)});
    for (size_t bh = 0; bh < batch_heads; ++bh) {
        const Eigen::Index bh_idx = static_cast<Eigen::Index>(bh);
        scores.data().middleRows(bh_idx * q_len, q_len).noalias() =
            q.data().middleRows(bh_idx * q_len, q_len) *
            k.data().middleRows(bh_idx * k_len, k_len).transpose();
    }
    scores.data() *= scale;
    return scores;
}

Tensor attention_apply(const Tensor& weights, const Tensor& v) {
    require_rank(weights, 4, "attention weights");
    require_rank(v, 4, "value");
    require_same_batch_heads(weights, v, "attention_apply");
    if (weights.dim(3) != v.dim(2)) {
        throw ShapeMismatch("attention weights " + shape_to_string(weights.shape()) +
                            " do not match value sequence length " + shape_to_string(v.shape()));
    }

    const size_t batch_heads = weights.dim(0) * weights.dim(1);
    const Eigen::Index q_len = static_cast<Eigen::Index>(weights.dim(2));
    const Eigen::Index k_len = static_cast<Eigen::Index>(v.dim(2));

    Tensor output({weights.dim(0), weights.dim(1), weights.dim(2), v.dim(3)});
    for (size_t bh = 0; bh < batch_heads; ++bh) {
        const Eigen::Index bh_idx = static_cast<Eigen::Index>(bh);
        output.data().middleRows(bh_idx * q_len, q_len).noalias() =
            weights.data().middleRows(bh_idx * q_len, q_len) *
            v.data().middleRows(bh_idx * k_len, k_len);
    }
    return output;
}

Tensor softmax_last_axis(const Tensor& input) {
    return input.softmax();
}

Tensor dropout(const Tensor& input, float rate, bool training, std::mt19937& gen) {
    check_rate(rate);
    if (!training || rate <= 0.0f) return input;

    Tensor output(input.shape());
    if (rate >= 1.0f) return output;

    std::bernoulli_distribution keep(1.0 - rate);
    const float keep_scale = 1.0f / (1.0f - rate);
    for (size_t i = 0; i < input.size(); ++i) {
        output(i) = keep(gen) ? input(i) * keep_scale : 0.0f;
    }
    return output;
}

Tensor scaled_dot_product_attention(const Tensor& q, const Tensor& k, const Tensor& v,
                                    float scale, float dropout_rate, bool training,
                                    std::mt19937& gen, size_t block_size) {
    require_rank(q, 4, "query");
    require_rank(k, 4, "key");
    require_rank(v, 4, "value");
    require_same_batch_heads(q, k, "scaled_dot_product_attention");
    require_same_batch_heads(q, v, "scaled_dot_product_attention");
    if (q.dim(3) != k.dim(3) || k.dim(2) != v.dim(2)) {
        throw ShapeMismatch("scaled_dot_product_attention: incompatible q/k/v shapes " +
                            shape_to_string(q.shape()) + ", " + shape_to_string(k.shape()) + ", " +
                            shape_to_string(v.shape()));
    }
    if (block_size == 0) {
        throw InvalidConfiguration("attention block size must be positive");
    }
    check_rate(dropout_rate);

    const bool apply_dropout = training && dropout_rate > 0.0f;
    const float keep_scale = dropout_rate < 1.0f ? 1.0f / (1.0f - dropout_rate) : 0.0f;
    std::bernoulli_distribution keep(1.0 - static_cast<double>(dropout_rate));

    const size_t batch_heads = q.dim(0) * q.dim(1);
    const Eigen::Index q_len = static_cast<Eigen::Index>(q.dim(2));
    const Eigen::Index k_len = static_cast<Eigen::Index>(k.dim(2));
    const Eigen::Index v_dim = static_cast<Eigen::Index>(v.dim(3));
    const Eigen::Index tile = static_cast<Eigen::Index>(block_size);
    const float neg_inf = -std::numeric_limits<float>::infinity();

    Tensor output({q.dim(0), q.dim(1), q.dim(2), v.dim(3)});
    if (k_len == 0) return output;

    for (size_t bh = 0; bh < batch_heads; ++bh) {
        const Eigen::Index bh_idx = static_cast<Eigen::Index>(bh);
        auto q_head = q.data().middleRows(bh_idx * q_len, q_len);
        auto k_head = k.data().middleRows(bh_idx * k_len, k_len);
        auto v_head = v.data().middleRows(bh_idx * k_len, k_len);

        for (Eigen::Index q_start = 0; q_start < q_len; q_start += tile) {
            const Eigen::Index q_rows = std::min(tile, q_len - q_start);
            auto q_tile = q_head.middleRows(q_start, q_rows);

            Eigen::VectorXf row_max = Eigen::VectorXf::Constant(q_rows, neg_inf);
            Eigen::VectorXf row_sum = Eigen::VectorXf::Zero(q_rows);
            Storage acc = Storage::Zero(q_rows, v_dim);

            for (Eigen::Index k_start = 0; k_start < k_len; k_start += tile) {
                const Eigen::Index k_rows = std::min(tile, k_len - k_start);

                Storage scores = (q_tile * k_head.middleRows(k_start, k_rows).transpose()) * scale;

                Eigen::VectorXf new_max = row_max.cwiseMax(scores.rowwise().maxCoeff());
                // exp(-inf) == 0 on the first tile, which discards the empty accumulator.
                Eigen::VectorXf correction = (row_max - new_max).array().exp().matrix();
                Storage probs = (scores.colwise() - new_max).array().exp().matrix();

                row_sum = row_sum.cwiseProduct(correction) + probs.rowwise().sum();

                if (apply_dropout) {
                    for (Eigen::Index r = 0; r < probs.rows(); ++r) {
                        for (Eigen::Index c = 0; c < probs.cols(); ++c) {
                            probs(r, c) = keep(gen) ? probs(r, c) * keep_scale : 0.0f;
                        }
                    }
                }

                acc.array().colwise() *= correction.array();
                acc.noalias() += probs * v_head.middleRows(k_start, k_rows);
                row_max = new_max;
            }

            acc.array().colwise() /= row_sum.array();
            output.data().middleRows(bh_idx * q_len + q_start, q_rows) = acc;
        }
    }
    return output;
}

std::array<Tensor, 3> split_heads(const Tensor& qkv, size_t num_heads, size_t head_dim) {
    require_rank(qkv, 3, "qkv projection");
    const size_t batch = qkv.dim(0);
    const size_t seq_len = qkv.dim(1);
    if (qkv.dim(2) != 3 * num_heads * head_dim) {
        throw ShapeMismatch("qkv projection of shape " + shape_to_string(qkv.shape()) +
                            " cannot be split into 3 x " + std::to_string(num_heads) +
                            " heads of size " + std::to_string(head_dim));
    }

    // [b, t, 3, h, d] -> [3, b, h, t, d]
    Tensor packed = qkv.reshape({batch, seq_len, 3, num_heads, head_dim}).permute({2, 0, 3, 1, 4});
    return {packed.select(0), packed.select(1), packed.select(2)};
}

Tensor merge_heads(const Tensor& x) {
    require_rank(x, 4, "attention output");
    const size_t batch = x.dim(0);
    const size_t num_heads = x.dim(1);
    const size_t seq_len = x.dim(2);
    const size_t head_dim = x.dim(3);

    return x.permute({0, 2, 1, 3}).reshape({batch, seq_len, num_heads * head_dim});
}

} // namespace ops
} // namespace mhsa
