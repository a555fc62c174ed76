#pragma once

#include "mhsa/core/tensor.hpp"
#include <random>
#include <vector>

namespace mhsa {

// Affine layer y = x W^T + b with W of shape [out_features, in_features].
class Linear {
public:
    Linear(size_t in_features, size_t out_features, bool bias, std::mt19937& gen);

    std::vector<Tensor*> parameters();
    Tensor forward(const Tensor& input) const;

    size_t in_features() const { return in_features_; }
    size_t out_features() const { return out_features_; }
    bool has_bias() const { return !bias_.empty(); }

    Tensor& weight() { return weight_; }
    const Tensor& weight() const { return weight_; }
    Tensor& bias() { return bias_; }
    const Tensor& bias() const { return bias_; }

    template <class Archive>
    void serialize(Archive& archive) {
        archive(cereal::make_nvp("weight", weight_), cereal::make_nvp("bias", bias_));
    }

private:
    size_t in_features_;
    size_t out_features_;

    Tensor weight_;
    Tensor bias_;
};

} // namespace mhsa
