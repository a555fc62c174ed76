#include "mhsa/models/linear.hpp"
#include "mhsa/ops/attention_ops.hpp"
#include <cmath>

namespace mhsa {

Linear::Linear(size_t in_features, size_t out_features, bool bias, std::mt19937& gen)
    : in_features_(in_features), out_features_(out_features) {

    if (in_features == 0 || out_features == 0) {
        throw InvalidConfiguration("Linear layer dimensions must be positive, got " +
                                   std::to_string(in_features) + " -> " + std::to_string(out_features));
    }

    // Same bound torch.nn.Linear uses for both weight and bias
    const float bound = 1.0f / std::sqrt(static_cast<float>(in_features_));
    weight_ = Tensor::uniform(std::vector<size_t>{out_features_, in_features_}, -bound, bound, gen);
    if (bias) {
        bias_ = Tensor::uniform(std::vector<size_t>{out_features_}, -bound, bound, gen);
    }
}

std::vector<Tensor*> Linear::parameters() {
    if (has_bias()) {
        return {&weight_, &bias_};
    }
    return {&weight_};
}

Tensor Linear::forward(const Tensor& input) const {
    return ops::linear(input, weight_, bias_);
}

} // namespace mhsa
