#include "mhsa/models/dropout.hpp"
#include "mhsa/ops/attention_ops.hpp"

namespace mhsa {

Dropout::Dropout(float rate, std::uint32_t seed)
    : rate_(rate), gen_(seed) {
    if (!(rate >= 0.0f && rate <= 1.0f)) {
        throw InvalidConfiguration("dropout_rate should be between 0 and 1, got " + std::to_string(rate));
    }
}

Tensor Dropout::forward(const Tensor& input) const {
    return ops::dropout(input, rate_, training_, gen_);
}

} // namespace mhsa
