#pragma once

#include "mhsa/core/tensor.hpp"
#include <cstdint>
#include <random>

namespace mhsa {

// Inverted dropout with its own generator. Inactive until set_training(true).
class Dropout {
public:
    Dropout(float rate, std::uint32_t seed);

    void set_training(bool training) { training_ = training; }
    bool is_training() const { return training_; }
    bool is_active() const { return training_ && rate_ > 0.0f; }
    float rate() const { return rate_; }

    void seed(std::uint32_t seed) { gen_.seed(seed); }
    std::mt19937& generator() const { return gen_; }

    Tensor forward(const Tensor& input) const;

private:
    float rate_;
    bool training_ = false;
    mutable std::mt19937 gen_;
};

} // namespace mhsa
