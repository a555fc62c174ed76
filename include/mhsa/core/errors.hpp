#pragma once

#include <stdexcept>
#include <string>

namespace mhsa {

// Raised when a block or layer is built from out-of-range settings.
class InvalidConfiguration : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Raised when a tensor does not have the rank or dimensions an operation needs.
class ShapeMismatch : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

} // namespace mhsa
