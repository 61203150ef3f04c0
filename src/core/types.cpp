/// @file src/core/types.cpp
/// @brief String conversions for the shared enums.

#include "birkhoff/types.hpp"

namespace birkhoff {

const char* to_string(QuadratureRule rule) noexcept {
    switch (rule) {
        case QuadratureRule::Trapezoidal: return "trapezoidal";
        case QuadratureRule::Midpoint:    return "midpoint";
    }
    return "unknown";
}

const char* to_string(SearchSpace space) noexcept {
    switch (space) {
        case SearchSpace::Full:       return "full";
        case SearchSpace::Orthogonal: return "orthogonal";
    }
    return "unknown";
}

} // namespace birkhoff
