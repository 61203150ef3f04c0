/// @file src/optimizer/line_search.cpp
/// @brief Backtracking Armijo search that also backs off from the forbidden
///        region.

#include "birkhoff/optimizer.hpp"

#include <cmath>
#include <stdexcept>

namespace birkhoff {

LineSearchResult
backtracking_line_search(const std::function<std::optional<double>(double)>& phi,
                         double phi0, double slope, double alpha0,
                         const LineSearchOptions& options) {
    if (!(alpha0 > 0.0)) {
        throw std::invalid_argument("backtracking_line_search: initial step must be positive");
    }
    if (!(options.shrink_factor > 0.0 && options.shrink_factor < 1.0)) {
        throw std::invalid_argument("backtracking_line_search: shrink factor must lie in (0, 1)");
    }

    LineSearchResult r{false, alpha0, alpha0, phi0, 0, 0};
    double alpha = alpha0;
    for (std::size_t trial = 0; trial <= options.max_shrink; ++trial) {
        if (trial > 0) alpha *= options.shrink_factor;

        const std::optional<double> value = phi(alpha);
        if (!value || !std::isfinite(*value)) {
            ++r.domain_shrinks;
        } else if (*value <= phi0 + options.c1 * alpha * slope) {
            r.accepted = true;
            r.step     = alpha;
            r.value    = *value;
            return r;
        } else {
            ++r.armijo_shrinks;
        }
    }
    r.step = alpha;
    return r;
}

} // namespace birkhoff
