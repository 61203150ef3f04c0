#pragma once

/// @file include/birkhoff/sampling.hpp
/// @brief Turn sample requests into metric samples through a dispatcher.

#include "birkhoff/curve.hpp"
#include "birkhoff/metric.hpp"
#include "birkhoff/types.hpp"
#include "birkhoff/worker_pool.hpp"

#include <cstddef>
#include <vector>

namespace birkhoff {

/// Evaluate every request in one dispatch round. Boundary requests clamp the
/// metric at the floor; the rest require E − V > 0.
///
/// # Errors
/// `DomainError` naming the request's index; `WorkerFailure` from the
/// dispatcher.
[[nodiscard]] std::vector<MetricSample>
evaluate_requests(const std::vector<SampleRequest>& requests, const MetricValues& metric,
                  comm::Dispatcher& dispatcher);

/// Fill every sample `curve` lacks for `rule`.
///
/// # Returns
/// Number of oracle evaluations requested.
std::size_t attach_missing_samples(Curve& curve, QuadratureRule rule, const MetricValues& metric,
                                   comm::Dispatcher& dispatcher);

} // namespace birkhoff
