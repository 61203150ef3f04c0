/// @file src/metric/sampling.cpp
/// @brief Dispatch rounds for curve samples.

#include "birkhoff/sampling.hpp"
#include "birkhoff/errors.hpp"

namespace birkhoff {

std::vector<MetricSample>
evaluate_requests(const std::vector<SampleRequest>& requests, const MetricValues& metric,
                  comm::Dispatcher& dispatcher) {
    std::vector<comm::WorkItem> items;
    items.reserve(requests.size());
    for (const auto& r : requests) items.push_back(comm::WorkItem{r.index, r.position});

    const auto results = dispatcher.dispatch(items);

    std::vector<MetricSample> out;
    out.reserve(requests.size());
    for (std::size_t k = 0; k < requests.size(); ++k) {
        const SampleRequest& r = requests[k];
        try {
            out.push_back(r.boundary ? metric.from_potential_boundary(r.position, results[k].value)
                                     : metric.from_potential(r.position, results[k].value));
        } catch (const DomainError& e) {
            throw e.at_node(r.index);
        }
    }
    return out;
}

std::size_t attach_missing_samples(Curve& curve, QuadratureRule rule, const MetricValues& metric,
                                   comm::Dispatcher& dispatcher) {
    const auto missing = curve.missing_samples(rule);
    if (missing.empty()) return 0;
    auto samples = evaluate_requests(missing, metric, dispatcher);
    for (std::size_t k = 0; k < missing.size(); ++k) curve.attach(missing[k], std::move(samples[k]));
    return missing.size();
}

} // namespace birkhoff
