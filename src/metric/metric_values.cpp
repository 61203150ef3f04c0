/// @file src/metric/metric_values.cpp
/// @brief Conformal metric g = 2(E − V) and its derivatives.

#include "birkhoff/metric.hpp"
#include "birkhoff/errors.hpp"
#include "birkhoff/linalg.hpp"

#include <algorithm>
#include <cmath>

namespace birkhoff {

MetricValues::MetricValues(double total_energy, double metric_floor)
    : total_energy_(total_energy)
    , metric_floor_(metric_floor) {}

MetricSample MetricValues::evaluate(const PotentialOracle& oracle,
                                    const Configuration& x) const {
    return from_potential(x, oracle.evaluate(x));
}

MetricSample MetricValues::from_potential(const Configuration& x,
                                          const PotentialValue& pv) const {
    linalg::require_size("MetricValues::from_potential", x.size(), pv.gradient.size());

    const double ke = kinetic_energy(pv.energy);
    // The negated comparison also rejects NaN energies.
    if (!(ke > 0.0)) {
        throw DomainError(ke, DomainError::NO_NODE);
    }
    return build(x, pv, 2.0 * ke);
}

MetricSample MetricValues::from_potential_boundary(const Configuration& x,
                                                   const PotentialValue& pv) const {
    linalg::require_size("MetricValues::from_potential_boundary", x.size(),
                         pv.gradient.size());

    const double ke = kinetic_energy(pv.energy);
    if (std::isnan(ke)) {
        throw DomainError(ke, DomainError::NO_NODE);
    }
    return build(x, pv, std::max(2.0 * ke, metric_floor_));
}

MetricSample MetricValues::build(const Configuration& x, const PotentialValue& pv,
                                 double g) const {
    const double a = std::sqrt(g);
    return MetricSample{
        .position       = x,
        .potential      = pv.energy,
        .grad_potential = pv.gradient,
        .metric         = g,
        .grad_metric    = -2.0 * pv.gradient,
        .speed          = a,
        .grad_speed     = -pv.gradient / a,
    };
}

} // namespace birkhoff
