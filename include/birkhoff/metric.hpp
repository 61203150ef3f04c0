#pragma once

/// @file include/birkhoff/metric.hpp
/// @brief Energy-dependent conformal metric of the Maupertuis problem.
///
/// # Module: MetricValues
///
/// ## Responsibility
/// Turn an oracle result (V, ∇V) at a configuration x into the local metric
/// data the geometry layer needs:
///
///   g(x)  = 2 (E − V(x))          conformal factor on the mass metric
///   ∇g(x) = −2 ∇V(x)
///   a(x)  = √g(x)                 line-element weight, L = ∫ a ‖u′‖_M dτ
///   ∇a(x) = −∇V(x) / a(x)
///
/// ## Domain
/// The functional is real only where E − V(x) > 0. Interior points that
/// violate this raise `DomainError`; the optimizer answers by shrinking its
/// step. Fixed endpoints may sit exactly on the energy boundary (turning
/// points), so boundary samples clamp g at `metric_floor` instead.
///
/// ## NOT Responsible For
/// - Caching: samples are cached on the curve nodes that requested them.
/// - Parallel dispatch: see `birkhoff/worker_pool.hpp`.

#include "birkhoff/constants.hpp"
#include "birkhoff/potential.hpp"
#include "birkhoff/types.hpp"

namespace birkhoff {

class MetricValues {
public:
    /// # Arguments
    /// * `total_energy`: E of the Maupertuis principle
    /// * `metric_floor`: lower clamp of g used for boundary samples
    explicit MetricValues(double total_energy,
                          double metric_floor = constants::DEFAULT_METRIC_FLOOR);

    /// Query the oracle at x and build the sample.
    ///
    /// # Errors
    /// `DomainError` if E − V(x) ≤ 0.
    [[nodiscard]] MetricSample evaluate(const PotentialOracle& oracle,
                                        const Configuration& x) const;

    /// Build a sample from an oracle result computed elsewhere (a worker).
    ///
    /// # Errors
    /// `DomainError` if E − V ≤ 0; `ShapeError` if the gradient size differs
    /// from x.
    [[nodiscard]] MetricSample from_potential(const Configuration& x,
                                              const PotentialValue& pv) const;

    /// As `from_potential`, but g is clamped at the floor instead of failing.
    [[nodiscard]] MetricSample from_potential_boundary(const Configuration& x,
                                                       const PotentialValue& pv) const;

    /// E − V: positive inside the allowed region.
    [[nodiscard]] double kinetic_energy(double potential) const noexcept {
        return total_energy_ - potential;
    }

    [[nodiscard]] double total_energy() const noexcept { return total_energy_; }
    [[nodiscard]] double metric_floor() const noexcept { return metric_floor_; }

private:
    [[nodiscard]] MetricSample build(const Configuration& x, const PotentialValue& pv,
                                     double g) const;

    double total_energy_;
    double metric_floor_;
};

} // namespace birkhoff
