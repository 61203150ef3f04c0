#pragma once

/// @file include/birkhoff/potential.hpp
/// @brief The potential oracle seam and the built-in analytic potentials.
///
/// # Module: Potential
///
/// ## Responsibility
/// The engine never computes forces itself. Everything it knows about the
/// energy surface comes through `PotentialOracle::evaluate`, a deterministic,
/// side-effect-free map x ↦ (V(x), ∇V(x)). Workers hold a shared const
/// reference to one oracle and may call it concurrently.
///
/// The analytic oracles below exist for tests, benchmarks and the CLI demo;
/// a real effective-medium evaluator plugs in by deriving from the interface.

#include "birkhoff/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace birkhoff {

// ─── PotentialOracle ──────────────────────────────────────────────────────────

class PotentialOracle {
public:
    virtual ~PotentialOracle() = default;

    /// V(x) and ∇V(x). Must be safe to call from several threads at once.
    [[nodiscard]] virtual PotentialValue evaluate(const Configuration& x) const = 0;

    /// Short name used in log output.
    [[nodiscard]] virtual std::string name() const = 0;
};

// ─── Built-in Potentials ──────────────────────────────────────────────────────

/// V(x) = c everywhere.
class FlatPotential final : public PotentialOracle {
public:
    explicit FlatPotential(double level = 0.0) noexcept : level_(level) {}

    [[nodiscard]] PotentialValue evaluate(const Configuration& x) const override;
    [[nodiscard]] std::string name() const override { return "flat"; }

private:
    double level_;
};

/// V(x) = ½ Σ k_i (x_i − c_i)².
///
/// A scalar stiffness applies to every coordinate; the centre defaults to
/// the origin.
class HarmonicPotential final : public PotentialOracle {
public:
    explicit HarmonicPotential(double stiffness,
                               std::optional<Configuration> centre = std::nullopt);
    HarmonicPotential(Eigen::VectorXd stiffness, Configuration centre);

    [[nodiscard]] PotentialValue evaluate(const Configuration& x) const override;
    [[nodiscard]] std::string name() const override { return "harmonic"; }

private:
    std::optional<double>          scalar_stiffness_;
    Eigen::VectorXd                stiffness_;
    std::optional<Configuration>   centre_;
};

/// One Gaussian well: −depth · exp(−‖x − centre‖² / (2 width²)).
struct GaussianWell {
    Configuration centre;
    double        depth;
    double        width;
};

/// Sum of Gaussian wells. A smooth many-minimum surface standing in for an
/// effective-medium energy in tests.
class GaussianWellPotential final : public PotentialOracle {
public:
    explicit GaussianWellPotential(std::vector<GaussianWell> wells);

    [[nodiscard]] PotentialValue evaluate(const Configuration& x) const override;
    [[nodiscard]] std::string name() const override { return "gaussian_wells"; }

private:
    std::vector<GaussianWell> wells_;
};

/// Build a built-in potential by name.
///
/// # Arguments
/// * `name`  : "flat", "harmonic" or "gaussian_wells"
/// * `params`: flat: {level}; harmonic: {stiffness};
///              gaussian_wells: repeated {depth, width, c_1 … c_d}
/// * `dimension`: configuration-space dimension d
///
/// # Returns
/// `nullopt` for an unknown name or malformed parameters.
[[nodiscard]] std::optional<std::shared_ptr<const PotentialOracle>>
make_potential(const std::string& name, const std::vector<double>& params,
               std::size_t dimension);

} // namespace birkhoff
