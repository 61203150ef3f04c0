/// @file src/metric/potentials.cpp
/// @brief Built-in analytic potential oracles.

#include "birkhoff/potential.hpp"
#include "birkhoff/linalg.hpp"

#include <cmath>

namespace birkhoff {

// ─── FlatPotential ────────────────────────────────────────────────────────────

PotentialValue FlatPotential::evaluate(const Configuration& x) const {
    return PotentialValue{level_, Displacement::Zero(x.size())};
}

// ─── HarmonicPotential ────────────────────────────────────────────────────────

HarmonicPotential::HarmonicPotential(double stiffness,
                                     std::optional<Configuration> centre)
    : scalar_stiffness_(stiffness)
    , centre_(std::move(centre)) {}

HarmonicPotential::HarmonicPotential(Eigen::VectorXd stiffness, Configuration centre)
    : stiffness_(std::move(stiffness))
    , centre_(std::move(centre)) {
    linalg::require_size("HarmonicPotential", centre_->size(), stiffness_.size());
}

PotentialValue HarmonicPotential::evaluate(const Configuration& x) const {
    Displacement dx = x;
    if (centre_) {
        linalg::require_size("HarmonicPotential::evaluate", centre_->size(), x.size());
        dx -= *centre_;
    }

    Eigen::VectorXd k;
    if (scalar_stiffness_) {
        k = Eigen::VectorXd::Constant(x.size(), *scalar_stiffness_);
    } else {
        linalg::require_size("HarmonicPotential::evaluate", stiffness_.size(), x.size());
        k = stiffness_;
    }

    const Displacement force_free = k.cwiseProduct(dx);
    return PotentialValue{0.5 * dx.dot(force_free), force_free};
}

// ─── GaussianWellPotential ────────────────────────────────────────────────────

GaussianWellPotential::GaussianWellPotential(std::vector<GaussianWell> wells)
    : wells_(std::move(wells)) {}

PotentialValue GaussianWellPotential::evaluate(const Configuration& x) const {
    PotentialValue out{0.0, Displacement::Zero(x.size())};
    for (const auto& w : wells_) {
        linalg::require_size("GaussianWellPotential::evaluate", w.centre.size(), x.size());
        const Displacement dx = x - w.centre;
        const double s2 = w.width * w.width;
        const double e  = -w.depth * std::exp(-dx.squaredNorm() / (2.0 * s2));
        out.energy   += e;
        // ∇[−D exp(−r²/2s²)] = D exp(−r²/2s²) (x − c)/s² = −e (x − c)/s²
        out.gradient += (-e / s2) * dx;
    }
    return out;
}

// ─── Factory ──────────────────────────────────────────────────────────────────

std::optional<std::shared_ptr<const PotentialOracle>>
make_potential(const std::string& name, const std::vector<double>& params,
               std::size_t dimension) {
    if (name == "flat") {
        const double level = params.empty() ? 0.0 : params.front();
        return std::make_shared<const FlatPotential>(level);
    }

    if (name == "harmonic") {
        if (params.empty() || !(params.front() > 0.0)) {
            return std::nullopt;
        }
        return std::make_shared<const HarmonicPotential>(params.front());
    }

    if (name == "gaussian_wells") {
        const std::size_t stride = dimension + 2;
        if (dimension == 0 || params.empty() || params.size() % stride != 0) {
            return std::nullopt;
        }
        std::vector<GaussianWell> wells;
        for (std::size_t off = 0; off < params.size(); off += stride) {
            GaussianWell w{Configuration(static_cast<Eigen::Index>(dimension)),
                           params[off], params[off + 1]};
            if (!(w.width > 0.0)) {
                return std::nullopt;
            }
            for (std::size_t i = 0; i < dimension; ++i) {
                w.centre(static_cast<Eigen::Index>(i)) = params[off + 2 + i];
            }
            wells.push_back(std::move(w));
        }
        return std::make_shared<const GaussianWellPotential>(std::move(wells));
    }

    return std::nullopt;
}

} // namespace birkhoff
