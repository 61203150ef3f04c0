/// @file src/optimizer/lbfgs_memory.cpp
/// @brief Two-loop recursion over the stored curvature pairs.

#include "birkhoff/constants.hpp"
#include "birkhoff/linalg.hpp"
#include "birkhoff/optimizer.hpp"

#include <cmath>
#include <vector>

namespace birkhoff {

LbfgsMemory::LbfgsMemory(std::size_t capacity) : capacity_(capacity) {}

bool LbfgsMemory::push(const Eigen::VectorXd& s, const Eigen::VectorXd& y) {
    if (capacity_ == 0) return false;
    linalg::require_size("LbfgsMemory::push", s.size(), y.size());
    if (!pairs_.empty()) {
        linalg::require_size("LbfgsMemory::push", pairs_.back().s.size(), s.size());
    }

    const double sy = s.dot(y);
    if (!std::isfinite(sy) || sy <= constants::CURVATURE_PAIR_EPSILON * s.norm() * y.norm()) {
        return false;
    }
    if (pairs_.size() == capacity_) pairs_.pop_front();
    pairs_.push_back(Pair{s, y, 1.0 / sy});
    return true;
}

Eigen::VectorXd LbfgsMemory::apply(const Eigen::VectorXd& g) const {
    Eigen::VectorXd q = g;
    if (pairs_.empty()) return q;

    std::vector<double> alpha(pairs_.size());
    for (std::size_t k = pairs_.size(); k-- > 0;) {
        const Pair& p = pairs_[k];
        alpha[k] = p.rho * p.s.dot(q);
        q -= alpha[k] * p.y;
    }

    const Pair& last = pairs_.back();
    const double gamma = last.s.dot(last.y) / last.y.squaredNorm();
    q *= gamma;

    for (std::size_t k = 0; k < pairs_.size(); ++k) {
        const Pair& p = pairs_[k];
        const double beta = p.rho * p.y.dot(q);
        q += (alpha[k] - beta) * p.s;
    }
    return q;
}

void LbfgsMemory::clear() noexcept { pairs_.clear(); }

} // namespace birkhoff
