/// @file src/linalg/linear_algebra.cpp
/// @brief Dimension-checked vector and matrix primitives.

#include "birkhoff/linalg.hpp"
#include "birkhoff/constants.hpp"
#include "birkhoff/errors.hpp"

#include <cmath>
#include <stdexcept>

namespace birkhoff::linalg {

void require_size(const char* where, Eigen::Index expected, Eigen::Index actual) {
    if (expected != actual) {
        throw ShapeError(where, static_cast<std::size_t>(expected),
                         static_cast<std::size_t>(actual));
    }
}

Eigen::VectorXd add(const Eigen::VectorXd& a, const Eigen::VectorXd& b) {
    require_size("linalg::add", a.size(), b.size());
    return a + b;
}

Eigen::VectorXd axpy(const Eigen::VectorXd& a, double s, const Eigen::VectorXd& b) {
    require_size("linalg::axpy", a.size(), b.size());
    return a + s * b;
}

Eigen::VectorXd scale(double s, const Eigen::VectorXd& v) {
    return s * v;
}

double dot(const Eigen::VectorXd& a, const Eigen::VectorXd& b) {
    require_size("linalg::dot", a.size(), b.size());
    return a.dot(b);
}

double norm(const Eigen::VectorXd& v) noexcept {
    return v.norm();
}

double max_abs(const Eigen::VectorXd& v) noexcept {
    return v.size() == 0 ? 0.0 : v.cwiseAbs().maxCoeff();
}

double mass_norm(const Eigen::VectorXd& v, const MassWeights& masses) {
    require_size("linalg::mass_norm", masses.size(), v.size());
    return std::sqrt(v.dot(masses.cwiseProduct(v)));
}

Eigen::VectorXd mass_apply(const Eigen::VectorXd& v, const MassWeights& masses) {
    require_size("linalg::mass_apply", masses.size(), v.size());
    return masses.cwiseProduct(v);
}

double dual_mass_norm(const Eigen::VectorXd& g, const MassWeights& masses) {
    require_size("linalg::dual_mass_norm", masses.size(), g.size());
    return std::sqrt(g.dot(g.cwiseQuotient(masses)));
}

Eigen::VectorXd project_onto(const Eigen::VectorXd& v, const Eigen::VectorXd& d) {
    require_size("linalg::project_onto", d.size(), v.size());
    const double dd = d.squaredNorm();
    if (dd < constants::FLOAT_EPSILON * constants::FLOAT_EPSILON) {
        return Eigen::VectorXd::Zero(v.size());
    }
    return (v.dot(d) / dd) * d;
}

Eigen::VectorXd reject_from(const Eigen::VectorXd& v, const Eigen::VectorXd& d) {
    return v - project_onto(v, d);
}

Eigen::VectorXd apply(const Eigen::MatrixXd& A, const Eigen::VectorXd& v) {
    require_size("linalg::apply", A.cols(), v.size());
    return A * v;
}

Eigen::MatrixXd rank1_update(const Eigen::MatrixXd& A, double alpha,
                             const Eigen::VectorXd& u) {
    require_size("linalg::rank1_update", A.rows(), A.cols());
    require_size("linalg::rank1_update", A.rows(), u.size());
    return A + alpha * u * u.transpose();
}

Eigen::MatrixXd rank2_update(const Eigen::MatrixXd& A, double alpha,
                             const Eigen::VectorXd& u,
                             const Eigen::VectorXd& v) {
    require_size("linalg::rank2_update", A.rows(), A.cols());
    require_size("linalg::rank2_update", A.rows(), u.size());
    require_size("linalg::rank2_update", u.size(), v.size());
    return A + alpha * (u * v.transpose() + v * u.transpose());
}

Eigen::MatrixXd orthonormal_tangent_basis(const Eigen::VectorXd& tangent) {
    const Eigen::Index d = tangent.size();
    if (d == 0) {
        throw ShapeError("linalg::orthonormal_tangent_basis", 1, 0);
    }

    Eigen::Index pivot = -1;
    for (Eigen::Index i = 0; i < d; ++i) {
        if (tangent(i) != 0.0) {
            pivot = i;
            break;
        }
    }
    if (pivot < 0) {
        throw std::invalid_argument(
            "linalg::orthonormal_tangent_basis: tangent must be non-zero");
    }

    // Seed columns: tangent, then e_i for every i except the pivot.
    Eigen::MatrixXd seed(d, d);
    seed.col(0) = tangent;
    Eigen::Index col = 1;
    for (Eigen::Index i = 0; i < d; ++i) {
        if (i == pivot) continue;
        seed.col(col) = Eigen::VectorXd::Unit(d, i);
        ++col;
    }

    // Modified Gram–Schmidt. The seed is full rank because the pivot row of
    // the tangent is the only non-zero entry in that row.
    Eigen::MatrixXd Q(d, d);
    for (Eigen::Index j = 0; j < d; ++j) {
        Eigen::VectorXd v = seed.col(j);
        for (Eigen::Index i = 0; i < j; ++i) {
            v -= Q.col(i).dot(v) * Q.col(i);
        }
        Q.col(j) = v / v.norm();
    }
    return Q;
}

} // namespace birkhoff::linalg
