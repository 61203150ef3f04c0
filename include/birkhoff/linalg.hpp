#pragma once

/// @file include/birkhoff/linalg.hpp
/// @brief Dense vector and matrix primitives used by every other module.
///
/// # Module: LinearAlgebra
///
/// ## Responsibility
/// Thin, dimension-checked wrappers over Eigen. Every function is pure; a size
/// disagreement throws `ShapeError` naming the offending call instead of
/// tripping an Eigen assertion.
///
/// ## Mass weighting
/// Norms on configuration space are taken in the mass metric
/// ‖v‖_M = √(vᵀ M v) with M = diag(masses). Gradients live in the dual space
/// and are measured with ‖g‖_{M⁻¹} = √(gᵀ M⁻¹ g).

#include "birkhoff/types.hpp"

#include <Eigen/Dense>

namespace birkhoff::linalg {

/// a + b
[[nodiscard]] Eigen::VectorXd add(const Eigen::VectorXd& a, const Eigen::VectorXd& b);

/// a + s·b
[[nodiscard]] Eigen::VectorXd axpy(const Eigen::VectorXd& a, double s,
                                   const Eigen::VectorXd& b);

[[nodiscard]] Eigen::VectorXd scale(double s, const Eigen::VectorXd& v);

[[nodiscard]] double dot(const Eigen::VectorXd& a, const Eigen::VectorXd& b);

/// Euclidean norm.
[[nodiscard]] double norm(const Eigen::VectorXd& v) noexcept;

/// Largest absolute component (L∞ norm); 0 for an empty vector.
[[nodiscard]] double max_abs(const Eigen::VectorXd& v) noexcept;

/// √(vᵀ M v) for M = diag(masses).
[[nodiscard]] double mass_norm(const Eigen::VectorXd& v, const MassWeights& masses);

/// M v for M = diag(masses).
[[nodiscard]] Eigen::VectorXd mass_apply(const Eigen::VectorXd& v,
                                         const MassWeights& masses);

/// √(gᵀ M⁻¹ g): the norm of a gradient in the dual of the mass metric.
[[nodiscard]] double dual_mass_norm(const Eigen::VectorXd& g,
                                    const MassWeights& masses);

/// Component of v along direction d: (v·d / d·d) d. Zero if d vanishes.
[[nodiscard]] Eigen::VectorXd project_onto(const Eigen::VectorXd& v,
                                           const Eigen::VectorXd& d);

/// v minus its projection onto d.
[[nodiscard]] Eigen::VectorXd reject_from(const Eigen::VectorXd& v,
                                          const Eigen::VectorXd& d);

/// A v
[[nodiscard]] Eigen::VectorXd apply(const Eigen::MatrixXd& A, const Eigen::VectorXd& v);

/// A + α u uᵀ  (A must be square and match u).
[[nodiscard]] Eigen::MatrixXd rank1_update(const Eigen::MatrixXd& A, double alpha,
                                           const Eigen::VectorXd& u);

/// A + α (u vᵀ + v uᵀ)
[[nodiscard]] Eigen::MatrixXd rank2_update(const Eigen::MatrixXd& A, double alpha,
                                           const Eigen::VectorXd& u,
                                           const Eigen::VectorXd& v);

/// Orthonormal d×d matrix whose first column is parallel to `tangent`.
///
/// The remaining columns start from the standard basis vectors, skipping the
/// first coordinate in which `tangent` is non-zero, and are orthonormalised
/// by modified Gram–Schmidt.
///
/// # Errors
/// Throws `ShapeError` for an empty tangent and `std::invalid_argument` for a
/// zero tangent.
[[nodiscard]] Eigen::MatrixXd orthonormal_tangent_basis(const Eigen::VectorXd& tangent);

/// Throws ShapeError if `actual != expected`.
void require_size(const char* where, Eigen::Index expected, Eigen::Index actual);

} // namespace birkhoff::linalg
