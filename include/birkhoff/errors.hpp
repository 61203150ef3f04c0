#pragma once

/// @file include/birkhoff/errors.hpp
/// @brief Exception taxonomy of the geodesic engine.
///
/// | Error                   | Raised when                              | Recovery           |
/// |-------------------------|------------------------------------------|--------------------|
/// | ShapeError              | vector/matrix dimensions disagree        | none (programming) |
/// | BoundaryViolationError  | a fixed endpoint is mutated              | call fails only    |
/// | DomainError             | E − V(x) ≤ 0 at a sampled point          | step shrinkage     |
/// | WorkerFailure           | an evaluation exhausted its retries      | run fails          |
/// | ConfigError             | a configuration value is unusable        | none               |

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace birkhoff {

/// Root of every error thrown by the engine.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ShapeError : public Error {
public:
    ShapeError(const std::string& where, std::size_t expected, std::size_t actual);

    [[nodiscard]] std::size_t expected() const noexcept { return expected_; }
    [[nodiscard]] std::size_t actual() const noexcept { return actual_; }

private:
    std::size_t expected_;
    std::size_t actual_;
};

class BoundaryViolationError : public Error {
public:
    explicit BoundaryViolationError(std::size_t node_index);

    [[nodiscard]] std::size_t node_index() const noexcept { return node_index_; }

private:
    std::size_t node_index_;
};

/// E − V(x) ≤ 0: the curve touched or crossed the classically forbidden region.
class DomainError : public Error {
public:
    DomainError(double kinetic_energy, std::size_t node_index);

    /// E − V(x) at the offending point (≤ 0).
    [[nodiscard]] double kinetic_energy() const noexcept { return kinetic_energy_; }
    [[nodiscard]] std::size_t node_index() const noexcept { return node_index_; }

    /// Copy of this error attributed to a specific node.
    [[nodiscard]] DomainError at_node(std::size_t node_index) const;

    static constexpr std::size_t NO_NODE = static_cast<std::size_t>(-1);

private:
    double      kinetic_energy_;
    std::size_t node_index_;
};

class WorkerFailure : public Error {
public:
    WorkerFailure(std::uint64_t request_id, std::size_t attempts,
                  const std::string& reason);

    [[nodiscard]] std::uint64_t request_id() const noexcept { return request_id_; }
    [[nodiscard]] std::size_t attempts() const noexcept { return attempts_; }

private:
    std::uint64_t request_id_;
    std::size_t   attempts_;
};

class ConfigError : public Error {
public:
    using Error::Error;
};

} // namespace birkhoff
