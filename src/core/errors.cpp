/// @file src/core/errors.cpp
/// @brief Error message formatting for the exception taxonomy.

#include "birkhoff/errors.hpp"

#include <fmt/format.h>

namespace birkhoff {

ShapeError::ShapeError(const std::string& where, std::size_t expected,
                       std::size_t actual)
    : Error(fmt::format("{}: dimension mismatch (expected {}, got {})",
                        where, expected, actual))
    , expected_(expected)
    , actual_(actual) {}

BoundaryViolationError::BoundaryViolationError(std::size_t node_index)
    : Error(fmt::format("node {} is a fixed endpoint and cannot be moved",
                        node_index))
    , node_index_(node_index) {}

DomainError::DomainError(double kinetic_energy, std::size_t node_index)
    : Error(node_index == NO_NODE
                ? fmt::format("E - V(x) = {:.6g} <= 0: point lies outside the "
                              "energetically allowed region", kinetic_energy)
                : fmt::format("E - V(x) = {:.6g} <= 0 at node {}: point lies "
                              "outside the energetically allowed region",
                              kinetic_energy, node_index))
    , kinetic_energy_(kinetic_energy)
    , node_index_(node_index) {}

DomainError DomainError::at_node(std::size_t node_index) const {
    return DomainError(kinetic_energy_, node_index);
}

WorkerFailure::WorkerFailure(std::uint64_t request_id, std::size_t attempts,
                             const std::string& reason)
    : Error(fmt::format("request {} failed after {} attempt(s): {}",
                        request_id, attempts, reason))
    , request_id_(request_id)
    , attempts_(attempts) {}

} // namespace birkhoff
