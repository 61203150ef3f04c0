#pragma once

/// @file include/birkhoff/curve_io.hpp
/// @brief CSV export of a node sequence: `node,x0,x1,…` then one row per node.

#include "birkhoff/types.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace birkhoff {

/// # Errors
/// `ShapeError` if the nodes differ in dimension.
void write_curve_csv(std::ostream& out, const std::vector<Configuration>& nodes);

/// # Returns
/// false if the file could not be written.
[[nodiscard]] bool write_curve_csv(const std::string& path,
                                   const std::vector<Configuration>& nodes);

} // namespace birkhoff
