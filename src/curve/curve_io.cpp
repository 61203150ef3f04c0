/// @file src/curve/curve_io.cpp
/// @brief CSV writer for converged curves.

#include "birkhoff/curve_io.hpp"
#include "birkhoff/linalg.hpp"

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <fstream>
#include <ostream>

namespace birkhoff {

void write_curve_csv(std::ostream& out, const std::vector<Configuration>& nodes) {
    if (nodes.empty()) return;
    const Eigen::Index d = nodes.front().size();

    fmt::print(out, "node");
    for (Eigen::Index k = 0; k < d; ++k) fmt::print(out, ",x{}", k);
    fmt::print(out, "\n");

    for (std::size_t i = 0; i < nodes.size(); ++i) {
        linalg::require_size("write_curve_csv", d, nodes[i].size());
        fmt::print(out, "{}", i);
        for (Eigen::Index k = 0; k < d; ++k) fmt::print(out, ",{:.17g}", nodes[i][k]);
        fmt::print(out, "\n");
    }
}

bool write_curve_csv(const std::string& path, const std::vector<Configuration>& nodes) {
    std::ofstream file(path);
    if (!file.is_open()) return false;
    write_curve_csv(file, nodes);
    return static_cast<bool>(file);
}

} // namespace birkhoff
