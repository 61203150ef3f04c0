/**
 * @file  fuzz_geometric.cpp
 * @brief libFuzzer target for the curve geometry helpers
 *
 * Build:
 *   cmake -DBIRKHOFF_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_geometric
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort on any IEEE 754 bit pattern.
 *   2. reparametrize keeps the node count and both endpoints.
 *   3. For finite nodes, spacing_ratio ≥ 1 and curvature selection returns
 *      an interior index.
 *
 * Fuzzer strategy:
 *   The first byte picks the dimension (1-4); the rest is read as raw
 *   doubles via memcpy and chopped into nodes.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "birkhoff/geometric.hpp"

using namespace birkhoff;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 1) return 0;
    const std::size_t dim = 1u + (data[0] % 4u);
    const std::size_t n_doubles = (size - 1) / sizeof(double);
    const std::size_t n_nodes = n_doubles / dim;
    if (n_nodes < 2) return 0;

    std::vector<Configuration> nodes;
    bool finite = true;
    for (std::size_t i = 0; i < n_nodes; ++i) {
        Configuration x(static_cast<Eigen::Index>(dim));
        for (std::size_t k = 0; k < dim; ++k) {
            double v{};
            __builtin_memcpy(&v, data + 1 + (i * dim + k) * sizeof(double), sizeof(double));
            x[static_cast<Eigen::Index>(k)] = v;
            finite = finite && std::isfinite(v) && std::abs(v) < 1e100;
        }
        nodes.push_back(x);
    }

    const MassWeights m = MassWeights::Ones(static_cast<Eigen::Index>(dim));
    const auto out = geometric::reparametrize(nodes, m);
    assert(out.size() == nodes.size());
    if (!finite) return 0;

    assert((out.front().array() == nodes.front().array()).all());
    assert((out.back().array() == nodes.back().array()).all());
    assert(geometric::spacing_ratio(nodes, m) >= 1.0);

    if (n_nodes >= 3) {
        const std::size_t hi = geometric::max_curvature_node(nodes, m);
        const std::size_t lo = geometric::min_curvature_node(nodes, m);
        assert(hi >= 1 && hi + 1 < n_nodes);
        assert(lo >= 1 && lo + 1 < n_nodes);
    }
    return 0;
}
