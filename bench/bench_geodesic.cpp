/**
 * @file  bench/bench_geodesic.cpp
 * @brief Google Benchmark suite for the geodesic engine hot paths.
 *
 * Benchmarks
 * ----------
 *   BM_FunctionalGradient  : ∂L over N nodes, trapezoidal rule
 *   BM_Reparametrize       : arc-length redistribution of N nodes
 *   BM_LbfgsApply          : two-loop recursion, full memory
 *   BM_LocalGeodesic_Inline: CustomBFGS on a harmonic well, no pool
 *
 * Build (CMake):
 *   cmake --build build --target bench_geodesic
 *   ./build/bench_geodesic --benchmark_format=json
 */

#include "benchmark/benchmark.h"

#include "birkhoff/curve.hpp"
#include "birkhoff/geometric.hpp"
#include "birkhoff/metric.hpp"
#include "birkhoff/optimizer.hpp"
#include "birkhoff/potential.hpp"
#include "birkhoff/worker_pool.hpp"

#include <cmath>
#include <memory>
#include <numbers>
#include <vector>

using namespace birkhoff;

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// N nodes on a sine arc in ℝ^d, first two coordinates only.
static std::vector<Configuration> make_arc(std::size_t n, Eigen::Index d) {
    std::vector<Configuration> nodes;
    nodes.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        const double t = static_cast<double>(i) / static_cast<double>(n - 1);
        Configuration x = Configuration::Zero(d);
        x[0] = 2.0 * t - 1.0;
        if (d > 1) x[1] = 0.3 * std::sin(std::numbers::pi * t);
        nodes.push_back(x);
    }
    return nodes;
}

// ── Benchmarks ─────────────────────────────────────────────────────────────────

static void BM_FunctionalGradient(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto nodes = make_arc(n, 6);
    const HarmonicPotential oracle(1.0);
    const MetricValues metric(5.0);
    std::vector<MetricSample> samples;
    for (const auto& x : nodes) samples.push_back(metric.evaluate(oracle, x));
    const MassWeights m = MassWeights::Ones(6);

    for (auto _ : state) {
        auto g = geometric::functional_gradient(nodes, samples, QuadratureRule::Trapezoidal, m);
        benchmark::DoNotOptimize(g.data());
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n));
}
BENCHMARK(BM_FunctionalGradient)->Arg(16)->Arg(128)->Arg(1024);

static void BM_Reparametrize(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto nodes = make_arc(n, 6);
    const MassWeights m = MassWeights::Ones(6);
    for (auto _ : state) {
        auto out = geometric::reparametrize(nodes, m);
        benchmark::DoNotOptimize(out.data());
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n));
}
BENCHMARK(BM_Reparametrize)->Arg(16)->Arg(128)->Arg(1024);

static void BM_LbfgsApply(benchmark::State& state) {
    const auto dim = static_cast<Eigen::Index>(state.range(0));
    LbfgsMemory memory(10);
    for (int k = 0; k < 10; ++k) {
        const Eigen::VectorXd s = Eigen::VectorXd::Random(dim);
        const Eigen::VectorXd y = s + 0.1 * Eigen::VectorXd::Random(dim);
        (void)memory.push(s, y);
    }
    const Eigen::VectorXd g = Eigen::VectorXd::Random(dim);
    for (auto _ : state) {
        auto p = memory.apply(g);
        benchmark::DoNotOptimize(p.data());
    }
}
BENCHMARK(BM_LbfgsApply)->Arg(64)->Arg(1024)->Arg(16384);

static void BM_LocalGeodesic_Inline(benchmark::State& state) {
    auto oracle = std::make_shared<const HarmonicPotential>(1.0);
    comm::InlineDispatcher dispatcher(oracle);
    const MetricValues metric(2.0);
    Configuration a(2), b(2);
    a << -1.0, 0.3;
    b << 1.0, 0.3;
    BfgsOptions options;
    options.history_capacity = 0;

    for (auto _ : state) {
        Curve curve = Curve::initialize(a, b, static_cast<std::size_t>(state.range(0)));
        CustomBFGS bfgs(curve, metric, dispatcher, options);
        auto r = bfgs.run();
        benchmark::DoNotOptimize(r.functional);
    }
}
BENCHMARK(BM_LocalGeodesic_Inline)->Arg(9)->Arg(33)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
