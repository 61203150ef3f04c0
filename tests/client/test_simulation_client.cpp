#include <gtest/gtest.h>
#include "birkhoff/simulation.hpp"
#include "birkhoff/curve.hpp"
#include "birkhoff/errors.hpp"
#include "birkhoff/potential.hpp"

#include <cmath>
#include <memory>
#include <vector>

using namespace birkhoff;

// ─── Helpers ──────────────────────────────────────────────────────────────────

static Configuration point(double x, double y) {
    Configuration c(2);
    c << x, y;
    return c;
}

static GeodesicConfig harmonic_config(std::size_t pool_size) {
    GeodesicConfig cfg;
    cfg.total_energy       = 2.0;
    cfg.endpoint_a         = point(-1.0, 0.3);
    cfg.endpoint_b         = point(1.0, 0.3);
    cfg.n_nodes            = 9;
    cfg.gradient_tolerance = 1e-6;
    cfg.worker_pool_size   = pool_size;
    return cfg;
}

static std::shared_ptr<const PotentialOracle> harmonic() {
    return std::make_shared<const HarmonicPotential>(1.0);
}

// ─── Construction ─────────────────────────────────────────────────────────────

TEST(SimulationClient_Construction, InvalidConfigThrows) {
    GeodesicConfig cfg = harmonic_config(0);
    cfg.n_nodes = 1;
    EXPECT_THROW({ SimulationClient client(cfg, harmonic()); }, ConfigError);
}

TEST(SimulationClient_Construction, NullOracleThrows) {
    EXPECT_THROW({ SimulationClient client(harmonic_config(0), nullptr); },
                 std::invalid_argument);
}

// ─── Local Runs ───────────────────────────────────────────────────────────────

TEST(SimulationClient_Run, InlineConverges) {
    SimulationClient client(harmonic_config(0), harmonic());
    const RunResult r = client.run();

    ASSERT_EQ(r.status, RunStatus::Converged) << r.reason;
    ASSERT_EQ(r.nodes.size(), 9u);
    EXPECT_EQ(r.nodes.front(), point(-1.0, 0.3));
    EXPECT_EQ(r.nodes.back(), point(1.0, 0.3));
    // The path bows away from the well centre.
    EXPECT_GT(r.nodes[4][1], 0.3);
    EXPECT_EQ(r.history.size(), r.iterations);
    EXPECT_EQ(client.pool_stats(), nullptr);
}

TEST(SimulationClient_Run, PoolMatchesInline) {
    SimulationClient inline_client(harmonic_config(0), harmonic());
    const RunResult expected = inline_client.run();

    SimulationClient client(harmonic_config(2), harmonic());
    client.start();
    const RunResult r = client.run();
    client.shutdown();

    ASSERT_EQ(r.status, RunStatus::Converged) << r.reason;
    // Evaluations are deterministic, so the trajectory is identical.
    EXPECT_EQ(r.iterations, expected.iterations);
    EXPECT_DOUBLE_EQ(r.functional_value, expected.functional_value);

    const comm::PoolStats* stats = client.pool_stats();
    ASSERT_NE(stats, nullptr);
    EXPECT_GT(stats->rounds, 0u);
    EXPECT_EQ(stats->retries, 0u);
}

TEST(SimulationClient_Run, RestartsAfterShutdown) {
    SimulationClient client(harmonic_config(2), harmonic());
    client.start();
    const RunResult first = client.run();
    client.shutdown();

    const RunResult second = client.run();
    EXPECT_EQ(second.status, first.status);
    EXPECT_DOUBLE_EQ(second.functional_value, first.functional_value);
}

TEST(SimulationClient_Run, RunFromPreviousSolutionIsImmediate) {
    SimulationClient client(harmonic_config(0), harmonic());
    const RunResult first = client.run();
    ASSERT_EQ(first.status, RunStatus::Converged) << first.reason;

    const RunResult again = client.run_from(first.nodes);
    EXPECT_EQ(again.status, RunStatus::Converged);
    EXPECT_LT(again.iterations, first.iterations);
    EXPECT_NEAR(again.functional_value, first.functional_value, 1e-8);
}

TEST(SimulationClient_Run, RunFromRejectsWrongDimension) {
    SimulationClient client(harmonic_config(0), harmonic());
    const std::vector<Configuration> nodes = {Configuration::Zero(3), Configuration::Ones(3)};
    EXPECT_THROW((void)client.run_from(nodes), ShapeError);
}

TEST(SimulationClient_Run, CancelStopsAndResetClears) {
    SimulationClient client(harmonic_config(0), harmonic());
    client.cancel();
    const RunResult cancelled = client.run();
    EXPECT_EQ(cancelled.status, RunStatus::Cancelled);
    EXPECT_EQ(cancelled.iterations, 0u);

    client.reset_cancel();
    const RunResult r = client.run();
    EXPECT_EQ(r.status, RunStatus::Converged) << r.reason;
}

TEST(SimulationClient_Run, ObserverSeesEveryIteration) {
    SimulationClient client(harmonic_config(0), harmonic());
    std::size_t calls = 0;
    client.set_observer([&calls](const IterationRecord& rec, const Curve&) {
        ++calls;
        EXPECT_EQ(rec.iteration, calls);
    });
    const RunResult r = client.run();
    EXPECT_EQ(calls, r.iterations);
}

// ─── Global Runs ──────────────────────────────────────────────────────────────

TEST(SimulationClient_Birkhoff, FlatPotentialConvergesInOneSweep) {
    GeodesicConfig cfg = harmonic_config(0);
    cfg.total_energy = 1.0;
    cfg.global_nodes = 5;
    SimulationClient client(cfg, std::make_shared<const FlatPotential>(0.0));

    const BirkhoffResult r = client.run_birkhoff();
    ASSERT_EQ(r.status, RunStatus::Converged) << r.reason;
    EXPECT_EQ(r.sweeps, 1u);
    EXPECT_EQ(r.local_failures, 0u);
    EXPECT_LT(r.movement, cfg.movement_tolerance);
    // Length 2 at speed √2.
    EXPECT_NEAR(r.functional_value, 2.0 * std::sqrt(2.0), 1e-12);
}

TEST(SimulationClient_Birkhoff, HarmonicAgreesWithLocalGeodesic) {
    GeodesicConfig cfg = harmonic_config(0);
    cfg.global_nodes       = 9;
    cfg.movement_tolerance = 1e-4;
    cfg.max_sweeps         = 1000;
    SimulationClient client(cfg, harmonic());

    const RunResult local = client.run();
    const BirkhoffResult global = client.run_birkhoff();

    ASSERT_EQ(local.status, RunStatus::Converged) << local.reason;
    ASSERT_EQ(global.status, RunStatus::Converged) << global.reason;
    ASSERT_EQ(global.nodes.size(), 9u);
    // Both discretise the same symmetric geodesic with nine nodes.
    EXPECT_NEAR(global.nodes[4][0], 0.0, 1e-3);
    EXPECT_NEAR(global.nodes[4][1], local.nodes[4][1], 1e-2);
    EXPECT_NEAR(global.functional_value, local.functional_value, 1e-2 * local.functional_value);
}

TEST(SimulationClient_Birkhoff, CancelledBeforeFirstSweep) {
    SimulationClient client(harmonic_config(0), harmonic());
    client.cancel();
    const BirkhoffResult r = client.run_birkhoff();
    EXPECT_EQ(r.status, RunStatus::Cancelled);
    EXPECT_EQ(r.sweeps, 0u);
    EXPECT_EQ(r.nodes.size(), client.config().global_nodes);
}
