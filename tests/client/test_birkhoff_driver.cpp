#include <gtest/gtest.h>
#include "birkhoff/simulation.hpp"
#include "birkhoff/errors.hpp"
#include "birkhoff/potential.hpp"

#include <atomic>
#include <cmath>
#include <memory>
#include <vector>

using namespace birkhoff;

namespace {

Configuration point(double x, double y) {
    Configuration c(2);
    c << x, y;
    return c;
}

class ThrowingDispatcher final : public comm::Dispatcher {
public:
    [[nodiscard]] std::vector<comm::WorkResult>
    dispatch(const std::vector<comm::WorkItem>&) override {
        throw WorkerFailure(3, 3, "worker reported: segfault");
    }
};

struct DriverFixture : public ::testing::Test {
    GeodesicConfig config;
    std::shared_ptr<const PotentialOracle> oracle = std::make_shared<const FlatPotential>(0.0);
    comm::InlineDispatcher dispatcher{oracle};
    MetricValues metric{1.0};

    void SetUp() override {
        config.total_energy = 1.0;
        config.endpoint_a   = point(0.0, 0.0);
        config.endpoint_b   = point(2.0, 0.0);
    }
};

} // namespace

TEST_F(DriverFixture, NeedsAnInteriorNode) {
    BirkhoffDriver driver(config, metric, dispatcher);
    EXPECT_THROW((void)driver.run({point(0, 0), point(1, 0)}), std::invalid_argument);
}

TEST_F(DriverFixture, RejectsWrongDimension) {
    BirkhoffDriver driver(config, metric, dispatcher);
    EXPECT_THROW((void)driver.run({point(0, 0), Configuration::Zero(3), point(1, 0)}),
                 ShapeError);
}

TEST_F(DriverFixture, StraightensAKinkedPath) {
    // In a flat potential the geodesic is the chord.
    std::vector<Configuration> nodes = {point(0.0, 0.0), point(0.5, 0.4), point(1.0, 0.6),
                                        point(1.5, 0.4), point(2.0, 0.0)};
    BirkhoffDriver driver(config, metric, dispatcher);
    std::vector<double> movements;
    driver.set_observer([&](std::size_t, double movement, const std::vector<Configuration>&) {
        movements.push_back(movement);
    });
    const BirkhoffResult r = driver.run(nodes);

    ASSERT_EQ(r.status, RunStatus::Converged) << r.reason;
    EXPECT_EQ(movements.size(), r.sweeps);
    EXPECT_GT(movements.front(), movements.back());
    for (const auto& x : r.nodes) EXPECT_NEAR(x[1], 0.0, 1e-4);
    EXPECT_EQ(r.nodes.front(), point(0.0, 0.0));
    EXPECT_EQ(r.nodes.back(), point(2.0, 0.0));
    EXPECT_NEAR(r.functional_value, 2.0 * std::sqrt(2.0), 1e-6);
}

TEST_F(DriverFixture, SweepLimitFails) {
    config.max_sweeps = 1;
    config.movement_tolerance = 0.0;
    BirkhoffDriver driver(config, metric, dispatcher);
    const BirkhoffResult r =
        driver.run({point(0.0, 0.0), point(1.0, 0.5), point(2.0, 0.0)});
    EXPECT_EQ(r.status, RunStatus::Failed);
    EXPECT_EQ(r.sweeps, 1u);
    EXPECT_NE(r.reason.find("sweep limit"), std::string::npos);
}

TEST_F(DriverFixture, LocalFailuresKeepTheNode) {
    ThrowingDispatcher failing;
    BirkhoffDriver driver(config, metric, failing);
    const std::vector<Configuration> nodes = {point(0.0, 0.0), point(1.0, 0.5), point(2.0, 0.0)};
    const BirkhoffResult r = driver.run(nodes);

    // Each local solve fails before its first step; the node stays put and
    // the final functional cannot be evaluated either.
    EXPECT_EQ(r.local_failures, 1u);
    EXPECT_EQ(r.nodes[1], nodes[1]);
    EXPECT_EQ(r.status, RunStatus::Converged);
    EXPECT_TRUE(std::isnan(r.functional_value));
}

TEST_F(DriverFixture, CancelFlag) {
    std::atomic<bool> flag{true};
    BirkhoffDriver driver(config, metric, dispatcher);
    driver.set_cancel_flag(&flag);
    const BirkhoffResult r =
        driver.run({point(0.0, 0.0), point(1.0, 0.5), point(2.0, 0.0)});
    EXPECT_EQ(r.status, RunStatus::Cancelled);
    EXPECT_EQ(r.sweeps, 0u);
}
