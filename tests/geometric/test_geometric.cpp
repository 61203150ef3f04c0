#include <gtest/gtest.h>
#include "birkhoff/geometric.hpp"
#include "birkhoff/metric.hpp"
#include "birkhoff/potential.hpp"
#include "birkhoff/errors.hpp"
#include "birkhoff/constants.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <vector>

using namespace birkhoff;
using namespace birkhoff::constants;

// ─── Helpers ──────────────────────────────────────────────────────────────────

static Configuration point(double x, double y) {
    Configuration c(2);
    c << x, y;
    return c;
}

static Configuration scalar(double x) {
    Configuration c(1);
    c << x;
    return c;
}

/// Samples in the layout the functional expects for `rule`.
static std::vector<MetricSample> samples_for(const std::vector<Configuration>& nodes,
                                             const PotentialOracle& V,
                                             const MetricValues& metric,
                                             QuadratureRule rule) {
    std::vector<MetricSample> out;
    if (rule == QuadratureRule::Trapezoidal) {
        for (const auto& x : nodes) out.push_back(metric.evaluate(V, x));
    } else {
        for (const auto& m : geometric::segment_midpoints(nodes)) {
            out.push_back(metric.evaluate(V, m));
        }
    }
    return out;
}

static std::vector<Configuration> bent_path() {
    return {point(-1.0, 0.0), point(-0.4, 0.5), point(0.1, 0.6), point(0.6, 0.3),
            point(1.0, 0.0)};
}

// ─── Segment Lengths ──────────────────────────────────────────────────────────

TEST(Geometric_Length, MassWeightedSegmentLength) {
    Eigen::VectorXd m(2);
    m << 4.0, 1.0;
    EXPECT_NEAR(geometric::segment_length(point(0, 0), point(1, 1), m), std::sqrt(5.0),
                FLOAT_EPSILON);
}

TEST(Geometric_Length, SampleCountPerRule) {
    EXPECT_EQ(geometric::sample_count(QuadratureRule::Trapezoidal, 5), 5u);
    EXPECT_EQ(geometric::sample_count(QuadratureRule::Midpoint, 5), 4u);
}

// ─── Functional ───────────────────────────────────────────────────────────────

TEST(Geometric_Functional, FlatStraightLine_IsSqrtTwoTimesLength) {
    const FlatPotential V(0.0);
    const MetricValues metric(1.0);
    const Eigen::VectorXd m = Eigen::VectorXd::Ones(1);
    const std::vector<Configuration> nodes = {scalar(0.0), scalar(0.25), scalar(0.5),
                                              scalar(0.75), scalar(1.0)};

    for (auto rule : {QuadratureRule::Trapezoidal, QuadratureRule::Midpoint}) {
        const auto s = samples_for(nodes, V, metric, rule);
        EXPECT_NEAR(geometric::functional(nodes, s, rule, m), std::sqrt(2.0), 1e-14)
            << to_string(rule);
    }
}

TEST(Geometric_Functional, WrongSampleCount_ThrowsShapeError) {
    const FlatPotential V(0.0);
    const MetricValues metric(1.0);
    const Eigen::VectorXd m = Eigen::VectorXd::Ones(2);
    const auto nodes = bent_path();
    auto s = samples_for(nodes, V, metric, QuadratureRule::Trapezoidal);
    s.pop_back();
    EXPECT_THROW((void)geometric::functional(nodes, s, QuadratureRule::Trapezoidal, m),
                 ShapeError);
}

// ─── Gradient ─────────────────────────────────────────────────────────────────

class GeometricGradient : public ::testing::TestWithParam<QuadratureRule> {};

TEST_P(GeometricGradient, MatchesFiniteDifference) {
    const QuadratureRule rule = GetParam();
    const HarmonicPotential V(1.0);
    const MetricValues metric(2.0);
    Eigen::VectorXd m(2);
    m << 1.0, 2.5;

    const auto nodes = bent_path();
    const auto grad = geometric::functional_gradient(
        nodes, samples_for(nodes, V, metric, rule), rule, m);
    ASSERT_EQ(grad.size(), nodes.size() - 2);

    const double h = 1e-6;
    for (std::size_t i = 1; i + 1 < nodes.size(); ++i) {
        for (int k = 0; k < 2; ++k) {
            auto plus = nodes, minus = nodes;
            plus[i][k] += h;
            minus[i][k] -= h;
            const double fp = geometric::functional(plus, samples_for(plus, V, metric, rule), rule, m);
            const double fm = geometric::functional(minus, samples_for(minus, V, metric, rule), rule, m);
            EXPECT_NEAR(grad[i - 1][k], (fp - fm) / (2 * h), 1e-6)
                << "node " << i << " coordinate " << k;
        }
    }
}

INSTANTIATE_TEST_SUITE_P(Rules, GeometricGradient,
                         ::testing::Values(QuadratureRule::Trapezoidal, QuadratureRule::Midpoint));

TEST(Geometric_Gradient, EndpointsOnlyGiveEmptyGradient) {
    const FlatPotential V(0.0);
    const MetricValues metric(1.0);
    const std::vector<Configuration> nodes = {point(0, 0), point(1, 0)};
    const auto s = samples_for(nodes, V, metric, QuadratureRule::Trapezoidal);
    EXPECT_TRUE(geometric::functional_gradient(nodes, s, QuadratureRule::Trapezoidal,
                                               Eigen::VectorXd::Ones(2)).empty());
}

// ─── Curvature ────────────────────────────────────────────────────────────────

TEST(Geometric_Curvature, StraightLineHasZeroCurvature) {
    const std::vector<Configuration> nodes = {point(0, 0), point(1, 1), point(2, 2)};
    EXPECT_NEAR(geometric::curvature(nodes, 1, Eigen::VectorXd::Ones(2)), 0.0, FLOAT_EPSILON);
}

TEST(Geometric_Curvature, RightAngleTurn) {
    const std::vector<Configuration> nodes = {point(0, 0), point(1, 0), point(1, 1)};
    // ‖(0,1) − (1,0)‖ / 1
    EXPECT_NEAR(geometric::curvature(nodes, 1, Eigen::VectorXd::Ones(2)), std::sqrt(2.0),
                FLOAT_EPSILON);
}

TEST(Geometric_Curvature, EndpointIsNotInterior) {
    const std::vector<Configuration> nodes = {point(0, 0), point(1, 0), point(1, 1)};
    EXPECT_THROW((void)geometric::curvature(nodes, 0, Eigen::VectorXd::Ones(2)),
                 std::out_of_range);
}

TEST(Geometric_Curvature, TiesResolveToLowestIndex) {
    // Zig-zag with identical turns at nodes 1, 2 and 3.
    const std::vector<Configuration> nodes = {point(0, 0), point(1, 1), point(2, 0),
                                              point(3, 1), point(4, 0)};
    const Eigen::VectorXd m = Eigen::VectorXd::Ones(2);
    EXPECT_EQ(geometric::max_curvature_node(nodes, m), 1u);
    EXPECT_EQ(geometric::min_curvature_node(nodes, m), 1u);
}

TEST(Geometric_Curvature, SharpestTurnWins) {
    const std::vector<Configuration> nodes = {point(0, 0), point(1, 0), point(2, 0.1),
                                              point(2.5, 1.0), point(3.5, 2.8)};
    const Eigen::VectorXd m = Eigen::VectorXd::Ones(2);
    EXPECT_EQ(geometric::max_curvature_node(nodes, m), 2u);
    EXPECT_EQ(geometric::min_curvature_node(nodes, m), 3u);
}

// ─── Spacing & Reparametrization ──────────────────────────────────────────────

TEST(Geometric_Spacing, RatioOfLongestToShortest) {
    const std::vector<Configuration> nodes = {scalar(0.0), scalar(0.1), scalar(0.5), scalar(1.0)};
    EXPECT_NEAR(geometric::spacing_ratio(nodes, Eigen::VectorXd::Ones(1)), 5.0, 1e-12);
}

TEST(Geometric_Spacing, DegenerateSegmentGivesInfinity) {
    const std::vector<Configuration> nodes = {scalar(0.0), scalar(0.5), scalar(0.5), scalar(1.0)};
    EXPECT_EQ(geometric::spacing_ratio(nodes, Eigen::VectorXd::Ones(1)),
              std::numeric_limits<double>::infinity());
}

TEST(Geometric_Reparametrize, EqualSpacingAlongStraightLine) {
    const std::vector<Configuration> nodes = {scalar(0.0), scalar(0.05), scalar(0.1),
                                              scalar(0.9), scalar(1.0)};
    const auto out = geometric::reparametrize(nodes, Eigen::VectorXd::Ones(1));
    ASSERT_EQ(out.size(), nodes.size());
    for (std::size_t i = 0; i < out.size(); ++i) {
        EXPECT_NEAR(out[i][0], 0.25 * static_cast<double>(i), 1e-12);
    }
}

TEST(Geometric_Reparametrize, EndpointsBitIdenticalAndLengthPreserved) {
    const FlatPotential V(0.0);
    const MetricValues metric(1.0);
    const Eigen::VectorXd m = Eigen::VectorXd::Ones(2);
    const auto nodes = bent_path();
    const auto out = geometric::reparametrize(nodes, m);

    EXPECT_TRUE((out.front().array() == nodes.front().array()).all());
    EXPECT_TRUE((out.back().array() == nodes.back().array()).all());

    // New nodes lie on the old polyline, so the length cannot grow and the
    // corners cut off are small.
    const auto rule = QuadratureRule::Trapezoidal;
    const double before = geometric::functional(nodes, samples_for(nodes, V, metric, rule), rule, m);
    const double after  = geometric::functional(out, samples_for(out, V, metric, rule), rule, m);
    EXPECT_LE(after, before + 1e-12);
    EXPECT_NEAR(after, before, 0.05 * before);
}
