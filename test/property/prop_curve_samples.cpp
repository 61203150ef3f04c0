/**
 * @file  prop_curve_samples.cpp
 * @brief Property: moving a node drops exactly the samples it invalidates
 *        and never touches the fixed endpoints.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_curve_samples
 */

#include <rapidcheck.h>
#include <cmath>
#include <memory>

#include "birkhoff/curve.hpp"
#include "birkhoff/errors.hpp"
#include "birkhoff/metric.hpp"
#include "birkhoff/potential.hpp"

using namespace birkhoff;

namespace {

void fill(Curve& c, QuadratureRule rule, const MetricValues& metric,
          const PotentialOracle& oracle) {
    for (const auto& req : c.missing_samples(rule)) {
        c.attach(req, metric.from_potential_boundary(req.position,
                                                     oracle.evaluate(req.position)));
    }
}

} // namespace

int main() {
    const HarmonicPotential oracle(1.0);
    const MetricValues metric(100.0);

    // ── Property 1: perturbing node i drops only node i's sample ─────────────
    rc::check(
        "curve: perturb invalidates the moved node and its two segments",
        [&]() {
            const auto n = *rc::gen::inRange<std::size_t>(3, 12);
            const auto i = *rc::gen::inRange<std::size_t>(1, n - 1);
            const double dx = *rc::gen::inRange(-1000, 1000) / 1000.0;

            Configuration a(2), b(2);
            a << -1.0, 0.0;
            b << 1.0, 0.5;
            Curve c = Curve::initialize(a, b, n);
            fill(c, QuadratureRule::Trapezoidal, metric, oracle);
            fill(c, QuadratureRule::Midpoint, metric, oracle);

            Displacement delta(2);
            delta << dx, 0.5 * dx + 1e-3;
            c.perturb(i, delta);

            const auto node_missing = c.missing_samples(QuadratureRule::Trapezoidal);
            RC_ASSERT(node_missing.size() == 1u);
            RC_ASSERT(node_missing.front().index == i);

            const auto seg_missing = c.missing_samples(QuadratureRule::Midpoint);
            RC_ASSERT(seg_missing.size() == 2u);
            RC_ASSERT(seg_missing[0].index == i - 1);
            RC_ASSERT(seg_missing[1].index == i);
        }
    );

    // ── Property 2: endpoints refuse every mutation ──────────────────────────
    rc::check(
        "curve: endpoints cannot be perturbed",
        [&]() {
            const auto n = *rc::gen::inRange<std::size_t>(2, 10);
            Configuration a(1), b(1);
            a << 0.0;
            b << 1.0;
            Curve c = Curve::initialize(a, b, n);
            const Displacement delta = Displacement::Constant(1, 0.25);

            bool first_refused = false;
            bool last_refused  = false;
            try {
                c.perturb(0, delta);
            } catch (const BoundaryViolationError&) {
                first_refused = true;
            }
            try {
                c.perturb(n - 1, delta);
            } catch (const BoundaryViolationError&) {
                last_refused = true;
            }
            RC_ASSERT(first_refused);
            RC_ASSERT(last_refused);
            RC_ASSERT(c.position(0)[0] == 0.0);
            RC_ASSERT(c.position(n - 1)[0] == 1.0);
        }
    );

    return 0;
}
