#include <gtest/gtest.h>
#include "birkhoff/worker_pool.hpp"
#include "birkhoff/potential.hpp"
#include "birkhoff/errors.hpp"
#include <Eigen/Dense>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

using namespace birkhoff;
using namespace birkhoff::comm;

// ─── Scripted Transport ───────────────────────────────────────────────────────

/// Replies are produced synchronously by a script when a message is posted.
/// `wait` returns queued replies, or sleeps to the deadline when none exist.
class ScriptedTransport final : public WorkerTransport {
public:
    struct Posted {
        std::size_t worker;
        Message     msg;
    };

    struct Log {
        std::vector<Posted> posted;
        bool                stopped = false;
    };

    using Script = std::function<std::vector<Message>(std::size_t worker, const Message& msg)>;

    ScriptedTransport(std::size_t workers, Script script, std::shared_ptr<Log> log)
        : workers_(workers), script_(std::move(script)), log_(std::move(log)) {}

    void start() override {}
    [[nodiscard]] std::size_t worker_count() const noexcept override { return workers_; }

    void post(std::size_t worker, Message msg) override {
        log_->posted.push_back(Posted{worker, msg});
        for (auto& reply : script_(worker, msg)) queue_.push_back(std::move(reply));
    }

    [[nodiscard]] std::optional<Message> wait(Clock::time_point deadline) override {
        if (queue_.empty()) {
            std::this_thread::sleep_until(deadline);
            return std::nullopt;
        }
        Message m = std::move(queue_.front());
        queue_.pop_front();
        return m;
    }

    void stop() override { log_->stopped = true; }

private:
    std::size_t           workers_;
    Script                script_;
    std::shared_ptr<Log>  log_;
    std::deque<Message>   queue_;
};

// ─── Helpers ──────────────────────────────────────────────────────────────────

static Configuration scalar(double x) {
    Configuration c(1);
    c << x;
    return c;
}

/// V(x) = x₀, ∇V = 1.
static PotentialValue linear_value(const Configuration& x) {
    return PotentialValue{x[0], Displacement::Ones(x.size())};
}

static Message answer(std::size_t worker, const Message& msg) {
    const auto& req = std::get<EvaluateRequest>(msg.body);
    return make_evaluate_response(msg.request_id, linear_value(req.position), worker,
                                  req.attempt);
}

/// Acknowledge shutdown, answer every request.
static std::vector<Message> cooperative(std::size_t worker, const Message& msg) {
    if (std::holds_alternative<ShutdownRequest>(msg.body)) {
        return {make_heartbeat(worker, steady_seconds())};
    }
    return {answer(worker, msg)};
}

static PoolOptions fast_options(std::size_t retries = 2) {
    PoolOptions o;
    o.eval_timeout     = std::chrono::duration<double>(0.02);
    o.retry_count      = retries;
    o.shutdown_timeout = std::chrono::duration<double>(0.1);
    return o;
}

static std::vector<WorkItem> items_at(std::initializer_list<double> xs) {
    std::vector<WorkItem> out;
    std::size_t i = 0;
    for (double x : xs) out.push_back(WorkItem{i++, scalar(x)});
    return out;
}

// ─── Dispatch ─────────────────────────────────────────────────────────────────

TEST(WorkerPool_Dispatch, ResultsComeBackInItemOrder) {
    auto log = std::make_shared<ScriptedTransport::Log>();
    WorkerPool pool(std::make_unique<ScriptedTransport>(3, cooperative, log), fast_options());
    pool.start();

    const auto results = pool.dispatch(items_at({0.1, 0.2, 0.3, 0.4}));
    ASSERT_EQ(results.size(), 4u);
    for (std::size_t i = 0; i < results.size(); ++i) {
        EXPECT_EQ(results[i].node_index, i);
        EXPECT_DOUBLE_EQ(results[i].value.energy, 0.1 * static_cast<double>(i + 1));
    }

    // Round-robin over three workers with distinct request ids.
    ASSERT_EQ(log->posted.size(), 4u);
    EXPECT_EQ(log->posted[0].worker, 0u);
    EXPECT_EQ(log->posted[1].worker, 1u);
    EXPECT_EQ(log->posted[2].worker, 2u);
    EXPECT_EQ(log->posted[3].worker, 0u);
    EXPECT_NE(log->posted[0].msg.request_id, log->posted[1].msg.request_id);
    EXPECT_EQ(pool.stats().requests_sent, 4u);
}

TEST(WorkerPool_Dispatch, BeforeStart_Throws) {
    auto log = std::make_shared<ScriptedTransport::Log>();
    WorkerPool pool(std::make_unique<ScriptedTransport>(1, cooperative, log), fast_options());
    EXPECT_THROW((void)pool.dispatch(items_at({0.1})), std::logic_error);
}

TEST(WorkerPool_Dispatch, EmptyRoundReturnsImmediately) {
    auto log = std::make_shared<ScriptedTransport::Log>();
    WorkerPool pool(std::make_unique<ScriptedTransport>(1, cooperative, log), fast_options());
    pool.start();
    EXPECT_TRUE(pool.dispatch({}).empty());
}

// ─── Timeouts & Retries ───────────────────────────────────────────────────────

TEST(WorkerPool_Retry, TwoTimeoutsThenSuccess_RoundCompletes) {
    auto log = std::make_shared<ScriptedTransport::Log>();
    auto script = [](std::size_t worker, const Message& msg) -> std::vector<Message> {
        if (const auto* req = std::get_if<EvaluateRequest>(&msg.body)) {
            if (req->attempt <= 2) return {};  // lost
        }
        return cooperative(worker, msg);
    };
    WorkerPool pool(std::make_unique<ScriptedTransport>(1, script, log), fast_options(2));
    pool.start();

    const auto results = pool.dispatch(items_at({0.7}));
    ASSERT_EQ(results.size(), 1u);
    EXPECT_DOUBLE_EQ(results[0].value.energy, 0.7);
    EXPECT_EQ(pool.stats().timeouts, 2u);
    EXPECT_EQ(pool.stats().retries, 2u);

    // Every attempt reuses the request id.
    ASSERT_EQ(log->posted.size(), 3u);
    EXPECT_EQ(log->posted[0].msg.request_id, log->posted[2].msg.request_id);
}

TEST(WorkerPool_Retry, ThirdTimeout_RaisesWorkerFailure) {
    auto log = std::make_shared<ScriptedTransport::Log>();
    auto script = [](std::size_t worker, const Message& msg) -> std::vector<Message> {
        if (std::holds_alternative<EvaluateRequest>(msg.body)) return {};
        return cooperative(worker, msg);
    };
    WorkerPool pool(std::make_unique<ScriptedTransport>(1, script, log), fast_options(2));
    pool.start();

    try {
        (void)pool.dispatch(items_at({0.7}));
        FAIL() << "expected WorkerFailure";
    } catch (const WorkerFailure& e) {
        EXPECT_EQ(e.attempts(), 3u);
        EXPECT_EQ(e.request_id(), log->posted.front().msg.request_id);
    }
    EXPECT_EQ(pool.stats().timeouts, 3u);
}

TEST(WorkerPool_Retry, ErrorReportRetriesOnAnotherWorker) {
    auto log = std::make_shared<ScriptedTransport::Log>();
    auto script = [](std::size_t worker, const Message& msg) -> std::vector<Message> {
        if (std::holds_alternative<EvaluateRequest>(msg.body) && worker == 0) {
            const auto& req = std::get<EvaluateRequest>(msg.body);
            return {make_error_report(msg.request_id, worker, "segfault in oracle", req.attempt)};
        }
        return cooperative(worker, msg);
    };
    WorkerPool pool(std::make_unique<ScriptedTransport>(2, script, log), fast_options(2));
    pool.start();

    const auto results = pool.dispatch(items_at({0.25}));
    EXPECT_DOUBLE_EQ(results[0].value.energy, 0.25);
    EXPECT_EQ(pool.stats().error_reports, 1u);
    ASSERT_EQ(log->posted.size(), 2u);
    EXPECT_EQ(log->posted[0].worker, 0u);
    EXPECT_EQ(log->posted[1].worker, 1u);
    EXPECT_EQ(std::get<EvaluateRequest>(log->posted[1].msg.body).attempt, 2u);
}

TEST(WorkerPool_Retry, WrongGradientDimensionIsRetried) {
    auto log = std::make_shared<ScriptedTransport::Log>();
    auto script = [](std::size_t worker, const Message& msg) -> std::vector<Message> {
        if (const auto* req = std::get_if<EvaluateRequest>(&msg.body); req && req->attempt == 1) {
            return {make_evaluate_response(msg.request_id,
                                           PotentialValue{0.0, Displacement::Zero(3)}, worker,
                                           req->attempt)};
        }
        return cooperative(worker, msg);
    };
    WorkerPool pool(std::make_unique<ScriptedTransport>(1, script, log), fast_options(2));
    pool.start();

    const auto results = pool.dispatch(items_at({0.5}));
    EXPECT_DOUBLE_EQ(results[0].value.energy, 0.5);
    EXPECT_EQ(pool.stats().retries, 1u);
}

// ─── Duplicates & Stale Messages ──────────────────────────────────────────────

TEST(WorkerPool_Duplicates, DuplicateResponseIsDiscarded) {
    auto log = std::make_shared<ScriptedTransport::Log>();
    auto script = [](std::size_t worker, const Message& msg) -> std::vector<Message> {
        if (!std::holds_alternative<EvaluateRequest>(msg.body)) return cooperative(worker, msg);
        Message first = answer(worker, msg);
        Message corrupt = first;
        std::get<EvaluateResponse>(corrupt.body).potential = -999.0;
        return {first, corrupt};
    };
    WorkerPool pool(std::make_unique<ScriptedTransport>(1, script, log), fast_options());
    pool.start();

    const auto first = pool.dispatch(items_at({0.1, 0.2}));
    EXPECT_DOUBLE_EQ(first[0].value.energy, 0.1);
    EXPECT_DOUBLE_EQ(first[1].value.energy, 0.2);

    // The duplicates left in the queue must not leak into the next round.
    const auto second = pool.dispatch(items_at({0.3}));
    EXPECT_DOUBLE_EQ(second[0].value.energy, 0.3);
    EXPECT_GE(pool.stats().discarded_messages, 2u);
}

TEST(WorkerPool_Duplicates, LateReplyOfRetriedItemIsDiscarded) {
    auto log = std::make_shared<ScriptedTransport::Log>();
    auto script = [](std::size_t worker, const Message& msg) -> std::vector<Message> {
        if (const auto* req = std::get_if<EvaluateRequest>(&msg.body)) {
            if (req->attempt == 1) return {};  // slow worker
            // The retry answers, then the slow attempt finally arrives.
            Message late = answer(worker, msg);
            std::get<EvaluateResponse>(late.body).potential = 123.0;
            return {answer(worker, msg), late};
        }
        return cooperative(worker, msg);
    };
    WorkerPool pool(std::make_unique<ScriptedTransport>(1, script, log), fast_options());
    pool.start();

    EXPECT_DOUBLE_EQ(pool.dispatch(items_at({0.4}))[0].value.energy, 0.4);
    EXPECT_DOUBLE_EQ(pool.dispatch(items_at({0.6}))[0].value.energy, 0.6);
    EXPECT_GE(pool.stats().discarded_messages, 1u);
}

TEST(WorkerPool_Duplicates, ErrorFromSupersededAttemptDoesNotSpendRetries) {
    auto log = std::make_shared<ScriptedTransport::Log>();
    auto script = [](std::size_t worker, const Message& msg) -> std::vector<Message> {
        if (const auto* req = std::get_if<EvaluateRequest>(&msg.body)) {
            if (req->attempt == 1) return {};  // hangs past its deadline
            // The hung first attempt fails just as the retry succeeds.
            return {make_error_report(msg.request_id, 0, "crash in attempt 1", 1),
                    answer(worker, msg)};
        }
        return cooperative(worker, msg);
    };
    WorkerPool pool(std::make_unique<ScriptedTransport>(2, script, log), fast_options(1));
    pool.start();

    const auto results = pool.dispatch(items_at({0.7}));
    EXPECT_DOUBLE_EQ(results[0].value.energy, 0.7);
    EXPECT_EQ(pool.stats().retries, 1u);
    EXPECT_EQ(pool.stats().error_reports, 0u);
    EXPECT_EQ(pool.stats().discarded_messages, 1u);
}

TEST(WorkerPool_Duplicates, SchemaMismatchIsDiscarded) {
    auto log = std::make_shared<ScriptedTransport::Log>();
    auto script = [](std::size_t worker, const Message& msg) -> std::vector<Message> {
        if (!std::holds_alternative<EvaluateRequest>(msg.body)) return cooperative(worker, msg);
        Message foreign = answer(worker, msg);
        foreign.schema_version = SCHEMA_VERSION + 1;
        std::get<EvaluateResponse>(foreign.body).potential = -1.0;
        return {foreign, answer(worker, msg)};
    };
    WorkerPool pool(std::make_unique<ScriptedTransport>(1, script, log), fast_options());
    pool.start();

    EXPECT_DOUBLE_EQ(pool.dispatch(items_at({0.9}))[0].value.energy, 0.9);
    EXPECT_EQ(pool.stats().discarded_messages, 1u);
}

// ─── Shutdown ─────────────────────────────────────────────────────────────────

TEST(WorkerPool_Shutdown, CountsAcknowledgementsAndStopsTransport) {
    auto log = std::make_shared<ScriptedTransport::Log>();
    WorkerPool pool(std::make_unique<ScriptedTransport>(3, cooperative, log), fast_options());
    pool.start();

    EXPECT_EQ(pool.shutdown(), 3u);
    EXPECT_FALSE(pool.running());
    EXPECT_TRUE(log->stopped);
    EXPECT_EQ(pool.shutdown(), 0u);  // idempotent
    for (std::size_t w = 0; w < 3; ++w) EXPECT_TRUE(pool.last_heartbeat(w).has_value());
}

TEST(WorkerPool_Shutdown, SilentWorkerIsNotCounted) {
    auto log = std::make_shared<ScriptedTransport::Log>();
    auto script = [](std::size_t worker, const Message& msg) -> std::vector<Message> {
        if (worker == 1) return {};
        return cooperative(worker, msg);
    };
    WorkerPool pool(std::make_unique<ScriptedTransport>(2, script, log), fast_options());
    pool.start();
    EXPECT_EQ(pool.shutdown(), 1u);
    EXPECT_TRUE(log->stopped);
}

// ─── Thread Transport ─────────────────────────────────────────────────────────

TEST(WorkerPool_Threads, ParallelRoundMatchesOracle) {
    auto oracle = std::make_shared<const HarmonicPotential>(2.0);
    PoolOptions options;
    options.eval_timeout = std::chrono::duration<double>(5.0);
    WorkerPool pool(oracle, 3, options);
    pool.start();

    std::vector<WorkItem> items;
    for (std::size_t i = 0; i < 10; ++i) {
        items.push_back(WorkItem{i, scalar(0.1 * static_cast<double>(i))});
    }
    const auto results = pool.dispatch(items);
    ASSERT_EQ(results.size(), items.size());
    for (std::size_t i = 0; i < items.size(); ++i) {
        const auto expected = oracle->evaluate(items[i].position);
        EXPECT_DOUBLE_EQ(results[i].value.energy, expected.energy);
        EXPECT_TRUE(results[i].value.gradient.isApprox(expected.gradient));
    }
    EXPECT_EQ(pool.shutdown(), 3u);
}

namespace {

class ThrowingPotential final : public PotentialOracle {
public:
    [[nodiscard]] PotentialValue evaluate(const Configuration&) const override {
        throw std::runtime_error("force field diverged");
    }
    [[nodiscard]] std::string name() const override { return "throwing"; }
};

} // namespace

TEST(WorkerPool_Threads, OracleExceptionsExhaustRetries) {
    PoolOptions options;
    options.eval_timeout = std::chrono::duration<double>(5.0);
    options.retry_count  = 1;
    WorkerPool pool(std::make_shared<const ThrowingPotential>(), 2, options);
    pool.start();

    EXPECT_THROW((void)pool.dispatch(items_at({0.1})), WorkerFailure);
    EXPECT_EQ(pool.stats().error_reports, 2u);
    EXPECT_EQ(pool.shutdown(), 2u);
}

TEST(InlineDispatcher_Dispatch, EvaluatesSerially) {
    InlineDispatcher inline_dispatcher(std::make_shared<const FlatPotential>(0.5));
    const auto results = inline_dispatcher.dispatch(items_at({1.0, 2.0}));
    ASSERT_EQ(results.size(), 2u);
    EXPECT_DOUBLE_EQ(results[1].value.energy, 0.5);
    EXPECT_NE(results[0].request_id, results[1].request_id);
}
