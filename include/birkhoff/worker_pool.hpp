#pragma once

/// @file include/birkhoff/worker_pool.hpp
/// @brief Explicitly owned pool of evaluation workers and the dispatch
///        protocol that fans potential evaluations out to it.
///
/// # Module: WorkerPool
///
/// ## Lifecycle
///   start() → dispatch()* → shutdown()
/// There is no process-wide pool; whoever runs an optimisation owns one.
///
/// ## Dispatch round
/// Each work item is tagged with a fresh request id and posted to a worker
/// (round-robin). `dispatch` blocks until every item of the round has been
/// answered; no partial round is ever returned. An item that misses its
/// deadline or comes back as an ErrorReport is re-posted to a different
/// worker under the same request id, at most `retry_count` times; one more
/// failure aborts the round with `WorkerFailure`. Responses are matched by
/// request id only, so answers for ids that are not pending (duplicates, late
/// answers to a retried item, leftovers of an earlier round) are discarded and
/// counted.
///
/// ## Transport seam
/// `WorkerTransport` hides how messages reach workers. `ThreadTransport`
/// runs one thread per worker, each with its own inbox; coordinator and
/// workers share no mutable state, only copies of messages. Tests plug in
/// scripted transports to inject timeouts and duplicates.

#include "birkhoff/mailbox.hpp"
#include "birkhoff/potential.hpp"
#include "birkhoff/protocol.hpp"
#include "birkhoff/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace birkhoff::comm {

using Clock = std::chrono::steady_clock;

// ─── Work Items ───────────────────────────────────────────────────────────────

/// One evaluation the coordinator needs: V and ∇V at `position`.
struct WorkItem {
    std::size_t   node_index;
    Configuration position;
};

/// Answer to one work item.
struct WorkResult {
    std::uint64_t  request_id;
    std::size_t    node_index;
    PotentialValue value;
};

// ─── Dispatcher ───────────────────────────────────────────────────────────────

/// Anything that can evaluate a round of work items.
class Dispatcher {
public:
    virtual ~Dispatcher() = default;

    /// Evaluate every item. Results come back in item order.
    ///
    /// # Errors
    /// `WorkerFailure` if an item exhausts its retries.
    [[nodiscard]] virtual std::vector<WorkResult>
    dispatch(const std::vector<WorkItem>& items) = 0;
};

/// Evaluates on the calling thread. Used when no pool is configured.
class InlineDispatcher final : public Dispatcher {
public:
    explicit InlineDispatcher(std::shared_ptr<const PotentialOracle> oracle);

    [[nodiscard]] std::vector<WorkResult>
    dispatch(const std::vector<WorkItem>& items) override;

private:
    std::shared_ptr<const PotentialOracle> oracle_;
    std::uint64_t                          next_request_id_ = 1;
};

// ─── Transport ────────────────────────────────────────────────────────────────

class WorkerTransport {
public:
    virtual ~WorkerTransport() = default;

    /// Bring the workers up.
    virtual void start() = 0;

    [[nodiscard]] virtual std::size_t worker_count() const noexcept = 0;

    /// Deliver a message to one worker.
    virtual void post(std::size_t worker, Message msg) = 0;

    /// Next message from any worker, or `nullopt` once `deadline` passes.
    [[nodiscard]] virtual std::optional<Message> wait(Clock::time_point deadline) = 0;

    /// Release the workers. Called after shutdown has been acknowledged or
    /// has timed out.
    virtual void stop() = 0;
};

/// One thread per worker, each calling the shared const oracle.
class ThreadTransport final : public WorkerTransport {
public:
    ThreadTransport(std::shared_ptr<const PotentialOracle> oracle, std::size_t workers);
    ~ThreadTransport() override;

    ThreadTransport(const ThreadTransport&)            = delete;
    ThreadTransport& operator=(const ThreadTransport&) = delete;

    void start() override;
    [[nodiscard]] std::size_t worker_count() const noexcept override { return inboxes_.size(); }
    void post(std::size_t worker, Message msg) override;
    [[nodiscard]] std::optional<Message> wait(Clock::time_point deadline) override;
    void stop() override;

private:
    void run_worker(std::size_t worker_id);

    std::shared_ptr<const PotentialOracle>         oracle_;
    std::vector<std::unique_ptr<Mailbox<Message>>> inboxes_;
    Mailbox<Message>                               outbox_;
    std::vector<std::thread>                       threads_;
};

// ─── WorkerPool ───────────────────────────────────────────────────────────────

struct PoolOptions {
    /// Per-item wait before the item is presumed lost.
    std::chrono::duration<double> eval_timeout{30.0};

    /// Re-posts allowed per item after its first attempt.
    std::size_t retry_count = 2;

    /// How long `shutdown` waits for acknowledgements.
    std::chrono::duration<double> shutdown_timeout{5.0};
};

/// Counters for diagnostics and tests.
struct PoolStats {
    std::uint64_t rounds             = 0;
    std::uint64_t requests_sent      = 0;  ///< including retries
    std::uint64_t retries            = 0;
    std::uint64_t timeouts           = 0;
    std::uint64_t error_reports      = 0;
    std::uint64_t discarded_messages = 0;  ///< duplicates, late or bad version
    std::uint64_t heartbeats         = 0;
};

class WorkerPool final : public Dispatcher {
public:
    WorkerPool(std::unique_ptr<WorkerTransport> transport, PoolOptions options);

    /// Convenience: a pool of `workers` threads around `oracle`.
    WorkerPool(std::shared_ptr<const PotentialOracle> oracle, std::size_t workers,
               PoolOptions options);

    /// Shuts the pool down if the owner did not.
    ~WorkerPool() override;

    WorkerPool(const WorkerPool&)            = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void start();

    [[nodiscard]] std::vector<WorkResult>
    dispatch(const std::vector<WorkItem>& items) override;

    /// Send ShutdownRequest to every worker, wait for the acknowledgements
    /// (bounded by `shutdown_timeout`) and release the transport. Idempotent.
    ///
    /// # Returns
    /// Number of workers that acknowledged.
    std::size_t shutdown();

    [[nodiscard]] bool running() const noexcept { return running_; }
    [[nodiscard]] std::size_t worker_count() const noexcept;
    [[nodiscard]] const PoolStats& stats() const noexcept { return stats_; }

    /// Time of the latest heartbeat from a worker, if any arrived.
    [[nodiscard]] std::optional<Clock::time_point> last_heartbeat(std::size_t worker) const;

private:
    struct InFlight {
        std::size_t       item;
        std::uint32_t     attempts;
        std::size_t       worker;
        Clock::time_point deadline;
    };

    [[nodiscard]] std::size_t next_worker() noexcept;
    [[nodiscard]] Clock::duration timeout() const;
    void send(std::uint64_t request_id, const WorkItem& item, InFlight& flight);
    void record_heartbeat(const Message& msg);

    std::unique_ptr<WorkerTransport>              transport_;
    PoolOptions                                   options_;
    PoolStats                                     stats_;
    std::vector<std::optional<Clock::time_point>> heartbeats_;
    std::uint64_t                                 next_request_id_ = 1;
    std::size_t                                   cursor_          = 0;
    bool                                          running_         = false;
};

} // namespace birkhoff::comm
