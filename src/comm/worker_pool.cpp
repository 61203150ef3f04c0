/// @file src/comm/worker_pool.cpp
/// @brief Request tagging, per-item deadlines, bounded retry and duplicate
///        discard for a dispatch round.

#include "birkhoff/worker_pool.hpp"
#include "birkhoff/errors.hpp"
#include "birkhoff/log.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>
#include <variant>

namespace birkhoff::comm {

// ─── InlineDispatcher ─────────────────────────────────────────────────────────

InlineDispatcher::InlineDispatcher(std::shared_ptr<const PotentialOracle> oracle)
    : oracle_(std::move(oracle)) {
    if (!oracle_) {
        throw std::invalid_argument("InlineDispatcher: oracle must not be null");
    }
}

std::vector<WorkResult> InlineDispatcher::dispatch(const std::vector<WorkItem>& items) {
    std::vector<WorkResult> out;
    out.reserve(items.size());
    for (const auto& item : items) {
        out.push_back(WorkResult{next_request_id_++, item.node_index,
                                 oracle_->evaluate(item.position)});
    }
    return out;
}

// ─── WorkerPool: lifecycle ────────────────────────────────────────────────────

WorkerPool::WorkerPool(std::unique_ptr<WorkerTransport> transport, PoolOptions options)
    : transport_(std::move(transport))
    , options_(options) {
    if (!transport_) {
        throw std::invalid_argument("WorkerPool: transport must not be null");
    }
    if (transport_->worker_count() == 0) {
        throw std::invalid_argument("WorkerPool: transport has no workers");
    }
    heartbeats_.assign(transport_->worker_count(), std::nullopt);
}

WorkerPool::WorkerPool(std::shared_ptr<const PotentialOracle> oracle,
                       std::size_t workers, PoolOptions options)
    : WorkerPool(std::make_unique<ThreadTransport>(std::move(oracle), workers), options) {}

WorkerPool::~WorkerPool() {
    if (running_) {
        shutdown();
    }
}

void WorkerPool::start() {
    if (running_) return;
    transport_->start();
    running_ = true;
    SPDLOG_LOGGER_DEBUG(log::get(), "worker pool started with {} worker(s)",
                        transport_->worker_count());
}

std::size_t WorkerPool::worker_count() const noexcept {
    return transport_->worker_count();
}

std::optional<Clock::time_point> WorkerPool::last_heartbeat(std::size_t worker) const {
    if (worker >= heartbeats_.size()) return std::nullopt;
    return heartbeats_[worker];
}

std::size_t WorkerPool::shutdown() {
    if (!running_) return 0;
    running_ = false;

    const std::size_t n = transport_->worker_count();
    const double requested_at = steady_seconds();
    for (std::size_t w = 0; w < n; ++w) {
        transport_->post(w, make_shutdown_request());
    }

    // A worker acknowledges with a heartbeat stamped after the request;
    // older heartbeats still queued from start-up do not count.
    std::vector<bool> acked(n, false);
    std::size_t acks = 0;
    const auto deadline = Clock::now()
        + std::chrono::duration_cast<Clock::duration>(options_.shutdown_timeout);
    while (acks < n) {
        auto msg = transport_->wait(deadline);
        if (!msg) break;
        const auto* hb = std::get_if<Heartbeat>(&msg->body);
        if (hb == nullptr) {
            ++stats_.discarded_messages;
            continue;
        }
        record_heartbeat(*msg);
        if (hb->worker_id < n && !acked[hb->worker_id] && hb->timestamp >= requested_at) {
            acked[hb->worker_id] = true;
            ++acks;
        }
    }

    if (acks < n) {
        SPDLOG_LOGGER_WARN(log::get(), "{} of {} worker(s) did not acknowledge shutdown",
                           n - acks, n);
    }
    transport_->stop();
    return acks;
}

// ─── WorkerPool: dispatch ─────────────────────────────────────────────────────

std::size_t WorkerPool::next_worker() noexcept {
    const std::size_t w = cursor_;
    cursor_ = (cursor_ + 1) % transport_->worker_count();
    return w;
}

Clock::duration WorkerPool::timeout() const {
    return std::chrono::duration_cast<Clock::duration>(options_.eval_timeout);
}

void WorkerPool::send(std::uint64_t request_id, const WorkItem& item, InFlight& flight) {
    transport_->post(flight.worker,
                     make_evaluate_request(request_id, item.node_index, item.position,
                                           flight.attempts));
    flight.deadline = Clock::now() + timeout();
    ++stats_.requests_sent;
}

void WorkerPool::record_heartbeat(const Message& msg) {
    const auto& hb = std::get<Heartbeat>(msg.body);
    ++stats_.heartbeats;
    if (hb.worker_id < heartbeats_.size()) {
        heartbeats_[hb.worker_id] = Clock::now();
    }
}

std::vector<WorkResult> WorkerPool::dispatch(const std::vector<WorkItem>& items) {
    if (!running_) {
        throw std::logic_error("WorkerPool::dispatch called before start()");
    }
    ++stats_.rounds;

    auto logger = log::get();
    std::vector<std::optional<WorkResult>> results(items.size());
    std::map<std::uint64_t, InFlight> pending;

    for (std::size_t i = 0; i < items.size(); ++i) {
        const std::uint64_t id = next_request_id_++;
        InFlight flight{i, 1, next_worker(), Clock::time_point{}};
        send(id, items[i], flight);
        pending.emplace(id, flight);
    }

    // Re-post to another worker, or give up once the retry budget is spent.
    auto retry_or_fail = [&](std::map<std::uint64_t, InFlight>::iterator it,
                             const std::string& reason) {
        InFlight& flight = it->second;
        if (flight.attempts > options_.retry_count) {
            throw WorkerFailure(it->first, flight.attempts, reason);
        }
        SPDLOG_LOGGER_WARN(logger, "request {} (node {}) attempt {} on worker {}: {}; retrying",
                           it->first, items[flight.item].node_index, flight.attempts,
                           flight.worker, reason);
        const std::size_t n = transport_->worker_count();
        flight.worker = n > 1 ? (flight.worker + 1) % n : flight.worker;
        ++flight.attempts;
        ++stats_.retries;
        send(it->first, items[flight.item], flight);
    };

    auto handle = [&](const Message& msg) {
        if (msg.schema_version != SCHEMA_VERSION) {
            ++stats_.discarded_messages;
            SPDLOG_LOGGER_DEBUG(logger, "discarding {}: schema version mismatch", describe(msg));
            return;
        }
        if (std::holds_alternative<Heartbeat>(msg.body)) {
            record_heartbeat(msg);
            return;
        }

        auto it = pending.find(msg.request_id);
        if (it == pending.end()) {
            ++stats_.discarded_messages;
            SPDLOG_LOGGER_DEBUG(logger, "discarding {}: request not pending", describe(msg));
            return;
        }

        // Any attempt may satisfy the item, but only the attempt in flight
        // may spend the retry budget.
        const std::uint32_t current = it->second.attempts;
        if (const auto* resp = std::get_if<EvaluateResponse>(&msg.body)) {
            const WorkItem& item = items[it->second.item];
            if (resp->gradient.size() != item.position.size()) {
                if (resp->attempt != current) {
                    ++stats_.discarded_messages;
                    SPDLOG_LOGGER_DEBUG(logger, "discarding {}: malformed answer to superseded "
                                                "attempt {}", describe(msg), resp->attempt);
                    return;
                }
                ++stats_.error_reports;
                retry_or_fail(it, "response gradient has the wrong dimension");
                return;
            }
            results[it->second.item] = WorkResult{
                it->first, item.node_index, PotentialValue{resp->potential, resp->gradient}};
            pending.erase(it);
        } else if (const auto* err = std::get_if<ErrorReport>(&msg.body)) {
            if (err->attempt != current) {
                ++stats_.discarded_messages;
                SPDLOG_LOGGER_DEBUG(logger, "discarding {}: error from superseded attempt {} "
                                            "(now on attempt {})", describe(msg), err->attempt,
                                    current);
                return;
            }
            ++stats_.error_reports;
            retry_or_fail(it, "worker reported: " + err->reason);
        } else {
            ++stats_.discarded_messages;
        }
    };

    while (!pending.empty()) {
        const auto earliest = std::min_element(
            pending.begin(), pending.end(),
            [](const auto& a, const auto& b) { return a.second.deadline < b.second.deadline; });

        if (auto msg = transport_->wait(earliest->second.deadline)) {
            handle(*msg);
        }

        // Every item whose deadline has passed is presumed lost.
        const auto now = Clock::now();
        for (auto it = pending.begin(); it != pending.end(); ++it) {
            if (it->second.deadline <= now) {
                ++stats_.timeouts;
                retry_or_fail(it, "timed out");
            }
        }
    }

    std::vector<WorkResult> out;
    out.reserve(items.size());
    for (auto& r : results) {
        out.push_back(std::move(*r));
    }
    return out;
}

} // namespace birkhoff::comm
