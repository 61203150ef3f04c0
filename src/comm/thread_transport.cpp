/// @file src/comm/thread_transport.cpp
/// @brief Thread-per-worker transport: each worker owns an inbox and answers
///        through the shared outbox.

#include "birkhoff/worker_pool.hpp"
#include "birkhoff/log.hpp"

#include <fmt/format.h>

#include <cmath>
#include <exception>
#include <stdexcept>
#include <type_traits>
#include <variant>

namespace birkhoff::comm {

ThreadTransport::ThreadTransport(std::shared_ptr<const PotentialOracle> oracle,
                                 std::size_t workers)
    : oracle_(std::move(oracle)) {
    if (!oracle_) {
        throw std::invalid_argument("ThreadTransport: oracle must not be null");
    }
    if (workers == 0) {
        throw std::invalid_argument("ThreadTransport: need at least one worker");
    }
    inboxes_.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
        inboxes_.push_back(std::make_unique<Mailbox<Message>>());
    }
}

ThreadTransport::~ThreadTransport() {
    stop();
}

void ThreadTransport::start() {
    if (!threads_.empty()) return;
    threads_.reserve(inboxes_.size());
    for (std::size_t i = 0; i < inboxes_.size(); ++i) {
        threads_.emplace_back([this, i] { run_worker(i); });
    }
}

void ThreadTransport::post(std::size_t worker, Message msg) {
    if (worker >= inboxes_.size()) {
        throw std::out_of_range(fmt::format("ThreadTransport: no worker {}", worker));
    }
    if (!inboxes_[worker]->push(std::move(msg))) {
        SPDLOG_LOGGER_DEBUG(log::get(), "worker {} inbox closed, message dropped", worker);
    }
}

std::optional<Message> ThreadTransport::wait(Clock::time_point deadline) {
    return outbox_.pop_until(deadline);
}

void ThreadTransport::stop() {
    for (auto& inbox : inboxes_) {
        inbox->close();
    }
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
}

void ThreadTransport::run_worker(std::size_t worker_id) {
    outbox_.push(make_heartbeat(worker_id, steady_seconds()));

    while (auto msg = inboxes_[worker_id]->pop()) {
        if (msg->schema_version != SCHEMA_VERSION) {
            continue;
        }

        if (std::holds_alternative<ShutdownRequest>(msg->body)) {
            outbox_.push(make_heartbeat(worker_id, steady_seconds()));
            return;
        }

        const auto* req = std::get_if<EvaluateRequest>(&msg->body);
        if (req == nullptr) {
            continue;
        }

        try {
            PotentialValue pv = oracle_->evaluate(req->position);
            if (pv.gradient.size() != req->position.size()) {
                outbox_.push(make_error_report(
                    msg->request_id, worker_id,
                    fmt::format("gradient has {} components, position has {}",
                                pv.gradient.size(), req->position.size()),
                    req->attempt));
            } else if (!std::isfinite(pv.energy) || !pv.gradient.allFinite()) {
                outbox_.push(make_error_report(msg->request_id, worker_id,
                                               "oracle returned a non-finite value",
                                               req->attempt));
            } else {
                outbox_.push(make_evaluate_response(msg->request_id, pv, worker_id,
                                                    req->attempt));
            }
        } catch (const std::exception& e) {
            outbox_.push(make_error_report(msg->request_id, worker_id, e.what(), req->attempt));
        }
    }
}

} // namespace birkhoff::comm
