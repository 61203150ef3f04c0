#pragma once

/// @file include/birkhoff/mailbox.hpp
/// @brief Blocking FIFO used to pass messages between threads by value.
///
/// Producers `push`; consumers `pop` (blocking) or `pop_until` (bounded
/// wait). After `close()` pushes are dropped and consumers drain what is left,
/// then receive `nullopt`.

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace birkhoff {

template <typename T>
class Mailbox {
public:
    Mailbox() = default;
    Mailbox(const Mailbox&)            = delete;
    Mailbox& operator=(const Mailbox&) = delete;

    /// Enqueue a message. Returns false if the mailbox is closed.
    bool push(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return false;
            queue_.push_back(std::move(value));
        }
        cv_.notify_one();
        return true;
    }

    /// Block until a message is available or the mailbox is closed and empty.
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        return take_locked();
    }

    /// Block until a message is available or `deadline` passes.
    template <typename Clock, typename Duration>
    std::optional<T> pop_until(const std::chrono::time_point<Clock, Duration>& deadline) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_until(lock, deadline, [this] { return closed_ || !queue_.empty(); });
        return take_locked();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    std::optional<T> take_locked() {
        if (queue_.empty()) return std::nullopt;
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    mutable std::mutex      mutex_;
    std::condition_variable cv_;
    std::deque<T>           queue_;
    bool                    closed_ = false;
};

} // namespace birkhoff
