#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace collector::pipeline {

using Payload = std::vector<std::uint8_t>;

/**
 * @brief FIFO of encoded descriptors between the ingestion path and the persistence worker
 *
 * Producers never block. After shutdown() no payload is accepted, but consumers
 * still drain whatever was queued before.
 */
class HandoffChannel {
public:
    HandoffChannel() = default;

    HandoffChannel(const HandoffChannel&) = delete;
    HandoffChannel& operator=(const HandoffChannel&) = delete;

    // False after shutdown().
    bool push(Payload payload) {
        {
            std::lock_guard lock(mutex_);
            if (shutdown_) {
                return false;
            }
            queue_.push_back(std::move(payload));
        }
        cv_.notify_one();
        return true;
    }

    std::optional<Payload> try_pop() {
        std::lock_guard lock(mutex_);
        return take();
    }

    // Blocks until a payload arrives; empty once shut down and drained.
    std::optional<Payload> pop() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty() || shutdown_; });
        return take();
    }

    template<typename Rep, typename Period>
    std::optional<Payload> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || shutdown_; });
        return take();
    }

    void shutdown() {
        {
            std::lock_guard lock(mutex_);
            shutdown_ = true;
        }
        cv_.notify_all();
    }

    bool is_shutdown() const {
        std::lock_guard lock(mutex_);
        return shutdown_;
    }

    std::size_t size() const {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

private:
    // Caller holds mutex_.
    std::optional<Payload> take() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        Payload payload = std::move(queue_.front());
        queue_.pop_front();
        return payload;
    }

    std::deque<Payload> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool shutdown_ = false;
};

} // namespace collector::pipeline
