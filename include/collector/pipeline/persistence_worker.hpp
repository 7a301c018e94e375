#pragma once

#include "collector/codec/descriptor.hpp"
#include "collector/pipeline/handoff_channel.hpp"

#include <atomic>
#include <functional>
#include <thread>

namespace collector::pipeline {

/**
 * @brief Background consumer of the handoff channel
 *
 * Decodes each payload and passes the descriptor to the sink. Undecodable
 * payloads are logged and dropped; a throwing sink is logged as well, and the
 * worker keeps running in both cases.
 */
class PersistenceWorker {
public:
    using Sink = std::function<void(const codec::CompletedUploadDescriptor&)>;

    PersistenceWorker(HandoffChannel& channel, Sink sink);
    ~PersistenceWorker();

    PersistenceWorker(const PersistenceWorker&) = delete;
    PersistenceWorker& operator=(const PersistenceWorker&) = delete;

    void start();

    // Shuts the channel down, drains what is queued and joins the thread.
    void stop();

    bool is_running() const { return running_.load(); }
    std::size_t processed() const { return processed_.load(); }
    std::size_t rejected() const { return rejected_.load(); }

private:
    void run();
    void handle(const Payload& payload);

    HandoffChannel& channel_;
    Sink sink_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<std::size_t> processed_{0};
    std::atomic<std::size_t> rejected_{0};
};

} // namespace collector::pipeline
