#pragma once

#include "collector/upload/coordinator.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>

namespace collector::server {

/**
 * @brief Runs UploadCoordinator::sweep_expired every interval
 *
 * The timer lives on the event loop; the sweep itself is posted to the worker
 * pool since it touches storage. A sweep still running when the next tick fires
 * makes that tick a no-op.
 */
class CleanupScheduler {
public:
    CleanupScheduler(boost::asio::io_context& io_context,
                     boost::asio::thread_pool& workers,
                     upload::UploadCoordinator& coordinator,
                     std::chrono::milliseconds interval);

    void start();
    void stop();

    std::size_t runs() const { return runs_.load(); }

private:
    void schedule();
    void tick();

    boost::asio::steady_timer timer_;
    boost::asio::thread_pool& workers_;
    upload::UploadCoordinator& coordinator_;
    std::chrono::milliseconds interval_;
    std::atomic<bool> running_{false};
    std::atomic<bool> sweeping_{false};
    std::atomic<std::size_t> runs_{0};
};

} // namespace collector::server
