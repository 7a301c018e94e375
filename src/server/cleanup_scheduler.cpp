#include "collector/server/cleanup_scheduler.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

namespace collector::server {

CleanupScheduler::CleanupScheduler(boost::asio::io_context& io_context,
                                   boost::asio::thread_pool& workers,
                                   upload::UploadCoordinator& coordinator,
                                   std::chrono::milliseconds interval)
    : timer_(io_context), workers_(workers), coordinator_(coordinator), interval_(interval) {}

void CleanupScheduler::start() {
    if (running_.exchange(true)) {
        return;
    }
    spdlog::info("Cleaning up expired uploads every {} ms", interval_.count());
    schedule();
}

void CleanupScheduler::stop() {
    running_ = false;
    timer_.cancel();
}

void CleanupScheduler::schedule() {
    timer_.expires_after(interval_);
    timer_.async_wait([this](boost::system::error_code ec) {
        if (ec || !running_) {
            return;
        }
        tick();
        schedule();
    });
}

void CleanupScheduler::tick() {
    if (sweeping_.exchange(true)) {
        spdlog::debug("Previous cleanup still running, skipping");
        return;
    }
    boost::asio::post(workers_, [this]() {
        auto swept = coordinator_.sweep_expired();
        if (swept.is_error()) {
            spdlog::warn("Cleanup failed: {}", describe(swept.error()));
        }
        ++runs_;
        sweeping_ = false;
    });
}

} // namespace collector::server
