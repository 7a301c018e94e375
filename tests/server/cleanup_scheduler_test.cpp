#include <gtest/gtest.h>
#include "collector/events/event_bus.hpp"
#include "collector/events/events.hpp"
#include "collector/metadata/memory_database.hpp"
#include "collector/server/cleanup_scheduler.hpp"
#include "collector/storage/local_storage.hpp"

#include <boost/asio/post.hpp>

#include <atomic>
#include <filesystem>
#include <future>
#include <thread>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

using collector::events::EventBus;
using collector::events::UploadsExpiredEvent;
using collector::server::CleanupScheduler;
using collector::upload::ChunkRequest;
using collector::upload::ContentRange;
using collector::upload::UploadCoordinator;
using collector::upload::UploadSessionStore;

namespace {

class CleanupSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() /
                ("collector_scheduler_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(root_);
        storage_ = std::make_shared<collector::storage::LocalStorageBackend>(root_ / "uploads", root_ / "files");
        ASSERT_TRUE(storage_->initialize().is_ok());

        sessions_ = std::make_unique<UploadSessionStore>(10min, [this] {
            return std::chrono::steady_clock::time_point{} + std::chrono::minutes(offset_minutes_.load());
        });
        coordinator_ = std::make_unique<UploadCoordinator>(
            *sessions_, storage_,
            [this](std::chrono::milliseconds age) { return storage_->cleanup(age); },
            std::make_shared<collector::metadata::InMemoryMetadataDatabase>(true),
            handoff_, bus_, 1024);
    }

    void TearDown() override {
        coordinator_.reset();
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    template<typename Predicate>
    bool wait_until(Predicate predicate) {
        const auto deadline = std::chrono::steady_clock::now() + 5s;
        while (!predicate()) {
            if (std::chrono::steady_clock::now() > deadline) {
                return false;
            }
            std::this_thread::sleep_for(5ms);
        }
        return true;
    }

    // The timer belongs to the event loop, so stop() runs there too.
    static void stop_on_loop(boost::asio::io_context& io_context, CleanupScheduler& scheduler) {
        std::promise<void> stopped;
        boost::asio::post(io_context, [&] {
            scheduler.stop();
            stopped.set_value();
        });
        stopped.get_future().wait();
    }

    fs::path root_;
    std::atomic<int> offset_minutes_{60};
    std::shared_ptr<collector::storage::LocalStorageBackend> storage_;
    std::unique_ptr<UploadSessionStore> sessions_;
    collector::pipeline::HandoffChannel handoff_;
    EventBus bus_;
    std::unique_ptr<UploadCoordinator> coordinator_;
};

} // namespace

TEST_F(CleanupSchedulerTest, SweepsExpiredSessionsPeriodically) {
    ChunkRequest request;
    request.identifier = "idle";
    request.metadata.identity = {"device-1", "42", std::nullopt};
    request.metadata.user_id = "erin";
    request.metadata.device_type = "Pixel 7";
    request.metadata.os_version = "Android 14";
    request.metadata.app_version = "4.2.0";
    request.metadata.format_version = collector::upload::kCurrentFormatVersion;
    request.range = ContentRange{0, 3, 8};
    request.payload = {1, 2, 3, 4};
    ASSERT_TRUE(coordinator_->accept_chunk(request).is_ok());
    ASSERT_TRUE(fs::exists(storage_->temporary_path("idle")));

    std::atomic<std::size_t> expired{0};
    bus_.subscribe<UploadsExpiredEvent>([&expired](const UploadsExpiredEvent& event) {
        expired += event.sessions_removed;
    });

    offset_minutes_ += 30;

    boost::asio::io_context io_context;
    boost::asio::thread_pool workers(1);
    CleanupScheduler scheduler(io_context, workers, *coordinator_, 20ms);
    scheduler.start();
    std::thread loop([&io_context] { io_context.run(); });

    EXPECT_TRUE(wait_until([&] { return scheduler.runs() >= 2; }));
    EXPECT_EQ(expired.load(), 1u);
    EXPECT_FALSE(fs::exists(storage_->temporary_path("idle")));
    EXPECT_EQ(sessions_->get("idle").error().code, collector::ErrorCode::SessionExpired);

    stop_on_loop(io_context, scheduler);
    workers.join();
    io_context.stop();
    loop.join();
}

TEST_F(CleanupSchedulerTest, StopPreventsFurtherSweeps) {
    boost::asio::io_context io_context;
    boost::asio::thread_pool workers(1);
    CleanupScheduler scheduler(io_context, workers, *coordinator_, 10ms);
    scheduler.start();
    std::thread loop([&io_context] { io_context.run(); });

    EXPECT_TRUE(wait_until([&] { return scheduler.runs() >= 1; }));
    stop_on_loop(io_context, scheduler);
    workers.join();
    const auto runs = scheduler.runs();
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(scheduler.runs(), runs);

    io_context.stop();
    loop.join();
}
