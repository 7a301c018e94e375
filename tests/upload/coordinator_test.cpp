#include "collector/codec/descriptor_codec.hpp"
#include "collector/events/event_bus.hpp"
#include "collector/events/events.hpp"
#include "collector/metadata/memory_database.hpp"
#include "collector/storage/local_storage.hpp"
#include "collector/upload/coordinator.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <functional>
#include <future>
#include <random>
#include <thread>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

using collector::ErrorCode;
using collector::codec::DescriptorCodec;
using collector::codec::FileType;
using collector::events::EventBus;
using collector::events::UploadCompletedEvent;
using collector::events::UploadRejectedEvent;
using collector::metadata::InMemoryMetadataDatabase;
using collector::pipeline::HandoffChannel;
using collector::storage::LocalStorageBackend;
using collector::storage::StorageBackend;
using collector::upload::ChunkRequest;
using collector::upload::ChunkStatus;
using collector::upload::ContentRange;
using collector::upload::SessionState;
using collector::upload::UploadCoordinator;
using collector::upload::UploadIdentity;
using collector::upload::UploadMetaData;
using collector::upload::UploadProgress;
using collector::upload::UploadSessionStore;

namespace {

// Delegates to a real backend, failing selected calls on request.
class ScriptedStorage : public StorageBackend {
public:
    explicit ScriptedStorage(std::shared_ptr<StorageBackend> inner) : inner_(std::move(inner)) {}

    collector::Result<std::uint64_t> store(const std::string& id, const std::vector<std::uint8_t>& chunk,
                                           const ContentRange& range) override {
        if (fail_next_store) {
            fail_next_store = false;
            return collector::Err<std::uint64_t>(ErrorCode::StorageFailure, "injected store failure");
        }
        if (before_store) {
            before_store(id);
        }
        return inner_->store(id, chunk, range);
    }

    collector::Result<std::uint64_t> bytes_stored(const std::string& id) override {
        return inner_->bytes_stored(id);
    }

    collector::Result<std::string> finalize(const std::string& id) override {
        if (fail_next_finalize) {
            fail_next_finalize = false;
            return collector::Err<std::string>(ErrorCode::StorageFailure, "injected finalize failure");
        }
        return inner_->finalize(id);
    }

    collector::Result<void> remove(const std::string& id) override { return inner_->remove(id); }

    collector::Result<std::size_t> cleanup(std::chrono::milliseconds age) override {
        return inner_->cleanup(age);
    }

    const char* name() const override { return "scripted"; }

    bool fail_next_store = false;
    bool fail_next_finalize = false;
    std::function<void(const std::string&)> before_store;

private:
    std::shared_ptr<StorageBackend> inner_;
};

std::vector<std::uint8_t> random_bytes(std::size_t size, unsigned seed = 7) {
    std::mt19937 engine(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    std::vector<std::uint8_t> data(size);
    for (auto& byte : data) {
        byte = static_cast<std::uint8_t>(dist(engine));
    }
    return data;
}

UploadMetaData measurement_metadata(const std::string& device, const std::string& measurement) {
    UploadMetaData metadata;
    metadata.identity = UploadIdentity{device, measurement, std::nullopt};
    metadata.user_id = "alice";
    metadata.device_type = "Pixel 7";
    metadata.os_version = "Android 14";
    metadata.app_version = "4.2.0";
    metadata.format_version = collector::upload::kCurrentFormatVersion;
    return metadata;
}

class CoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() /
                ("collector_coordinator_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                 "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(root_);
        local_ = std::make_shared<LocalStorageBackend>(root_ / "uploads", root_ / "files");
        ASSERT_TRUE(local_->initialize().is_ok());
        storage_ = std::make_shared<ScriptedStorage>(local_);
        build(true);
    }

    void TearDown() override {
        coordinator_.reset();
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void build(bool enforce_unique) {
        coordinator_.reset();
        database_ = std::make_shared<InMemoryMetadataDatabase>(enforce_unique);
        sessions_ = std::make_unique<UploadSessionStore>(10min, [this] { return now_; });
        coordinator_ = std::make_unique<UploadCoordinator>(
            *sessions_, storage_,
            [this](std::chrono::milliseconds age) { return storage_->cleanup(age); },
            database_, handoff_, bus_, 1024 * 1024);
    }

    ChunkRequest chunk(const std::string& id, const UploadMetaData& metadata,
                       const std::vector<std::uint8_t>& data, std::uint64_t start, std::uint64_t end) {
        ChunkRequest request;
        request.identifier = id;
        request.metadata = metadata;
        request.range = ContentRange{start, end, data.size()};
        request.payload.assign(data.begin() + static_cast<std::ptrdiff_t>(start),
                               data.begin() + static_cast<std::ptrdiff_t>(end + 1));
        return request;
    }

    collector::Result<collector::upload::ChunkOutcome> upload_whole(const std::string& id,
                                                                    const UploadMetaData& metadata,
                                                                    const std::vector<std::uint8_t>& data) {
        return coordinator_->accept_chunk(chunk(id, metadata, data, 0, data.size() - 1));
    }

    fs::path root_;
    std::chrono::steady_clock::time_point now_{std::chrono::steady_clock::time_point{} + 1h};
    std::shared_ptr<LocalStorageBackend> local_;
    std::shared_ptr<ScriptedStorage> storage_;
    std::shared_ptr<InMemoryMetadataDatabase> database_;
    std::unique_ptr<UploadSessionStore> sessions_;
    HandoffChannel handoff_;
    EventBus bus_;
    std::unique_ptr<UploadCoordinator> coordinator_;
};

} // namespace

TEST_F(CoordinatorTest, TwoChunkUploadCompletesAndHandsOffDescriptor) {
    const auto data = random_bytes(1500);
    const auto metadata = measurement_metadata("device-1", "42");

    std::size_t completed = 0;
    bus_.subscribe<UploadCompletedEvent>([&](const UploadCompletedEvent& e) {
        ++completed;
        EXPECT_EQ(e.total_length, 1500u);
    });

    auto first = coordinator_->accept_chunk(chunk("U1", metadata, data, 0, 999));
    ASSERT_TRUE(first.is_ok()) << first.error().message;
    EXPECT_EQ(first.value().status, ChunkStatus::Incomplete);
    EXPECT_EQ(first.value().bytes_stored, 1000u);
    EXPECT_EQ(sessions_->get("U1").value().state, SessionState::Receiving);

    auto second = coordinator_->accept_chunk(chunk("U1", metadata, data, 1000, 1499));
    ASSERT_TRUE(second.is_ok()) << second.error().message;
    EXPECT_EQ(second.value().status, ChunkStatus::Complete);
    EXPECT_EQ(second.value().bytes_stored, 1500u);
    EXPECT_FALSE(second.value().document_id.empty());

    EXPECT_EQ(completed, 1u);
    EXPECT_EQ(database_->count().value(), 1u);
    EXPECT_EQ(sessions_->size(), 0u);
    EXPECT_EQ(fs::file_size(local_->final_path("U1")), 1500u);

    auto documents = database_->find(metadata.identity);
    ASSERT_TRUE(documents.is_ok());
    ASSERT_EQ(documents.value().size(), 1u);
    EXPECT_EQ(documents.value().front().metadata.filename, local_->final_path("U1").string());
    EXPECT_EQ(documents.value().front().length, 1500u);

    auto payload = handoff_.try_pop();
    ASSERT_TRUE(payload.has_value());
    auto descriptor = DescriptorCodec::decode(*payload);
    ASSERT_TRUE(descriptor.is_ok());
    EXPECT_EQ(descriptor.value().device_id, "device-1");
    EXPECT_EQ(descriptor.value().measurement_id, "42");
    EXPECT_EQ(descriptor.value().device_type, "Pixel 7");
    ASSERT_EQ(descriptor.value().files.size(), 1u);
    EXPECT_EQ(descriptor.value().files.begin()->type, FileType::Measurement);
}

TEST_F(CoordinatorTest, SecondCompletionOfSameIdentityIsDuplicate) {
    const auto data = random_bytes(1500);
    const auto metadata = measurement_metadata("device-1", "42");
    ASSERT_TRUE(upload_whole("U1", metadata, data).is_ok());

    auto again = coordinator_->accept_chunk(chunk("U2", metadata, data, 0, 999));
    ASSERT_TRUE(again.is_ok());
    auto duplicate = coordinator_->accept_chunk(chunk("U2", metadata, data, 1000, 1499));
    ASSERT_TRUE(duplicate.is_error());
    EXPECT_EQ(duplicate.error().code, ErrorCode::DuplicateUpload);

    EXPECT_EQ(database_->count().value(), 1u);
    EXPECT_EQ(storage_->bytes_stored("U2").value(), 0u);
    EXPECT_FALSE(fs::exists(local_->temporary_path("U2")));
    EXPECT_TRUE(fs::exists(local_->final_path("U1")));
    EXPECT_EQ(sessions_->size(), 0u);
    EXPECT_EQ(handoff_.size(), 1u);
}

TEST_F(CoordinatorTest, NonContiguousChunkLeavesProgressUntouched) {
    const auto data = random_bytes(1500);
    const auto metadata = measurement_metadata("device-1", "42");
    ASSERT_TRUE(coordinator_->accept_chunk(chunk("U1", metadata, data, 0, 999)).is_ok());

    for (auto start : {std::uint64_t{900}, std::uint64_t{1100}}) {
        auto rejected = coordinator_->accept_chunk(chunk("U1", metadata, data, start, 1499));
        ASSERT_TRUE(rejected.is_error());
        EXPECT_EQ(rejected.error().code, ErrorCode::ContentRangeMismatch);
        EXPECT_EQ(coordinator_->range_state("U1")->bytes_stored, 1000u);
        EXPECT_EQ(storage_->bytes_stored("U1").value(), 1000u);
    }

    auto resumed = coordinator_->accept_chunk(chunk("U1", metadata, data, 1000, 1499));
    ASSERT_TRUE(resumed.is_ok());
    EXPECT_EQ(resumed.value().status, ChunkStatus::Complete);
}

TEST_F(CoordinatorTest, PayloadSizeMismatchIsReported) {
    const auto data = random_bytes(100);
    auto request = chunk("U1", measurement_metadata("device-1", "42"), data, 0, 99);
    request.payload.pop_back();

    auto result = coordinator_->accept_chunk(request);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::ContentRangeNotMatchingFileSize);
    EXPECT_EQ(sessions_->size(), 0u);
}

TEST_F(CoordinatorTest, CorruptedMetadataIsFatalAndKeepsBytes) {
    build(false);
    auto metadata = measurement_metadata("device-1", "42");
    metadata.filename = "elsewhere";
    ASSERT_TRUE(database_->store_metadata(metadata).is_ok());
    ASSERT_TRUE(database_->store_metadata(metadata).is_ok());

    std::vector<ErrorCode> rejections;
    bus_.subscribe<UploadRejectedEvent>([&](const UploadRejectedEvent& e) { rejections.push_back(e.error.code); });

    const auto data = random_bytes(64);
    auto result = upload_whole("U1", measurement_metadata("device-1", "42"), data);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::CorruptedMetadataState);
    EXPECT_FALSE(collector::is_retryable(result.error().code));

    ASSERT_EQ(rejections.size(), 1u);
    EXPECT_EQ(rejections.front(), ErrorCode::CorruptedMetadataState);
    EXPECT_EQ(database_->count().value(), 2u);
    EXPECT_EQ(storage_->bytes_stored("U1").value(), 64u);
    EXPECT_EQ(handoff_.size(), 0u);
}

TEST_F(CoordinatorTest, IdleSessionExpiresAndIdentifierStartsOver) {
    const auto data = random_bytes(1500);
    const auto metadata = measurement_metadata("device-1", "42");
    ASSERT_TRUE(coordinator_->accept_chunk(chunk("U1", metadata, data, 0, 999)).is_ok());

    now_ += 11min;
    auto swept = coordinator_->sweep_expired();
    ASSERT_TRUE(swept.is_ok());
    EXPECT_EQ(swept.value(), 1u);
    EXPECT_EQ(sessions_->size(), 0u);
    EXPECT_FALSE(fs::exists(local_->temporary_path("U1")));

    auto late = coordinator_->accept_chunk(chunk("U1", metadata, data, 1000, 1499));
    ASSERT_TRUE(late.is_error());
    EXPECT_EQ(late.error().code, ErrorCode::SessionExpired);

    auto restart = coordinator_->accept_chunk(chunk("U1", metadata, data, 0, 999));
    ASSERT_TRUE(restart.is_ok());
    EXPECT_EQ(restart.value().bytes_stored, 1000u);
}

TEST_F(CoordinatorTest, ActiveSessionSurvivesSweep) {
    const auto data = random_bytes(1500);
    const auto metadata = measurement_metadata("device-1", "42");
    ASSERT_TRUE(coordinator_->accept_chunk(chunk("U1", metadata, data, 0, 999)).is_ok());

    now_ += 5min;
    auto swept = coordinator_->sweep_expired();
    ASSERT_TRUE(swept.is_ok());
    EXPECT_EQ(swept.value(), 0u);
    EXPECT_EQ(coordinator_->range_state("U1")->bytes_stored, 1000u);
}

TEST_F(CoordinatorTest, FailedStoreIsRetryableWithSameChunk) {
    const auto data = random_bytes(1500);
    const auto metadata = measurement_metadata("device-1", "42");
    ASSERT_TRUE(coordinator_->accept_chunk(chunk("U1", metadata, data, 0, 999)).is_ok());

    storage_->fail_next_store = true;
    auto failed = coordinator_->accept_chunk(chunk("U1", metadata, data, 1000, 1499));
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error().code, ErrorCode::StorageFailure);
    EXPECT_TRUE(collector::is_retryable(failed.error().code));
    EXPECT_EQ(coordinator_->range_state("U1")->bytes_stored, 1000u);

    auto retried = coordinator_->accept_chunk(chunk("U1", metadata, data, 1000, 1499));
    ASSERT_TRUE(retried.is_ok());
    EXPECT_EQ(retried.value().status, ChunkStatus::Complete);
}

TEST_F(CoordinatorTest, FailedFinalizationIsRetriedByResendingLastChunk) {
    const auto data = random_bytes(1500);
    const auto metadata = measurement_metadata("device-1", "42");
    ASSERT_TRUE(coordinator_->accept_chunk(chunk("U1", metadata, data, 0, 999)).is_ok());

    storage_->fail_next_finalize = true;
    auto failed = coordinator_->accept_chunk(chunk("U1", metadata, data, 1000, 1499));
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error().code, ErrorCode::StorageFailure);

    auto session = sessions_->get("U1");
    ASSERT_TRUE(session.is_ok());
    EXPECT_EQ(session.value().state, SessionState::Receiving);
    EXPECT_EQ(session.value().bytes_stored, 1500u);
    EXPECT_EQ(database_->count().value(), 0u);

    auto retried = coordinator_->accept_chunk(chunk("U1", metadata, data, 1000, 1499));
    ASSERT_TRUE(retried.is_ok()) << retried.error().message;
    EXPECT_EQ(retried.value().status, ChunkStatus::Complete);
    EXPECT_EQ(database_->count().value(), 1u);
    EXPECT_EQ(fs::file_size(local_->final_path("U1")), 1500u);
}

TEST_F(CoordinatorTest, SessionIsBoundToItsIdentity) {
    const auto data = random_bytes(1500);
    ASSERT_TRUE(coordinator_->accept_chunk(chunk("U1", measurement_metadata("device-1", "42"), data, 0, 999)).is_ok());

    auto hijack = coordinator_->accept_chunk(chunk("U1", measurement_metadata("device-2", "42"), data, 1000, 1499));
    ASSERT_TRUE(hijack.is_error());
    EXPECT_EQ(hijack.error().code, ErrorCode::InvalidRequest);
    EXPECT_EQ(coordinator_->range_state("U1")->bytes_stored, 1000u);
}

TEST_F(CoordinatorTest, RejectsMalformedIdentifiersAndMetadata) {
    const auto data = random_bytes(10);

    auto traversal = upload_whole("../escape", measurement_metadata("device-1", "42"), data);
    ASSERT_TRUE(traversal.is_error());
    EXPECT_EQ(traversal.error().code, ErrorCode::InvalidRequest);

    auto anonymous = measurement_metadata("device-1", "42");
    anonymous.user_id.clear();
    EXPECT_EQ(upload_whole("U1", anonymous, data).error().code, ErrorCode::Unauthorized);

    auto deprecated = measurement_metadata("device-1", "42");
    deprecated.format_version = 2;
    EXPECT_EQ(upload_whole("U1", deprecated, data).error().code, ErrorCode::InvalidRequest);

    auto overlong = measurement_metadata("device-1", "42");
    overlong.device_type = std::string(collector::upload::kMaxGenericFieldLength + 1, 'x');
    EXPECT_EQ(upload_whole("U1", overlong, data).error().code, ErrorCode::InvalidRequest);

    EXPECT_EQ(sessions_->size(), 0u);
}

TEST_F(CoordinatorTest, RejectsUploadsAboveLimit) {
    ChunkRequest request;
    request.identifier = "U1";
    request.metadata = measurement_metadata("device-1", "42");
    request.range = ContentRange{0, 0, 2 * 1024 * 1024};
    request.payload = {1};

    auto result = coordinator_->accept_chunk(request);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::PayloadTooLarge);
}

TEST_F(CoordinatorTest, PreRequestChecksForExistingUpload) {
    const auto metadata = measurement_metadata("device-1", "42");

    auto identifier = coordinator_->pre_request(metadata, 1500);
    ASSERT_TRUE(identifier.is_ok());
    EXPECT_TRUE(collector::upload::is_valid_identifier(identifier.value()));
    EXPECT_NE(identifier.value(), coordinator_->pre_request(metadata, 1500).value());

    EXPECT_EQ(coordinator_->pre_request(metadata, 4 * 1024 * 1024).error().code, ErrorCode::PayloadTooLarge);
    EXPECT_EQ(coordinator_->pre_request(metadata, 0).error().code, ErrorCode::InvalidRequest);

    ASSERT_TRUE(upload_whole(identifier.value(), metadata, random_bytes(1500)).is_ok());
    EXPECT_EQ(coordinator_->pre_request(metadata, 1500).error().code, ErrorCode::DuplicateUpload);
}

TEST_F(CoordinatorTest, StatusReflectsProgress) {
    const auto data = random_bytes(1500);
    const auto metadata = measurement_metadata("device-1", "42");

    auto nothing = coordinator_->status("U1", metadata.identity);
    ASSERT_TRUE(nothing.is_ok());
    EXPECT_EQ(nothing.value().progress, UploadProgress::NothingReceived);

    ASSERT_TRUE(coordinator_->accept_chunk(chunk("U1", metadata, data, 0, 999)).is_ok());
    auto partial = coordinator_->status("U1", metadata.identity);
    ASSERT_TRUE(partial.is_ok());
    EXPECT_EQ(partial.value().progress, UploadProgress::Partial);
    EXPECT_EQ(partial.value().bytes_stored, 1000u);

    ASSERT_TRUE(coordinator_->accept_chunk(chunk("U1", metadata, data, 1000, 1499)).is_ok());
    EXPECT_EQ(coordinator_->status("U1", metadata.identity).value().progress, UploadProgress::AlreadyStored);
}

TEST_F(CoordinatorTest, StatusOfForeignSessionIsRefused) {
    const auto data = random_bytes(1500);
    const auto owner = measurement_metadata("device-1", "42");
    ASSERT_TRUE(coordinator_->accept_chunk(chunk("U1", owner, data, 0, 999)).is_ok());

    auto other_measurement = coordinator_->status("U1", measurement_metadata("device-1", "43").identity);
    ASSERT_TRUE(other_measurement.is_error());
    EXPECT_EQ(other_measurement.error().code, ErrorCode::InvalidRequest);

    auto other_device = coordinator_->status("U1", measurement_metadata("device-2", "42").identity);
    ASSERT_TRUE(other_device.is_error());
    EXPECT_EQ(other_device.error().code, ErrorCode::InvalidRequest);

    auto own = coordinator_->status("U1", owner.identity);
    ASSERT_TRUE(own.is_ok());
    EXPECT_EQ(own.value().bytes_stored, 1000u);
}

TEST_F(CoordinatorTest, AttachmentIsIndependentOfItsMeasurement) {
    const auto data = random_bytes(200);
    const auto measurement = measurement_metadata("device-1", "42");
    ASSERT_TRUE(upload_whole("M1", measurement, data).is_ok());
    ASSERT_TRUE(handoff_.try_pop().has_value());

    auto attachment = measurement_metadata("device-1", "42");
    attachment.identity.attachment_id = "7";
    attachment.attachment_counts = collector::upload::AttachmentCounts{0, 3, 1, 4096};

    auto result = upload_whole("A1", attachment, data);
    ASSERT_TRUE(result.is_ok()) << result.error().message;
    EXPECT_EQ(database_->count().value(), 2u);

    auto payload = handoff_.try_pop();
    ASSERT_TRUE(payload.has_value());
    auto descriptor = DescriptorCodec::decode(*payload);
    ASSERT_TRUE(descriptor.is_ok());
    EXPECT_EQ(descriptor.value().files.begin()->type, FileType::Video);

    EXPECT_EQ(upload_whole("A2", attachment, data).error().code, ErrorCode::DuplicateUpload);
}

TEST_F(CoordinatorTest, ConcurrentCompletionsStoreOneDocument) {
    const auto data = random_bytes(512);
    const auto metadata = measurement_metadata("device-1", "42");

    std::atomic<int> completed{0};
    std::atomic<int> duplicates{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 6; ++i) {
        threads.emplace_back([&, i] {
            auto result = upload_whole("C" + std::to_string(i), metadata, data);
            if (result.is_ok()) {
                ++completed;
            } else if (result.error().code == ErrorCode::DuplicateUpload) {
                ++duplicates;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(completed.load(), 1);
    EXPECT_EQ(duplicates.load(), 5);
    EXPECT_EQ(database_->count().value(), 1u);
}

TEST_F(CoordinatorTest, BusyUploadDoesNotBlockOthers) {
    const auto slow_data = random_bytes(300, 1);
    const auto fast_data = random_bytes(300, 2);
    const auto slow = measurement_metadata("device-1", "42");
    const auto fast = measurement_metadata("device-2", "43");

    std::promise<void> entered;
    std::promise<void> release;
    auto released = release.get_future().share();
    storage_->before_store = [&](const std::string& id) {
        if (id == "SLOW") {
            entered.set_value();
            released.wait();
        }
    };

    auto pending = std::async(std::launch::async, [&] { return upload_whole("SLOW", slow, slow_data); });
    entered.get_future().wait();

    auto resubmitted = upload_whole("SLOW", slow, slow_data);
    ASSERT_TRUE(resubmitted.is_error());
    EXPECT_EQ(resubmitted.error().code, ErrorCode::StorageFailure);
    EXPECT_TRUE(collector::is_retryable(resubmitted.error().code));

    auto other = upload_whole("FAST", fast, fast_data);
    ASSERT_TRUE(other.is_ok()) << other.error().message;
    EXPECT_EQ(other.value().status, ChunkStatus::Complete);

    auto swept = coordinator_->sweep_expired();
    ASSERT_TRUE(swept.is_ok());
    EXPECT_EQ(swept.value(), 0u);

    release.set_value();
    auto finished = pending.get();
    ASSERT_TRUE(finished.is_ok()) << finished.error().message;
    EXPECT_EQ(finished.value().status, ChunkStatus::Complete);
    EXPECT_EQ(database_->count().value(), 2u);
}
