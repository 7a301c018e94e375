#include <gtest/gtest.h>
#include "collector/metadata/memory_database.hpp"

#include <thread>
#include <vector>

using namespace collector::metadata;
using collector::ErrorCode;

namespace {

UploadMetaData metadata_for(const std::string& device, const std::string& measurement,
                            std::optional<std::string> attachment = std::nullopt) {
    UploadMetaData metadata;
    metadata.identity = UploadIdentity{device, measurement, std::move(attachment)};
    metadata.user_id = "bob";
    metadata.filename = "files/" + device + "-" + measurement;
    metadata.content_range = {0, 9, 10};
    return metadata;
}

} // namespace

TEST(InMemoryMetadataDatabase, StoresAndFindsDocument) {
    InMemoryMetadataDatabase database;

    auto id = database.store_metadata(metadata_for("d1", "1"));
    ASSERT_TRUE(id.is_ok());

    EXPECT_TRUE(database.exists("d1", "1").value());
    EXPECT_FALSE(database.exists("d1", "2").value());
    EXPECT_FALSE(database.exists("d1", "1", "1").value());

    auto found = database.find(UploadIdentity{"d1", "1", std::nullopt});
    ASSERT_TRUE(found.is_ok());
    ASSERT_EQ(found.value().size(), 1u);
    EXPECT_EQ(found.value().front().id, id.value());
    EXPECT_EQ(found.value().front().metadata.filename, "files/d1-1");
}

TEST(InMemoryMetadataDatabase, AttachmentDoesNotShadowMeasurement) {
    InMemoryMetadataDatabase database;
    ASSERT_TRUE(database.store_metadata(metadata_for("d1", "1", "5")).is_ok());

    EXPECT_FALSE(database.exists("d1", "1").value());
    EXPECT_TRUE(database.exists("d1", "1", "5").value());
    EXPECT_TRUE(database.store_metadata(metadata_for("d1", "1")).is_ok());
    EXPECT_EQ(database.count().value(), 2u);
}

TEST(InMemoryMetadataDatabase, RejectsSecondDocumentForIdentity) {
    InMemoryMetadataDatabase database;
    ASSERT_TRUE(database.store_metadata(metadata_for("d1", "1")).is_ok());

    auto second = database.store_metadata(metadata_for("d1", "1"));
    ASSERT_TRUE(second.is_error());
    EXPECT_EQ(second.error().code, ErrorCode::DuplicateUpload);
    EXPECT_EQ(database.count().value(), 1u);
}

TEST(InMemoryMetadataDatabase, ReportsCorruptionWithoutEnforcement) {
    InMemoryMetadataDatabase database(false);
    ASSERT_TRUE(database.store_metadata(metadata_for("d1", "1")).is_ok());
    ASSERT_TRUE(database.store_metadata(metadata_for("d1", "1")).is_ok());

    auto exists = database.exists(UploadIdentity{"d1", "1", std::nullopt});
    ASSERT_TRUE(exists.is_error());
    EXPECT_EQ(exists.error().code, ErrorCode::CorruptedMetadataState);
}

TEST(InMemoryMetadataDatabase, ConcurrentStoresKeepOneDocument) {
    InMemoryMetadataDatabase database;

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&database] {
            auto result = database.store_metadata(metadata_for("d1", "1"));
            if (result.is_error()) {
                EXPECT_EQ(result.error().code, ErrorCode::DuplicateUpload);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(database.count().value(), 1u);
}
