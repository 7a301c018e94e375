#include <gtest/gtest.h>
#include "collector/storage/local_storage.hpp"
#include "collector/storage/storage_builder.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

using collector::config::StorageConfig;
using collector::config::StorageType;
using collector::storage::LocalStorageBackend;
using collector::upload::ContentRange;

namespace {

class StorageBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() /
                ("collector_builder_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(root_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    fs::path root_;
};

} // namespace

TEST_F(StorageBuilderTest, LocalBackendComesWithItsCleanup) {
    StorageConfig config;
    config.type = StorageType::Local;
    config.local.uploads_folder = (root_ / "uploads").string();
    config.local.files_folder = (root_ / "files").string();

    auto setup = collector::storage::build_storage(config);
    ASSERT_TRUE(setup.is_ok()) << setup.error().message;
    ASSERT_TRUE(setup.value().backend);
    ASSERT_TRUE(setup.value().cleanup);
    EXPECT_STREQ(setup.value().backend->name(), "local");
    EXPECT_TRUE(fs::is_directory(root_ / "uploads"));
    EXPECT_TRUE(fs::is_directory(root_ / "files"));

    auto& backend = *setup.value().backend;
    ASSERT_TRUE(backend.store("stale", {1, 2, 3}, ContentRange{0, 2, 6}).is_ok());
    ASSERT_TRUE(backend.store("fresh", {1, 2, 3}, ContentRange{0, 2, 6}).is_ok());

    auto* local = dynamic_cast<LocalStorageBackend*>(setup.value().backend.get());
    ASSERT_NE(local, nullptr);
    fs::last_write_time(local->temporary_path("stale"), fs::file_time_type::clock::now() - 2h);

    auto removed = setup.value().cleanup(1h);
    ASSERT_TRUE(removed.is_ok()) << removed.error().message;
    EXPECT_EQ(removed.value(), 1u);
    EXPECT_FALSE(fs::exists(local->temporary_path("stale")));
    EXPECT_EQ(backend.bytes_stored("fresh").value(), 3u);
}

TEST_F(StorageBuilderTest, GoogleBackendIsBuiltWithoutContactingTheStore) {
    StorageConfig config;
    config.type = StorageType::Google;
    config.google.host = "storage.example.com";
    config.google.bucket_name = "measurements";

    auto setup = collector::storage::build_storage(config);
    ASSERT_TRUE(setup.is_ok()) << setup.error().message;
    EXPECT_STREQ(setup.value().backend->name(), "google");
    EXPECT_TRUE(setup.value().cleanup);
}

TEST_F(StorageBuilderTest, UnusableLocalFolderIsReported) {
    fs::create_directories(root_);
    {
        std::ofstream blocker(root_ / "not-a-folder");
        blocker << "x";
    }

    StorageConfig config;
    config.type = StorageType::Local;
    config.local.uploads_folder = (root_ / "not-a-folder" / "uploads").string();
    config.local.files_folder = (root_ / "files").string();

    auto setup = collector::storage::build_storage(config);
    ASSERT_TRUE(setup.is_error());
    EXPECT_EQ(setup.error().code, collector::ErrorCode::StorageFailure);
}
