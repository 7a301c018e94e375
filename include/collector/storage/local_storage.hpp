#pragma once

#include "collector/storage/storage_backend.hpp"

#include <filesystem>

namespace collector::storage {

/**
 * @brief Filesystem backend: one append-only file per upload identifier
 *
 * Temporary files live in the uploads folder, finalized uploads are renamed into
 * the files folder. Appends use write(2) followed by fsync(2); a failed or short
 * write truncates the file back to the last committed length.
 */
class LocalStorageBackend : public StorageBackend {
public:
    LocalStorageBackend(std::filesystem::path uploads_folder, std::filesystem::path files_folder);

    // Creates both folders when missing.
    collector::Result<void> initialize();

    collector::Result<std::uint64_t> store(const UploadIdentifier& identifier,
                                           const std::vector<std::uint8_t>& chunk,
                                           const ContentRange& range) override;

    collector::Result<std::uint64_t> bytes_stored(const UploadIdentifier& identifier) override;

    collector::Result<std::string> finalize(const UploadIdentifier& identifier) override;

    collector::Result<void> remove(const UploadIdentifier& identifier) override;

    collector::Result<std::size_t> cleanup(std::chrono::milliseconds expiration_age) override;

    const char* name() const override { return "local"; }

    std::filesystem::path temporary_path(const UploadIdentifier& identifier) const;
    std::filesystem::path final_path(const UploadIdentifier& identifier) const;

private:
    std::filesystem::path uploads_folder_;
    std::filesystem::path files_folder_;
};

} // namespace collector::storage
