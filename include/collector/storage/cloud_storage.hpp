#pragma once

#include "collector/storage/object_store.hpp"
#include "collector/storage/storage_backend.hpp"

namespace collector::storage {

/**
 * @brief Object store backend
 *
 * Layout, with prefix "uploads" and files prefix "files":
 *   uploads/<id>/data   bytes received so far
 *   uploads/<id>/tmp    the chunk being appended
 *   files/<id>          finalized upload
 *
 * An append writes the chunk to tmp and composes [data, tmp] into data, so data
 * only ever grows by whole chunks.
 */
class CloudStorageBackend : public StorageBackend {
public:
    CloudStorageBackend(ObjectStorePtr store,
                        std::string uploads_prefix = "uploads",
                        std::string files_prefix = "files");

    collector::Result<std::uint64_t> store(const UploadIdentifier& identifier,
                                           const std::vector<std::uint8_t>& chunk,
                                           const ContentRange& range) override;

    collector::Result<std::uint64_t> bytes_stored(const UploadIdentifier& identifier) override;

    collector::Result<std::string> finalize(const UploadIdentifier& identifier) override;

    collector::Result<void> remove(const UploadIdentifier& identifier) override;

    collector::Result<std::size_t> cleanup(std::chrono::milliseconds expiration_age) override;

    const char* name() const override { return "google"; }

    std::string data_object(const UploadIdentifier& identifier) const;
    std::string chunk_object(const UploadIdentifier& identifier) const;
    std::string final_object(const UploadIdentifier& identifier) const;

private:
    ObjectStorePtr store_;
    std::string uploads_prefix_;
    std::string files_prefix_;
};

} // namespace collector::storage
