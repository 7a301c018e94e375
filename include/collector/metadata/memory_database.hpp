#pragma once

#include "collector/metadata/database.hpp"

#include <nlohmann/json.hpp>

#include <shared_mutex>
#include <unordered_map>

namespace collector::metadata {

/**
 * @brief Process-local document collection keyed by document id
 *
 * With enforce_unique_identity the identity check and the insert happen under
 * one write lock, so a second document for an identity is rejected with
 * DuplicateUpload.
 */
class InMemoryMetadataDatabase : public MetadataDatabase {
public:
    explicit InMemoryMetadataDatabase(bool enforce_unique_identity = true);

    using MetadataDatabase::exists;

    collector::Result<std::string> store_metadata(const UploadMetaData& metadata) override;

    collector::Result<bool> exists(const std::string& device_id,
                                   const std::string& measurement_id) override;

    collector::Result<bool> exists(const std::string& device_id,
                                   const std::string& measurement_id,
                                   const std::string& attachment_id) override;

    collector::Result<std::vector<MetadataDocument>> find(const UploadIdentity& identity) override;

    collector::Result<std::size_t> count() override;

private:
    std::size_t count_matches(const UploadIdentity& identity) const;
    collector::Result<bool> check(const UploadIdentity& identity);

    bool enforce_unique_identity_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, nlohmann::json> documents_;
};

} // namespace collector::metadata
