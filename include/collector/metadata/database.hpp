#pragma once

#include "collector/metadata/document.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace collector::metadata {

/*
  Durable store of one document per finished measurement or attachment.

  exists() reports CorruptedMetadataState when more than one document matches,
  since that means the dedup invariant was broken by an earlier write.
  Documents are append-only.
*/
class MetadataDatabase {
public:
    virtual ~MetadataDatabase() = default;

    // Returns the id of the written document.
    virtual collector::Result<std::string> store_metadata(const UploadMetaData& metadata) = 0;

    virtual collector::Result<bool> exists(const std::string& device_id,
                                           const std::string& measurement_id) = 0;

    virtual collector::Result<bool> exists(const std::string& device_id,
                                           const std::string& measurement_id,
                                           const std::string& attachment_id) = 0;

    virtual collector::Result<std::vector<MetadataDocument>> find(const UploadIdentity& identity) = 0;

    virtual collector::Result<std::size_t> count() = 0;

    collector::Result<bool> exists(const UploadIdentity& identity) {
        if (identity.attachment_id) {
            return exists(identity.device_id, identity.measurement_id, *identity.attachment_id);
        }
        return exists(identity.device_id, identity.measurement_id);
    }
};

using MetadataDatabasePtr = std::shared_ptr<MetadataDatabase>;

} // namespace collector::metadata
