#include "collector/metadata/memory_database.hpp"

#include <spdlog/spdlog.h>

#include <mutex>

namespace collector::metadata {

InMemoryMetadataDatabase::InMemoryMetadataDatabase(bool enforce_unique_identity)
    : enforce_unique_identity_(enforce_unique_identity) {}

collector::Result<std::string> InMemoryMetadataDatabase::store_metadata(const UploadMetaData& metadata) {
    auto document = make_document(metadata, std::chrono::system_clock::now());

    std::unique_lock lock(mutex_);
    if (enforce_unique_identity_ && count_matches(metadata.identity) > 0) {
        return collector::Err<std::string>(ErrorCode::DuplicateUpload,
            "A document for " + metadata.identity.to_string() + " already exists");
    }
    documents_.emplace(document.id, to_json(document));
    return collector::Ok(document.id);
}

collector::Result<bool> InMemoryMetadataDatabase::exists(const std::string& device_id,
                                                         const std::string& measurement_id) {
    return check(UploadIdentity{device_id, measurement_id, std::nullopt});
}

collector::Result<bool> InMemoryMetadataDatabase::exists(const std::string& device_id,
                                                         const std::string& measurement_id,
                                                         const std::string& attachment_id) {
    return check(UploadIdentity{device_id, measurement_id, attachment_id});
}

collector::Result<std::vector<MetadataDocument>> InMemoryMetadataDatabase::find(const UploadIdentity& identity) {
    std::shared_lock lock(mutex_);
    std::vector<MetadataDocument> result;
    for (const auto& [id, feature] : documents_) {
        if (!matches(feature, identity)) {
            continue;
        }
        auto document = from_json(feature);
        if (document.is_error()) {
            return collector::Err<std::vector<MetadataDocument>>(document.error());
        }
        result.push_back(std::move(document.value()));
    }
    return collector::Ok(std::move(result));
}

collector::Result<std::size_t> InMemoryMetadataDatabase::count() {
    std::shared_lock lock(mutex_);
    return collector::Ok(documents_.size());
}

std::size_t InMemoryMetadataDatabase::count_matches(const UploadIdentity& identity) const {
    std::size_t matched = 0;
    for (const auto& [id, feature] : documents_) {
        if (matches(feature, identity)) {
            ++matched;
        }
    }
    return matched;
}

collector::Result<bool> InMemoryMetadataDatabase::check(const UploadIdentity& identity) {
    std::shared_lock lock(mutex_);
    const auto matched = count_matches(identity);
    if (matched > 1) {
        spdlog::error("Found {} documents for {}, metadata state is corrupted",
                      matched, identity.to_string());
        return collector::Err<bool>(ErrorCode::CorruptedMetadataState,
            std::to_string(matched) + " documents match " + identity.to_string());
    }
    return collector::Ok(matched == 1);
}

} // namespace collector::metadata
