#pragma once

#include "collector/core/result.hpp"
#include "collector/upload/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace collector::metadata {

using collector::upload::UploadIdentity;
using collector::upload::UploadMetaData;

/**
 * @brief Persisted form of one finished upload
 *
 * Serialized as a GeoJSON Feature whose properties block carries the identity,
 * the owning user, device information, the stored filename, the declared
 * length and the upload timestamp.
 */
struct MetadataDocument {
    std::string id;
    UploadMetaData metadata;
    std::uint64_t length = 0;
    std::chrono::system_clock::time_point upload_date{};
};

MetadataDocument make_document(const UploadMetaData& metadata,
                               std::chrono::system_clock::time_point upload_date);

nlohmann::json to_json(const MetadataDocument& document);

collector::Result<MetadataDocument> from_json(const nlohmann::json& feature);

// True when the document belongs to the identity. A measurement identity never
// matches an attachment document and vice versa.
bool matches(const nlohmann::json& feature, const UploadIdentity& identity);

// ISO-8601 UTC with millisecond precision, e.g. 2024-03-01T12:00:00.000Z
std::string format_timestamp(std::chrono::system_clock::time_point time);

collector::Result<std::chrono::system_clock::time_point> parse_timestamp(const std::string& text);

} // namespace collector::metadata
