#include "collector/metadata/document.hpp"

#include "collector/core/uuid.hpp"

#include <cstdio>
#include <ctime>

namespace collector::metadata {

using json = nlohmann::json;

MetadataDocument make_document(const UploadMetaData& metadata,
                               std::chrono::system_clock::time_point upload_date) {
    MetadataDocument document;
    document.id = make_uuid();
    document.metadata = metadata;
    document.length = metadata.content_range.total_length;
    document.upload_date = upload_date;
    return document;
}

json to_json(const MetadataDocument& document) {
    const auto& metadata = document.metadata;

    json properties = {
        {"deviceId", metadata.identity.device_id},
        {"measurementId", metadata.identity.measurement_id},
        {"userId", metadata.user_id},
        {"deviceType", metadata.device_type},
        {"osVersion", metadata.os_version},
        {"appVersion", metadata.app_version},
        {"formatVersion", metadata.format_version},
        {"filename", metadata.filename},
        {"length", document.length},
        {"uploadDate", format_timestamp(document.upload_date)},
    };
    if (metadata.identity.attachment_id) {
        properties["attachmentId"] = *metadata.identity.attachment_id;
    }
    if (metadata.attachment_counts) {
        properties["logCount"] = metadata.attachment_counts->log_count;
        properties["imageCount"] = metadata.attachment_counts->image_count;
        properties["videoCount"] = metadata.attachment_counts->video_count;
        properties["filesSize"] = metadata.attachment_counts->files_size;
    }

    return json{
        {"type", "Feature"},
        {"id", document.id},
        {"geometry", nullptr},
        {"properties", std::move(properties)},
    };
}

collector::Result<MetadataDocument> from_json(const json& feature) {
    try {
        if (feature.at("type").get<std::string>() != "Feature") {
            return collector::Err<MetadataDocument>(ErrorCode::InvalidRequest, "Not a GeoJSON Feature");
        }
        const auto& properties = feature.at("properties");

        MetadataDocument document;
        document.id = feature.value("id", std::string{});
        auto& metadata = document.metadata;
        metadata.identity.device_id = properties.at("deviceId").get<std::string>();
        metadata.identity.measurement_id = properties.at("measurementId").get<std::string>();
        if (properties.contains("attachmentId")) {
            metadata.identity.attachment_id = properties.at("attachmentId").get<std::string>();
        }
        metadata.user_id = properties.at("userId").get<std::string>();
        metadata.device_type = properties.value("deviceType", std::string{});
        metadata.os_version = properties.value("osVersion", std::string{});
        metadata.app_version = properties.value("appVersion", std::string{});
        metadata.format_version = properties.value("formatVersion", 3u);
        metadata.filename = properties.at("filename").get<std::string>();
        if (properties.contains("logCount")) {
            collector::upload::AttachmentCounts counts;
            counts.log_count = properties.at("logCount").get<std::uint32_t>();
            counts.image_count = properties.value("imageCount", 0u);
            counts.video_count = properties.value("videoCount", 0u);
            counts.files_size = properties.value("filesSize", std::uint64_t{0});
            metadata.attachment_counts = counts;
        }
        document.length = properties.at("length").get<std::uint64_t>();
        metadata.content_range = {0, document.length > 0 ? document.length - 1 : 0, document.length};

        auto upload_date = parse_timestamp(properties.at("uploadDate").get<std::string>());
        if (upload_date.is_error()) {
            return collector::Err<MetadataDocument>(upload_date.error());
        }
        document.upload_date = upload_date.value();
        return collector::Ok(std::move(document));
    } catch (const json::exception& e) {
        return collector::Err<MetadataDocument>(ErrorCode::InvalidRequest,
            std::string("Malformed metadata document: ") + e.what());
    }
}

bool matches(const json& feature, const UploadIdentity& identity) {
    const auto properties = feature.find("properties");
    if (properties == feature.end() || !properties->is_object()) {
        return false;
    }
    if (properties->value("deviceId", std::string{}) != identity.device_id ||
        properties->value("measurementId", std::string{}) != identity.measurement_id) {
        return false;
    }

    const auto attachment = properties->find("attachmentId");
    if (!identity.attachment_id) {
        return attachment == properties->end();
    }
    return attachment != properties->end() && attachment->is_string() &&
           attachment->get<std::string>() == *identity.attachment_id;
}

std::string format_timestamp(std::chrono::system_clock::time_point time) {
    const auto since_epoch = time.time_since_epoch();
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch - seconds);

    const std::time_t t = static_cast<std::time_t>(seconds.count());
    std::tm tm{};
    ::gmtime_r(&t, &tm);

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(millis.count()));
    return buffer;
}

collector::Result<std::chrono::system_clock::time_point> parse_timestamp(const std::string& text) {
    std::tm tm{};
    int millis = 0;
    const int fields = std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%3dZ",
                                   &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                                   &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &millis);
    if (fields < 6) {
        return collector::Err<std::chrono::system_clock::time_point>(ErrorCode::InvalidRequest,
            "Not an ISO-8601 timestamp: " + text);
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    return collector::Ok(std::chrono::system_clock::from_time_t(::timegm(&tm)) +
                         std::chrono::milliseconds(millis));
}

} // namespace collector::metadata
