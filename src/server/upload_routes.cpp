#include "collector/server/upload_routes.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <functional>
#include <limits>
#include <utility>

namespace collector::server {

using network::HttpContext;
using network::HttpRequest;
using network::HttpResponse;
using network::HttpStatus;
using upload::UploadMetaData;
using json = nlohmann::json;

namespace {

collector::Result<std::uint64_t> parse_unsigned(const char* name, const std::string& text) {
    if (text.empty() || text.size() > 19) {
        return collector::Err<std::uint64_t>(ErrorCode::InvalidRequest,
                                             std::string("Invalid ") + name + ": '" + text + "'");
    }
    std::uint64_t value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return collector::Err<std::uint64_t>(ErrorCode::InvalidRequest,
                                                 std::string("Invalid ") + name + ": '" + text + "'");
        }
        value = value * 10 + static_cast<std::uint64_t>(c - '0');
    }
    return collector::Ok(value);
}

collector::Result<std::uint32_t> parse_count(const char* name, const std::string& text) {
    auto value = parse_unsigned(name, text);
    if (value.is_error()) {
        return collector::Err<std::uint32_t>(value.error());
    }
    if (value.value() > std::numeric_limits<std::uint32_t>::max()) {
        return collector::Err<std::uint32_t>(ErrorCode::InvalidRequest,
                                             std::string(name) + " out of range: " + text);
    }
    return collector::Ok(static_cast<std::uint32_t>(value.value()));
}

// Clients send every metadata value as a string, numbers included.
std::string string_field(const json& body, const char* name) {
    auto it = body.find(name);
    if (it == body.end() || it->is_null()) {
        return {};
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_number_unsigned() || it->is_number_integer()) {
        return it->dump();
    }
    return {};
}

using FieldReader = std::function<std::string(const char*)>;

collector::Result<UploadMetaData> read_metadata(const FieldReader& field,
                                                const std::optional<std::string>& measurement_from_path,
                                                bool attachment) {
    UploadMetaData metadata;
    metadata.identity.device_id = field("deviceId");
    metadata.identity.measurement_id = field("measurementId");
    metadata.device_type = field("deviceType");
    metadata.os_version = field("osVersion");
    metadata.app_version = field("appVersion");

    if (measurement_from_path) {
        if (!metadata.identity.measurement_id.empty() &&
            metadata.identity.measurement_id != *measurement_from_path) {
            return collector::Err<UploadMetaData>(ErrorCode::InvalidRequest,
                "measurementId " + metadata.identity.measurement_id + " does not match path " +
                *measurement_from_path);
        }
        metadata.identity.measurement_id = *measurement_from_path;
    }

    auto format_version = parse_count("formatVersion", field("formatVersion"));
    if (format_version.is_error()) {
        return collector::Err<UploadMetaData>(format_version.error());
    }
    metadata.format_version = format_version.value();

    if (attachment) {
        metadata.identity.attachment_id = field("attachmentId");

        upload::AttachmentCounts counts;
        const std::pair<const char*, std::uint32_t*> counters[] = {
            {"logCount", &counts.log_count},
            {"imageCount", &counts.image_count},
            {"videoCount", &counts.video_count},
        };
        for (const auto& [name, target] : counters) {
            auto value = parse_count(name, field(name));
            if (value.is_error()) {
                return collector::Err<UploadMetaData>(value.error());
            }
            *target = value.value();
        }
        auto files_size = parse_unsigned("filesSize", field("filesSize"));
        if (files_size.is_error()) {
            return collector::Err<UploadMetaData>(files_size.error());
        }
        counts.files_size = files_size.value();
        metadata.attachment_counts = counts;
    }

    return collector::Ok(std::move(metadata));
}

} // namespace

HttpStatus status_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::ContentRangeMismatch: return HttpStatus::RANGE_NOT_SATISFIABLE;
        case ErrorCode::ContentRangeNotMatchingFileSize: return HttpStatus::BAD_REQUEST;
        case ErrorCode::InvalidRequest: return HttpStatus::UNPROCESSABLE_ENTITY;
        case ErrorCode::SessionExpired: return HttpStatus::NOT_FOUND;
        case ErrorCode::NotFound: return HttpStatus::NOT_FOUND;
        case ErrorCode::DuplicateUpload: return HttpStatus::CONFLICT;
        case ErrorCode::PayloadTooLarge: return HttpStatus::PAYLOAD_TOO_LARGE;
        case ErrorCode::Unauthorized: return HttpStatus::UNAUTHORIZED;
        case ErrorCode::StorageFailure: return HttpStatus::SERVICE_UNAVAILABLE;
        case ErrorCode::CorruptedMetadataState:
        case ErrorCode::InvalidConfiguration:
        case ErrorCode::MalformedDescriptor:
            return HttpStatus::INTERNAL_SERVER_ERROR;
    }
    return HttpStatus::INTERNAL_SERVER_ERROR;
}

HttpResponse make_json_response(HttpStatus status, const json& body) {
    HttpResponse response(status);
    response.set_header("Content-Type", "application/json");
    response.set_body(body.dump());
    return response;
}

HttpResponse make_error(HttpStatus status, const std::string& message) {
    return make_json_response(status, json{{"error", message}});
}

collector::Result<UploadMetaData> metadata_from_headers(const HttpRequest& request,
                                                        const std::optional<std::string>& measurement_from_path,
                                                        bool attachment) {
    auto metadata = read_metadata([&request](const char* name) { return request.get_header(name); },
                                  measurement_from_path, attachment);
    if (metadata.is_ok()) {
        metadata.value().user_id = request.get_header(kAuthenticatedUserHeader);
    }
    return metadata;
}

collector::Result<UploadMetaData> metadata_from_json(const json& body,
                                                     const std::optional<std::string>& measurement_from_path,
                                                     bool attachment) {
    if (!body.is_object()) {
        return collector::Err<UploadMetaData>(ErrorCode::InvalidRequest, "Pre-request body must be a JSON object");
    }
    return read_metadata([&body](const char* name) { return string_field(body, name); },
                         measurement_from_path, attachment);
}

UploadRoutes::UploadRoutes(upload::UploadCoordinator& coordinator, std::string endpoint)
    : coordinator_(coordinator), endpoint_(std::move(endpoint)) {}

void UploadRoutes::register_routes(network::HttpRouter& router) {
    router.use([](const HttpContext& ctx, HttpResponse& response) {
        if (ctx.request.get_header(kAuthenticatedUserHeader).empty()) {
            response = make_error(HttpStatus::UNAUTHORIZED, "Missing authenticated user");
            return false;
        }
        return true;
    });

    const std::string measurements = endpoint_ + "/measurements";
    router.post(measurements, [this](const HttpContext& ctx) { return pre_request(ctx, false); });
    router.put(measurements + "/:upload_id", [this](const HttpContext& ctx) { return upload(ctx, false); });
    router.post(measurements + "/:measurement_id/attachments",
                [this](const HttpContext& ctx) { return pre_request(ctx, true); });
    router.put(measurements + "/:measurement_id/attachments/:upload_id",
               [this](const HttpContext& ctx) { return upload(ctx, true); });
}

HttpResponse UploadRoutes::pre_request(const HttpContext& ctx, bool attachment) {
    const auto& request = ctx.request;

    auto declared = parse_unsigned(kUploadLengthHeader, request.get_header(kUploadLengthHeader));
    if (declared.is_error()) {
        return make_error(HttpStatus::BAD_REQUEST, declared.error().message);
    }

    auto body = json::parse(request.body_as_string(), nullptr, false);
    if (body.is_discarded()) {
        return make_error(HttpStatus::UNPROCESSABLE_ENTITY, "Invalid JSON");
    }

    std::optional<std::string> measurement;
    if (attachment) {
        measurement = ctx.get_param("measurement_id");
    }
    auto metadata = metadata_from_json(body, measurement, attachment);
    if (metadata.is_error()) {
        return make_error(HttpStatus::UNPROCESSABLE_ENTITY, metadata.error().message);
    }
    metadata.value().user_id = request.get_header(kAuthenticatedUserHeader);

    auto identifier = coordinator_.pre_request(metadata.value(), declared.value());
    if (identifier.is_error()) {
        return error_response({}, identifier.error());
    }

    HttpResponse response(HttpStatus::OK);
    response.set_header("Location", location_for(identifier.value(), metadata.value()));
    return response;
}

HttpResponse UploadRoutes::upload(const HttpContext& ctx, bool attachment) {
    const auto& request = ctx.request;
    const auto identifier = ctx.get_param("upload_id");

    std::optional<std::string> measurement;
    if (attachment) {
        measurement = ctx.get_param("measurement_id");
    }
    auto metadata = metadata_from_headers(request, measurement, attachment);
    if (metadata.is_error()) {
        return make_error(HttpStatus::UNPROCESSABLE_ENTITY, metadata.error().message);
    }

    const auto content_range = request.get_header("Content-Range");
    if (content_range.empty()) {
        return make_error(HttpStatus::BAD_REQUEST, "Missing Content-Range");
    }
    if (request.body.empty() && content_range.find('*') != std::string::npos) {
        return status_query(identifier, metadata.value(), content_range);
    }

    auto range = upload::parse_content_range(content_range);
    if (range.is_error()) {
        return make_error(HttpStatus::BAD_REQUEST, range.error().message);
    }

    upload::ChunkRequest chunk;
    chunk.identifier = identifier;
    chunk.metadata = std::move(metadata.value());
    chunk.range = range.value();
    chunk.payload = request.body;

    auto outcome = coordinator_.accept_chunk(chunk);
    if (outcome.is_error()) {
        return error_response(identifier, outcome.error());
    }

    if (outcome.value().status == upload::ChunkStatus::Complete) {
        return make_json_response(HttpStatus::CREATED, json{{"id", outcome.value().document_id}});
    }

    HttpResponse response(HttpStatus::PERMANENT_REDIRECT);
    response.set_header("Range", upload::make_range_header(outcome.value().bytes_stored));
    return response;
}

HttpResponse UploadRoutes::status_query(const upload::UploadIdentifier& identifier,
                                        const UploadMetaData& metadata,
                                        const std::string& content_range) {
    auto total = upload::parse_status_range(content_range);
    if (total.is_error()) {
        return make_error(HttpStatus::BAD_REQUEST, total.error().message);
    }

    auto report = coordinator_.status(identifier, metadata.identity);
    if (report.is_error()) {
        return error_response(identifier, report.error());
    }

    switch (report.value().progress) {
        case upload::UploadProgress::AlreadyStored:
            return HttpResponse(HttpStatus::OK);
        case upload::UploadProgress::NothingReceived:
            return HttpResponse(HttpStatus::PERMANENT_REDIRECT);
        case upload::UploadProgress::Partial: {
            HttpResponse response(HttpStatus::PERMANENT_REDIRECT);
            response.set_header("Range", upload::make_range_header(report.value().bytes_stored));
            return response;
        }
    }
    return HttpResponse(HttpStatus::INTERNAL_SERVER_ERROR);
}

HttpResponse UploadRoutes::error_response(const upload::UploadIdentifier& identifier, const Error& error) {
    const auto status = status_for(error.code);
    if (status == HttpStatus::INTERNAL_SERVER_ERROR) {
        spdlog::error("Upload {} failed: {}", identifier, describe(error));
    }
    auto response = make_error(status, error.message);
    response.set_header("X-Error-Code", to_string(error.code));

    if (error.code == ErrorCode::ContentRangeMismatch) {
        if (auto state = coordinator_.range_state(identifier); state && state->bytes_stored > 0) {
            response.set_header("Range", upload::make_range_header(state->bytes_stored));
        }
    } else if (is_retryable(error.code)) {
        response.set_header("Retry-After", "1");
    }
    return response;
}

std::string UploadRoutes::location_for(const upload::UploadIdentifier& identifier,
                                       const UploadMetaData& metadata) const {
    if (metadata.identity.attachment_id) {
        return endpoint_ + "/measurements/" + metadata.identity.measurement_id + "/attachments/" + identifier;
    }
    return endpoint_ + "/measurements/" + identifier;
}

} // namespace collector::server
