#pragma once

#include "collector/core/result.hpp"
#include "collector/network/http_router.hpp"
#include "collector/upload/coordinator.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace collector::server {

// Header set by the upstream authenticator.
inline constexpr const char* kAuthenticatedUserHeader = "X-Authenticated-User";
// Declared size of the upload announced by a pre-request.
inline constexpr const char* kUploadLengthHeader = "X-Upload-Content-Length";

network::HttpStatus status_for(ErrorCode code);

network::HttpResponse make_json_response(network::HttpStatus status, const nlohmann::json& body);

network::HttpResponse make_error(network::HttpStatus status, const std::string& message);

/**
 * @brief Reads identity and device metadata sent as chunk headers
 *
 * @param measurement_from_path measurement id taken from an attachment route,
 *        must agree with the measurementId header when both are present
 */
collector::Result<upload::UploadMetaData> metadata_from_headers(
    const network::HttpRequest& request,
    const std::optional<std::string>& measurement_from_path,
    bool attachment);

// Same fields as metadata_from_headers, read from a pre-request JSON body.
collector::Result<upload::UploadMetaData> metadata_from_json(
    const nlohmann::json& body,
    const std::optional<std::string>& measurement_from_path,
    bool attachment);

/**
 * @brief HTTP face of the UploadCoordinator
 *
 *   POST <endpoint>/measurements                                  pre-request
 *   PUT  <endpoint>/measurements/:upload_id                       chunk or status query
 *   POST <endpoint>/measurements/:measurement_id/attachments      pre-request
 *   PUT  <endpoint>/measurements/:measurement_id/attachments/:upload_id
 *
 * A PUT with an empty body whose Content-Range carries only the total length
 * asks for the current progress instead of appending.
 */
class UploadRoutes {
public:
    UploadRoutes(upload::UploadCoordinator& coordinator, std::string endpoint);

    void register_routes(network::HttpRouter& router);

    network::HttpResponse pre_request(const network::HttpContext& ctx, bool attachment);

    network::HttpResponse upload(const network::HttpContext& ctx, bool attachment);

    const std::string& endpoint() const { return endpoint_; }

private:
    network::HttpResponse status_query(const upload::UploadIdentifier& identifier,
                                       const upload::UploadMetaData& metadata,
                                       const std::string& content_range);

    network::HttpResponse error_response(const upload::UploadIdentifier& identifier, const Error& error);

    std::string location_for(const upload::UploadIdentifier& identifier,
                             const upload::UploadMetaData& metadata) const;

    upload::UploadCoordinator& coordinator_;
    std::string endpoint_;
};

} // namespace collector::server
