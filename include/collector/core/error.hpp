#pragma once

#include <string>
#include <utility>

namespace collector {

enum class ErrorCode {
    ContentRangeMismatch,
    ContentRangeNotMatchingFileSize,
    DuplicateUpload,
    StorageFailure,
    CorruptedMetadataState,
    SessionExpired,
    InvalidRequest,
    PayloadTooLarge,
    Unauthorized,
    InvalidConfiguration,
    MalformedDescriptor,
    NotFound
};

/**
 * @brief Error value carried by every failed collector::Result
 */
struct Error {
    ErrorCode code = ErrorCode::InvalidRequest;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::ContentRangeMismatch: return "ContentRangeMismatch";
        case ErrorCode::ContentRangeNotMatchingFileSize: return "ContentRangeNotMatchingFileSize";
        case ErrorCode::DuplicateUpload: return "DuplicateUpload";
        case ErrorCode::StorageFailure: return "StorageFailure";
        case ErrorCode::CorruptedMetadataState: return "CorruptedMetadataState";
        case ErrorCode::SessionExpired: return "SessionExpired";
        case ErrorCode::InvalidRequest: return "InvalidRequest";
        case ErrorCode::PayloadTooLarge: return "PayloadTooLarge";
        case ErrorCode::Unauthorized: return "Unauthorized";
        case ErrorCode::InvalidConfiguration: return "InvalidConfiguration";
        case ErrorCode::MalformedDescriptor: return "MalformedDescriptor";
        case ErrorCode::NotFound: return "NotFound";
    }
    return "Unknown";
}

// Only transient storage errors may be resubmitted unchanged by the client.
inline bool is_retryable(ErrorCode code) {
    return code == ErrorCode::StorageFailure;
}

inline std::string describe(const Error& error) {
    return std::string(to_string(error.code)) + ": " + error.message;
}

} // namespace collector
