#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace collector::upload {

using UploadIdentifier = std::string;

// Identifiers name files and objects, so only [A-Za-z0-9_-] is accepted.
inline bool is_valid_identifier(const UploadIdentifier& identifier) {
    if (identifier.empty() || identifier.size() > 64) {
        return false;
    }
    for (char c : identifier) {
        const bool alnum = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
        if (!alnum && c != '-' && c != '_') {
            return false;
        }
    }
    return true;
}

/**
 * @brief Identity tuple naming one measurement or one of its attachments
 */
struct UploadIdentity {
    std::string device_id;
    std::string measurement_id;
    std::optional<std::string> attachment_id;

    [[nodiscard]] bool is_attachment() const noexcept { return attachment_id.has_value(); }

    [[nodiscard]] std::string to_string() const {
        std::string text = device_id + ":" + measurement_id;
        if (attachment_id) {
            text += ":" + *attachment_id;
        }
        return text;
    }

    bool operator==(const UploadIdentity& other) const {
        return device_id == other.device_id && measurement_id == other.measurement_id &&
               attachment_id == other.attachment_id;
    }
};

/**
 * @brief Byte range declared by one chunk, inclusive end
 */
struct ContentRange {
    std::uint64_t start = 0;
    std::uint64_t end = 0;
    std::uint64_t total_length = 0;

    [[nodiscard]] std::uint64_t length() const noexcept { return end - start + 1; }
    [[nodiscard]] bool is_final() const noexcept { return end + 1 == total_length; }

    bool operator==(const ContentRange& other) const {
        return start == other.start && end == other.end && total_length == other.total_length;
    }
};

/**
 * @brief Attachment counters reported by the client for attachment uploads
 */
struct AttachmentCounts {
    std::uint32_t log_count = 0;
    std::uint32_t image_count = 0;
    std::uint32_t video_count = 0;
    std::uint64_t files_size = 0;
};

/**
 * @brief Descriptive metadata of one upload, immutable once finalized
 */
struct UploadMetaData {
    UploadIdentity identity;
    std::string user_id;
    ContentRange content_range;
    std::string device_type;
    std::string os_version;
    std::string app_version;
    std::uint32_t format_version = 3;
    std::optional<AttachmentCounts> attachment_counts;
    std::string filename; ///< Retrievable storage name, set on finalization
};

enum class SessionState {
    New,
    Receiving,
    Finalizing,
    Complete,
    Expired,
    Failed
};

inline const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::New: return "NEW";
        case SessionState::Receiving: return "RECEIVING";
        case SessionState::Finalizing: return "FINALIZING";
        case SessionState::Complete: return "COMPLETE";
        case SessionState::Expired: return "EXPIRED";
        case SessionState::Failed: return "FAILED";
    }
    return "UNKNOWN";
}

/**
 * @brief Progress record of one resumable upload
 */
struct UploadSession {
    UploadIdentifier identifier;
    UploadIdentity identity;
    std::uint64_t total_length = 0;
    std::uint64_t bytes_stored = 0;
    SessionState state = SessionState::New;
    std::chrono::steady_clock::time_point created{};
    std::chrono::steady_clock::time_point last_activity{};
    std::string last_error; ///< Populated when state == Failed
};

/**
 * @brief One chunk as delivered by the HTTP surface
 */
struct ChunkRequest {
    UploadIdentifier identifier;
    UploadMetaData metadata;
    ContentRange range;
    std::vector<std::uint8_t> payload;
};

enum class ChunkStatus {
    Incomplete,
    Complete
};

/**
 * @brief Outcome of an accepted chunk
 */
struct ChunkOutcome {
    UploadIdentifier identifier;
    ChunkStatus status = ChunkStatus::Incomplete;
    std::uint64_t bytes_stored = 0;
    std::uint64_t total_length = 0;
    std::string document_id; ///< Set when status == Complete
};

enum class UploadProgress {
    AlreadyStored,
    NothingReceived,
    Partial
};

struct StatusReport {
    UploadProgress progress = UploadProgress::NothingReceived;
    std::uint64_t bytes_stored = 0;
};

} // namespace collector::upload
