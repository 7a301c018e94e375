/**
 * @file events.hpp
 * @brief Upload lifecycle events
 *
 * Events are past-tense facts published by the coordinator and the server.
 */

#pragma once

#include "collector/core/error.hpp"
#include "collector/upload/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace collector::events {

using collector::upload::UploadIdentifier;
using collector::upload::UploadIdentity;

// ════════════════════════════════════════════════════════
// Upload Events
// ════════════════════════════════════════════════════════

/**
 * @brief First chunk of a new upload session accepted
 */
struct UploadStartedEvent {
    UploadIdentifier identifier;
    UploadIdentity identity;
    std::uint64_t total_length;
    std::chrono::system_clock::time_point timestamp;

    UploadStartedEvent(UploadIdentifier id, UploadIdentity who, std::uint64_t total)
        : identifier(std::move(id)),
          identity(std::move(who)),
          total_length(total),
          timestamp(std::chrono::system_clock::now()) {}
};

struct ChunkStoredEvent {
    UploadIdentifier identifier;
    std::uint64_t chunk_length;
    std::uint64_t bytes_stored;
    std::uint64_t total_length;

    ChunkStoredEvent(UploadIdentifier id, std::uint64_t length, std::uint64_t stored, std::uint64_t total)
        : identifier(std::move(id)), chunk_length(length), bytes_stored(stored), total_length(total) {}
};

/**
 * @brief Upload finalized: metadata written and descriptor handed off
 */
struct UploadCompletedEvent {
    UploadIdentifier identifier;
    UploadIdentity identity;
    std::string document_id;
    std::string filename;
    std::uint64_t total_length;
    std::chrono::milliseconds duration;

    UploadCompletedEvent(UploadIdentifier id, UploadIdentity who, std::string document,
                         std::string file, std::uint64_t total, std::chrono::milliseconds took)
        : identifier(std::move(id)),
          identity(std::move(who)),
          document_id(std::move(document)),
          filename(std::move(file)),
          total_length(total),
          duration(took) {}
};

/**
 * @brief A request on an upload failed
 *
 * Emitted for every error surfaced to the client, retryable or not.
 */
struct UploadRejectedEvent {
    UploadIdentifier identifier;
    UploadIdentity identity;
    collector::Error error;

    UploadRejectedEvent(UploadIdentifier id, UploadIdentity who, collector::Error err)
        : identifier(std::move(id)), identity(std::move(who)), error(std::move(err)) {}
};

struct UploadsExpiredEvent {
    std::size_t sessions_removed;
    std::size_t storage_removed;

    UploadsExpiredEvent(std::size_t sessions, std::size_t storage)
        : sessions_removed(sessions), storage_removed(storage) {}
};

// ════════════════════════════════════════════════════════
// Server Events
// ════════════════════════════════════════════════════════

struct ServerStartedEvent {
    std::uint16_t port;
    std::string endpoint;
    std::string storage;
    std::chrono::system_clock::time_point timestamp;

    ServerStartedEvent(std::uint16_t p, std::string ep, std::string backend)
        : port(p),
          endpoint(std::move(ep)),
          storage(std::move(backend)),
          timestamp(std::chrono::system_clock::now()) {}
};

struct ServerShuttingDownEvent {
    std::string reason;

    explicit ServerShuttingDownEvent(std::string why) : reason(std::move(why)) {}
};

} // namespace collector::events
