#pragma once

#include "collector/codec/descriptor.hpp"
#include "collector/core/result.hpp"
#include "collector/events/event_bus.hpp"
#include "collector/metadata/database.hpp"
#include "collector/pipeline/handoff_channel.hpp"
#include "collector/storage/storage_backend.hpp"
#include "collector/upload/content_range.hpp"
#include "collector/upload/session_store.hpp"
#include "collector/upload/types.hpp"

#include <optional>

namespace collector::upload {

constexpr std::uint32_t kCurrentFormatVersion = 3;
constexpr std::size_t kMaxGenericFieldLength = 30;

/**
 * @brief Checks user, identity and device fields of an upload
 *
 * Missing user -> Unauthorized. Empty or overlong fields and a deprecated or
 * unknown format version -> InvalidRequest.
 */
collector::Result<void> validate_metadata(const UploadMetaData& metadata);

// Measurement uploads map to FileType::Measurement, attachments to the kind they count.
codec::FileType file_type_of(const UploadMetaData& metadata);

codec::CompletedUploadDescriptor make_descriptor(const UploadMetaData& metadata);

/**
 * @brief Drives chunked uploads from first byte to persisted metadata
 *
 * Chunks of one identifier are serialized by a per-identifier lock held for the
 * whole request, including finalization (dedup check, storage finalize,
 * metadata write, descriptor handoff). Different identifiers run in parallel.
 */
class UploadCoordinator {
public:
    UploadCoordinator(UploadSessionStore& sessions,
                      storage::StorageBackendPtr storage,
                      storage::CleanupOperation cleanup,
                      metadata::MetadataDatabasePtr database,
                      pipeline::HandoffChannel& handoff,
                      events::EventBus& bus,
                      std::uint64_t payload_limit);

    UploadCoordinator(const UploadCoordinator&) = delete;
    UploadCoordinator& operator=(const UploadCoordinator&) = delete;

    /**
     * @brief Announces an upload before its first chunk
     *
     * Runs the dedup check early and hands out a fresh upload identifier. The
     * check at finalization stays authoritative.
     */
    collector::Result<UploadIdentifier> pre_request(const UploadMetaData& metadata,
                                                    std::uint64_t declared_total);

    collector::Result<ChunkOutcome> accept_chunk(const ChunkRequest& request);

    collector::Result<StatusReport> status(const UploadIdentifier& identifier,
                                           const UploadIdentity& identity);

    /**
     * @brief Expires idle sessions and runs the storage cleanup
     *
     * @return number of sessions expired
     */
    collector::Result<std::size_t> sweep_expired();

    // Current progress of a live session, used to answer rejected chunks.
    std::optional<RangeState> range_state(const UploadIdentifier& identifier) const;

    std::uint64_t payload_limit() const { return payload_limit_; }

private:
    collector::Result<ChunkOutcome> finalize(const UploadSession& session, const UploadMetaData& metadata);

    // Ends a session for good: optional byte removal, Failed state, session dropped.
    void abandon(const UploadIdentifier& identifier, const collector::Error& error, bool discard_bytes);

    // Leaves finalization after a transient failure so the final chunk can be resent.
    void resume_receiving(const UploadIdentifier& identifier);

    template<typename T>
    collector::Result<T> reject(const UploadIdentifier& identifier,
                                const UploadIdentity& identity,
                                collector::Error error);

    UploadSessionStore& sessions_;
    UploadLockTable locks_;
    storage::StorageBackendPtr storage_;
    storage::CleanupOperation cleanup_;
    metadata::MetadataDatabasePtr database_;
    pipeline::HandoffChannel& handoff_;
    events::EventBus& bus_;
    std::uint64_t payload_limit_;
};

} // namespace collector::upload
