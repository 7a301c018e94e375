#include "collector/upload/coordinator.hpp"

#include "collector/codec/descriptor_codec.hpp"
#include "collector/core/uuid.hpp"
#include "collector/events/events.hpp"

#include <spdlog/spdlog.h>

namespace collector::upload {

namespace {

collector::Result<void> check_field(const char* name, const std::string& value) {
    if (value.empty()) {
        return collector::Err<void>(Error{ErrorCode::InvalidRequest, std::string("Missing ") + name});
    }
    if (value.size() > kMaxGenericFieldLength) {
        return collector::Err<void>(Error{ErrorCode::InvalidRequest,
            std::string(name) + " longer than " + std::to_string(kMaxGenericFieldLength) + " characters"});
    }
    return collector::Ok();
}

} // namespace

collector::Result<void> validate_metadata(const UploadMetaData& metadata) {
    if (metadata.user_id.empty()) {
        return collector::Err<void>(Error{ErrorCode::Unauthorized, "No authenticated user"});
    }

    const std::pair<const char*, const std::string*> fields[] = {
        {"deviceId", &metadata.identity.device_id},
        {"measurementId", &metadata.identity.measurement_id},
        {"deviceType", &metadata.device_type},
        {"osVersion", &metadata.os_version},
        {"appVersion", &metadata.app_version},
    };
    for (const auto& [name, value] : fields) {
        auto result = check_field(name, *value);
        if (result.is_error()) {
            return result;
        }
    }
    if (metadata.identity.attachment_id) {
        auto result = check_field("attachmentId", *metadata.identity.attachment_id);
        if (result.is_error()) {
            return result;
        }
    }

    if (metadata.format_version < kCurrentFormatVersion) {
        return collector::Err<void>(Error{ErrorCode::InvalidRequest,
            "Deprecated format version " + std::to_string(metadata.format_version)});
    }
    if (metadata.format_version > kCurrentFormatVersion) {
        return collector::Err<void>(Error{ErrorCode::InvalidRequest,
            "Unknown format version " + std::to_string(metadata.format_version)});
    }
    return collector::Ok();
}

codec::FileType file_type_of(const UploadMetaData& metadata) {
    if (!metadata.identity.is_attachment()) {
        return codec::FileType::Measurement;
    }
    if (metadata.attachment_counts) {
        if (metadata.attachment_counts->video_count > 0) {
            return codec::FileType::Video;
        }
        if (metadata.attachment_counts->image_count > 0) {
            return codec::FileType::Image;
        }
    }
    return codec::FileType::Log;
}

codec::CompletedUploadDescriptor make_descriptor(const UploadMetaData& metadata) {
    codec::CompletedUploadDescriptor descriptor;
    descriptor.device_id = metadata.identity.device_id;
    descriptor.measurement_id = metadata.identity.measurement_id;
    descriptor.device_type = metadata.device_type;
    descriptor.os_version = metadata.os_version;
    descriptor.files.insert(codec::StoredFile{metadata.filename, file_type_of(metadata)});
    return descriptor;
}

UploadCoordinator::UploadCoordinator(UploadSessionStore& sessions,
                                     storage::StorageBackendPtr storage,
                                     storage::CleanupOperation cleanup,
                                     metadata::MetadataDatabasePtr database,
                                     pipeline::HandoffChannel& handoff,
                                     events::EventBus& bus,
                                     std::uint64_t payload_limit)
    : sessions_(sessions),
      storage_(std::move(storage)),
      cleanup_(std::move(cleanup)),
      database_(std::move(database)),
      handoff_(handoff),
      bus_(bus),
      payload_limit_(payload_limit) {}

template<typename T>
collector::Result<T> UploadCoordinator::reject(const UploadIdentifier& identifier,
                                               const UploadIdentity& identity,
                                               collector::Error error) {
    bus_.emit(events::UploadRejectedEvent{identifier, identity, error});
    return collector::Err<T>(std::move(error));
}

collector::Result<UploadIdentifier> UploadCoordinator::pre_request(const UploadMetaData& metadata,
                                                                   std::uint64_t declared_total) {
    const auto& identity = metadata.identity;

    auto valid = validate_metadata(metadata);
    if (valid.is_error()) {
        return reject<UploadIdentifier>({}, identity, valid.error());
    }
    if (declared_total == 0) {
        return reject<UploadIdentifier>({}, identity, Error{ErrorCode::InvalidRequest, "Empty upload announced"});
    }
    if (declared_total > payload_limit_) {
        return reject<UploadIdentifier>({}, identity, Error{ErrorCode::PayloadTooLarge,
            std::to_string(declared_total) + " bytes exceed the limit of " + std::to_string(payload_limit_)});
    }

    auto exists = database_->exists(identity);
    if (exists.is_error()) {
        return reject<UploadIdentifier>({}, identity, exists.error());
    }
    if (exists.value()) {
        return reject<UploadIdentifier>({}, identity, Error{ErrorCode::DuplicateUpload,
            identity.to_string() + " is already stored"});
    }

    auto identifier = make_uuid();
    spdlog::debug("Announced upload {} for {} ({} bytes)", identifier, identity.to_string(), declared_total);
    return collector::Ok(std::move(identifier));
}

collector::Result<ChunkOutcome> UploadCoordinator::accept_chunk(const ChunkRequest& request) {
    const auto& identifier = request.identifier;
    const auto& metadata = request.metadata;
    const auto& identity = metadata.identity;
    const auto& range = request.range;

    if (!is_valid_identifier(identifier)) {
        return reject<ChunkOutcome>(identifier, identity,
                                    Error{ErrorCode::InvalidRequest, "Malformed upload identifier"});
    }
    auto valid = validate_metadata(metadata);
    if (valid.is_error()) {
        return reject<ChunkOutcome>(identifier, identity, valid.error());
    }
    if (range.total_length > payload_limit_) {
        return reject<ChunkOutcome>(identifier, identity, Error{ErrorCode::PayloadTooLarge,
            std::to_string(range.total_length) + " bytes exceed the limit of " + std::to_string(payload_limit_)});
    }

    auto guard = locks_.try_acquire(identifier);
    if (!guard) {
        return reject<ChunkOutcome>(identifier, identity, Error{ErrorCode::StorageFailure,
            "A chunk of upload " + identifier + " is still being processed"});
    }

    auto existing = sessions_.get(identifier);
    UploadSession session;
    if (existing.is_error()) {
        if (range.start != 0) {
            return reject<ChunkOutcome>(identifier, identity, Error{ErrorCode::SessionExpired,
                "Upload " + identifier + " is unknown or expired, restart at offset 0"});
        }
        auto checked = validate_chunk(std::nullopt, range, request.payload.size());
        if (checked.is_error()) {
            return reject<ChunkOutcome>(identifier, identity, checked.error());
        }
        auto created = sessions_.create(identifier, identity, range.total_length);
        if (created.is_error()) {
            return reject<ChunkOutcome>(identifier, identity, created.error());
        }
        session = created.value();
        bus_.emit(events::UploadStartedEvent{identifier, identity, range.total_length});
    } else {
        session = existing.value();
        if (!(session.identity == identity)) {
            return reject<ChunkOutcome>(identifier, identity, Error{ErrorCode::InvalidRequest,
                "Upload " + identifier + " belongs to " + session.identity.to_string()});
        }

        // Every byte is stored but an earlier finalization failed: resending the
        // final chunk retries finalization without appending again.
        const bool pending_finalization = session.bytes_stored == session.total_length;
        if (pending_finalization && range.is_final() && range.total_length == session.total_length &&
            range.length() == request.payload.size()) {
            return finalize(session, metadata);
        }

        auto checked = validate_chunk(RangeState{session.bytes_stored, session.total_length},
                                      range, request.payload.size());
        if (checked.is_error()) {
            return reject<ChunkOutcome>(identifier, identity, checked.error());
        }
    }

    auto stored = storage_->store(identifier, request.payload, range);
    if (stored.is_error()) {
        return reject<ChunkOutcome>(identifier, identity, stored.error());
    }
    if (stored.value() != range.end + 1) {
        return reject<ChunkOutcome>(identifier, identity, Error{ErrorCode::StorageFailure,
            "Backend reports " + std::to_string(stored.value()) + " bytes after appending up to " +
            std::to_string(range.end + 1)});
    }

    auto advanced = sessions_.advance(identifier, range.length());
    if (advanced.is_error()) {
        return reject<ChunkOutcome>(identifier, identity, advanced.error());
    }
    session = advanced.value();
    bus_.emit(events::ChunkStoredEvent{identifier, range.length(), session.bytes_stored, session.total_length});

    if (session.bytes_stored < session.total_length) {
        ChunkOutcome outcome;
        outcome.identifier = identifier;
        outcome.status = ChunkStatus::Incomplete;
        outcome.bytes_stored = session.bytes_stored;
        outcome.total_length = session.total_length;
        return collector::Ok(outcome);
    }

    return finalize(session, metadata);
}

collector::Result<ChunkOutcome> UploadCoordinator::finalize(const UploadSession& session,
                                                            const UploadMetaData& request_metadata) {
    const auto& identifier = session.identifier;
    const auto& identity = session.identity;

    auto entered = sessions_.transition(identifier, SessionState::Finalizing);
    if (entered.is_error()) {
        return reject<ChunkOutcome>(identifier, identity, entered.error());
    }

    auto exists = database_->exists(identity);
    if (exists.is_error()) {
        if (exists.error().code == ErrorCode::CorruptedMetadataState) {
            abandon(identifier, exists.error(), false);
        } else {
            resume_receiving(identifier);
        }
        return reject<ChunkOutcome>(identifier, identity, exists.error());
    }
    if (exists.value()) {
        Error duplicate{ErrorCode::DuplicateUpload, identity.to_string() + " is already stored"};
        abandon(identifier, duplicate, true);
        return reject<ChunkOutcome>(identifier, identity, duplicate);
    }

    auto filename = storage_->finalize(identifier);
    if (filename.is_error()) {
        if (filename.error().code == ErrorCode::NotFound) {
            // The bytes are gone (removed by cleanup), nothing left to finalize.
            Error lost{ErrorCode::SessionExpired, filename.error().message};
            abandon(identifier, lost, false);
            return reject<ChunkOutcome>(identifier, identity, lost);
        }
        resume_receiving(identifier);
        return reject<ChunkOutcome>(identifier, identity, filename.error());
    }

    UploadMetaData metadata = request_metadata;
    metadata.identity = identity;
    metadata.content_range = ContentRange{0, session.total_length - 1, session.total_length};
    metadata.filename = filename.value();

    auto document_id = database_->store_metadata(metadata);
    if (document_id.is_error()) {
        if (document_id.error().code == ErrorCode::DuplicateUpload) {
            // Lost the race against a concurrent completion of the same identity.
            abandon(identifier, document_id.error(), true);
        } else {
            resume_receiving(identifier);
        }
        return reject<ChunkOutcome>(identifier, identity, document_id.error());
    }

    if (!handoff_.push(codec::DescriptorCodec::encode(make_descriptor(metadata)))) {
        spdlog::error("Handoff channel closed, descriptor of {} ({}) not handed off",
                      identifier, identity.to_string());
    }

    auto completed = sessions_.transition(identifier, SessionState::Complete);
    if (completed.is_error()) {
        spdlog::warn("Session {} not marked complete: {}", identifier, describe(completed.error()));
    }
    sessions_.remove(identifier);

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - session.created);
    bus_.emit(events::UploadCompletedEvent{identifier, identity, document_id.value(),
                                           metadata.filename, session.total_length, elapsed});

    ChunkOutcome outcome;
    outcome.identifier = identifier;
    outcome.status = ChunkStatus::Complete;
    outcome.bytes_stored = session.total_length;
    outcome.total_length = session.total_length;
    outcome.document_id = document_id.value();
    return collector::Ok(outcome);
}

void UploadCoordinator::abandon(const UploadIdentifier& identifier, const collector::Error& error,
                                bool discard_bytes) {
    if (discard_bytes) {
        auto removed = storage_->remove(identifier);
        if (removed.is_error()) {
            spdlog::warn("Could not discard bytes of {}: {}", identifier, describe(removed.error()));
        }
    }
    auto failed = sessions_.transition(identifier, SessionState::Failed, describe(error));
    if (failed.is_error()) {
        spdlog::warn("Session {} not marked failed: {}", identifier, describe(failed.error()));
    }
    sessions_.remove(identifier);
}

void UploadCoordinator::resume_receiving(const UploadIdentifier& identifier) {
    auto resumed = sessions_.transition(identifier, SessionState::Receiving);
    if (resumed.is_error()) {
        spdlog::warn("Session {} stuck in finalization: {}", identifier, describe(resumed.error()));
    }
}

collector::Result<StatusReport> UploadCoordinator::status(const UploadIdentifier& identifier,
                                                          const UploadIdentity& identity) {
    auto session = sessions_.get(identifier);
    if (session.is_ok() && !(session.value().identity == identity)) {
        return reject<StatusReport>(identifier, identity, Error{ErrorCode::InvalidRequest,
            "Upload " + identifier + " belongs to " + session.value().identity.to_string()});
    }

    auto exists = database_->exists(identity);
    if (exists.is_error()) {
        return reject<StatusReport>(identifier, identity, exists.error());
    }
    if (exists.value()) {
        return collector::Ok(StatusReport{UploadProgress::AlreadyStored, 0});
    }

    if (session.is_error() || session.value().bytes_stored == 0) {
        return collector::Ok(StatusReport{UploadProgress::NothingReceived, 0});
    }
    return collector::Ok(StatusReport{UploadProgress::Partial, session.value().bytes_stored});
}

std::optional<RangeState> UploadCoordinator::range_state(const UploadIdentifier& identifier) const {
    auto session = sessions_.get(identifier);
    if (session.is_error()) {
        return std::nullopt;
    }
    return RangeState{session.value().bytes_stored, session.value().total_length};
}

collector::Result<std::size_t> UploadCoordinator::sweep_expired() {
    std::size_t expired = 0;
    for (const auto& identifier : sessions_.expired()) {
        // A session someone is working on is not idle.
        auto guard = locks_.try_acquire(identifier);
        if (!guard || !sessions_.expire(identifier)) {
            continue;
        }
        ++expired;
        auto removed = storage_->remove(identifier);
        if (removed.is_error()) {
            spdlog::warn("Expired upload {} keeps its bytes for now: {}", identifier, describe(removed.error()));
        }
    }

    std::size_t storage_removed = 0;
    if (cleanup_) {
        auto cleaned = cleanup_(sessions_.expiration());
        if (cleaned.is_error()) {
            bus_.emit(events::UploadsExpiredEvent{expired, 0});
            return collector::Err<std::size_t>(cleaned.error());
        }
        storage_removed = cleaned.value();
    }

    bus_.emit(events::UploadsExpiredEvent{expired, storage_removed});
    return collector::Ok(expired);
}

} // namespace collector::upload
