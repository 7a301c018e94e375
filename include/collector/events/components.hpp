#pragma once

#include "collector/events/event_bus.hpp"
#include "collector/events/events.hpp"

#include <spdlog/spdlog.h>

namespace collector::events {

/**
 * @brief Writes every upload and server event to the spdlog default logger
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        ids_.push_back(bus_.subscribe<UploadStartedEvent>([this](const UploadStartedEvent& e) {
            on_upload_started(e);
        }));

        ids_.push_back(bus_.subscribe<ChunkStoredEvent>([this](const ChunkStoredEvent& e) {
            on_chunk_stored(e);
        }));

        ids_.push_back(bus_.subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent& e) {
            on_upload_completed(e);
        }));

        ids_.push_back(bus_.subscribe<UploadRejectedEvent>([this](const UploadRejectedEvent& e) {
            on_upload_rejected(e);
        }));

        ids_.push_back(bus_.subscribe<UploadsExpiredEvent>([this](const UploadsExpiredEvent& e) {
            on_uploads_expired(e);
        }));

        ids_.push_back(bus_.subscribe<ServerStartedEvent>([this](const ServerStartedEvent& e) {
            on_server_started(e);
        }));

        ids_.push_back(bus_.subscribe<ServerShuttingDownEvent>([this](const ServerShuttingDownEvent& e) {
            on_server_shutdown(e);
        }));
    }

    ~LoggerComponent() {
        bus_.unsubscribe<UploadStartedEvent>(ids_[0]);
        bus_.unsubscribe<ChunkStoredEvent>(ids_[1]);
        bus_.unsubscribe<UploadCompletedEvent>(ids_[2]);
        bus_.unsubscribe<UploadRejectedEvent>(ids_[3]);
        bus_.unsubscribe<UploadsExpiredEvent>(ids_[4]);
        bus_.unsubscribe<ServerStartedEvent>(ids_[5]);
        bus_.unsubscribe<ServerShuttingDownEvent>(ids_[6]);
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    void on_upload_started(const UploadStartedEvent& e) {
        spdlog::info("[UploadStarted] upload={} identity={} bytes={}",
                     e.identifier, e.identity.to_string(), e.total_length);
    }

    void on_chunk_stored(const ChunkStoredEvent& e) {
        spdlog::debug("[ChunkStored] upload={} chunk={} stored={}/{}",
                      e.identifier, e.chunk_length, e.bytes_stored, e.total_length);
    }

    void on_upload_completed(const UploadCompletedEvent& e) {
        spdlog::info("[UploadCompleted] upload={} identity={} document={} file={} bytes={} duration={}ms",
                     e.identifier, e.identity.to_string(), e.document_id, e.filename,
                     e.total_length, e.duration.count());
    }

    void on_upload_rejected(const UploadRejectedEvent& e) {
        if (e.error.code == ErrorCode::CorruptedMetadataState) {
            spdlog::error("[UploadRejected] upload={} identity={} {}",
                          e.identifier, e.identity.to_string(), describe(e.error));
        } else if (is_retryable(e.error.code)) {
            spdlog::warn("[UploadRejected] upload={} identity={} {} (retryable)",
                         e.identifier, e.identity.to_string(), describe(e.error));
        } else {
            spdlog::info("[UploadRejected] upload={} identity={} {}",
                         e.identifier, e.identity.to_string(), describe(e.error));
        }
    }

    void on_uploads_expired(const UploadsExpiredEvent& e) {
        if (e.sessions_removed == 0 && e.storage_removed == 0) {
            spdlog::debug("[UploadsExpired] nothing to clean up");
            return;
        }
        spdlog::info("[UploadsExpired] sessions={} stored uploads={}", e.sessions_removed, e.storage_removed);
    }

    void on_server_started(const ServerStartedEvent& e) {
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("Collector listening on port {}", e.port);
        spdlog::info("Upload endpoint {}, storage {}", e.endpoint, e.storage);
        spdlog::info("════════════════════════════════════════════");
    }

    void on_server_shutdown(const ServerShuttingDownEvent& e) {
        spdlog::info("Collector shutting down: {}", e.reason);
    }

    EventBus& bus_;
    std::vector<EventBus::HandlerId> ids_;
};

} // namespace collector::events
