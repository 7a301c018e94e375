#pragma once

#include "collector/core/result.hpp"
#include "collector/upload/types.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace collector::upload {

using Clock = std::function<std::chrono::steady_clock::time_point()>;

/**
 * @brief Per-identifier mutual exclusion
 *
 * Entries exist only while at least one caller holds or waits for a key, so the
 * table does not grow with the number of uploads ever seen.
 */
class UploadLockTable {
public:
    class Guard {
    public:
        Guard(Guard&& other) noexcept;
        Guard& operator=(Guard&&) = delete;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        ~Guard();

    private:
        friend class UploadLockTable;
        Guard(UploadLockTable* table, std::string key) : table_(table), key_(std::move(key)) {}

        UploadLockTable* table_;
        std::string key_;
    };

    UploadLockTable() = default;
    UploadLockTable(const UploadLockTable&) = delete;
    UploadLockTable& operator=(const UploadLockTable&) = delete;

    [[nodiscard]] Guard acquire(const std::string& key);

    // Empty when another caller holds the key.
    [[nodiscard]] std::optional<Guard> try_acquire(const std::string& key);

    [[nodiscard]] std::size_t active_keys() const;

private:
    struct Entry {
        std::mutex mutex;
        std::size_t users = 0;
    };

    void release(const std::string& key);

    mutable std::mutex table_mutex_;
    std::unordered_map<std::string, std::unique_ptr<Entry>> entries_;
};

/**
 * @brief Concurrency-safe map of upload identifier to session record
 *
 * Mutations of one session are expected to run under the matching
 * UploadLockTable guard; the store itself only protects the map.
 */
class UploadSessionStore {
public:
    explicit UploadSessionStore(std::chrono::milliseconds expiration,
                                Clock clock = [] { return std::chrono::steady_clock::now(); });

    UploadSessionStore(const UploadSessionStore&) = delete;
    UploadSessionStore& operator=(const UploadSessionStore&) = delete;

    collector::Result<UploadSession> create(const UploadIdentifier& identifier,
                                            const UploadIdentity& identity,
                                            std::uint64_t total_length);

    collector::Result<UploadSession> advance(const UploadIdentifier& identifier,
                                             std::uint64_t bytes_appended);

    collector::Result<UploadSession> get(const UploadIdentifier& identifier) const;

    collector::Result<void> transition(const UploadIdentifier& identifier,
                                       SessionState next_state,
                                       std::string error_message = {});

    bool remove(const UploadIdentifier& identifier);

    /**
     * @brief Identifiers idle for longer than the expiration window
     *
     * Only sessions still accepting chunks are reported; a session in
     * finalization is never considered idle.
     */
    [[nodiscard]] std::vector<UploadIdentifier> expired() const;

    // Marks the session Expired and drops it if it is still idle; false otherwise.
    bool expire(const UploadIdentifier& identifier);

    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] std::chrono::milliseconds expiration() const noexcept { return expiration_; }

private:
    static bool can_transition(SessionState current, SessionState target);
    bool is_idle(const UploadSession& session, std::chrono::steady_clock::time_point now) const;

    std::chrono::milliseconds expiration_;
    Clock clock_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<UploadIdentifier, UploadSession> sessions_;
};

} // namespace collector::upload
