#include "collector/upload/session_store.hpp"

#include <algorithm>

namespace collector::upload {
namespace {

bool is_progressive(SessionState current, SessionState target) {
    static const std::unordered_map<SessionState, std::vector<SessionState>> transitions {
        {SessionState::New, {SessionState::Receiving}},
        {SessionState::Receiving, {SessionState::Finalizing, SessionState::Expired}},
        // Back to Receiving when finalization hit a transient failure.
        {SessionState::Finalizing, {SessionState::Complete, SessionState::Receiving}},
    };

    if (target == SessionState::Failed) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

collector::Error unknown_session(const UploadIdentifier& identifier) {
    return collector::Error{ErrorCode::SessionExpired, "No upload session for " + identifier};
}

} // namespace

UploadLockTable::Guard::Guard(Guard&& other) noexcept
    : table_(other.table_), key_(std::move(other.key_)) {
    other.table_ = nullptr;
}

UploadLockTable::Guard::~Guard() {
    if (table_ != nullptr) {
        table_->release(key_);
    }
}

UploadLockTable::Guard UploadLockTable::acquire(const std::string& key) {
    Entry* entry = nullptr;
    {
        std::lock_guard lock(table_mutex_);
        auto& slot = entries_[key];
        if (!slot) {
            slot = std::make_unique<Entry>();
        }
        ++slot->users;
        entry = slot.get();
    }
    entry->mutex.lock();
    return Guard(this, key);
}

std::optional<UploadLockTable::Guard> UploadLockTable::try_acquire(const std::string& key) {
    std::lock_guard lock(table_mutex_);
    auto& slot = entries_[key];
    if (!slot) {
        slot = std::make_unique<Entry>();
    }
    if (!slot->mutex.try_lock()) {
        return std::nullopt;
    }
    ++slot->users;
    return Guard(this, key);
}

void UploadLockTable::release(const std::string& key) {
    std::lock_guard lock(table_mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return;
    }
    it->second->mutex.unlock();
    if (--it->second->users == 0) {
        entries_.erase(it);
    }
}

std::size_t UploadLockTable::active_keys() const {
    std::lock_guard lock(table_mutex_);
    return entries_.size();
}

UploadSessionStore::UploadSessionStore(std::chrono::milliseconds expiration, Clock clock)
    : expiration_(expiration), clock_(std::move(clock)) {}

collector::Result<UploadSession> UploadSessionStore::create(const UploadIdentifier& identifier,
                                                            const UploadIdentity& identity,
                                                            std::uint64_t total_length) {
    std::unique_lock lock(mutex_);
    auto it = sessions_.find(identifier);
    if (it != sessions_.end()) {
        if (it->second.total_length != total_length) {
            return collector::Err<UploadSession>(ErrorCode::ContentRangeMismatch,
                "Session " + identifier + " already declared " +
                std::to_string(it->second.total_length) + " bytes");
        }
        return collector::Ok(it->second);
    }

    UploadSession session;
    session.identifier = identifier;
    session.identity = identity;
    session.total_length = total_length;
    session.state = SessionState::New;
    session.created = clock_();
    session.last_activity = session.created;
    sessions_.emplace(identifier, session);
    return collector::Ok(session);
}

collector::Result<UploadSession> UploadSessionStore::advance(const UploadIdentifier& identifier,
                                                             std::uint64_t bytes_appended) {
    std::unique_lock lock(mutex_);
    auto it = sessions_.find(identifier);
    if (it == sessions_.end()) {
        return collector::Err<UploadSession>(unknown_session(identifier));
    }

    auto& session = it->second;
    if (session.state != SessionState::New && session.state != SessionState::Receiving) {
        return collector::Err<UploadSession>(ErrorCode::ContentRangeMismatch,
            "Session " + identifier + " no longer accepts chunks (" + to_string(session.state) + ")");
    }
    if (session.bytes_stored + bytes_appended > session.total_length) {
        return collector::Err<UploadSession>(ErrorCode::ContentRangeMismatch,
            "Appending " + std::to_string(bytes_appended) + " bytes exceeds declared length " +
            std::to_string(session.total_length));
    }

    session.bytes_stored += bytes_appended;
    session.state = SessionState::Receiving;
    session.last_activity = clock_();
    return collector::Ok(session);
}

collector::Result<UploadSession> UploadSessionStore::get(const UploadIdentifier& identifier) const {
    std::shared_lock lock(mutex_);
    auto it = sessions_.find(identifier);
    if (it == sessions_.end()) {
        return collector::Err<UploadSession>(unknown_session(identifier));
    }
    return collector::Ok(it->second);
}

collector::Result<void> UploadSessionStore::transition(const UploadIdentifier& identifier,
                                                       SessionState next_state,
                                                       std::string error_message) {
    std::unique_lock lock(mutex_);
    auto it = sessions_.find(identifier);
    if (it == sessions_.end()) {
        return collector::Err<void>(unknown_session(identifier));
    }

    auto& session = it->second;
    if (session.state == next_state) {
        return collector::Ok();
    }
    if (!can_transition(session.state, next_state)) {
        return collector::Err<void>(Error{ErrorCode::InvalidRequest,
            std::string("Illegal session state transition ") + to_string(session.state) + " -> " +
            to_string(next_state)});
    }

    session.state = next_state;
    session.last_activity = clock_();
    if (next_state == SessionState::Failed) {
        session.last_error = std::move(error_message);
    } else {
        session.last_error.clear();
    }
    return collector::Ok();
}

bool UploadSessionStore::remove(const UploadIdentifier& identifier) {
    std::unique_lock lock(mutex_);
    return sessions_.erase(identifier) > 0;
}

std::vector<UploadIdentifier> UploadSessionStore::expired() const {
    const auto now = clock_();
    std::shared_lock lock(mutex_);
    std::vector<UploadIdentifier> result;
    for (const auto& [identifier, session] : sessions_) {
        if (is_idle(session, now)) {
            result.push_back(identifier);
        }
    }
    return result;
}

bool UploadSessionStore::expire(const UploadIdentifier& identifier) {
    const auto now = clock_();
    std::unique_lock lock(mutex_);
    auto it = sessions_.find(identifier);
    if (it == sessions_.end() || !is_idle(it->second, now)) {
        return false;
    }
    it->second.state = SessionState::Expired;
    sessions_.erase(it);
    return true;
}

bool UploadSessionStore::is_idle(const UploadSession& session,
                                 std::chrono::steady_clock::time_point now) const {
    const bool accepting = session.state == SessionState::New ||
                           session.state == SessionState::Receiving;
    return accepting && now - session.last_activity > expiration_;
}

std::size_t UploadSessionStore::size() const {
    std::shared_lock lock(mutex_);
    return sessions_.size();
}

bool UploadSessionStore::can_transition(SessionState current, SessionState target) {
    if (current == target) {
        return true;
    }
    if (current == SessionState::Complete || current == SessionState::Expired ||
        current == SessionState::Failed) {
        return false;
    }
    return is_progressive(current, target);
}

} // namespace collector::upload
