#include "session_store.hh"
#include "core/logging.hh"

namespace fairplay {

SessionSnapshot SessionSnapshot::of(const VrfSession& session) {
    SessionSnapshot snap;
    snap.session_id = session.session_id;
    snap.wallet_address = session.wallet_address;
    snap.master_seed_hash = session.master_seed_hash;
    snap.seed_hash = session.seed_hash;
    snap.piece_index = session.piece_index;
    snap.start_time = session.start_time;
    snap.vrf_signature = session.vrf_signature;
    snap.verifiable = session.verifiable;
    snap.state = session.state;
    return snap;
}

// ============================================================================
// SessionStore Implementation
// ============================================================================

SessionStore::SessionStore(SessionConfig config)
    : config_(config) {}

SessionStore::~SessionStore() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, entry] : sessions_) {
        std::lock_guard<std::mutex> entry_lock(entry->mutex);
        secure_zero(entry->session.master_seed);
    }
}

SessionStore::InsertResult SessionStore::insert(std::shared_ptr<SessionEntry> entry) {
    std::lock_guard<std::mutex> lock(mutex_);

    const std::string id = entry->session.session_id;
    if (sessions_.count(id) > 0) {
        return InsertResult::DUPLICATE;
    }

    sessions_.emplace(id, std::move(entry));
    FAIRPLAY_LOG_DEBUG(log::sessions) << "Stored session " << id
                                      << " (total: " << sessions_.size() << ")";
    return InsertResult::INSERTED;
}

std::shared_ptr<SessionEntry> SessionStore::find(std::string_view session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(std::string(session_id));
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

bool SessionStore::contains(std::string_view session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(std::string(session_id)) > 0;
}

bool SessionStore::erase(std::string_view session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(std::string(session_id));
    if (it == sessions_.end()) {
        return false;
    }

    {
        std::lock_guard<std::mutex> entry_lock(it->second->mutex);
        it->second->session.state = SessionState::EXPIRED;
        secure_zero(it->second->session.master_seed);
    }
    sessions_.erase(it);
    return true;
}

std::size_t SessionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<std::string> SessionStore::session_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& [id, entry] : sessions_) {
        ids.push_back(id);
    }
    return ids;
}

std::size_t SessionStore::evict_expired(system_time_t now) {
    const auto ttl = std::chrono::milliseconds(config_.ttl_ms);

    std::lock_guard<std::mutex> lock(mutex_);

    std::size_t evicted = 0;
    std::size_t deferred = 0;

    for (auto it = sessions_.begin(); it != sessions_.end();) {
        auto& entry = *it->second;

        // start_time is fixed at insert, safe to read unlocked
        if (now - entry.session.start_time <= ttl) {
            ++it;
            continue;
        }

        if (entry.in_flight.load() > 0) {
            ++deferred;
            ++it;
            continue;
        }

        std::unique_lock<std::mutex> entry_lock(entry.mutex, std::try_to_lock);
        if (!entry_lock.owns_lock() || entry.in_flight.load() > 0) {
            ++deferred;
            ++it;
            continue;
        }

        entry.session.state = SessionState::EXPIRED;
        secure_zero(entry.session.master_seed);
        entry_lock.unlock();

        it = sessions_.erase(it);
        ++evicted;
    }

    if (evicted > 0 || deferred > 0) {
        FAIRPLAY_LOG_INFO(log::sessions) << "Session sweep evicted " << evicted
                                         << ", deferred " << deferred
                                         << ", remaining " << sessions_.size();
    }
    return evicted;
}

}  // namespace fairplay
