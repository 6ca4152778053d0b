#include "commit_reveal.hh"
#include "core/error.hh"
#include "core/logging.hh"
#include "crypto/hash.hh"

namespace fairplay {

std::string_view reveal_status_string(CommitRevealManager::RevealStatus status) {
    switch (status) {
        case CommitRevealManager::RevealStatus::REVEALED: return "revealed";
        case CommitRevealManager::RevealStatus::ALREADY_REVEALED: return "already-revealed";
        case CommitRevealManager::RevealStatus::NOT_COMMITTED: return "not-committed";
        case CommitRevealManager::RevealStatus::SESSION_ACTIVE: return "session-active";
    }
    return "unknown";
}

CommitRevealManager::CommitRevealManager(SeedAuthority& authority)
    : authority_(authority) {}

CommitRevealManager::~CommitRevealManager() {
    for (auto& [id, entry] : entries_) {
        secure_zero(entry.seed);
    }
}

// ============================================================================
// Commit
// ============================================================================

CommitReceipt CommitRevealManager::commit_seed(std::string_view wallet,
                                               std::string_view session_id,
                                               system_time_t now) {
    if (wallet.empty() || session_id.empty()) {
        throw FairnessException(FairnessError::INVALID_ARGUMENT,
                                "commit needs a wallet and a session id");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (tombstones_.count(std::string(session_id)) > 0) {
            throw_closed(session_id);
        }
        auto it = entries_.find(std::string(session_id));
        if (it != entries_.end()) {
            const auto& existing = it->second.commitment;
            if (existing.wallet_address != wallet) {
                FAIRPLAY_LOG_WARN(log::commit) << "Session " << session_id
                                               << " already committed for another wallet";
                throw FairnessException(FairnessError::COMMITMENT_CONFLICT,
                                        "session " + std::string(session_id) +
                                        " belongs to another wallet");
            }
            if (existing.session_complete || existing.revealed_seed) {
                throw_closed(session_id);
            }
            return {existing.seed_hash, existing.session_id, existing.vrf_signature,
                    existing.verifiable};
        }
    }

    // Oracle round-trip happens outside the lock
    auto record = authority_.current_seed(now);
    seed_t seed = SeedAuthority::round_seed(*record, wallet, session_id);

    Entry entry;
    entry.seed = seed;
    entry.commitment.wallet_address = std::string(wallet);
    entry.commitment.session_id = std::string(session_id);
    entry.commitment.seed_hash = sha256(seed);
    entry.commitment.vrf_signature = record->vrf_signature;
    entry.commitment.verifiable = record->verifiable;
    entry.commitment.created_at = now;
    secure_zero(seed);

    std::lock_guard<std::mutex> lock(mutex_);
    if (tombstones_.count(std::string(session_id)) > 0) {
        secure_zero(entry.seed);
        throw_closed(session_id);
    }
    auto [it, inserted] = entries_.emplace(std::string(session_id), std::move(entry));
    const auto& stored = it->second.commitment;

    if (!inserted && stored.wallet_address != wallet) {
        throw FairnessException(FairnessError::COMMITMENT_CONFLICT,
                                "session " + std::string(session_id) +
                                " belongs to another wallet");
    }
    if (!inserted && (stored.session_complete || stored.revealed_seed)) {
        throw_closed(session_id);
    }

    if (inserted) {
        FAIRPLAY_LOG_DEBUG(log::commit) << "Committed session " << session_id
                                        << " seed_hash=" << short_hex(stored.seed_hash);
    }
    return {stored.seed_hash, stored.session_id, stored.vrf_signature, stored.verifiable};
}

bool CommitRevealManager::mark_session_complete(std::string_view session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(std::string(session_id));
    if (it == entries_.end()) {
        return false;
    }
    it->second.commitment.session_complete = true;
    return true;
}

// ============================================================================
// Reveal
// ============================================================================

CommitRevealManager::RevealResult CommitRevealManager::reveal(std::string_view session_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(std::string(session_id));
    if (it == entries_.end()) {
        return {RevealStatus::NOT_COMMITTED, std::nullopt};
    }

    auto& commitment = it->second.commitment;
    if (commitment.revealed_seed) {
        return {RevealStatus::ALREADY_REVEALED, commitment.revealed_seed};
    }

    if (!commitment.session_complete) {
        FAIRPLAY_LOG_WARN(log::commit) << "Refused reveal of active session " << session_id;
        return {RevealStatus::SESSION_ACTIVE, std::nullopt};
    }

    commitment.revealed_seed = it->second.seed;
    log::commit.info("Revealed seed for session " + commitment.session_id);
    return {RevealStatus::REVEALED, commitment.revealed_seed};
}

std::optional<seed_t> CommitRevealManager::reveal_seed(std::string_view session_id) {
    return reveal(session_id).seed;
}

bool CommitRevealManager::verify_reveal(const hash_t& seed_hash, const seed_t& seed) {
    return sha256(seed) == seed_hash;
}

// ============================================================================
// Queries
// ============================================================================

std::optional<SeedCommitment> CommitRevealManager::commitment(std::string_view session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(std::string(session_id));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.commitment;
}

bool CommitRevealManager::has_commitment(std::string_view session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(std::string(session_id)) > 0;
}

std::size_t CommitRevealManager::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::optional<seed_t> CommitRevealManager::committed_seed(std::string_view session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(std::string(session_id));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.seed;
}

bool CommitRevealManager::is_closed(std::string_view session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (tombstones_.count(std::string(session_id)) > 0) {
        return true;
    }
    auto it = entries_.find(std::string(session_id));
    return it != entries_.end() &&
           (it->second.commitment.session_complete || it->second.commitment.revealed_seed);
}

std::size_t CommitRevealManager::tombstone_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tombstones_.size();
}

std::size_t CommitRevealManager::prune(system_time_t before) {
    return prune(before, {});
}

std::size_t CommitRevealManager::prune(system_time_t before,
                                       const std::unordered_set<std::string>& retain) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        const auto& commitment = it->second.commitment;
        if (commitment.created_at >= before || retain.count(it->first) > 0) {
            ++it;
            continue;
        }

        if (commitment.session_complete || commitment.revealed_seed) {
            tombstones_.emplace(it->first, next_utc_midnight(commitment.created_at));
        }
        secure_zero(it->second.seed);
        it = entries_.erase(it);
        ++removed;
    }

    std::size_t retired = 0;
    for (auto it = tombstones_.begin(); it != tombstones_.end();) {
        if (it->second <= before) {
            it = tombstones_.erase(it);
            ++retired;
        } else {
            ++it;
        }
    }

    if (removed > 0 || retired > 0) {
        FAIRPLAY_LOG_DEBUG(log::commit) << "Pruned " << removed << " commitments, retired "
                                        << retired << " tombstones, " << tombstones_.size()
                                        << " remain";
    }
    return removed;
}

void CommitRevealManager::throw_closed(std::string_view session_id) {
    FAIRPLAY_LOG_WARN(log::commit) << "Refused to recommit closed session " << session_id;
    throw FairnessException(FairnessError::SESSION_CLOSED,
                            "session " + std::string(session_id) + " already completed");
}

}  // namespace fairplay
