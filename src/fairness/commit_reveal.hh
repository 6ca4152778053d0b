#pragma once

#include "core/types.hh"
#include "fairness/seed_authority.hh"
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace fairplay {

// ============================================================================
// Commitment (public view)
// ============================================================================

struct SeedCommitment {
    std::string wallet_address;
    std::string session_id;
    hash_t seed_hash;                 // SHA-256(seed), published before play
    std::optional<seed_t> revealed_seed;
    bool session_complete = false;
    std::string vrf_signature;        // Of the daily seed this was derived from
    bool verifiable = true;           // Inherited from the seed record
    system_time_t created_at;
};

struct CommitReceipt {
    hash_t seed_hash;
    std::string session_id;
    std::string vrf_signature;
    bool verifiable = true;
};

// ============================================================================
// Commit-Reveal Manager
// ============================================================================

class CommitRevealManager {
public:
    explicit CommitRevealManager(SeedAuthority& authority);
    ~CommitRevealManager();

    CommitRevealManager(const CommitRevealManager&) = delete;
    CommitRevealManager& operator=(const CommitRevealManager&) = delete;

    // Commits the round seed for (wallet, session_id). A repeat commit for
    // the same wallet returns the original commitment while it is still open;
    // another wallet throws COMMITMENT_CONFLICT. An id whose session completed
    // throws SESSION_CLOSED, even after the commitment was pruned, because the
    // round seed for that id repeats until the daily seed rotates.
    // Oracle failures surface as ORACLE_UNAVAILABLE.
    CommitReceipt commit_seed(std::string_view wallet,
                              std::string_view session_id,
                              system_time_t now = std::chrono::system_clock::now());

    // Gameplay finished; reveal becomes possible. False if never committed.
    bool mark_session_complete(std::string_view session_id);

    enum class RevealStatus {
        REVEALED,
        ALREADY_REVEALED,
        NOT_COMMITTED,
        SESSION_ACTIVE,      // Refused: pieces would become predictable
    };

    struct RevealResult {
        RevealStatus status;
        std::optional<seed_t> seed;
    };

    // First reveal wins; later calls return the identical seed
    RevealResult reveal(std::string_view session_id);

    // Seed, or empty when not committed or still active
    [[nodiscard]] std::optional<seed_t> reveal_seed(std::string_view session_id);

    // SHA-256(seed) == seed_hash; never throws
    [[nodiscard]] static bool verify_reveal(const hash_t& seed_hash, const seed_t& seed);

    [[nodiscard]] std::optional<SeedCommitment> commitment(std::string_view session_id) const;
    [[nodiscard]] bool has_commitment(std::string_view session_id) const;
    [[nodiscard]] std::size_t size() const;

    // Completed, or tombstoned after a prune; the id cannot be committed again
    [[nodiscard]] bool is_closed(std::string_view session_id) const;
    [[nodiscard]] std::size_t tombstone_count() const;

    // Drop commitments created before the cutoff, except ids in `retain`;
    // returns how many. Completed ids leave a tombstone that lasts until the
    // UTC midnight after the commit and is dropped once the cutoff passes it.
    std::size_t prune(system_time_t before);
    std::size_t prune(system_time_t before, const std::unordered_set<std::string>& retain);

private:
    friend class PieceEngine;

    struct Entry {
        SeedCommitment commitment;
        seed_t seed;
    };

    SeedAuthority& authority_;
    std::unordered_map<std::string, Entry> entries_;
    std::unordered_map<std::string, system_time_t> tombstones_;   // id -> retire at
    mutable std::mutex mutex_;

    [[noreturn]] static void throw_closed(std::string_view session_id);

    // Raw seed for server-side derivation only
    [[nodiscard]] std::optional<seed_t> committed_seed(std::string_view session_id) const;
};

[[nodiscard]] std::string_view reveal_status_string(CommitRevealManager::RevealStatus status);

}  // namespace fairplay
