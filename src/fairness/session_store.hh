#pragma once

#include "core/config.hh"
#include "core/types.hh"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace fairplay {

// ============================================================================
// Piece Result
// ============================================================================

struct PieceGenerationResult {
    std::string session_id;
    piece_index_t piece_index = 0;
    TetrominoType piece_type = TetrominoType::I;
    hash_t proof{};
    std::optional<seed_t> seed_used;   // Only present once disclosed post-game
};

// ============================================================================
// VRF Session
// ============================================================================

struct VrfSession {
    std::string session_id;
    std::string wallet_address;
    seed_t master_seed{};              // Never leaves the process
    hash_t master_seed_hash{};
    hash_t seed_hash{};                // Commitment for the round seed
    piece_index_t piece_index = 0;
    system_time_t start_time;
    std::string vrf_signature;
    bool verifiable = true;
    SessionState state = SessionState::INITIALIZED;
    std::vector<PieceGenerationResult> issued;   // Kept for disclosure until eviction
};

// Public fields only
struct SessionSnapshot {
    std::string session_id;
    std::string wallet_address;
    hash_t master_seed_hash{};
    hash_t seed_hash{};
    piece_index_t piece_index = 0;
    system_time_t start_time;
    std::string vrf_signature;
    bool verifiable = true;
    SessionState state = SessionState::INITIALIZED;

    [[nodiscard]] static SessionSnapshot of(const VrfSession& session);
};

// One session plus the lock that serializes its piece counter
struct SessionEntry {
    std::mutex mutex;
    std::atomic<std::uint32_t> in_flight{0};
    VrfSession session;
};

// Marks an entry busy for the duration of a call so the TTL sweep skips it
class SessionLease {
public:
    explicit SessionLease(SessionEntry& entry) : entry_(entry) { entry_.in_flight.fetch_add(1); }
    ~SessionLease() { entry_.in_flight.fetch_sub(1); }

    SessionLease(const SessionLease&) = delete;
    SessionLease& operator=(const SessionLease&) = delete;

private:
    SessionEntry& entry_;
};

// ============================================================================
// Session Store
// ============================================================================

class SessionStore {
public:
    explicit SessionStore(SessionConfig config = {});
    ~SessionStore();

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    enum class InsertResult {
        INSERTED,
        DUPLICATE,
    };
    InsertResult insert(std::shared_ptr<SessionEntry> entry);

    [[nodiscard]] std::shared_ptr<SessionEntry> find(std::string_view session_id) const;
    [[nodiscard]] bool contains(std::string_view session_id) const;

    bool erase(std::string_view session_id);

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::vector<std::string> session_ids() const;

    // Evicts sessions whose start_time is older than the TTL. Entries that
    // are locked or have a call in flight are left for the next sweep.
    // Evicted entries are marked EXPIRED so outstanding handles fail.
    std::size_t evict_expired(system_time_t now);

    [[nodiscard]] const SessionConfig& config() const { return config_; }

private:
    SessionConfig config_;
    std::unordered_map<std::string, std::shared_ptr<SessionEntry>> sessions_;
    mutable std::mutex mutex_;
};

}  // namespace fairplay
