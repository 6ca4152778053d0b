#pragma once

#include "core/config.hh"
#include "core/types.hh"
#include "fairness/commit_reveal.hh"
#include "fairness/session_store.hh"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fairplay {

class SessionRng;

// ============================================================================
// Piece Generation Engine
// ============================================================================
//
// Derivation chain, all HMAC-SHA256 / HKDF-SHA256:
//
//   round_seed   = committed seed for (wallet, session_id)
//   master_seed  = HMAC(round_seed, wallet ":" start_time_ms)
//   piece_seed_i = HMAC(master_seed, "piece:" session_id ":" i)
//   type_i       = u64_be(HKDF-Expand(piece_seed_i, "fairplay/piece-type/v1")) mod 7
//   proof_i      = HKDF-Expand(piece_seed_i, "fairplay/piece-proof/v1" || session_id || u64_be(i))
//
// Once the round seed is revealed anyone can replay the whole stream.

class PieceEngine {
public:
    explicit PieceEngine(CommitRevealManager& commits, SessionConfig config = {});

    PieceEngine(const PieceEngine&) = delete;
    PieceEngine& operator=(const PieceEngine&) = delete;

    // Creates a session bound to the committed round seed (committing first
    // if needed). session_id is generated when absent. Throws
    // ORACLE_UNAVAILABLE, COMMITMENT_CONFLICT or INVALID_ARGUMENT.
    SessionSnapshot initialize_session(
        std::string_view wallet,
        std::optional<std::string> session_id = std::nullopt,
        system_time_t now = std::chrono::system_clock::now());

    // Next piece; seed_used is withheld. Throws SESSION_NOT_FOUND or SESSION_CLOSED.
    PieceGenerationResult generate_next_piece(std::string_view session_id);

    // As above, but the caller states which index it expects.
    // Throws PIECE_INDEX_OUT_OF_ORDER on mismatch without advancing.
    PieceGenerationResult generate_next_piece(std::string_view session_id,
                                              piece_index_t expected_index);

    // count contiguous pieces under one lock
    std::vector<PieceGenerationResult> generate_piece_sequence(std::string_view session_id,
                                                               std::size_t count);

    // Recomputes type and proof from seed_used; never throws
    [[nodiscard]] static bool verify_piece_generation(const PieceGenerationResult& piece);

    // Also checks seed_used descends from master_seed; never throws
    [[nodiscard]] static bool verify_piece_against_master(const PieceGenerationResult& piece,
                                                          const seed_t& master_seed);

    // Third-party replay from a revealed round seed, seed_used populated
    [[nodiscard]] static std::vector<PieceGenerationResult> replay_pieces(
        const seed_t& round_seed,
        std::string_view wallet,
        system_time_t start_time,
        std::string_view session_id,
        std::size_t count);

    // Public snapshot for validation; moves the session to EXPORTED and
    // marks its commitment complete. Empty when unknown or expired.
    std::optional<SessionSnapshot> export_session_data(std::string_view session_id);

    // Issued pieces with seed_used, only once the session is EXPORTED
    [[nodiscard]] std::optional<std::vector<PieceGenerationResult>> disclose_pieces(
        std::string_view session_id) const;

    [[nodiscard]] std::optional<SessionSnapshot> session(std::string_view session_id) const;

    // Replay stream keyed by the session's master seed, for the server-side
    // move simulation. Throws SESSION_NOT_FOUND.
    [[nodiscard]] std::unique_ptr<SessionRng> session_rng(std::string_view session_id) const;

    // TTL sweep over sessions and their commitments; returns the number of
    // sessions evicted. Seeds of evicted sessions can no longer be revealed.
    std::size_t cleanup_old_sessions(system_time_t now = std::chrono::system_clock::now());

    [[nodiscard]] std::size_t session_count() const { return store_.size(); }

    // ========================================================================
    // Derivations
    // ========================================================================

    [[nodiscard]] static seed_t derive_master_seed(const seed_t& round_seed,
                                                   std::string_view wallet,
                                                   std::int64_t start_time_ms);

    [[nodiscard]] static seed_t derive_piece_seed(const seed_t& master_seed,
                                                  std::string_view session_id,
                                                  piece_index_t index);

    [[nodiscard]] static TetrominoType derive_piece_type(const seed_t& piece_seed);

    [[nodiscard]] static hash_t derive_piece_proof(const seed_t& piece_seed,
                                                   std::string_view session_id,
                                                   piece_index_t index);

    // session_<unix ms>_<16 hex>
    [[nodiscard]] static std::string generate_session_id(system_time_t now);

private:
    CommitRevealManager& commits_;
    SessionStore store_;

    std::shared_ptr<SessionEntry> open_entry(std::string_view session_id) const;
    static PieceGenerationResult issue_locked(VrfSession& session);
};

// ============================================================================
// Session RNG
// ============================================================================

// Server-side replay stream: value_n = u32_be(HMAC(master_seed, "rng_" n)) / 0xFFFFFFFF
class SessionRng {
public:
    explicit SessionRng(const seed_t& master_seed);
    ~SessionRng();

    SessionRng(const SessionRng&) = delete;
    SessionRng& operator=(const SessionRng&) = delete;

    // In [0, 1]
    [[nodiscard]] double next();

    [[nodiscard]] std::uint64_t counter() const { return counter_; }

private:
    seed_t master_seed_;
    std::uint64_t counter_ = 0;
};

}  // namespace fairplay
