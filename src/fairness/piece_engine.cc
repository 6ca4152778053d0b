#include "piece_engine.hh"
#include "core/error.hh"
#include "core/logging.hh"
#include "crypto/hash.hh"
#include "crypto/signature.hh"
#include <unordered_set>

namespace fairplay {

namespace {

constexpr std::string_view PIECE_TYPE_INFO = "fairplay/piece-type/v1";
constexpr std::string_view PIECE_PROOF_INFO = "fairplay/piece-proof/v1";

void ensure_open(const VrfSession& session) {
    if (session.state == SessionState::EXPORTED || session.state == SessionState::EXPIRED) {
        throw FairnessException(FairnessError::SESSION_CLOSED,
                                "session " + session.session_id + " is " +
                                std::string(session_state_string(session.state)));
    }
}

}  // namespace

PieceEngine::PieceEngine(CommitRevealManager& commits, SessionConfig config)
    : commits_(commits)
    , store_(config) {}

// ============================================================================
// Derivations
// ============================================================================

seed_t PieceEngine::derive_master_seed(const seed_t& round_seed,
                                       std::string_view wallet,
                                       std::int64_t start_time_ms) {
    std::string message(wallet);
    message.append(":").append(std::to_string(start_time_ms));
    return hmac_sha256(round_seed, message);
}

seed_t PieceEngine::derive_piece_seed(const seed_t& master_seed,
                                      std::string_view session_id,
                                      piece_index_t index) {
    std::string message = "piece:";
    message.append(session_id).append(":").append(std::to_string(index));
    return hmac_sha256(master_seed, message);
}

TetrominoType PieceEngine::derive_piece_type(const seed_t& piece_seed) {
    auto material = hkdf_expand_hash(piece_seed, as_bytes(PIECE_TYPE_INFO));
    return tetromino_from_value(decode_u64_be(material.data()));
}

hash_t PieceEngine::derive_piece_proof(const seed_t& piece_seed,
                                       std::string_view session_id,
                                       piece_index_t index) {
    bytes_t info(PIECE_PROOF_INFO.begin(), PIECE_PROOF_INFO.end());
    info.insert(info.end(), session_id.begin(), session_id.end());

    std::array<std::uint8_t, 8> index_bytes;
    encode_u64_be(index_bytes.data(), index);
    info.insert(info.end(), index_bytes.begin(), index_bytes.end());

    return hkdf_expand_hash(piece_seed, info);
}

std::string PieceEngine::generate_session_id(system_time_t now) {
    std::array<std::uint8_t, SESSION_ID_RANDOM_BYTES> suffix;
    random_bytes(suffix);
    return "session_" + std::to_string(to_unix_ms(now)) + "_" + bytes_to_hex(suffix);
}

// ============================================================================
// Session Lifecycle
// ============================================================================

SessionSnapshot PieceEngine::initialize_session(std::string_view wallet,
                                                std::optional<std::string> session_id,
                                                system_time_t now) {
    if (wallet.empty()) {
        throw FairnessException(FairnessError::INVALID_ARGUMENT, "wallet address is empty");
    }

    const std::string id = session_id ? *session_id : generate_session_id(now);
    if (id.empty()) {
        throw FairnessException(FairnessError::INVALID_ARGUMENT, "session id is empty");
    }

    auto reuse = [&](SessionEntry& entry) {
        SessionLease lease(entry);
        std::lock_guard<std::mutex> lock(entry.mutex);
        if (entry.session.wallet_address != wallet) {
            throw FairnessException(FairnessError::COMMITMENT_CONFLICT,
                                    "session " + id + " belongs to another wallet");
        }
        ensure_open(entry.session);
        return SessionSnapshot::of(entry.session);
    };

    if (auto existing = store_.find(id)) {
        return reuse(*existing);
    }

    auto receipt = commits_.commit_seed(wallet, id, now);
    auto round_seed = commits_.committed_seed(id);
    if (!round_seed) {
        throw FairnessException(FairnessError::SEED_NOT_COMMITTED,
                                "commitment for " + id + " vanished");
    }

    const std::int64_t start_ms = to_unix_ms(now);

    auto entry = std::make_shared<SessionEntry>();
    VrfSession& session = entry->session;
    session.session_id = id;
    session.wallet_address = std::string(wallet);
    session.master_seed = derive_master_seed(*round_seed, wallet, start_ms);
    session.master_seed_hash = sha256(session.master_seed);
    session.seed_hash = receipt.seed_hash;
    session.start_time = from_unix_ms(start_ms);
    session.vrf_signature = receipt.vrf_signature;
    session.verifiable = receipt.verifiable;
    secure_zero(*round_seed);

    SessionSnapshot snapshot = SessionSnapshot::of(session);

    if (store_.insert(entry) == SessionStore::InsertResult::DUPLICATE) {
        // Lost a race with a concurrent initialize for the same id
        if (auto existing = store_.find(id)) {
            return reuse(*existing);
        }
        throw FairnessException(FairnessError::SESSION_CLOSED, "session " + id + " was evicted");
    }

    FAIRPLAY_LOG_INFO(log::pieces) << "Initialized session " << id
                                   << " master_seed_hash=" << short_hex(snapshot.master_seed_hash)
                                   << (snapshot.verifiable ? "" : " [unverifiable]");
    return snapshot;
}

std::shared_ptr<SessionEntry> PieceEngine::open_entry(std::string_view session_id) const {
    auto entry = store_.find(session_id);
    if (!entry) {
        throw FairnessException(FairnessError::SESSION_NOT_FOUND,
                                "no session " + std::string(session_id));
    }
    return entry;
}

PieceGenerationResult PieceEngine::issue_locked(VrfSession& session) {
    const piece_index_t index = session.piece_index;

    seed_t piece_seed = derive_piece_seed(session.master_seed, session.session_id, index);

    PieceGenerationResult result;
    result.session_id = session.session_id;
    result.piece_index = index;
    result.piece_type = derive_piece_type(piece_seed);
    result.proof = derive_piece_proof(piece_seed, session.session_id, index);

    PieceGenerationResult retained = result;
    retained.seed_used = piece_seed;
    session.issued.push_back(std::move(retained));
    secure_zero(piece_seed);

    session.piece_index = index + 1;
    session.state = SessionState::GENERATING;

    FAIRPLAY_LOG_TRACE(log::pieces) << "Session " << session.session_id << " piece "
                                    << index << " = " << tetromino_name(result.piece_type);
    return result;
}

PieceGenerationResult PieceEngine::generate_next_piece(std::string_view session_id) {
    auto entry = open_entry(session_id);
    SessionLease lease(*entry);
    std::lock_guard<std::mutex> lock(entry->mutex);

    ensure_open(entry->session);
    return issue_locked(entry->session);
}

PieceGenerationResult PieceEngine::generate_next_piece(std::string_view session_id,
                                                       piece_index_t expected_index) {
    auto entry = open_entry(session_id);
    SessionLease lease(*entry);
    std::lock_guard<std::mutex> lock(entry->mutex);

    ensure_open(entry->session);
    if (entry->session.piece_index != expected_index) {
        FAIRPLAY_LOG_WARN(log::pieces) << "Session " << session_id << " expected piece "
                                       << expected_index << ", next is "
                                       << entry->session.piece_index;
        throw FairnessException(FairnessError::PIECE_INDEX_OUT_OF_ORDER,
                                "expected " + std::to_string(expected_index) + ", next is " +
                                std::to_string(entry->session.piece_index));
    }
    return issue_locked(entry->session);
}

std::vector<PieceGenerationResult> PieceEngine::generate_piece_sequence(std::string_view session_id,
                                                                        std::size_t count) {
    auto entry = open_entry(session_id);
    SessionLease lease(*entry);
    std::lock_guard<std::mutex> lock(entry->mutex);

    ensure_open(entry->session);

    std::vector<PieceGenerationResult> pieces;
    pieces.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        pieces.push_back(issue_locked(entry->session));
    }
    return pieces;
}

std::optional<SessionSnapshot> PieceEngine::export_session_data(std::string_view session_id) {
    auto entry = store_.find(session_id);
    if (!entry) {
        return std::nullopt;
    }

    SessionLease lease(*entry);
    std::lock_guard<std::mutex> lock(entry->mutex);

    VrfSession& session = entry->session;
    if (session.state == SessionState::EXPIRED) {
        return std::nullopt;
    }

    if (session.state != SessionState::EXPORTED) {
        session.state = SessionState::EXPORTED;
        if (!commits_.mark_session_complete(session.session_id)) {
            FAIRPLAY_LOG_WARN(log::pieces) << "Session " << session_id
                                           << " exported without a commitment";
        }
        FAIRPLAY_LOG_INFO(log::pieces) << "Exported session " << session_id << " after "
                                       << session.piece_index << " pieces";
    }
    return SessionSnapshot::of(session);
}

std::optional<std::vector<PieceGenerationResult>> PieceEngine::disclose_pieces(
    std::string_view session_id) const {
    auto entry = store_.find(session_id);
    if (!entry) {
        return std::nullopt;
    }

    SessionLease lease(*entry);
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->session.state != SessionState::EXPORTED) {
        return std::nullopt;
    }
    return entry->session.issued;
}

std::optional<SessionSnapshot> PieceEngine::session(std::string_view session_id) const {
    auto entry = store_.find(session_id);
    if (!entry) {
        return std::nullopt;
    }

    SessionLease lease(*entry);
    std::lock_guard<std::mutex> lock(entry->mutex);
    return SessionSnapshot::of(entry->session);
}

std::unique_ptr<SessionRng> PieceEngine::session_rng(std::string_view session_id) const {
    auto entry = open_entry(session_id);
    SessionLease lease(*entry);
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->session.state == SessionState::EXPIRED) {
        throw FairnessException(FairnessError::SESSION_CLOSED,
                                "session " + std::string(session_id) + " expired");
    }
    return std::make_unique<SessionRng>(entry->session.master_seed);
}

std::size_t PieceEngine::cleanup_old_sessions(system_time_t now) {
    const std::size_t evicted = store_.evict_expired(now);

    // Deferred sessions keep their commitments until a later sweep evicts them
    const auto ids = store_.session_ids();
    const std::unordered_set<std::string> live(ids.begin(), ids.end());
    (void)commits_.prune(now - std::chrono::milliseconds(store_.config().ttl_ms), live);
    return evicted;
}

// ============================================================================
// Verification
// ============================================================================

bool PieceEngine::verify_piece_generation(const PieceGenerationResult& piece) {
    if (!piece.seed_used || piece.session_id.empty()) {
        return false;
    }

    try {
        const seed_t& seed = *piece.seed_used;
        if (derive_piece_type(seed) != piece.piece_type) {
            return false;
        }
        return derive_piece_proof(seed, piece.session_id, piece.piece_index) == piece.proof;
    } catch (const std::exception& e) {
        FAIRPLAY_LOG_DEBUG(log::pieces) << "Piece verification error: " << e.what();
        return false;
    }
}

bool PieceEngine::verify_piece_against_master(const PieceGenerationResult& piece,
                                              const seed_t& master_seed) {
    if (!piece.seed_used) {
        return false;
    }

    try {
        if (derive_piece_seed(master_seed, piece.session_id, piece.piece_index) != *piece.seed_used) {
            return false;
        }
    } catch (const std::exception& e) {
        FAIRPLAY_LOG_DEBUG(log::pieces) << "Piece verification error: " << e.what();
        return false;
    }
    return verify_piece_generation(piece);
}

std::vector<PieceGenerationResult> PieceEngine::replay_pieces(const seed_t& round_seed,
                                                              std::string_view wallet,
                                                              system_time_t start_time,
                                                              std::string_view session_id,
                                                              std::size_t count) {
    seed_t master = derive_master_seed(round_seed, wallet, to_unix_ms(start_time));

    std::vector<PieceGenerationResult> pieces;
    pieces.reserve(count);
    for (piece_index_t i = 0; i < count; ++i) {
        seed_t piece_seed = derive_piece_seed(master, session_id, i);

        PieceGenerationResult piece;
        piece.session_id = std::string(session_id);
        piece.piece_index = i;
        piece.piece_type = derive_piece_type(piece_seed);
        piece.proof = derive_piece_proof(piece_seed, session_id, i);
        piece.seed_used = piece_seed;
        pieces.push_back(std::move(piece));
    }

    secure_zero(master);
    return pieces;
}

// ============================================================================
// SessionRng Implementation
// ============================================================================

SessionRng::SessionRng(const seed_t& master_seed)
    : master_seed_(master_seed) {}

SessionRng::~SessionRng() {
    secure_zero(master_seed_);
}

double SessionRng::next() {
    auto h = hmac_sha256(master_seed_, "rng_" + std::to_string(counter_++));
    return static_cast<double>(decode_u32_be(h.data())) / 4294967295.0;
}

}  // namespace fairplay
