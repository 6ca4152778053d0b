#pragma once

#include "core/types.hh"
#include "crypto/hash.hh"
#include "raffle/ticket_manager.hh"
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace fairplay {

// ============================================================================
// Merkle Audit Tree
// ============================================================================

// Commits the day's qualification set. Leaves are
// SHA-256("wallet:rank:score:tickets") in rank order; parents hash the raw
// 32-byte children; odd levels duplicate the last node. An empty set has the
// all-zero root.
class MerkleAudit {
public:
    explicit MerkleAudit(std::span<const QualifiedWallet> qualified);

    [[nodiscard]] const hash_t& root() const { return tree_.root(); }
    [[nodiscard]] std::string root_hex() const { return bytes_to_hex(tree_.root()); }
    [[nodiscard]] std::size_t leaf_count() const { return tree_.leaf_count(); }
    [[nodiscard]] const std::vector<hash_t>& leaves() const { return leaves_; }

    // Leaves first, root last; empty for an empty set
    [[nodiscard]] std::vector<hash_t> nodes() const { return tree_.nodes(); }

    // Proof for the wallet holding `rank`, nullopt if no such rank
    [[nodiscard]] std::optional<std::vector<hash_t>> proof_for(rank_t rank) const;

    // ------------------------------------------------------------------------
    // Stateless surface
    // ------------------------------------------------------------------------

    [[nodiscard]] static hash_t leaf_hash(std::string_view wallet, rank_t rank,
                                          score_t score, ticket_count_t tickets);
    [[nodiscard]] static hash_t leaf_hash(const QualifiedWallet& q);

    // Leaf hashes ordered by rank
    [[nodiscard]] static std::vector<hash_t> leaves_for(std::span<const QualifiedWallet> qualified);

    [[nodiscard]] static hash_t build_tree(std::span<const QualifiedWallet> qualified);

    // Sibling hashes leaf to root. Throws FairnessException(INVALID_ARGUMENT)
    // when index is out of range.
    [[nodiscard]] static std::vector<hash_t> generate_merkle_proof(std::span<const hash_t> leaves,
                                                                   std::size_t index);

    // Recomputes the leaf and folds it to the root using rank - 1 as the
    // position. Only a match against `root` is accepted. Never throws.
    [[nodiscard]] static bool verify_proof(std::string_view wallet, rank_t rank,
                                           score_t score, ticket_count_t tickets,
                                           const std::vector<hash_t>& proof,
                                           const hash_t& root);

    // Root over raw plays, leaf = SHA-256("wallet:score:ts_ms:seed_hash:move_hash"),
    // ordered by timestamp then wallet
    [[nodiscard]] static hash_t build_daily_play_root(std::span<const PlayRecord> plays);

    [[nodiscard]] static std::vector<std::string> proof_hex(const std::vector<hash_t>& proof);

private:
    std::vector<hash_t> leaves_;
    MerkleTree tree_;
};

}  // namespace fairplay
