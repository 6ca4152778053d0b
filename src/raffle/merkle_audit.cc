#include "merkle_audit.hh"
#include "core/error.hh"
#include "core/logging.hh"
#include <algorithm>

namespace fairplay {

MerkleAudit::MerkleAudit(std::span<const QualifiedWallet> qualified)
    : leaves_(leaves_for(qualified)),
      tree_(leaves_) {
    FAIRPLAY_LOG_INFO(log::audit) << "Qualification tree built: " << leaves_.size()
                                  << " leaves, root " << short_hex(tree_.root());
}

std::optional<std::vector<hash_t>> MerkleAudit::proof_for(rank_t rank) const {
    if (rank == 0 || rank > leaves_.size()) {
        return std::nullopt;
    }
    return tree_.proof(rank - 1);
}

// ============================================================================
// Leaves
// ============================================================================

hash_t MerkleAudit::leaf_hash(std::string_view wallet, rank_t rank,
                              score_t score, ticket_count_t tickets) {
    std::string data(wallet);
    data.append(":").append(std::to_string(rank));
    data.append(":").append(std::to_string(score));
    data.append(":").append(std::to_string(tickets));
    return sha256(data);
}

hash_t MerkleAudit::leaf_hash(const QualifiedWallet& q) {
    return leaf_hash(q.wallet, q.rank, q.score, q.tickets);
}

std::vector<hash_t> MerkleAudit::leaves_for(std::span<const QualifiedWallet> qualified) {
    std::vector<const QualifiedWallet*> ordered;
    ordered.reserve(qualified.size());
    for (const auto& q : qualified) {
        ordered.push_back(&q);
    }
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const QualifiedWallet* a, const QualifiedWallet* b) {
                         return a->rank < b->rank;
                     });

    std::vector<hash_t> leaves;
    leaves.reserve(ordered.size());
    for (const auto* q : ordered) {
        leaves.push_back(leaf_hash(*q));
    }
    return leaves;
}

// ============================================================================
// Tree / Proofs
// ============================================================================

hash_t MerkleAudit::build_tree(std::span<const QualifiedWallet> qualified) {
    auto leaves = leaves_for(qualified);
    return compute_merkle_root(leaves);
}

std::vector<hash_t> MerkleAudit::generate_merkle_proof(std::span<const hash_t> leaves,
                                                       std::size_t index) {
    if (index >= leaves.size()) {
        throw FairnessException(FairnessError::INVALID_ARGUMENT,
                                "leaf index " + std::to_string(index) + " out of range (" +
                                std::to_string(leaves.size()) + " leaves)");
    }
    MerkleTree tree(std::vector<hash_t>(leaves.begin(), leaves.end()));
    return tree.proof(index);
}

bool MerkleAudit::verify_proof(std::string_view wallet, rank_t rank,
                               score_t score, ticket_count_t tickets,
                               const std::vector<hash_t>& proof,
                               const hash_t& root) {
    if (rank == 0) {
        return false;
    }
    try {
        const hash_t leaf = leaf_hash(wallet, rank, score, tickets);
        return MerkleTree::verify(leaf, proof, rank - 1, root);
    } catch (const std::exception& e) {
        FAIRPLAY_LOG_WARN(log::audit) << "Proof verification failed: " << e.what();
        return false;
    }
}

hash_t MerkleAudit::build_daily_play_root(std::span<const PlayRecord> plays) {
    std::vector<const PlayRecord*> ordered;
    ordered.reserve(plays.size());
    for (const auto& p : plays) {
        ordered.push_back(&p);
    }
    std::sort(ordered.begin(), ordered.end(), [](const PlayRecord* a, const PlayRecord* b) {
        if (a->timestamp != b->timestamp) return a->timestamp < b->timestamp;
        if (a->wallet != b->wallet) return a->wallet < b->wallet;
        return a->score > b->score;
    });

    std::vector<hash_t> leaves;
    leaves.reserve(ordered.size());
    for (const auto* p : ordered) {
        std::string data = p->wallet;
        data.append(":").append(std::to_string(p->score));
        data.append(":").append(std::to_string(to_unix_ms(p->timestamp)));
        data.append(":").append(bytes_to_hex(p->seed_hash));
        data.append(":").append(p->move_hash);
        leaves.push_back(sha256(data));
    }
    return compute_merkle_root(leaves);
}

std::vector<std::string> MerkleAudit::proof_hex(const std::vector<hash_t>& proof) {
    std::vector<std::string> out;
    out.reserve(proof.size());
    for (const auto& h : proof) {
        out.push_back(bytes_to_hex(h));
    }
    return out;
}

}  // namespace fairplay
