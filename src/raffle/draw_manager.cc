#include "draw_manager.hh"
#include "core/error.hh"
#include "core/logging.hh"
#include "crypto/hash.hh"
#include "raffle/merkle_audit.hh"
#include <algorithm>
#include <bit>

namespace fairplay {

namespace {

constexpr std::string_view DRAW_INFO = "fairplay/raffle-draw/v1";
constexpr std::string_view DRAW_DRBG_LABEL = "fairplay/raffle-draw/drbg";

std::vector<const QualifiedWallet*> rank_ordered(std::span<const QualifiedWallet> qualified) {
    std::vector<const QualifiedWallet*> ordered;
    ordered.reserve(qualified.size());
    for (const auto& q : qualified) {
        ordered.push_back(&q);
    }
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const QualifiedWallet* a, const QualifiedWallet* b) {
                         return a->rank < b->rank;
                     });
    return ordered;
}

}  // namespace

// ============================================================================
// TicketWeightTree Implementation
// ============================================================================

TicketWeightTree::TicketWeightTree(std::span<const std::uint64_t> weights)
    : tree_(weights.size() + 1, 0) {
    // Linear build: push each node into its parent
    for (std::size_t i = 1; i <= weights.size(); ++i) {
        tree_[i] += weights[i - 1];
        total_ += weights[i - 1];
        std::size_t parent = i + (i & (~i + 1));
        if (parent <= weights.size()) {
            tree_[parent] += tree_[i];
        }
    }
}

void TicketWeightTree::add(std::size_t index, std::int64_t delta) {
    const auto d = static_cast<std::uint64_t>(delta);
    total_ += d;
    for (std::size_t i = index + 1; i < tree_.size(); i += i & (~i + 1)) {
        tree_[i] += d;
    }
}

std::uint64_t TicketWeightTree::prefix(std::size_t index) const {
    std::uint64_t sum = 0;
    for (std::size_t i = std::min(index, size()); i > 0; i -= i & (~i + 1)) {
        sum += tree_[i];
    }
    return sum;
}

std::uint64_t TicketWeightTree::weight(std::size_t index) const {
    return prefix(index + 1) - prefix(index);
}

std::size_t TicketWeightTree::find(std::uint64_t point) const {
    const std::size_t n = size();
    std::size_t pos = 0;
    std::uint64_t remaining = point;

    for (std::size_t step = std::bit_floor(n); step > 0; step >>= 1) {
        if (pos + step <= n && tree_[pos + step] <= remaining) {
            pos += step;
            remaining -= tree_[pos];
        }
    }
    return pos;
}

// ============================================================================
// Draw
// ============================================================================

hash_t RaffleDrawManager::derive_draw_seed(const hash_t& randomness, const hash_t& merkle_root) {
    bytes_t info(DRAW_INFO.begin(), DRAW_INFO.end());
    info.insert(info.end(), merkle_root.begin(), merkle_root.end());

    const hash_t prk = hkdf_extract({}, randomness);
    return hkdf_expand_hash(prk, info);
}

RaffleResult RaffleDrawManager::draw(std::span<const QualifiedWallet> qualified,
                                     std::size_t winner_count,
                                     const hash_t& randomness,
                                     const hash_t& merkle_root,
                                     system_time_t now) {
    if (qualified.empty()) {
        throw FairnessException(FairnessError::EMPTY_QUALIFICATION_SET,
                                "no qualified wallets to draw from");
    }

    const auto ordered = rank_ordered(qualified);

    std::vector<std::uint64_t> weights;
    std::vector<ticket_number_t> offsets;
    weights.reserve(ordered.size());
    offsets.reserve(ordered.size());
    ticket_number_t offset = 0;
    for (const auto* q : ordered) {
        offsets.push_back(offset);
        weights.push_back(q->tickets);
        offset += q->tickets;
    }

    TicketWeightTree tree(weights);
    if (tree.total() == 0) {
        throw FairnessException(FairnessError::EMPTY_QUALIFICATION_SET,
                                "qualified wallets hold no tickets");
    }

    RaffleResult result;
    result.draw_randomness = randomness;
    result.total_tickets = tree.total();
    result.draw_timestamp = now;
    result.merkle_root = merkle_root;

    HashDRBG drbg(derive_draw_seed(randomness, merkle_root), DRAW_DRBG_LABEL);

    const std::size_t count = std::min(winner_count, ordered.size());
    result.winners.reserve(count);

    for (std::size_t k = 0; k < count && tree.total() > 0; ++k) {
        const std::uint64_t point = drbg.next_range(tree.total());
        const std::size_t idx = tree.find(point);
        const std::uint64_t within = point - tree.prefix(idx);

        RaffleWinner winner;
        winner.wallet = ordered[idx]->wallet;
        winner.rank = ordered[idx]->rank;
        winner.ticket_number = offsets[idx] + within + 1;
        winner.order = static_cast<std::uint32_t>(k + 1);
        result.winners.push_back(std::move(winner));

        // Without replacement: the wallet's remaining range leaves the pool
        tree.add(idx, -static_cast<std::int64_t>(tree.weight(idx)));
    }

    FAIRPLAY_LOG_INFO(log::draw) << "Raffle drawn: " << result.winners.size() << " winners from "
                                 << ordered.size() << " wallets / " << result.total_tickets
                                 << " tickets, root " << short_hex(merkle_root);
    for (const auto& w : result.winners) {
        FAIRPLAY_LOG_DEBUG(log::draw) << "  #" << w.order << " " << w.wallet
                                      << " ticket " << w.ticket_number << " (rank " << w.rank << ")";
    }
    return result;
}

RaffleResult RaffleDrawManager::draw(std::span<const QualifiedWallet> qualified,
                                     std::size_t winner_count,
                                     const DrawRandomness& randomness,
                                     const hash_t& merkle_root,
                                     system_time_t now) {
    auto result = draw(qualified, winner_count, randomness.randomness, merkle_root, now);
    result.vrf_signature = randomness.vrf_signature;
    result.verifiable = randomness.verifiable;
    if (!result.verifiable) {
        log::draw.warn("Draw used locally generated randomness and is not publicly verifiable");
    }
    return result;
}

// ============================================================================
// Lookup / Verification
// ============================================================================

std::optional<QualifiedWallet> RaffleDrawManager::ticket_owner(
    std::span<const QualifiedWallet> qualified, ticket_number_t ticket_number) {
    if (ticket_number == 0) {
        return std::nullopt;
    }

    const auto ordered = rank_ordered(qualified);
    std::vector<std::uint64_t> weights;
    weights.reserve(ordered.size());
    for (const auto* q : ordered) {
        weights.push_back(q->tickets);
    }

    TicketWeightTree tree(weights);
    if (ticket_number > tree.total()) {
        return std::nullopt;
    }
    return *ordered[tree.find(ticket_number - 1)];
}

bool RaffleDrawManager::verify_draw(const RaffleResult& result,
                                    std::span<const QualifiedWallet> qualified,
                                    const hash_t& randomness) {
    if (result.draw_randomness != randomness) {
        return false;
    }

    try {
        // The seed is keyed by the root, so it must be the root of this set
        if (MerkleAudit::build_tree(qualified) != result.merkle_root) {
            FAIRPLAY_LOG_DEBUG(log::draw) << "Draw root " << short_hex(result.merkle_root)
                                          << " does not match the qualified set";
            return false;
        }

        const auto replay = draw(qualified, result.winners.size(), randomness,
                                 result.merkle_root, result.draw_timestamp);
        if (replay.total_tickets != result.total_tickets ||
            replay.winners.size() != result.winners.size()) {
            return false;
        }
        for (std::size_t i = 0; i < replay.winners.size(); ++i) {
            const auto& a = replay.winners[i];
            const auto& b = result.winners[i];
            if (a.wallet != b.wallet || a.ticket_number != b.ticket_number ||
                a.rank != b.rank || a.order != b.order) {
                return false;
            }
        }
        return true;
    } catch (const std::exception& e) {
        FAIRPLAY_LOG_DEBUG(log::draw) << "Draw replay failed: " << e.what();
        return false;
    }
}

}  // namespace fairplay
