#include "score_signing.hh"
#include "core/error.hh"
#include "core/logging.hh"
#include <algorithm>

namespace fairplay {

// ============================================================================
// Canonical Message
// ============================================================================

std::string score_canonical_message(std::string_view wallet,
                                    score_t score,
                                    const hash_t& seed_hash,
                                    std::uint64_t move_count,
                                    std::int64_t timestamp_ms) {
    std::string message(wallet);
    message.append(":").append(std::to_string(score));
    message.append(":").append(bytes_to_hex(seed_hash));
    message.append(":").append(std::to_string(move_count));
    message.append(":").append(std::to_string(timestamp_ms));
    return message;
}

std::string ScoreProof::canonical_message() const {
    return score_canonical_message(wallet_address, score, seed_hash, move_count, timestamp_ms);
}

// ============================================================================
// ScoreVerifier Implementation
// ============================================================================

ScoreVerifier ScoreVerifier::ed25519(const ed25519_public_key_t& public_key) {
    ScoreVerifier verifier;
    verifier.scheme_ = SignatureScheme::ED25519;
    verifier.ed25519_key_ = public_key;
    return verifier;
}

ScoreVerifier ScoreVerifier::mldsa65(const mldsa_public_key_t& public_key) {
    ScoreVerifier verifier;
    verifier.scheme_ = SignatureScheme::MLDSA65;
    verifier.mldsa_key_ = std::make_shared<const mldsa_public_key_t>(public_key);
    return verifier;
}

bool ScoreVerifier::verify(const ScoreProof& proof) const {
    if (proof.scheme != scheme_ || proof.wallet_address.empty()) {
        return false;
    }

    const std::string message = proof.canonical_message();

    switch (scheme_) {
        case SignatureScheme::ED25519: {
            if (proof.signature.size() != ED25519_SIGNATURE_SIZE) {
                return false;
            }
            ed25519_signature_t sig;
            std::copy(proof.signature.begin(), proof.signature.end(), sig.begin());
            return ed25519_verify(ed25519_key_, as_bytes(message), sig);
        }
        case SignatureScheme::MLDSA65:
            if (!mldsa_key_) {
                return false;
            }
            return mldsa_verify(*mldsa_key_, as_bytes(message), proof.signature);
    }
    return false;
}

std::string ScoreVerifier::public_key_hex() const {
    if (scheme_ == SignatureScheme::MLDSA65 && mldsa_key_) {
        return bytes_to_hex(*mldsa_key_);
    }
    return bytes_to_hex(ed25519_key_);
}

// ============================================================================
// ScoreSigner Implementation
// ============================================================================

ScoreSigner::ScoreSigner(const ScoreSigningConfig& config)
    : scheme_(config.scheme) {

    switch (scheme_) {
        case SignatureScheme::ED25519: {
            if (!config.private_key_hex.empty()) {
                auto bytes = hex_to_bytes(config.private_key_hex);
                if (!bytes || bytes->size() != ED25519_SECRET_KEY_SIZE) {
                    throw FairnessException(FairnessError::INVALID_CONFIG,
                                            "score signing key must be 32 bytes of hex");
                }
                ed25519_secret_key_t seed;
                std::copy(bytes->begin(), bytes->end(), seed.begin());
                secure_zero(*bytes);

                ed25519_ = Ed25519KeyPair::from_seed(seed);
                secure_zero(seed);
            } else {
                log::signing.warn("No score signing key configured, generated an ephemeral "
                                  "Ed25519 key; proofs will not verify after restart");
                ed25519_ = Ed25519KeyPair::generate();
            }
            if (!ed25519_) {
                throw FairnessException(FairnessError::CRYPTO_FAILURE,
                                        "could not load Ed25519 score signing key");
            }
            break;
        }
        case SignatureScheme::MLDSA65:
            if (!config.private_key_hex.empty()) {
                mldsa_ = load_mldsa_key(config.private_key_hex);
            } else {
                log::signing.warn("No score signing key configured, generated an ephemeral "
                                  "ML-DSA-65 key; proofs will not verify after restart");
                mldsa_ = MLDSAKeyPair::generate();
            }
            if (!mldsa_) {
                throw FairnessException(FairnessError::CRYPTO_FAILURE,
                                        "could not generate ML-DSA-65 score signing key");
            }
            break;
    }

    verifier_ = make_verifier(scheme_, ed25519_, mldsa_);

    FAIRPLAY_LOG_INFO(log::signing) << "Score signer ready (" << signature_scheme_string(scheme_)
                                    << ", key " << verifier_.public_key_hex().substr(0, 16)
                                    << "...)";
}

std::optional<MLDSAKeyPair> ScoreSigner::load_mldsa_key(const std::string& key_hex) {
    auto bytes = hex_to_bytes(key_hex);
    if (!bytes || bytes->size() != MLDSA65_KEY_MATERIAL_SIZE) {
        if (bytes) {
            secure_zero(*bytes);
        }
        throw FairnessException(FairnessError::INVALID_CONFIG,
                                "ml-dsa-65 score signing key must be secret key || public key, " +
                                std::to_string(MLDSA65_KEY_MATERIAL_SIZE) + " bytes of hex");
    }

    auto sk = std::make_unique<mldsa_secret_key_t>();
    mldsa_public_key_t pk;
    std::copy_n(bytes->begin(), MLDSA65_SECRET_KEY_SIZE, sk->begin());
    std::copy_n(bytes->begin() + MLDSA65_SECRET_KEY_SIZE, MLDSA65_PUBLIC_KEY_SIZE, pk.begin());
    secure_zero(*bytes);

    auto keypair = MLDSAKeyPair::from_keys(pk, *sk);
    secure_zero(*sk);

    // A secret key that does not match the public key would sign unverifiable proofs
    constexpr std::string_view check = "fairplay/score-key-check";
    auto sig = keypair.sign(as_bytes(check));
    if (!sig || !keypair.verify(as_bytes(check), *sig)) {
        throw FairnessException(FairnessError::INVALID_CONFIG,
                                "ml-dsa-65 score signing key halves do not match");
    }
    return keypair;
}

ScoreVerifier ScoreSigner::make_verifier(SignatureScheme scheme,
                                         const std::optional<Ed25519KeyPair>& ed25519,
                                         const std::optional<MLDSAKeyPair>& mldsa) {
    if (scheme == SignatureScheme::MLDSA65) {
        return ScoreVerifier::mldsa65(mldsa->public_key());
    }
    return ScoreVerifier::ed25519(ed25519->public_key());
}

ScoreProof ScoreSigner::sign_score(std::string_view wallet,
                                   score_t score,
                                   const hash_t& seed_hash,
                                   std::uint64_t move_count,
                                   system_time_t now) const {
    if (wallet.empty()) {
        throw FairnessException(FairnessError::INVALID_ARGUMENT, "wallet address is empty");
    }

    ScoreProof proof;
    proof.wallet_address = std::string(wallet);
    proof.score = score;
    proof.seed_hash = seed_hash;
    proof.move_count = move_count;
    proof.timestamp_ms = to_unix_ms(now);
    proof.scheme = scheme_;

    const std::string message = proof.canonical_message();

    if (scheme_ == SignatureScheme::ED25519) {
        auto sig = ed25519_->sign(as_bytes(message));
        if (!sig) {
            throw FairnessException(FairnessError::CRYPTO_FAILURE, "Ed25519 score signing failed");
        }
        proof.signature.assign(sig->begin(), sig->end());
    } else {
        auto sig = mldsa_->sign(as_bytes(message));
        if (!sig) {
            throw FairnessException(FairnessError::CRYPTO_FAILURE, "ML-DSA-65 score signing failed");
        }
        proof.signature.assign(sig->begin(), sig->end());
    }

    FAIRPLAY_LOG_DEBUG(log::signing) << "Signed score " << score << " for " << wallet
                                     << " (" << move_count << " moves)";
    return proof;
}

bool ScoreSigner::verify_score_signature(const ScoreProof& proof) const {
    return verifier_.verify(proof);
}

}  // namespace fairplay
