#include "vrf_oracle.hh"
#include "core/error.hh"
#include "core/logging.hh"
#include "crypto/hash.hh"
#include <algorithm>

namespace fairplay {

Ed25519VrfOracle::Ed25519VrfOracle(Ed25519KeyPair keypair)
    : keypair_(std::move(keypair)) {
    if (!keypair_.has_secret_key()) {
        throw FairnessException(FairnessError::INVALID_ARGUMENT,
                                "VRF oracle needs a signing key");
    }
}

std::unique_ptr<Ed25519VrfOracle> Ed25519VrfOracle::generate() {
    auto keypair = Ed25519KeyPair::generate();
    if (!keypair) {
        throw FairnessException(FairnessError::CRYPTO_FAILURE,
                                "could not generate VRF oracle key");
    }
    return std::make_unique<Ed25519VrfOracle>(std::move(*keypair));
}

std::unique_ptr<Ed25519VrfOracle> Ed25519VrfOracle::from_seed(const ed25519_secret_key_t& seed) {
    auto keypair = Ed25519KeyPair::from_seed(seed);
    if (!keypair) {
        throw FairnessException(FairnessError::CRYPTO_FAILURE,
                                "could not load VRF oracle key");
    }
    return std::make_unique<Ed25519VrfOracle>(std::move(*keypair));
}

std::optional<VrfOutput> Ed25519VrfOracle::request(std::string_view alpha,
                                                   std::chrono::milliseconds /*timeout*/) {
    // Local evaluation completes well inside any timeout
    auto sig = keypair_.sign(as_bytes(alpha));
    if (!sig) {
        log::oracle.error("Ed25519 VRF evaluation failed");
        return std::nullopt;
    }

    VrfOutput output;
    output.proof.assign(sig->begin(), sig->end());
    output.randomness = sha256(output.proof);
    output.signature = bytes_to_hex(output.proof);

    FAIRPLAY_LOG_DEBUG(log::oracle) << "Evaluated VRF on '" << alpha << "' -> "
                                    << short_hex(output.randomness);
    return output;
}

bool Ed25519VrfOracle::verify(std::string_view alpha, const VrfOutput& output) const {
    return verify_with_key(keypair_.public_key(), alpha, output);
}

bool Ed25519VrfOracle::verify_with_key(const ed25519_public_key_t& public_key,
                                       std::string_view alpha,
                                       const VrfOutput& output) {
    if (output.proof.size() != ED25519_SIGNATURE_SIZE) {
        return false;
    }

    ed25519_signature_t sig;
    std::copy(output.proof.begin(), output.proof.end(), sig.begin());
    if (!ed25519_verify(public_key, as_bytes(alpha), sig)) {
        return false;
    }

    if (sha256(output.proof) != output.randomness) {
        return false;
    }
    return output.signature.empty() || output.signature == bytes_to_hex(output.proof);
}

}  // namespace fairplay
