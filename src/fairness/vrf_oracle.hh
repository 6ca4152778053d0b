#pragma once

#include "core/types.hh"
#include "crypto/signature.hh"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace fairplay {

// ============================================================================
// VRF Output
// ============================================================================

struct VrfOutput {
    hash_t randomness;        // beta
    bytes_t proof;            // pi
    std::string signature;    // hex rendering of the proof, published with results
};

// ============================================================================
// Oracle Interface
// ============================================================================

class VrfOracle {
public:
    virtual ~VrfOracle() = default;

    // Evaluate on alpha. Implementations must give up once timeout elapses.
    // std::nullopt means the oracle could not answer.
    [[nodiscard]] virtual std::optional<VrfOutput> request(
        std::string_view alpha, std::chrono::milliseconds timeout) = 0;

    // Checks proof and randomness for alpha; never throws
    [[nodiscard]] virtual bool verify(std::string_view alpha, const VrfOutput& output) const = 0;

    [[nodiscard]] virtual std::string_view name() const = 0;
};

// ============================================================================
// Ed25519-backed oracle
// ============================================================================

// proof = Ed25519_sign(sk, alpha) (deterministic per RFC 8032),
// randomness = SHA-256(proof). Unique per (key, alpha) and publicly
// checkable against the public key.
class Ed25519VrfOracle : public VrfOracle {
public:
    explicit Ed25519VrfOracle(Ed25519KeyPair keypair);

    [[nodiscard]] static std::unique_ptr<Ed25519VrfOracle> generate();
    [[nodiscard]] static std::unique_ptr<Ed25519VrfOracle> from_seed(const ed25519_secret_key_t& seed);

    [[nodiscard]] std::optional<VrfOutput> request(
        std::string_view alpha, std::chrono::milliseconds timeout) override;

    [[nodiscard]] bool verify(std::string_view alpha, const VrfOutput& output) const override;

    [[nodiscard]] std::string_view name() const override { return "ed25519-vrf"; }

    [[nodiscard]] const ed25519_public_key_t& public_key() const { return keypair_.public_key(); }

    // Verification without the secret key
    [[nodiscard]] static bool verify_with_key(const ed25519_public_key_t& public_key,
                                              std::string_view alpha,
                                              const VrfOutput& output);

private:
    Ed25519KeyPair keypair_;
};

}  // namespace fairplay
