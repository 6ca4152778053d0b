#include "signature.hh"
#include "core/logging.hh"
#include <oqs/oqs.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <stdexcept>

namespace fairplay {

namespace {

struct PkeyDeleter {
    void operator()(EVP_PKEY* pkey) const { EVP_PKEY_free(pkey); }
};

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

}  // namespace

// ============================================================================
// Ed25519 Implementation
// ============================================================================

Ed25519KeyPair::~Ed25519KeyPair() {
    if (secret_key_) {
        secure_zero(*secret_key_);
    }
}

Ed25519KeyPair::Ed25519KeyPair(Ed25519KeyPair&& other) noexcept
    : public_key_(other.public_key_)
    , secret_key_(std::move(other.secret_key_)) {}

Ed25519KeyPair& Ed25519KeyPair::operator=(Ed25519KeyPair&& other) noexcept {
    if (this != &other) {
        if (secret_key_) {
            secure_zero(*secret_key_);
        }
        public_key_ = other.public_key_;
        secret_key_ = std::move(other.secret_key_);
    }
    return *this;
}

std::optional<Ed25519KeyPair> Ed25519KeyPair::generate() {
    ed25519_secret_key_t seed;
    if (RAND_bytes(seed.data(), static_cast<int>(seed.size())) != 1) {
        log::crypto.error("RAND_bytes failed during Ed25519 key generation");
        return std::nullopt;
    }

    auto keypair = from_seed(seed);
    secure_zero(seed);
    if (keypair) {
        log::crypto.debug("Generated Ed25519 keypair");
    }
    return keypair;
}

std::optional<Ed25519KeyPair> Ed25519KeyPair::from_seed(const ed25519_secret_key_t& seed) {
    PkeyPtr pkey(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                              seed.data(), seed.size()));
    if (!pkey) {
        log::crypto.error("Failed to load Ed25519 private key");
        return std::nullopt;
    }

    Ed25519KeyPair keypair;
    std::size_t pk_len = keypair.public_key_.size();
    if (EVP_PKEY_get_raw_public_key(pkey.get(), keypair.public_key_.data(), &pk_len) != 1 ||
        pk_len != ED25519_PUBLIC_KEY_SIZE) {
        log::crypto.error("Failed to derive Ed25519 public key");
        return std::nullopt;
    }

    keypair.secret_key_ = std::make_unique<ed25519_secret_key_t>(seed);
    return keypair;
}

Ed25519KeyPair Ed25519KeyPair::from_public_key(const ed25519_public_key_t& pk) {
    Ed25519KeyPair keypair;
    keypair.public_key_ = pk;
    return keypair;
}

std::optional<ed25519_signature_t> Ed25519KeyPair::sign(
    std::span<const std::uint8_t> message) const {
    if (!secret_key_) {
        log::crypto.warn("Attempted to sign without secret key");
        return std::nullopt;
    }

    PkeyPtr pkey(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                              secret_key_->data(), secret_key_->size()));
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!pkey || !ctx) {
        log::crypto.error("Failed to create Ed25519 signing context");
        return std::nullopt;
    }

    // Ed25519 is one-shot: no digest, no streaming updates
    if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
        log::crypto.error("Ed25519 sign init failed");
        return std::nullopt;
    }

    ed25519_signature_t signature;
    std::size_t sig_len = signature.size();
    if (EVP_DigestSign(ctx.get(), signature.data(), &sig_len,
                       message.data(), message.size()) != 1 ||
        sig_len != ED25519_SIGNATURE_SIZE) {
        log::crypto.error("Ed25519 signing failed");
        return std::nullopt;
    }

    FAIRPLAY_LOG_TRACE(log::crypto) << "Signed message of " << message.size() << " bytes";
    return signature;
}

bool Ed25519KeyPair::verify(std::span<const std::uint8_t> message,
                            const ed25519_signature_t& signature) const {
    return ed25519_verify(public_key_, message, signature);
}

bool ed25519_verify(const ed25519_public_key_t& public_key,
                    std::span<const std::uint8_t> message,
                    const ed25519_signature_t& signature) {
    PkeyPtr pkey(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                             public_key.data(), public_key.size()));
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!pkey || !ctx) {
        FAIRPLAY_LOG_DEBUG(log::crypto) << "Ed25519 public key rejected";
        return false;
    }

    if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
        return false;
    }

    bool result = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                                   message.data(), message.size()) == 1;
    if (!result) {
        FAIRPLAY_LOG_DEBUG(log::crypto) << "Ed25519 signature verification failed";
    }
    return result;
}

// ============================================================================
// ML-DSA-65 Implementation
// ============================================================================

MLDSAKeyPair::~MLDSAKeyPair() {
    if (secret_key_) {
        secure_zero(*secret_key_);
    }
}

MLDSAKeyPair::MLDSAKeyPair(MLDSAKeyPair&& other) noexcept
    : public_key_(std::move(other.public_key_))
    , secret_key_(std::move(other.secret_key_)) {}

MLDSAKeyPair& MLDSAKeyPair::operator=(MLDSAKeyPair&& other) noexcept {
    if (this != &other) {
        if (secret_key_) {
            secure_zero(*secret_key_);
        }
        public_key_ = std::move(other.public_key_);
        secret_key_ = std::move(other.secret_key_);
    }
    return *this;
}

std::optional<MLDSAKeyPair> MLDSAKeyPair::generate() {
    OQS_SIG* sig = OQS_SIG_new(OQS_SIG_alg_ml_dsa_65);
    if (!sig) {
        log::crypto.error("Failed to create ML-DSA-65 signature context");
        return std::nullopt;
    }

    MLDSAKeyPair keypair;
    keypair.public_key_ = std::make_unique<mldsa_public_key_t>();
    keypair.secret_key_ = std::make_unique<mldsa_secret_key_t>();

    if (OQS_SIG_keypair(sig, keypair.public_key_->data(),
                        keypair.secret_key_->data()) != OQS_SUCCESS) {
        log::crypto.error("ML-DSA-65 key generation failed");
        OQS_SIG_free(sig);
        return std::nullopt;
    }

    OQS_SIG_free(sig);
    log::crypto.debug("Generated ML-DSA-65 keypair");
    return keypair;
}

MLDSAKeyPair MLDSAKeyPair::from_keys(const mldsa_public_key_t& pk,
                                     const mldsa_secret_key_t& sk) {
    MLDSAKeyPair keypair;
    keypair.public_key_ = std::make_unique<mldsa_public_key_t>(pk);
    keypair.secret_key_ = std::make_unique<mldsa_secret_key_t>(sk);
    return keypair;
}

MLDSAKeyPair MLDSAKeyPair::from_public_key(const mldsa_public_key_t& pk) {
    MLDSAKeyPair keypair;
    keypair.public_key_ = std::make_unique<mldsa_public_key_t>(pk);
    return keypair;
}

std::optional<mldsa_signature_t> MLDSAKeyPair::sign(
    std::span<const std::uint8_t> message) const {
    if (!secret_key_) {
        log::crypto.warn("Attempted to sign without secret key");
        return std::nullopt;
    }

    OQS_SIG* sig = OQS_SIG_new(OQS_SIG_alg_ml_dsa_65);
    if (!sig) {
        log::crypto.error("Failed to create ML-DSA-65 signature context for signing");
        return std::nullopt;
    }

    mldsa_signature_t signature{};
    std::size_t sig_len = MLDSA65_SIGNATURE_SIZE;

    if (OQS_SIG_sign(sig, signature.data(), &sig_len,
                     message.data(), message.size(),
                     secret_key_->data()) != OQS_SUCCESS) {
        log::crypto.error("ML-DSA-65 signing failed");
        OQS_SIG_free(sig);
        return std::nullopt;
    }

    OQS_SIG_free(sig);
    FAIRPLAY_LOG_TRACE(log::crypto) << "Signed message of " << message.size() << " bytes";
    return signature;
}

bool MLDSAKeyPair::verify(std::span<const std::uint8_t> message,
                          const mldsa_signature_t& signature) const {
    return mldsa_verify(*public_key_, message, signature);
}

bool mldsa_verify(const mldsa_public_key_t& public_key,
                  std::span<const std::uint8_t> message,
                  std::span<const std::uint8_t> signature) {
    if (signature.size() != MLDSA65_SIGNATURE_SIZE) {
        return false;
    }

    OQS_SIG* sig = OQS_SIG_new(OQS_SIG_alg_ml_dsa_65);
    if (!sig) {
        log::crypto.error("Failed to create ML-DSA-65 context for verification");
        return false;
    }

    bool result = OQS_SIG_verify(sig, message.data(), message.size(),
                                 signature.data(), signature.size(),
                                 public_key.data()) == OQS_SUCCESS;

    OQS_SIG_free(sig);

    if (!result) {
        FAIRPLAY_LOG_DEBUG(log::crypto) << "ML-DSA-65 signature verification failed";
    }
    return result;
}

// ============================================================================
// Secure Randomness
// ============================================================================

void random_bytes(std::span<std::uint8_t> out) {
    if (out.empty()) {
        return;
    }
    if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
        log::crypto.error("RAND_bytes failed");
        throw std::runtime_error("RAND_bytes failed");
    }
}

hash_t random_hash() {
    hash_t h;
    random_bytes(h);
    return h;
}

}  // namespace fairplay
