#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace fairplay {

// ============================================================================
// Error Codes
// ============================================================================

enum class FairnessError : std::uint8_t {
    SESSION_NOT_FOUND = 0,
    SESSION_CLOSED = 1,           // Exported or expired, no further pieces
    SEED_NOT_COMMITTED = 2,
    SEED_ALREADY_REVEALED = 3,
    COMMITMENT_CONFLICT = 4,      // Session already committed for another wallet
    PIECE_INDEX_OUT_OF_ORDER = 5,
    ORACLE_UNAVAILABLE = 6,
    SIGNATURE_INVALID = 7,
    EMPTY_QUALIFICATION_SET = 8,
    INVALID_ARGUMENT = 9,
    INVALID_CONFIG = 10,
    CRYPTO_FAILURE = 11,
};

[[nodiscard]] std::string_view fairness_error_string(FairnessError error);

// ============================================================================
// Exception
// ============================================================================

class FairnessException : public std::runtime_error {
public:
    FairnessException(FairnessError code, const std::string& message);

    [[nodiscard]] FairnessError code() const noexcept { return code_; }

private:
    FairnessError code_;
};

}  // namespace fairplay
