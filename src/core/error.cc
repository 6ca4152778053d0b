#include "error.hh"

namespace fairplay {

std::string_view fairness_error_string(FairnessError error) {
    switch (error) {
        case FairnessError::SESSION_NOT_FOUND: return "SESSION_NOT_FOUND";
        case FairnessError::SESSION_CLOSED: return "SESSION_CLOSED";
        case FairnessError::SEED_NOT_COMMITTED: return "SEED_NOT_COMMITTED";
        case FairnessError::SEED_ALREADY_REVEALED: return "SEED_ALREADY_REVEALED";
        case FairnessError::COMMITMENT_CONFLICT: return "COMMITMENT_CONFLICT";
        case FairnessError::PIECE_INDEX_OUT_OF_ORDER: return "PIECE_INDEX_OUT_OF_ORDER";
        case FairnessError::ORACLE_UNAVAILABLE: return "ORACLE_UNAVAILABLE";
        case FairnessError::SIGNATURE_INVALID: return "SIGNATURE_INVALID";
        case FairnessError::EMPTY_QUALIFICATION_SET: return "EMPTY_QUALIFICATION_SET";
        case FairnessError::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case FairnessError::INVALID_CONFIG: return "INVALID_CONFIG";
        case FairnessError::CRYPTO_FAILURE: return "CRYPTO_FAILURE";
    }
    return "UNKNOWN";
}

FairnessException::FairnessException(FairnessError code, const std::string& message)
    : std::runtime_error(std::string(fairness_error_string(code)) + ": " + message)
    , code_(code) {}

}  // namespace fairplay
