#ifndef LEVER_ERRORS_HPP
#define LEVER_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace lever {

// =============================================================================
// Error Codes
// =============================================================================

enum class ErrorCode : int32_t {
    OK = 0,

    // Session discipline
    ALREADY_LOCKED = -1,
    NOT_LOCKED = -2,
    NOT_PERMITTED = -3,
    SESSION_BALANCE_NON_ZERO = -4,
    RATE_CHANGED_DURING_SESSION = -5,
    SESSION_ACTIVE = -6,

    // Input validation
    ZERO_AMOUNT = -10,
    ZERO_ADDRESS = -11,
    AMOUNT_BELOW_MINIMUM = -12,
    AMOUNT_EXCEEDS_COLLATERAL = -13,
    INSUFFICIENT_SHARES = -14,
    INSUFFICIENT_SESSION_BALANCE = -15,
    NOT_INITIALIZED = -16,
    ZERO_SHARES = -17,
    INVALID_CONFIG = -18,

    // Invariant violations
    HEALTH_FACTOR_OUT_OF_RANGE = -20,
    NAV_INCREASE_BELOW_MIN = -21,
    INVALID_DEBT_AFTER_WITHDRAW = -22,
    INVALID_COLLATERAL_AFTER_WITHDRAW = -23,
    INSUFFICIENT_PROCEEDS = -24,
    ALREADY_INITIALIZED = -25,
    COLLATERAL_NON_ZERO = -26,
    DEBT_AFTER_INIT_NON_ZERO = -27,
    INVALID_STATE_AFTER_UNWIND = -28,

    // Arithmetic
    ARITHMETIC_OVERFLOW = -30,
    ARITHMETIC_UNDERFLOW = -31,
    DIVISION_BY_ZERO = -32
};

const char* to_string(ErrorCode code) noexcept;

// =============================================================================
// Exceptions
// =============================================================================

// Engine rejection; every predicate failure maps to a distinct code
class VaultError : public std::runtime_error {
public:
    explicit VaultError(ErrorCode code);
    VaultError(ErrorCode code, const std::string& detail);

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

// Failure raised by a lending-market, staking or token collaborator
class CollaboratorError : public std::runtime_error {
public:
    explicit CollaboratorError(const std::string& msg) : std::runtime_error(msg) {}
};

// Malformed or out-of-range configuration
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace lever

#endif // LEVER_ERRORS_HPP
