// =============================================================================
// errors.cpp - Error code names and exception construction
// =============================================================================

#include "lever/errors.hpp"

namespace lever {

const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::OK: return "Ok";
        case ErrorCode::ALREADY_LOCKED: return "AlreadyLocked";
        case ErrorCode::NOT_LOCKED: return "NotLocked";
        case ErrorCode::NOT_PERMITTED: return "NotPermitted";
        case ErrorCode::SESSION_BALANCE_NON_ZERO: return "SessionBalanceNonZero";
        case ErrorCode::RATE_CHANGED_DURING_SESSION: return "RateChangedDuringSession";
        case ErrorCode::SESSION_ACTIVE: return "SessionActive";
        case ErrorCode::ZERO_AMOUNT: return "ZeroAmount";
        case ErrorCode::ZERO_ADDRESS: return "ZeroAddress";
        case ErrorCode::AMOUNT_BELOW_MINIMUM: return "AmountBelowMinimum";
        case ErrorCode::AMOUNT_EXCEEDS_COLLATERAL: return "AmountExceedsCollateral";
        case ErrorCode::INSUFFICIENT_SHARES: return "InsufficientShares";
        case ErrorCode::INSUFFICIENT_SESSION_BALANCE: return "InsufficientSessionBalance";
        case ErrorCode::NOT_INITIALIZED: return "NotInitialized";
        case ErrorCode::ZERO_SHARES: return "ZeroShares";
        case ErrorCode::INVALID_CONFIG: return "InvalidConfig";
        case ErrorCode::HEALTH_FACTOR_OUT_OF_RANGE: return "HealthFactorOutOfRange";
        case ErrorCode::NAV_INCREASE_BELOW_MIN: return "NavIncreaseBelowMin";
        case ErrorCode::INVALID_DEBT_AFTER_WITHDRAW: return "InvalidDebtAfterWithdraw";
        case ErrorCode::INVALID_COLLATERAL_AFTER_WITHDRAW: return "InvalidCollateralAfterWithdraw";
        case ErrorCode::INSUFFICIENT_PROCEEDS: return "InsufficientProceeds";
        case ErrorCode::INVALID_STATE_AFTER_UNWIND: return "InvalidStateAfterUnwind";
        case ErrorCode::ALREADY_INITIALIZED: return "AlreadyInitialized";
        case ErrorCode::COLLATERAL_NON_ZERO: return "CollateralNonZero";
        case ErrorCode::DEBT_AFTER_INIT_NON_ZERO: return "DebtAfterInitNonZero";
        case ErrorCode::ARITHMETIC_OVERFLOW: return "ArithmeticOverflow";
        case ErrorCode::ARITHMETIC_UNDERFLOW: return "ArithmeticUnderflow";
        case ErrorCode::DIVISION_BY_ZERO: return "DivisionByZero";
    }
    return "Unknown";
}

VaultError::VaultError(ErrorCode code)
    : std::runtime_error(to_string(code)), code_(code) {}

VaultError::VaultError(ErrorCode code, const std::string& detail)
    : std::runtime_error(std::string(to_string(code)) + ": " + detail), code_(code) {}

} // namespace lever
