// =============================================================================
// borrow_sizing.cpp - Borrow amount toward a target health factor
// =============================================================================

#include "lever/borrow_sizing.hpp"
#include "lever/errors.hpp"
#include "lever/math.hpp"

namespace lever {

I128 compute_borrow_amount(const BorrowSizingInputs& in) {
    if (in.health_factor < in.target_health_factor || in.available_borrow <= 0) {
        return 0;
    }
    if (in.target_health_factor <= in.liquidation_threshold) {
        throw VaultError(ErrorCode::INVALID_CONFIG,
                         "target health factor must exceed the liquidation threshold");
    }

    I128 buffered = wad::mul(in.available_borrow, WAD - in.buffer, Rounding::FLOOR);
    if (in.debt <= 0) {
        return buffered;
    }

    I128 to_target = math::mul_div(in.health_factor - in.target_health_factor, in.debt,
                                   in.target_health_factor - in.liquidation_threshold,
                                   Rounding::FLOOR);
    return math::min(buffered, to_target);
}

I128 compute_borrow_amount(const PositionData& position, I128 target_health_factor,
                           I128 buffer) {
    BorrowSizingInputs in{};
    in.debt = position.debt_value;
    in.available_borrow = position.available_borrow;
    in.health_factor = position.health_factor;
    in.liquidation_threshold = position.liquidation_threshold_bps * BPS_TO_WAD;
    in.target_health_factor = target_health_factor;
    in.buffer = buffer;
    return compute_borrow_amount(in);
}

} // namespace lever
