// =============================================================================
// fee.cpp - High-water-mark fee accrual
// =============================================================================

#include "lever/fee.hpp"
#include "lever/math.hpp"
#include "lever/share_math.hpp"

namespace lever {

FeeAccrualResult FeeAccrual::preview(I128 nav, I128 total_shares) const {
    I128 rate = share_math::rate(nav, total_shares);

    if (rate <= state_.all_time_high || state_.fee_rate == 0 || total_shares == 0) {
        return {0, rate, state_.all_time_high};
    }

    I128 ownership = math::mul_div(rate - state_.all_time_high, state_.fee_rate, rate,
                                   Rounding::FLOOR);
    I128 fee_shares = math::mul_div(total_shares, ownership, WAD - ownership,
                                    Rounding::FLOOR);

    I128 new_high = share_math::rate(nav, math::checked_add(total_shares, fee_shares));
    if (new_high < state_.all_time_high) {
        new_high = state_.all_time_high;
    }
    return {fee_shares, rate, new_high};
}

I128 FeeAccrual::accrue(ShareLedger& shares, I128 nav) {
    FeeAccrualResult r = preview(nav, shares.total_supply());
    if (r.fee_shares > 0) {
        shares.mint(state_.fee_recipient, r.fee_shares);
    }
    state_.all_time_high = r.all_time_high;
    return r.fee_shares;
}

} // namespace lever
