#ifndef LEVER_FEE_HPP
#define LEVER_FEE_HPP

#include "types.hpp"
#include "share_ledger.hpp"

namespace lever {

// =============================================================================
// FeeState
// =============================================================================

struct FeeState {
    I128 fee_rate = 0;             // WAD fraction of rate growth
    I128 all_time_high = WAD;      // high-water mark, NAV per share (WAD)
    Address fee_recipient{};
};

struct FeeAccrualResult {
    I128 fee_shares;        // shares to mint to the recipient
    I128 rate;              // NAV per share before minting
    I128 all_time_high;     // mark after minting
};

// =============================================================================
// FeeAccrual - high-water-mark performance fee paid in new shares
// =============================================================================
//
// Only growth of NAV per share above the all-time high is charged. The fee is
// realized by dilution: fee_shares = T * f / (1 - f) with
// f = (rate - ath) * fee_rate / rate, which leaves the recipient owning f of
// the post-mint supply.

class FeeAccrual {
public:
    FeeAccrual() = default;
    explicit FeeAccrual(const FeeState& state) : state_(state) {}

    FeeAccrualResult preview(I128 nav, I128 total_shares) const;

    // Mints pending fee shares and raises the mark; returns the shares minted
    I128 accrue(ShareLedger& shares, I128 nav);

    // Only for a change of rate provider, the one case the mark may go down
    void reset_high_water_mark(I128 rate) noexcept { state_.all_time_high = rate; }

    void set_fee_rate(I128 rate) noexcept { state_.fee_rate = rate; }
    void set_fee_recipient(const Address& recipient) noexcept { state_.fee_recipient = recipient; }

    const FeeState& state() const noexcept { return state_; }

private:
    FeeState state_;
};

} // namespace lever

#endif // LEVER_FEE_HPP
