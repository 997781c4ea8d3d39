#ifndef LEVER_SNAPSHOT_HPP
#define LEVER_SNAPSHOT_HPP

#include "types.hpp"
#include "collaborators.hpp"

namespace lever {

// =============================================================================
// PositionSnapshot - immutable point-in-time view of the vault position
// =============================================================================

struct PositionSnapshot {
    I128 collateral_amount;        // collateral-asset units
    I128 collateral_value;         // reference currency, at reference_rate
    I128 debt_value;               // reference currency == borrowed-asset units
    I128 ltv;                      // WAD
    I128 liquidation_threshold;    // WAD
    I128 health_factor;            // WAD
    I128 available_borrow;         // reference currency
    I128 total_shares;             // includes unminted fee shares
    I128 collateral_scaled;
    I128 collateral_index;         // RAY
    I128 debt_scaled;
    I128 debt_index;               // RAY
    I128 reference_rate;           // WAD, collateral valuation rate

    // collateral_value - debt_value; throws ARITHMETIC_UNDERFLOW on a deficit
    I128 nav() const;

    bool has_debt() const noexcept { return debt_value > 0; }
};

// =============================================================================
// SnapshotReader
// =============================================================================

class SnapshotReader {
public:
    SnapshotReader(const ILendingMarket& market, const IRateCap& rate_cap,
                   const Address& owner, const Address& collateral_asset,
                   const Address& borrowed_asset);

    PositionSnapshot read(I128 total_shares) const;

    void set_rate_cap(const IRateCap& rate_cap) noexcept { rate_cap_ = &rate_cap; }
    const IRateCap& rate_cap() const noexcept { return *rate_cap_; }

private:
    const ILendingMarket* market_;
    const IRateCap* rate_cap_;
    Address owner_;
    Address collateral_asset_;
    Address borrowed_asset_;
};

} // namespace lever

#endif // LEVER_SNAPSHOT_HPP
