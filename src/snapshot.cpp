// =============================================================================
// snapshot.cpp - Position snapshot reader
// =============================================================================

#include "lever/snapshot.hpp"
#include "lever/math.hpp"

namespace lever {

I128 PositionSnapshot::nav() const {
    return math::checked_sub(collateral_value, debt_value);
}

SnapshotReader::SnapshotReader(const ILendingMarket& market, const IRateCap& rate_cap,
                               const Address& owner, const Address& collateral_asset,
                               const Address& borrowed_asset)
    : market_(&market)
    , rate_cap_(&rate_cap)
    , owner_(owner)
    , collateral_asset_(collateral_asset)
    , borrowed_asset_(borrowed_asset) {}

PositionSnapshot SnapshotReader::read(I128 total_shares) const {
    ScaledBalance coll = market_->collateral_balance(owner_, collateral_asset_);
    ScaledBalance debt = market_->debt_balance(owner_, borrowed_asset_);
    PositionData data = market_->position_data(owner_);
    I128 rate = rate_cap_->current_rate();

    PositionSnapshot snap{};
    snap.collateral_scaled = coll.scaled;
    snap.collateral_index = coll.index;
    snap.debt_scaled = debt.scaled;
    snap.debt_index = debt.index;

    // Supplied balances round down, owed balances round up
    snap.collateral_amount = math::mul_div(coll.scaled, coll.index, RAY, Rounding::FLOOR);
    snap.debt_value = math::mul_div(debt.scaled, debt.index, RAY, Rounding::CEIL);

    snap.reference_rate = rate;
    snap.collateral_value = wad::mul(snap.collateral_amount, rate, Rounding::FLOOR);

    snap.ltv = data.ltv_bps * BPS_TO_WAD;
    snap.liquidation_threshold = data.liquidation_threshold_bps * BPS_TO_WAD;
    snap.health_factor = data.health_factor;
    snap.available_borrow = data.available_borrow;
    snap.total_shares = total_shares;
    return snap;
}

} // namespace lever
