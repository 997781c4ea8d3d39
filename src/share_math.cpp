// =============================================================================
// share_math.cpp - NAV / share conversions
// =============================================================================

#include "lever/share_math.hpp"
#include "lever/errors.hpp"

namespace lever {
namespace share_math {

I128 assets_to_shares(I128 assets, I128 nav, I128 supply, Rounding rounding) {
    if (supply == 0 || nav == 0) return assets;
    return math::mul_div(assets, supply, nav, rounding);
}

I128 shares_to_assets(I128 shares, I128 nav, I128 supply, Rounding rounding) {
    if (supply == 0 || nav == 0) return shares;
    return math::mul_div(shares, nav, supply, rounding);
}

I128 rate(I128 nav, I128 supply) {
    if (supply == 0 || nav == 0) return WAD;
    return wad::div(nav, supply, Rounding::FLOOR);
}

I128 collateral_for_shares(I128 collateral, I128 shares, I128 supply) {
    return math::mul_div(collateral, shares, supply, Rounding::FLOOR);
}

I128 debt_for_shares(I128 debt, I128 shares, I128 supply) {
    return math::mul_div(debt, shares, supply, Rounding::CEIL);
}

I128 deposit_shares(I128 supply_before, I128 nav_delta, I128 nav_before) {
    if (nav_before <= 0) {
        throw VaultError(ErrorCode::DIVISION_BY_ZERO, "deposit into a vault with zero NAV");
    }
    return math::mul_div(supply_before, nav_delta, nav_before, Rounding::FLOOR);
}

} // namespace share_math
} // namespace lever
