#ifndef LEVER_SHARE_MATH_HPP
#define LEVER_SHARE_MATH_HPP

#include "types.hpp"
#include "math.hpp"

namespace lever {

// =============================================================================
// Proportional share accounting
// =============================================================================
//
// With an empty vault (supply or NAV of zero) conversions are 1:1.

namespace share_math {

// Reference-currency value -> shares
I128 assets_to_shares(I128 assets, I128 nav, I128 supply, Rounding rounding);

// Shares -> reference-currency value
I128 shares_to_assets(I128 shares, I128 nav, I128 supply, Rounding rounding);

// NAV per share, WAD; 1.0 when either operand is zero
I128 rate(I128 nav, I128 supply);

// Collateral released for `shares` of `supply` (rounded down)
I128 collateral_for_shares(I128 collateral, I128 shares, I128 supply);

// Debt owed for `shares` of `supply` (rounded up)
I128 debt_for_shares(I128 debt, I128 shares, I128 supply);

// Shares minted for a NAV increase: floor(supply * nav_delta / nav_before)
I128 deposit_shares(I128 supply_before, I128 nav_delta, I128 nav_before);

} // namespace share_math

} // namespace lever

#endif // LEVER_SHARE_MATH_HPP
