// =============================================================================
// comparator.cpp - Before/after snapshot predicates
// =============================================================================

#include "lever/comparator.hpp"
#include "lever/errors.hpp"
#include "lever/math.hpp"
#include "lever/share_math.hpp"

#include <stdexcept>

namespace lever {

namespace {

std::string hf_detail(I128 before, I128 after, I128 low, I128 high) {
    return "hf " + math::to_decimal_string(before, 18) + " -> " +
           math::to_decimal_string(after, 18) + ", band [" +
           math::to_decimal_string(low, 18) + ", " +
           math::to_decimal_string(high, 18) + "]";
}

} // anonymous namespace

I128 SnapshotComparator::nav_delta(const ComparisonContext& ctx) {
    return ctx.after.nav() - ctx.before.nav();
}

WithdrawExpectation SnapshotComparator::expected_after_withdraw(const PositionSnapshot& before,
                                                                I128 shares, I128 total_supply) {
    WithdrawExpectation e{};
    e.debt = before.debt_value -
             share_math::debt_for_shares(before.debt_value, shares, total_supply);
    e.collateral = before.collateral_amount -
                   share_math::collateral_for_shares(before.collateral_amount, shares,
                                                     total_supply);
    return e;
}

I128 SnapshotComparator::band_low() const {
    return wad::mul(config_.target_health_factor, WAD - config_.deposit_tolerance_low,
                    Rounding::CEIL);
}

I128 SnapshotComparator::band_high() const {
    return wad::mul(config_.target_health_factor, WAD + config_.deposit_tolerance_high,
                    Rounding::FLOOR);
}

// =============================================================================
// Predicates
// =============================================================================

void SnapshotComparator::check_rate_stable(const ComparisonContext& ctx) const {
    if (ctx.before.reference_rate != ctx.after.reference_rate) {
        throw VaultError(ErrorCode::RATE_CHANGED_DURING_SESSION,
                         math::to_decimal_string(ctx.before.reference_rate, 18) + " -> " +
                         math::to_decimal_string(ctx.after.reference_rate, 18));
    }
}

void SnapshotComparator::check_health_factor(const ComparisonContext& ctx) const {
    I128 hf0 = ctx.before.health_factor;
    I128 hf1 = ctx.after.health_factor;
    I128 low = band_low();
    I128 high = band_high();

    bool ok;
    if (hf0 < config_.target_health_factor) {
        // Below target: may only move toward it, never past the upper bound
        ok = hf1 >= hf0 && hf1 <= high;
    } else {
        ok = hf1 >= low && hf1 <= high;
    }
    if (!ok) {
        throw VaultError(ErrorCode::HEALTH_FACTOR_OUT_OF_RANGE, hf_detail(hf0, hf1, low, high));
    }
}

void SnapshotComparator::check_deposit(const ComparisonContext& ctx) const {
    check_health_factor(ctx);

    I128 delta = nav_delta(ctx);
    if (delta < config_.minimum_deposit) {
        throw VaultError(ErrorCode::NAV_INCREASE_BELOW_MIN, math::to_string(delta));
    }
}

void SnapshotComparator::check_donate(const ComparisonContext& ctx) const {
    I128 delta = nav_delta(ctx);
    if (delta <= 0) {
        throw VaultError(ErrorCode::NAV_INCREASE_BELOW_MIN, math::to_string(delta));
    }

    I128 floor_hf = math::min(ctx.before.health_factor, band_low());
    if (ctx.after.health_factor < floor_hf) {
        throw VaultError(ErrorCode::HEALTH_FACTOR_OUT_OF_RANGE,
                         hf_detail(ctx.before.health_factor, ctx.after.health_factor,
                                   floor_hf, HEALTH_FACTOR_MAX));
    }
}

void SnapshotComparator::check_withdraw(const ComparisonContext& ctx) const {
    if (!ctx.shares || !ctx.total_supply) {
        throw std::invalid_argument("withdraw comparison needs shares and total supply");
    }

    WithdrawExpectation e = expected_after_withdraw(ctx.before, *ctx.shares, *ctx.total_supply);

    I128 debt = ctx.after.debt_value;
    if (debt > e.debt || debt < e.debt - 1) {
        throw VaultError(ErrorCode::INVALID_DEBT_AFTER_WITHDRAW,
                         "debt " + math::to_string(debt) + ", expected " +
                         math::to_string(e.debt));
    }

    I128 collateral = ctx.after.collateral_amount;
    if (collateral < e.collateral || collateral > e.collateral + 1) {
        throw VaultError(ErrorCode::INVALID_COLLATERAL_AFTER_WITHDRAW,
                         "collateral " + math::to_string(collateral) + ", expected " +
                         math::to_string(e.collateral));
    }
}

void SnapshotComparator::check_initialize_pre(const PositionSnapshot& before) const {
    if (before.total_shares != 0) {
        throw VaultError(ErrorCode::ALREADY_INITIALIZED);
    }
    if (before.collateral_amount != 0) {
        throw VaultError(ErrorCode::COLLATERAL_NON_ZERO, math::to_string(before.collateral_amount));
    }
}

void SnapshotComparator::check_initialize_post(const ComparisonContext& ctx) const {
    if (ctx.after.debt_value != 0) {
        throw VaultError(ErrorCode::DEBT_AFTER_INIT_NON_ZERO, math::to_string(ctx.after.debt_value));
    }
    I128 nav = ctx.after.nav();
    if (nav < config_.minimum_deposit) {
        throw VaultError(ErrorCode::NAV_INCREASE_BELOW_MIN, math::to_string(nav));
    }
}

void SnapshotComparator::check_unwind(I128 proceeds, I128 redemption_value) const {
    I128 min_proceeds = wad::mul(redemption_value, WAD - config_.unwind_slippage,
                                 Rounding::CEIL);
    if (proceeds < min_proceeds) {
        throw VaultError(ErrorCode::INSUFFICIENT_PROCEEDS,
                         math::to_string(proceeds) + " < " + math::to_string(min_proceeds));
    }
}

void SnapshotComparator::check_unwind_post(const ComparisonContext& ctx, I128 proceeds,
                                           I128 redemption_value, I128 returned) const {
    const PositionSnapshot& before = ctx.before;
    const PositionSnapshot& after = ctx.after;

    if (after.debt_value > before.debt_value) {
        throw VaultError(ErrorCode::INVALID_STATE_AFTER_UNWIND,
                         "debt " + math::to_string(before.debt_value) + " -> " +
                         math::to_string(after.debt_value));
    }
    if (before.debt_value > 0 && after.health_factor <= before.health_factor) {
        throw VaultError(ErrorCode::INVALID_STATE_AFTER_UNWIND,
                         "hf " + math::to_decimal_string(before.health_factor, 18) + " -> " +
                         math::to_decimal_string(after.health_factor, 18));
    }

    I128 discount = math::max(redemption_value - proceeds, I128(0));
    I128 allowed = discount + returned + UNWIND_NAV_TOLERANCE;
    I128 loss = before.nav() - after.nav();
    if (loss > allowed) {
        throw VaultError(ErrorCode::INVALID_STATE_AFTER_UNWIND,
                         "nav loss " + math::to_string(loss) + " > " + math::to_string(allowed));
    }
}

I128 SnapshotComparator::shares_for_deposit(const ComparisonContext& ctx) const {
    return share_math::deposit_shares(ctx.before.total_shares, nav_delta(ctx), ctx.before.nav());
}

} // namespace lever
