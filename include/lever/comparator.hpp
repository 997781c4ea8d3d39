#ifndef LEVER_COMPARATOR_HPP
#define LEVER_COMPARATOR_HPP

#include <optional>

#include "types.hpp"
#include "config.hpp"
#include "snapshot.hpp"

namespace lever {

// Rounding slack on the unwind NAV check, covering the collateral valuation,
// the debt repayment and restaking of excess proceeds
constexpr I128 UNWIND_NAV_TOLERANCE = 4;

// =============================================================================
// ComparisonContext
// =============================================================================

struct ComparisonContext {
    const PositionSnapshot& before;
    const PositionSnapshot& after;
    std::optional<I128> shares;          // shares minted or burned
    std::optional<I128> total_supply;    // supply before the burn
};

struct WithdrawExpectation {
    I128 debt;          // largest acceptable debt after the withdraw
    I128 collateral;    // smallest acceptable collateral after the withdraw
};

// =============================================================================
// SnapshotComparator - accept/reject predicates per operation kind
// =============================================================================
//
// Every check throws VaultError with the code of the first violated rule and
// returns normally otherwise.

class SnapshotComparator {
public:
    explicit SnapshotComparator(const VaultConfig& config) : config_(config) {}

    // NAV(after) - NAV(before), signed
    static I128 nav_delta(const ComparisonContext& ctx);

    // Debt rounds up and collateral rounds down, both toward the vault
    static WithdrawExpectation expected_after_withdraw(const PositionSnapshot& before,
                                                       I128 shares, I128 total_supply);

    // RATE_CHANGED_DURING_SESSION
    void check_rate_stable(const ComparisonContext& ctx) const;

    // HEALTH_FACTOR_OUT_OF_RANGE, NAV_INCREASE_BELOW_MIN
    void check_deposit(const ComparisonContext& ctx) const;
    void check_donate(const ComparisonContext& ctx) const;

    // INVALID_DEBT_AFTER_WITHDRAW, INVALID_COLLATERAL_AFTER_WITHDRAW
    void check_withdraw(const ComparisonContext& ctx) const;

    // ALREADY_INITIALIZED, COLLATERAL_NON_ZERO
    void check_initialize_pre(const PositionSnapshot& before) const;

    // DEBT_AFTER_INIT_NON_ZERO, NAV_INCREASE_BELOW_MIN
    void check_initialize_post(const ComparisonContext& ctx) const;

    // INSUFFICIENT_PROCEEDS
    void check_unwind(I128 proceeds, I128 redemption_value) const;

    // INVALID_STATE_AFTER_UNWIND: debt may not grow, HF must strictly rise
    // while debt remains, and NAV may fall by at most the sale discount plus
    // any change returned to the operator
    void check_unwind_post(const ComparisonContext& ctx, I128 proceeds, I128 redemption_value,
                           I128 returned) const;

    // floor(total_shares_before * nav_delta / nav_before)
    I128 shares_for_deposit(const ComparisonContext& ctx) const;

    // Deposit band around the target health factor
    I128 band_low() const;
    I128 band_high() const;

private:
    void check_health_factor(const ComparisonContext& ctx) const;

    const VaultConfig& config_;
};

} // namespace lever

#endif // LEVER_COMPARATOR_HPP
