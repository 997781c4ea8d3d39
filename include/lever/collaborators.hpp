#ifndef LEVER_COLLABORATORS_HPP
#define LEVER_COLLABORATORS_HPP

#include <cstdint>

#include "types.hpp"

namespace lever {

// =============================================================================
// Token Interface (ERC20 subset)
// =============================================================================

class IToken {
public:
    virtual ~IToken() = default;

    virtual Address address() const = 0;
    virtual I128 balance_of(const Address& holder) const = 0;

    virtual void transfer(const Address& from, const Address& to, I128 amount) = 0;
    virtual void transfer_from(const Address& spender, const Address& from,
                               const Address& to, I128 amount) = 0;

    virtual void approve(const Address& owner, const Address& spender, I128 amount) = 0;
    virtual I128 allowance(const Address& owner, const Address& spender) const = 0;
};

// =============================================================================
// Lending Market Interface
// =============================================================================

// Balance kept as scaled units times an accrual index (RAY)
struct ScaledBalance {
    I128 scaled;
    I128 index;
};

struct PositionData {
    I128 collateral_value;            // reference currency
    I128 debt_value;                  // reference currency
    I128 available_borrow;            // reference currency, LTV headroom
    I128 liquidation_threshold_bps;
    I128 ltv_bps;
    I128 health_factor;               // WAD, HEALTH_FACTOR_MAX without debt
};

class ILendingMarket {
public:
    virtual ~ILendingMarket() = default;

    // Pulls `amount` of `asset` from `on_behalf_of` into the market
    virtual void supply(const Address& asset, I128 amount, const Address& on_behalf_of) = 0;

    // Withdraws from `owner`'s supply to `to`; returns the amount moved
    virtual I128 withdraw(const Address& asset, I128 amount, const Address& owner,
                          const Address& to) = 0;

    // Sends borrowed `asset` to `on_behalf_of` and records the debt
    virtual void borrow(const Address& asset, I128 amount, const Address& on_behalf_of) = 0;

    // Pulls up to `amount` from `on_behalf_of`; returns the debt actually repaid
    virtual I128 repay(const Address& asset, I128 amount, const Address& on_behalf_of) = 0;

    virtual PositionData position_data(const Address& owner) const = 0;

    virtual ScaledBalance collateral_balance(const Address& owner, const Address& asset) const = 0;
    virtual ScaledBalance debt_balance(const Address& owner, const Address& asset) const = 0;
};

// =============================================================================
// Liquid Staking Interface
// =============================================================================

class IStakingToken {
public:
    virtual ~IStakingToken() = default;

    // Takes `amount` of the underlying from `from`, mints staking shares to it
    virtual I128 stake(const Address& from, I128 amount) = 0;

    virtual I128 convert_to_assets(I128 shares) const = 0;
    virtual I128 convert_to_shares(I128 assets) const = 0;

    // Underlying per share, WAD
    virtual I128 current_rate() const = 0;
};

// =============================================================================
// Rate Cap Interface
// =============================================================================

struct RateCapInputs {
    I128 snapshot_rate;         // WAD
    uint64_t snapshot_time;     // seconds
    I128 max_yearly_growth;     // WAD fraction per year
    I128 source_rate;           // uncapped rate, WAD
    uint64_t now;               // seconds
};

class IRateCap {
public:
    virtual ~IRateCap() = default;

    virtual I128 current_rate() const = 0;
    virtual bool is_capped() const = 0;
    virtual RateCapInputs inputs() const = 0;
};

// =============================================================================
// Atomicity of the execution environment
// =============================================================================

// Checkpoints are nested; rollback restores the most recent begin()
class IStateJournal {
public:
    virtual ~IStateJournal() = default;

    virtual void begin() = 0;
    virtual void commit() = 0;
    virtual void rollback() noexcept = 0;
};

// Everything the vault consumes from its environment
struct Collaborators {
    IToken& borrowed_token;
    IToken& collateral_token;
    IStakingToken& staking;
    ILendingMarket& market;
    IRateCap& rate_cap;
    IStateJournal* journal;    // nullptr when the environment is not transactional
};

} // namespace lever

#endif // LEVER_COLLABORATORS_HPP
