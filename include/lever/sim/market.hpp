#ifndef LEVER_SIM_MARKET_HPP
#define LEVER_SIM_MARKET_HPP

#include <map>
#include <unordered_map>

#include "../types.hpp"
#include "../collaborators.hpp"

namespace lever {
namespace sim {

// =============================================================================
// Reserve configuration
// =============================================================================

struct ReserveConfig {
    I128 ltv_bps = 0;                      // 0 disables borrowing against it
    I128 liquidation_threshold_bps = 0;
    I128 supply_cap = 0;                   // 0 == unlimited
    bool borrowable = false;
};

// Calls that can be made to fail once for fault injection
enum class MarketCall : uint8_t {
    NONE = 0,
    SUPPLY = 1,
    WITHDRAW = 2,
    BORROW = 3,
    REPAY = 4
};

// =============================================================================
// SimLendingMarket - scaled-balance lending market
// =============================================================================
//
// Balances are kept as scaled units times a RAY index. Remaining balances are
// rounded in the market's favor: supply positions down, debt up. The borrowed
// asset is the pricing unit; every other asset is priced with an IRateCap.

class SimLendingMarket : public ILendingMarket {
public:
    struct Reserve {
        IToken* token = nullptr;
        ReserveConfig config;
        I128 liquidity_index = RAY;
        I128 borrow_index = RAY;
        I128 total_scaled_supply = 0;
        std::unordered_map<Address, I128, AddressHash> scaled_supply;
        std::unordered_map<Address, I128, AddressHash> scaled_debt;
    };

    struct State {
        std::map<Address, Reserve> reserves;
        MarketCall fail_next = MarketCall::NONE;
    };

    SimLendingMarket(const Address& self, IToken& pricing_asset, const IRateCap& price);

    void add_reserve(IToken& token, const ReserveConfig& config);

    // Simulated interest; indices never go below RAY
    void set_indices(const Address& asset, I128 liquidity_index, I128 borrow_index);

    void fail_next(MarketCall call) noexcept { state_.fail_next = call; }

    // ILendingMarket
    void supply(const Address& asset, I128 amount, const Address& on_behalf_of) override;
    I128 withdraw(const Address& asset, I128 amount, const Address& owner,
                  const Address& to) override;
    void borrow(const Address& asset, I128 amount, const Address& on_behalf_of) override;
    I128 repay(const Address& asset, I128 amount, const Address& on_behalf_of) override;

    PositionData position_data(const Address& owner) const override;
    ScaledBalance collateral_balance(const Address& owner, const Address& asset) const override;
    ScaledBalance debt_balance(const Address& owner, const Address& asset) const override;

    I128 supplied(const Address& owner, const Address& asset) const;
    I128 owed(const Address& owner, const Address& asset) const;

    const Address& address() const noexcept { return self_; }

    State checkpoint() const { return state_; }
    void restore(State state) { state_ = std::move(state); }

private:
    Reserve& reserve(const Address& asset);
    const Reserve& reserve(const Address& asset) const;
    I128 price(const Address& asset) const;
    void maybe_fail(MarketCall call);

    Address self_;
    Address pricing_asset_;
    const IRateCap& price_;
    State state_;
};

} // namespace sim
} // namespace lever

#endif // LEVER_SIM_MARKET_HPP
