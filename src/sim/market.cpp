// =============================================================================
// market.cpp - In-memory lending market
// =============================================================================

#include "lever/sim/market.hpp"
#include "lever/errors.hpp"
#include "lever/math.hpp"

namespace lever {
namespace sim {

namespace {

I128 lookup(const std::unordered_map<Address, I128, AddressHash>& m, const Address& key) {
    auto it = m.find(key);
    return it == m.end() ? 0 : it->second;
}

const char* to_string(MarketCall call) noexcept {
    switch (call) {
        case MarketCall::NONE: return "none";
        case MarketCall::SUPPLY: return "supply";
        case MarketCall::WITHDRAW: return "withdraw";
        case MarketCall::BORROW: return "borrow";
        case MarketCall::REPAY: return "repay";
    }
    return "unknown";
}

} // anonymous namespace

SimLendingMarket::SimLendingMarket(const Address& self, IToken& pricing_asset,
                                   const IRateCap& price)
    : self_(self), pricing_asset_(pricing_asset.address()), price_(price) {}

void SimLendingMarket::add_reserve(IToken& token, const ReserveConfig& config) {
    if (config.ltv_bps > config.liquidation_threshold_bps ||
        config.liquidation_threshold_bps > BPS_DENOMINATOR) {
        throw CollaboratorError("reserve: ltv must not exceed the liquidation threshold");
    }
    Reserve r;
    r.token = &token;
    r.config = config;
    state_.reserves[token.address()] = std::move(r);
}

void SimLendingMarket::set_indices(const Address& asset, I128 liquidity_index,
                                   I128 borrow_index) {
    if (liquidity_index < RAY || borrow_index < RAY) {
        throw CollaboratorError("reserve: indices start at RAY");
    }
    Reserve& r = reserve(asset);
    r.liquidity_index = liquidity_index;
    r.borrow_index = borrow_index;
}

SimLendingMarket::Reserve& SimLendingMarket::reserve(const Address& asset) {
    auto it = state_.reserves.find(asset);
    if (it == state_.reserves.end()) {
        throw CollaboratorError("market: unknown reserve " + addresses::to_hex(asset));
    }
    return it->second;
}

const SimLendingMarket::Reserve& SimLendingMarket::reserve(const Address& asset) const {
    auto it = state_.reserves.find(asset);
    if (it == state_.reserves.end()) {
        throw CollaboratorError("market: unknown reserve " + addresses::to_hex(asset));
    }
    return it->second;
}

I128 SimLendingMarket::price(const Address& asset) const {
    return asset == pricing_asset_ ? WAD : price_.current_rate();
}

void SimLendingMarket::maybe_fail(MarketCall call) {
    if (state_.fail_next == call) {
        state_.fail_next = MarketCall::NONE;
        throw CollaboratorError(std::string("market: injected ") + to_string(call) + " failure");
    }
}

// =============================================================================
// Balances
// =============================================================================

I128 SimLendingMarket::supplied(const Address& owner, const Address& asset) const {
    const Reserve& r = reserve(asset);
    return math::mul_div(lookup(r.scaled_supply, owner), r.liquidity_index, RAY,
                         Rounding::FLOOR);
}

I128 SimLendingMarket::owed(const Address& owner, const Address& asset) const {
    const Reserve& r = reserve(asset);
    return math::mul_div(lookup(r.scaled_debt, owner), r.borrow_index, RAY, Rounding::CEIL);
}

ScaledBalance SimLendingMarket::collateral_balance(const Address& owner,
                                                   const Address& asset) const {
    const Reserve& r = reserve(asset);
    return {lookup(r.scaled_supply, owner), r.liquidity_index};
}

ScaledBalance SimLendingMarket::debt_balance(const Address& owner, const Address& asset) const {
    const Reserve& r = reserve(asset);
    return {lookup(r.scaled_debt, owner), r.borrow_index};
}

PositionData SimLendingMarket::position_data(const Address& owner) const {
    I128 collateral_value = 0;
    I128 debt_value = 0;
    I128 weighted_ltv = 0;
    I128 weighted_lt = 0;
    const ReserveConfig* fallback = nullptr;

    for (const auto& [asset, r] : state_.reserves) {
        if (!fallback && r.config.liquidation_threshold_bps > 0) {
            fallback = &r.config;
        }
        I128 p = price(asset);

        I128 supplied_value = wad::mul(supplied(owner, asset), p, Rounding::FLOOR);
        if (supplied_value > 0 && r.config.liquidation_threshold_bps > 0) {
            collateral_value += supplied_value;
            weighted_ltv += supplied_value * r.config.ltv_bps;
            weighted_lt += supplied_value * r.config.liquidation_threshold_bps;
        }
        debt_value += wad::mul(owed(owner, asset), p, Rounding::CEIL);
    }

    PositionData d{};
    d.collateral_value = collateral_value;
    d.debt_value = debt_value;
    if (collateral_value > 0) {
        d.ltv_bps = weighted_ltv / collateral_value;
        d.liquidation_threshold_bps = weighted_lt / collateral_value;
    } else if (fallback) {
        d.ltv_bps = fallback->ltv_bps;
        d.liquidation_threshold_bps = fallback->liquidation_threshold_bps;
    }

    I128 max_debt = math::mul_div(collateral_value, d.ltv_bps, BPS_DENOMINATOR, Rounding::FLOOR);
    d.available_borrow = max_debt > debt_value ? max_debt - debt_value : 0;

    if (debt_value == 0) {
        d.health_factor = HEALTH_FACTOR_MAX;
    } else {
        I128 adjusted = math::mul_div(collateral_value, d.liquidation_threshold_bps,
                                      BPS_DENOMINATOR, Rounding::FLOOR);
        d.health_factor = wad::div(adjusted, debt_value, Rounding::FLOOR);
    }
    return d;
}

// =============================================================================
// Operations
// =============================================================================

void SimLendingMarket::supply(const Address& asset, I128 amount, const Address& on_behalf_of) {
    maybe_fail(MarketCall::SUPPLY);
    if (amount <= 0) {
        throw CollaboratorError("market: supply amount must be positive");
    }
    Reserve& r = reserve(asset);

    I128 scaled = math::mul_div(amount, RAY, r.liquidity_index, Rounding::FLOOR);
    if (r.config.supply_cap > 0) {
        I128 total = math::mul_div(r.total_scaled_supply + scaled, r.liquidity_index, RAY,
                                   Rounding::FLOOR);
        if (total > r.config.supply_cap) {
            throw CollaboratorError("market: supply cap exceeded");
        }
    }

    r.token->transfer(on_behalf_of, self_, amount);
    r.scaled_supply[on_behalf_of] += scaled;
    r.total_scaled_supply += scaled;
}

I128 SimLendingMarket::withdraw(const Address& asset, I128 amount, const Address& owner,
                                const Address& to) {
    maybe_fail(MarketCall::WITHDRAW);
    Reserve& r = reserve(asset);
    I128 balance = supplied(owner, asset);
    if (amount == I128_MAX) {
        amount = balance;
    }
    if (amount <= 0 || amount > balance) {
        throw CollaboratorError("market: withdraw exceeds supplied balance (" +
                                math::to_string(amount) + " > " + math::to_string(balance) + ")");
    }

    I128 old_scaled = lookup(r.scaled_supply, owner);
    I128 new_scaled = math::mul_div(balance - amount, RAY, r.liquidity_index, Rounding::CEIL);
    r.scaled_supply[owner] = new_scaled;

    PositionData after = position_data(owner);
    if (after.health_factor < WAD) {
        r.scaled_supply[owner] = old_scaled;
        throw CollaboratorError("market: withdraw would leave the health factor below 1");
    }

    r.total_scaled_supply -= old_scaled - new_scaled;
    r.token->transfer(self_, to, amount);
    return amount;
}

void SimLendingMarket::borrow(const Address& asset, I128 amount, const Address& on_behalf_of) {
    maybe_fail(MarketCall::BORROW);
    if (amount <= 0) {
        throw CollaboratorError("market: borrow amount must be positive");
    }
    Reserve& r = reserve(asset);
    if (!r.config.borrowable) {
        throw CollaboratorError("market: reserve is not borrowable");
    }

    PositionData before = position_data(on_behalf_of);
    I128 value = wad::mul(amount, price(asset), Rounding::CEIL);
    if (value > before.available_borrow) {
        throw CollaboratorError("market: borrow exceeds available (" + math::to_string(value) +
                                " > " + math::to_string(before.available_borrow) + ")");
    }
    if (r.token->balance_of(self_) < amount) {
        throw CollaboratorError("market: insufficient liquidity");
    }

    I128 current = owed(on_behalf_of, asset);
    r.scaled_debt[on_behalf_of] = math::mul_div(current + amount, RAY, r.borrow_index,
                                                Rounding::CEIL);
    r.token->transfer(self_, on_behalf_of, amount);
}

I128 SimLendingMarket::repay(const Address& asset, I128 amount, const Address& on_behalf_of) {
    maybe_fail(MarketCall::REPAY);
    if (amount <= 0) {
        throw CollaboratorError("market: repay amount must be positive");
    }
    Reserve& r = reserve(asset);

    I128 debt = owed(on_behalf_of, asset);
    I128 actual = math::min(amount, debt);
    if (actual == 0) {
        return 0;
    }

    r.token->transfer(on_behalf_of, self_, actual);
    r.scaled_debt[on_behalf_of] = actual == debt
        ? 0
        : math::mul_div(debt - actual, RAY, r.borrow_index, Rounding::FLOOR);
    return actual;
}

} // namespace sim
} // namespace lever
