// =============================================================================
// world.cpp - Simulated environment
// =============================================================================

#include "lever/sim/world.hpp"
#include "lever/errors.hpp"
#include "lever/math.hpp"

#include <stdexcept>

namespace lever {
namespace sim {

SimWorld::SimWorld(const WorldParams& params)
    : params_(params)
    , now_(params.start_time)
    , borrowed_(ids::BORROWED_TOKEN, "WETH")
    , staking_(ids::STAKING_TOKEN, "wstETH", borrowed_, params.staking_rate)
    , rate_cap_(staking_, params.staking_rate, params.start_time, params.max_yearly_growth,
                [this]() { return now_; })
    , market_(ids::MARKET, borrowed_, rate_cap_) {
    ReserveConfig collateral;
    collateral.ltv_bps = params_.ltv_bps;
    collateral.liquidation_threshold_bps = params_.liquidation_threshold_bps;
    collateral.supply_cap = params_.collateral_supply_cap;
    market_.add_reserve(staking_, collateral);

    ReserveConfig borrowed;
    borrowed.borrowable = true;
    market_.add_reserve(borrowed_, borrowed);

    borrowed_.mint(ids::MARKET, params_.market_liquidity);
    borrowed_.mint(ids::DEX, params_.dex_liquidity);
}

Collaborators SimWorld::collaborators() {
    return Collaborators{borrowed_, staking_, staking_, market_, rate_cap_, this};
}

void SimWorld::begin() {
    checkpoints_.push_back(Checkpoint{borrowed_.checkpoint(), staking_.checkpoint_staking(),
                                      market_.checkpoint(), now_});
}

void SimWorld::commit() {
    if (checkpoints_.empty()) {
        throw std::logic_error("commit without begin");
    }
    checkpoints_.pop_back();
}

void SimWorld::rollback() noexcept {
    if (checkpoints_.empty()) {
        return;
    }
    Checkpoint& cp = checkpoints_.back();
    borrowed_.restore(std::move(cp.borrowed));
    staking_.restore_staking(std::move(cp.staking));
    market_.restore(std::move(cp.market));
    now_ = cp.now;
    checkpoints_.pop_back();
}

void SimWorld::fund(const Address& account, I128 amount) {
    borrowed_.mint(account, amount);
}

void SimWorld::accrue_interest(I128 liquidity_index, I128 borrow_index) {
    SimLendingMarket::State state = market_.checkpoint();
    const SimLendingMarket::Reserve& reserve = state.reserves.at(ids::STAKING_TOKEN);
    I128 growth = math::max(liquidity_index - reserve.liquidity_index, 0);
    I128 grown = math::mul_div(reserve.total_scaled_supply, growth, RAY, Rounding::CEIL);
    market_.set_indices(ids::STAKING_TOKEN, liquidity_index, borrow_index);
    market_.set_indices(ids::BORROWED_TOKEN, liquidity_index, borrow_index);
    if (grown > 0) {
        staking_.mint(ids::MARKET, grown);
    }
}

} // namespace sim
} // namespace lever
