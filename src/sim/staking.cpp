// =============================================================================
// staking.cpp - In-memory liquid staking token
// =============================================================================

#include "lever/sim/staking.hpp"
#include "lever/errors.hpp"
#include "lever/math.hpp"

namespace lever {
namespace sim {

SimStakingToken::SimStakingToken(const Address& address, std::string symbol,
                                 SimToken& underlying, I128 rate)
    : SimToken(address, std::move(symbol)), underlying_(underlying), rate_(rate) {
    if (rate_ <= 0) {
        throw CollaboratorError("staking rate must be positive");
    }
}

I128 SimStakingToken::stake(const Address& from, I128 amount) {
    if (amount <= 0) {
        throw CollaboratorError(symbol() + ": stake amount must be positive");
    }
    I128 shares = convert_to_shares(amount);
    if (shares == 0) {
        throw CollaboratorError(symbol() + ": stake amount too small");
    }
    underlying_.transfer(from, address(), amount);
    mint(from, shares);
    return shares;
}

I128 SimStakingToken::convert_to_assets(I128 shares) const {
    return wad::mul(shares, rate_, Rounding::FLOOR);
}

I128 SimStakingToken::convert_to_shares(I128 assets) const {
    return wad::div(assets, rate_, Rounding::FLOOR);
}

void SimStakingToken::set_rate(I128 rate) {
    if (rate <= 0) {
        throw CollaboratorError(symbol() + ": rate must be positive");
    }
    rate_ = rate;
}

void SimStakingToken::restore_staking(StakingState state) {
    restore(std::move(state.token));
    rate_ = state.rate;
}

} // namespace sim
} // namespace lever
