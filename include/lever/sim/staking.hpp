#ifndef LEVER_SIM_STAKING_HPP
#define LEVER_SIM_STAKING_HPP

#include "token.hpp"

namespace lever {
namespace sim {

// =============================================================================
// SimStakingToken - yield-bearing wrapper over the borrowed asset
// =============================================================================
//
// Shares are minted at floor(amount / rate). Yield is simulated by raising the
// rate with set_rate().

class SimStakingToken : public SimToken, public IStakingToken {
public:
    struct StakingState {
        SimToken::State token;
        I128 rate;
    };

    SimStakingToken(const Address& address, std::string symbol, SimToken& underlying,
                    I128 rate = WAD);

    I128 stake(const Address& from, I128 amount) override;
    I128 convert_to_assets(I128 shares) const override;
    I128 convert_to_shares(I128 assets) const override;
    I128 current_rate() const override { return rate_; }

    // Throws CollaboratorError for a non-positive rate
    void set_rate(I128 rate);

    StakingState checkpoint_staking() const { return {checkpoint(), rate_}; }
    void restore_staking(StakingState state);

private:
    SimToken& underlying_;
    I128 rate_;
};

} // namespace sim
} // namespace lever

#endif // LEVER_SIM_STAKING_HPP
