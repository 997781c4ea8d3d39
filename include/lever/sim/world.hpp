#ifndef LEVER_SIM_WORLD_HPP
#define LEVER_SIM_WORLD_HPP

#include <cstdint>
#include <vector>

#include "../types.hpp"
#include "../collaborators.hpp"
#include "../rate_cap.hpp"
#include "token.hpp"
#include "staking.hpp"
#include "market.hpp"

namespace lever {
namespace sim {

// =============================================================================
// Well-known addresses
// =============================================================================

namespace ids {

constexpr Address BORROWED_TOKEN = addresses::from_id(0x1001);
constexpr Address STAKING_TOKEN = addresses::from_id(0x1002);
constexpr Address MARKET = addresses::from_id(0x1003);
constexpr Address DEX = addresses::from_id(0x1004);

} // namespace ids

struct WorldParams {
    I128 staking_rate = WAD * 12 / 10;
    I128 ltv_bps = 9300;
    I128 liquidation_threshold_bps = 9500;
    I128 collateral_supply_cap = 0;
    I128 market_liquidity = WAD * 1000000;
    I128 dex_liquidity = WAD * 1000000;
    I128 max_yearly_growth = WAD / 10;
    uint64_t start_time = 1700000000;
};

// =============================================================================
// SimWorld - the vault's environment, with value checkpoints
// =============================================================================

class SimWorld : public IStateJournal {
public:
    explicit SimWorld(const WorldParams& params = WorldParams{});

    SimWorld(const SimWorld&) = delete;
    SimWorld& operator=(const SimWorld&) = delete;

    Collaborators collaborators();

    // IStateJournal
    void begin() override;
    void commit() override;
    void rollback() noexcept override;
    size_t depth() const noexcept { return checkpoints_.size(); }

    // Mints borrowed asset to `account`
    void fund(const Address& account, I128 amount);

    void advance_time(uint64_t seconds) noexcept { now_ += seconds; }
    uint64_t now() const noexcept { return now_; }

    // Raises indices and mints the collateral the higher supply index implies
    void accrue_interest(I128 liquidity_index, I128 borrow_index);

    SimToken& borrowed() noexcept { return borrowed_; }
    SimStakingToken& staking() noexcept { return staking_; }
    SimLendingMarket& market() noexcept { return market_; }
    CappedRateAdapter& rate_cap() noexcept { return rate_cap_; }
    const WorldParams& params() const noexcept { return params_; }

private:
    struct Checkpoint {
        SimToken::State borrowed;
        SimStakingToken::StakingState staking;
        SimLendingMarket::State market;
        uint64_t now;
    };

    WorldParams params_;
    uint64_t now_;
    SimToken borrowed_;
    SimStakingToken staking_;
    CappedRateAdapter rate_cap_;
    SimLendingMarket market_;
    std::vector<Checkpoint> checkpoints_;
};

} // namespace sim
} // namespace lever

#endif // LEVER_SIM_WORLD_HPP
