#ifndef LEVER_SIM_ROUTERS_HPP
#define LEVER_SIM_ROUTERS_HPP

#include <functional>

#include "../types.hpp"
#include "../collaborators.hpp"
#include "../vault.hpp"

namespace lever {
namespace sim {

// =============================================================================
// Reference routers
// =============================================================================
//
// Routers act with the caller's authority: they grant the vault the allowance
// a pull needs before pulling.

// Adapts any callable
class LambdaCallback : public IOperationCallback {
public:
    using Fn = std::function<I128(SessionHandle&, const CallbackContext&)>;

    explicit LambdaCallback(Fn fn) : fn_(std::move(fn)) {}

    I128 run(SessionHandle& session, const CallbackContext& ctx) override {
        return fn_(session, ctx);
    }

private:
    Fn fn_;
};

// pull -> stake -> supply, no leverage (initialize)
class SeedCallback : public IOperationCallback {
public:
    SeedCallback(IToken& borrowed, I128 amount) : borrowed_(borrowed), amount_(amount) {}

    I128 run(SessionHandle& session, const CallbackContext& ctx) override;

private:
    IToken& borrowed_;
    I128 amount_;
};

// pull -> stake -> supply, then borrow/stake/supply until the target health
// factor is reached
class LoopDepositCallback : public IOperationCallback {
public:
    struct Params {
        I128 amount;
        I128 target_health_factor;
        I128 borrow_buffer;
        I128 min_borrow;
        int max_iterations = 32;
    };

    LoopDepositCallback(IToken& borrowed, const ILendingMarket& market, const Params& params)
        : borrowed_(borrowed), market_(market), params_(params) {}

    // Reads target, buffer and minimum from the vault configuration
    LoopDepositCallback(IToken& borrowed, const ILendingMarket& market,
                        const VaultConfig& config, I128 amount);

    I128 run(SessionHandle& session, const CallbackContext& ctx) override;

    int iterations() const noexcept { return iterations_; }

private:
    IToken& borrowed_;
    const ILendingMarket& market_;
    Params params_;
    int iterations_{0};
};

// Caller pays the debt share in the borrowed asset, receives the collateral share
class ProportionalWithdrawCallback : public IOperationCallback {
public:
    explicit ProportionalWithdrawCallback(IToken& borrowed) : borrowed_(borrowed) {}

    I128 run(SessionHandle& session, const CallbackContext& ctx) override;

private:
    IToken& borrowed_;
};

// Sells the unwound collateral slice to a liquidity holder at the redemption
// rate less `haircut`, and approves the proceeds to the vault
class SellCollateralCallback : public IOperationCallback {
public:
    SellCollateralCallback(IToken& borrowed, IToken& collateral, const IStakingToken& staking,
                           const Address& dex, I128 haircut)
        : borrowed_(borrowed), collateral_(collateral), staking_(staking),
          dex_(dex), haircut_(haircut) {}

    I128 run(SessionHandle& session, const CallbackContext& ctx) override;

private:
    IToken& borrowed_;
    IToken& collateral_;
    const IStakingToken& staking_;
    Address dex_;
    I128 haircut_;
};

// pull -> stake -> supply with no shares in return
class DonateCallback : public IOperationCallback {
public:
    DonateCallback(IToken& borrowed, I128 amount) : borrowed_(borrowed), amount_(amount) {}

    I128 run(SessionHandle& session, const CallbackContext& ctx) override;

private:
    IToken& borrowed_;
    I128 amount_;
};

} // namespace sim
} // namespace lever

#endif // LEVER_SIM_ROUTERS_HPP
