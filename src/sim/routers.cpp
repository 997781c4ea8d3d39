// =============================================================================
// routers.cpp - Reference operation callbacks
// =============================================================================

#include "lever/sim/routers.hpp"
#include "lever/borrow_sizing.hpp"
#include "lever/log.hpp"
#include "lever/math.hpp"
#include "lever/share_math.hpp"

namespace lever {
namespace sim {

namespace {

void stake_and_supply(SessionHandle& session, I128 amount) {
    I128 received = session.stake(amount);
    session.supply_collateral(received);
}

void pull_borrowed(IToken& borrowed, SessionHandle& session, const Address& from, I128 amount) {
    borrowed.approve(from, session.vault(),
                     math::checked_add(borrowed.allowance(from, session.vault()), amount));
    session.pull(Asset::BORROWED, from, amount);
}

} // anonymous namespace

I128 SeedCallback::run(SessionHandle& session, const CallbackContext& ctx) {
    pull_borrowed(borrowed_, session, ctx.caller, amount_);
    stake_and_supply(session, amount_);
    return 0;
}

// =============================================================================
// Leveraged deposit
// =============================================================================

LoopDepositCallback::LoopDepositCallback(IToken& borrowed, const ILendingMarket& market,
                                         const VaultConfig& config, I128 amount)
    : borrowed_(borrowed), market_(market) {
    params_.amount = amount;
    params_.target_health_factor = config.target_health_factor;
    params_.borrow_buffer = config.borrow_buffer;
    params_.min_borrow = config.min_stake;
}

I128 LoopDepositCallback::run(SessionHandle& session, const CallbackContext& ctx) {
    pull_borrowed(borrowed_, session, ctx.caller, params_.amount);
    stake_and_supply(session, params_.amount);

    iterations_ = 0;
    while (iterations_ < params_.max_iterations) {
        I128 amount = compute_borrow_amount(market_.position_data(session.vault()),
                                            params_.target_health_factor,
                                            params_.borrow_buffer);
        if (amount < params_.min_borrow || amount <= 0) {
            break;
        }
        session.borrow(amount);
        stake_and_supply(session, amount);
        ++iterations_;
    }
    log::debug("loop deposit finished after " + std::to_string(iterations_) + " borrows");
    return 0;
}

// =============================================================================
// Proportional withdraw
// =============================================================================

I128 ProportionalWithdrawCallback::run(SessionHandle& session, const CallbackContext& ctx) {
    I128 debt_share = share_math::debt_for_shares(ctx.before.debt_value, ctx.shares,
                                                  ctx.total_supply);
    I128 collateral_share = share_math::collateral_for_shares(ctx.before.collateral_amount,
                                                              ctx.shares, ctx.total_supply);

    if (debt_share > 0) {
        pull_borrowed(borrowed_, session, ctx.caller, debt_share);
        session.repay(debt_share);
        I128 change = session.balance(Asset::BORROWED);
        if (change > 0) {
            session.send(Asset::BORROWED, ctx.caller, change);
        }
    }

    if (collateral_share > 0) {
        I128 received = session.withdraw_collateral(collateral_share);
        session.send(Asset::COLLATERAL, ctx.receiver, received);
    }
    return 0;
}

// =============================================================================
// Unwind sale
// =============================================================================

I128 SellCollateralCallback::run(SessionHandle& session, const CallbackContext& ctx) {
    I128 slice = ctx.amount;
    collateral_.transfer(ctx.caller, dex_, slice);

    I128 proceeds = wad::mul(staking_.convert_to_assets(slice), WAD - haircut_, Rounding::FLOOR);
    borrowed_.transfer(dex_, ctx.caller, proceeds);
    borrowed_.approve(ctx.caller, session.vault(),
                      math::checked_add(borrowed_.allowance(ctx.caller, session.vault()),
                                        proceeds));
    return proceeds;
}

I128 DonateCallback::run(SessionHandle& session, const CallbackContext& ctx) {
    pull_borrowed(borrowed_, session, ctx.caller, amount_);
    stake_and_supply(session, amount_);
    return 0;
}

} // namespace sim
} // namespace lever
