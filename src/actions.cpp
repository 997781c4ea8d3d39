// =============================================================================
// actions.cpp - Primitive actions executed inside a session
// =============================================================================

#include "lever/actions.hpp"
#include "lever/errors.hpp"
#include "lever/math.hpp"

namespace lever {

namespace {

inline void require_positive(I128 amount) {
    if (amount <= 0) {
        throw VaultError(ErrorCode::ZERO_AMOUNT);
    }
}

} // anonymous namespace

ActionSet::ActionSet(IToken& borrowed_token, IToken& collateral_token, IStakingToken& staking,
                     ILendingMarket& market, const Address& vault, const VaultConfig& config)
    : borrowed_token_(borrowed_token)
    , collateral_token_(collateral_token)
    , staking_(staking)
    , market_(market)
    , vault_(vault)
    , config_(config) {}

IToken& ActionSet::token(Asset asset) noexcept {
    return asset == Asset::BORROWED ? borrowed_token_ : collateral_token_;
}

// =============================================================================
// Staking
// =============================================================================

I128 ActionSet::stake(Session& session, const Address& invoker, I128 amount) {
    session.require_caller(invoker);
    require_positive(amount);
    if (amount < config_.min_stake) {
        throw VaultError(ErrorCode::AMOUNT_BELOW_MINIMUM,
                         math::to_string(amount) + " < " + math::to_string(config_.min_stake));
    }

    session.debit(Asset::BORROWED, amount);
    I128 received = staking_.stake(vault_, amount);
    session.credit(Asset::COLLATERAL, received);
    return received;
}

// =============================================================================
// Lending Market
// =============================================================================

void ActionSet::supply_collateral(Session& session, const Address& invoker, I128 amount) {
    session.require_caller(invoker);
    require_positive(amount);

    session.debit(Asset::COLLATERAL, amount);
    market_.supply(collateral_token_.address(), amount, vault_);
}

I128 ActionSet::withdraw_collateral(Session& session, const Address& invoker, I128 amount) {
    session.require_caller(invoker);
    require_positive(amount);

    I128 actual = market_.withdraw(collateral_token_.address(), amount, vault_, vault_);
    session.credit(Asset::COLLATERAL, actual);
    return actual;
}

void ActionSet::borrow(Session& session, const Address& invoker, I128 amount) {
    session.require_caller(invoker);
    require_positive(amount);

    market_.borrow(borrowed_token_.address(), amount, vault_);
    session.credit(Asset::BORROWED, amount);
}

I128 ActionSet::repay(Session& session, const Address& invoker, I128 amount) {
    session.require_caller(invoker);
    require_positive(amount);

    session.debit(Asset::BORROWED, amount);
    I128 actual = market_.repay(borrowed_token_.address(), amount, vault_);
    if (actual < amount) {
        // Market took less than offered (debt was smaller); keep the change
        session.credit(Asset::BORROWED, amount - actual);
    }
    return actual;
}

// =============================================================================
// Transfers
// =============================================================================

void ActionSet::send(Session& session, const Address& invoker, Asset asset,
                     const Address& to, I128 amount) {
    session.require_caller(invoker);
    require_positive(amount);
    if (addresses::is_zero(to)) {
        throw VaultError(ErrorCode::ZERO_ADDRESS);
    }

    session.debit(asset, amount);
    token(asset).transfer(vault_, to, amount);
}

void ActionSet::pull(Session& session, const Address& invoker, Asset asset,
                     const Address& from, I128 amount) {
    session.require_caller(invoker);
    require_positive(amount);
    if (addresses::is_zero(from)) {
        throw VaultError(ErrorCode::ZERO_ADDRESS);
    }

    token(asset).transfer_from(vault_, from, vault_, amount);
    session.credit(asset, amount);
}

} // namespace lever
