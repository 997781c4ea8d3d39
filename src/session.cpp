// =============================================================================
// session.cpp - Session lock and running balances
// =============================================================================

#include "lever/session.hpp"
#include "lever/errors.hpp"
#include "lever/math.hpp"

namespace lever {

void Session::acquire(const Address& caller) {
    if (locked_) {
        throw VaultError(ErrorCode::ALREADY_LOCKED);
    }
    locked_ = true;
    caller_ = caller;
    borrowed_balance_ = 0;
    collateral_balance_ = 0;
}

void Session::release() {
    if (!locked_) {
        throw VaultError(ErrorCode::NOT_LOCKED);
    }
    require_settled();
    locked_ = false;
    caller_ = Address{};
}

void Session::require_settled() const {
    if (borrowed_balance_ != 0 || collateral_balance_ != 0) {
        throw VaultError(ErrorCode::SESSION_BALANCE_NON_ZERO,
                         "borrowed=" + math::to_string(borrowed_balance_) +
                         " collateral=" + math::to_string(collateral_balance_));
    }
}

void Session::abort() noexcept {
    locked_ = false;
    caller_ = Address{};
    borrowed_balance_ = 0;
    collateral_balance_ = 0;
}

void Session::require_caller(const Address& invoker) const {
    if (!locked_) {
        throw VaultError(ErrorCode::NOT_LOCKED);
    }
    if (invoker != caller_) {
        throw VaultError(ErrorCode::NOT_PERMITTED, addresses::to_hex(invoker));
    }
}

void Session::credit(Asset asset, I128 amount) {
    I128& bal = slot(asset);
    bal = math::checked_add(bal, amount);
}

void Session::debit(Asset asset, I128 amount) {
    I128& bal = slot(asset);
    if (amount > bal) {
        throw VaultError(ErrorCode::INSUFFICIENT_SESSION_BALANCE,
                         std::string(to_string(asset)) + " balance " + math::to_string(bal) +
                         " < " + math::to_string(amount));
    }
    bal -= amount;
}

I128 Session::balance(Asset asset) const noexcept {
    return asset == Asset::BORROWED ? borrowed_balance_ : collateral_balance_;
}

I128& Session::slot(Asset asset) noexcept {
    return asset == Asset::BORROWED ? borrowed_balance_ : collateral_balance_;
}

} // namespace lever
