// =============================================================================
// share_ledger.cpp - Vault share balances
// =============================================================================

#include "lever/share_ledger.hpp"
#include "lever/errors.hpp"
#include "lever/math.hpp"

namespace lever {

void ShareLedger::mint(const Address& to, I128 amount) {
    if (addresses::is_zero(to)) {
        throw VaultError(ErrorCode::ZERO_ADDRESS);
    }
    if (amount < 0) {
        throw VaultError(ErrorCode::ZERO_AMOUNT, "negative share amount");
    }
    if (amount == 0) return;

    total_supply_ = math::checked_add(total_supply_, amount);
    balances_[to] += amount;
}

void ShareLedger::burn(const Address& from, I128 amount) {
    if (amount < 0) {
        throw VaultError(ErrorCode::ZERO_AMOUNT, "negative share amount");
    }
    auto it = balances_.find(from);
    I128 held = (it != balances_.end()) ? it->second : 0;
    if (amount > held) {
        throw VaultError(ErrorCode::INSUFFICIENT_SHARES,
                         math::to_string(held) + " < " + math::to_string(amount));
    }
    if (amount == 0) return;

    it->second -= amount;
    if (it->second == 0) balances_.erase(it);
    total_supply_ -= amount;
}

void ShareLedger::transfer(const Address& from, const Address& to, I128 amount) {
    if (addresses::is_zero(to)) {
        throw VaultError(ErrorCode::ZERO_ADDRESS);
    }
    burn(from, amount);
    if (amount == 0) return;
    total_supply_ += amount;
    balances_[to] += amount;
}

I128 ShareLedger::balance_of(const Address& holder) const {
    auto it = balances_.find(holder);
    return (it != balances_.end()) ? it->second : 0;
}

} // namespace lever
