// =============================================================================
// token.cpp - In-memory token
// =============================================================================

#include "lever/sim/token.hpp"
#include "lever/errors.hpp"
#include "lever/math.hpp"

namespace lever {
namespace sim {

SimToken::SimToken(const Address& address, std::string symbol)
    : address_(address), symbol_(std::move(symbol)) {}

I128 SimToken::balance_of(const Address& holder) const {
    auto it = state_.balances.find(holder);
    return it == state_.balances.end() ? 0 : it->second;
}

void SimToken::transfer(const Address& from, const Address& to, I128 amount) {
    if (amount < 0) {
        throw CollaboratorError(symbol_ + ": negative transfer");
    }
    if (addresses::is_zero(to)) {
        throw CollaboratorError(symbol_ + ": transfer to the zero address");
    }
    I128 bal = balance_of(from);
    if (bal < amount) {
        throw CollaboratorError(symbol_ + ": transfer amount exceeds balance (" +
                                math::to_string(bal) + " < " + math::to_string(amount) + ")");
    }
    state_.balances[from] = bal - amount;
    state_.balances[to] += amount;
}

void SimToken::transfer_from(const Address& spender, const Address& from,
                             const Address& to, I128 amount) {
    if (spender != from) {
        I128 allowed = allowance(from, spender);
        if (allowed < amount) {
            throw CollaboratorError(symbol_ + ": insufficient allowance (" +
                                    math::to_string(allowed) + " < " +
                                    math::to_string(amount) + ")");
        }
        if (allowed != I128_MAX) {
            state_.allowances[{from, spender}] = allowed - amount;
        }
    }
    transfer(from, to, amount);
}

void SimToken::approve(const Address& owner, const Address& spender, I128 amount) {
    if (amount < 0) {
        throw CollaboratorError(symbol_ + ": negative allowance");
    }
    state_.allowances[{owner, spender}] = amount;
}

I128 SimToken::allowance(const Address& owner, const Address& spender) const {
    auto it = state_.allowances.find({owner, spender});
    return it == state_.allowances.end() ? 0 : it->second;
}

void SimToken::mint(const Address& to, I128 amount) {
    if (amount < 0) {
        throw CollaboratorError(symbol_ + ": negative mint");
    }
    state_.balances[to] += amount;
    state_.total_supply = math::checked_add(state_.total_supply, amount);
}

void SimToken::burn(const Address& from, I128 amount) {
    I128 bal = balance_of(from);
    if (amount < 0 || bal < amount) {
        throw CollaboratorError(symbol_ + ": burn amount exceeds balance");
    }
    state_.balances[from] = bal - amount;
    state_.total_supply -= amount;
}

} // namespace sim
} // namespace lever
