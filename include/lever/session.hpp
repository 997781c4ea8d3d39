#ifndef LEVER_SESSION_HPP
#define LEVER_SESSION_HPP

#include "types.hpp"

namespace lever {

// =============================================================================
// Session - lock plus two running balances that must net to zero
// =============================================================================
//
// Unlocked -> Locked(caller) -> Unlocked. While locked only the recorded
// caller may invoke primitive actions, and release() refuses to unlock until
// both the borrowed-asset and collateral-asset balances are back to zero.

class Session {
public:
    Session() = default;

    // Non-copyable: one ledger per vault
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Throws ALREADY_LOCKED
    void acquire(const Address& caller);

    // Throws SESSION_BALANCE_NON_ZERO, NOT_LOCKED
    void release();

    // Throws SESSION_BALANCE_NON_ZERO
    void require_settled() const;

    // Unconditional reset after a failed operation has been rolled back
    void abort() noexcept;

    // Throws NOT_LOCKED, NOT_PERMITTED
    void require_caller(const Address& invoker) const;

    void credit(Asset asset, I128 amount);

    // Throws INSUFFICIENT_SESSION_BALANCE
    void debit(Asset asset, I128 amount);

    bool locked() const noexcept { return locked_; }
    const Address& caller() const noexcept { return caller_; }
    I128 balance(Asset asset) const noexcept;
    I128 borrowed_balance() const noexcept { return borrowed_balance_; }
    I128 collateral_balance() const noexcept { return collateral_balance_; }

private:
    I128& slot(Asset asset) noexcept;

    bool locked_{false};
    Address caller_{};
    I128 borrowed_balance_{0};
    I128 collateral_balance_{0};
};

} // namespace lever

#endif // LEVER_SESSION_HPP
