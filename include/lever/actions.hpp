#ifndef LEVER_ACTIONS_HPP
#define LEVER_ACTIONS_HPP

#include "types.hpp"
#include "collaborators.hpp"
#include "session.hpp"
#include "config.hpp"

namespace lever {

// =============================================================================
// ActionSet - the state-mutating primitives available inside a session
// =============================================================================
//
// Every primitive checks that `session` is locked by `invoker`, moves exactly
// one running balance and performs the collaborator call immediately.

class ActionSet {
public:
    ActionSet(IToken& borrowed_token, IToken& collateral_token, IStakingToken& staking,
              ILendingMarket& market, const Address& vault, const VaultConfig& config);

    // Borrowed asset -> collateral asset through the staking collaborator
    I128 stake(Session& session, const Address& invoker, I128 amount);

    void supply_collateral(Session& session, const Address& invoker, I128 amount);
    I128 withdraw_collateral(Session& session, const Address& invoker, I128 amount);

    void borrow(Session& session, const Address& invoker, I128 amount);
    I128 repay(Session& session, const Address& invoker, I128 amount);

    // Session balance <-> external holder
    void send(Session& session, const Address& invoker, Asset asset,
              const Address& to, I128 amount);
    void pull(Session& session, const Address& invoker, Asset asset,
              const Address& from, I128 amount);

    const Address& vault() const noexcept { return vault_; }

private:
    IToken& token(Asset asset) noexcept;

    IToken& borrowed_token_;
    IToken& collateral_token_;
    IStakingToken& staking_;
    ILendingMarket& market_;
    Address vault_;
    const VaultConfig& config_;
};

// =============================================================================
// SessionHandle - what an operation callback receives
// =============================================================================

// Binds the action set and the session to one invoking identity
class SessionHandle {
public:
    SessionHandle(ActionSet& actions, Session& session, const Address& invoker)
        : actions_(actions), session_(session), invoker_(invoker) {}

    I128 stake(I128 amount) { return actions_.stake(session_, invoker_, amount); }
    void supply_collateral(I128 amount) { actions_.supply_collateral(session_, invoker_, amount); }
    I128 withdraw_collateral(I128 amount) { return actions_.withdraw_collateral(session_, invoker_, amount); }
    void borrow(I128 amount) { actions_.borrow(session_, invoker_, amount); }
    I128 repay(I128 amount) { return actions_.repay(session_, invoker_, amount); }

    void send(Asset asset, const Address& to, I128 amount) {
        actions_.send(session_, invoker_, asset, to, amount);
    }
    void pull(Asset asset, const Address& from, I128 amount) {
        actions_.pull(session_, invoker_, asset, from, amount);
    }

    I128 balance(Asset asset) const noexcept { return session_.balance(asset); }
    const Address& invoker() const noexcept { return invoker_; }
    const Address& vault() const noexcept { return actions_.vault(); }

private:
    ActionSet& actions_;
    Session& session_;
    Address invoker_;
};

} // namespace lever

#endif // LEVER_ACTIONS_HPP
