#ifndef LEVER_VAULT_HPP
#define LEVER_VAULT_HPP

#include <cstdint>
#include <unordered_set>
#include <vector>

#include "types.hpp"
#include "collaborators.hpp"
#include "config.hpp"
#include "session.hpp"
#include "actions.hpp"
#include "snapshot.hpp"
#include "comparator.hpp"
#include "share_ledger.hpp"
#include "fee.hpp"
#include "records.hpp"

namespace lever {

// =============================================================================
// Operation callbacks
// =============================================================================

struct CallbackContext {
    OperationKind kind;
    Address caller;
    Address receiver;                      // withdraw: where the collateral should go
    const PositionSnapshot& before;
    I128 shares;                           // withdraw: shares already burned
    I128 total_supply;                     // supply before the operation
    I128 amount;                           // unwind: collateral slice sent to the caller
    const std::vector<uint8_t>& data;      // opaque caller payload
};

// Caller logic run inside an open session. Must leave both session balances
// at zero. The return value is the unwind proceeds and is ignored otherwise.
class IOperationCallback {
public:
    virtual ~IOperationCallback() = default;
    virtual I128 run(SessionHandle& session, const CallbackContext& ctx) = 0;
};

// =============================================================================
// LeverVault - operation orchestrator
// =============================================================================
//
// Each top-level operation is all-or-nothing: the share ledger and fee state
// are checkpointed, the environment journal is opened, and any exception
// restores both before propagating.

class LeverVault {
public:
    LeverVault(const Address& self, Collaborators collaborators, VaultConfig config);

    LeverVault(const LeverVault&) = delete;
    LeverVault& operator=(const LeverVault&) = delete;

    // -------------------------------------------------------------------------
    // Operations
    // -------------------------------------------------------------------------

    // First deposit; shares minted equal the resulting NAV
    I128 initialize(const Address& caller, const Address& receiver,
                    IOperationCallback& callback, const std::vector<uint8_t>& data = {});

    // Shares minted pro rata to the NAV increase
    I128 deposit(const Address& caller, const Address& receiver,
                 IOperationCallback& callback, const std::vector<uint8_t>& data = {});

    // Burns `shares` of the caller, then the callback unwinds the matching
    // slice of debt and collateral
    void withdraw(const Address& caller, I128 shares, const Address& receiver,
                  IOperationCallback& callback, const std::vector<uint8_t>& data = {});

    // Operator deleveraging: `collateral_amount` is sent to the caller, whose
    // callback sells it and returns the proceeds used to repay debt
    I128 unwind(const Address& caller, I128 collateral_amount,
                IOperationCallback& callback, const std::vector<uint8_t>& data = {});

    // NAV increase without minting shares
    void donate(const Address& caller, IOperationCallback& callback,
                const std::vector<uint8_t>& data = {});

    // -------------------------------------------------------------------------
    // Views (throw SESSION_ACTIVE while an operation is in flight)
    // -------------------------------------------------------------------------

    PositionSnapshot snapshot() const;
    I128 nav() const;
    I128 share_rate() const;
    I128 convert_to_shares(I128 assets) const;
    I128 convert_to_assets(I128 shares) const;
    I128 pending_fee_shares() const;

    // Per WAD of shares
    I128 collateral_per_share() const;
    I128 debt_per_share() const;

    // Raw ledger state
    I128 total_supply() const noexcept { return shares_.total_supply(); }
    I128 balance_of(const Address& holder) const { return shares_.balance_of(holder); }
    const FeeState& fee_state() const noexcept { return fee_.state(); }
    const VaultConfig& config() const noexcept { return config_; }
    bool is_locked() const noexcept { return session_.locked(); }
    bool is_operator(const Address& account) const { return operators_.count(account) > 0; }
    const Address& address() const noexcept { return self_; }

    const Session& session() const noexcept { return session_; }
    ActionSet& actions() noexcept { return actions_; }

    // -------------------------------------------------------------------------
    // Shares
    // -------------------------------------------------------------------------

    void transfer_shares(const Address& from, const Address& to, I128 amount);

    // -------------------------------------------------------------------------
    // Admin (blocked while locked)
    // -------------------------------------------------------------------------

    void set_fee_rate(I128 rate);
    void set_fee_recipient(const Address& recipient);
    void set_target_health_factor(I128 hf);
    void set_deposit_tolerance(I128 low, I128 high);
    void set_minimum_deposit(I128 amount);
    void set_unwind_slippage(I128 slippage);
    void set_operator(const Address& account, bool enabled);

    // Accrues under the current provider, then restarts the mark at the
    // rate the new provider implies
    void set_rate_cap(IRateCap& rate_cap);

    void set_record_callback(RecordCallback callback) { on_record_ = std::move(callback); }

private:
    class Transaction;

    void require_unlocked() const;
    void require_initialized() const;
    void apply_config(const VaultConfig& candidate);

    PositionSnapshot read_snapshot() const;
    I128 accrue_fees();
    void emit(const OperationRecord& record);

    template <typename Fn>
    auto guarded(OperationKind kind, const Address& caller, Fn&& fn) -> decltype(fn());

    Address self_;
    Collaborators collab_;
    VaultConfig config_;

    Session session_;
    ShareLedger shares_;
    FeeAccrual fee_;

    ActionSet actions_;
    SnapshotReader reader_;
    SnapshotComparator comparator_;

    std::unordered_set<Address, AddressHash> operators_;
    RecordCallback on_record_;
};

} // namespace lever

#endif // LEVER_VAULT_HPP
