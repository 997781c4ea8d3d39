// =============================================================================
// vault.cpp - Leveraged loop vault orchestrator
// =============================================================================

#include "lever/vault.hpp"
#include "lever/errors.hpp"
#include "lever/log.hpp"
#include "lever/math.hpp"
#include "lever/share_math.hpp"

namespace lever {

// =============================================================================
// Transaction - checkpoint of vault and environment state
// =============================================================================

class LeverVault::Transaction {
public:
    explicit Transaction(LeverVault& vault)
        : vault_(vault)
        , shares_(vault.shares_)
        , fee_(vault.fee_) {
        if (vault_.collab_.journal) {
            vault_.collab_.journal->begin();
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    ~Transaction() {
        if (committed_) {
            return;
        }
        vault_.shares_ = std::move(shares_);
        vault_.fee_ = fee_;
        vault_.session_.abort();
        if (vault_.collab_.journal) {
            vault_.collab_.journal->rollback();
        }
    }

    void commit() {
        if (vault_.collab_.journal) {
            vault_.collab_.journal->commit();
        }
        committed_ = true;
    }

private:
    LeverVault& vault_;
    ShareLedger shares_;
    FeeAccrual fee_;
    bool committed_{false};
};

// =============================================================================
// Construction
// =============================================================================

LeverVault::LeverVault(const Address& self, Collaborators collaborators, VaultConfig config)
    : self_(self)
    , collab_(collaborators)
    , config_(std::move(config))
    , fee_(FeeState{config_.fee_rate, WAD, config_.fee_recipient})
    , actions_(collab_.borrowed_token, collab_.collateral_token, collab_.staking,
               collab_.market, self_, config_)
    , reader_(collab_.market, collab_.rate_cap, self_, collab_.collateral_token.address(),
              collab_.borrowed_token.address())
    , comparator_(config_) {
    if (addresses::is_zero(self_)) {
        throw VaultError(ErrorCode::ZERO_ADDRESS, "vault address");
    }
    config_.validate();
    log::set_level(log::parse_level(config_.log_level));
}

// =============================================================================
// Helpers
// =============================================================================

void LeverVault::require_unlocked() const {
    if (session_.locked()) {
        throw VaultError(ErrorCode::SESSION_ACTIVE);
    }
}

void LeverVault::require_initialized() const {
    if (shares_.total_supply() == 0) {
        throw VaultError(ErrorCode::NOT_INITIALIZED);
    }
}

void LeverVault::apply_config(const VaultConfig& candidate) {
    if (auto problem = candidate.check()) {
        throw VaultError(ErrorCode::INVALID_CONFIG, *problem);
    }
    config_ = candidate;
}

PositionSnapshot LeverVault::read_snapshot() const {
    I128 supply = shares_.total_supply();
    PositionSnapshot snap = reader_.read(supply);
    if (supply > 0) {
        snap.total_shares += fee_.preview(snap.nav(), supply).fee_shares;
    }
    return snap;
}

I128 LeverVault::accrue_fees() {
    I128 supply = shares_.total_supply();
    if (supply == 0) {
        return 0;
    }
    PositionSnapshot snap = reader_.read(supply);
    I128 minted = fee_.accrue(shares_, snap.nav());
    if (minted > 0) {
        log::debug("fee accrued: " + math::to_string(minted) + " shares to " +
                   addresses::to_hex(fee_.state().fee_recipient));
    }
    return minted;
}

void LeverVault::emit(const OperationRecord& record) {
    log::info(std::string(to_string(record.kind)) + " committed: shares=" +
              math::to_string(record.shares) + " nav_delta=" +
              math::to_string(record.nav_delta) + " supply=" +
              math::to_string(record.total_supply));
    if (on_record_) {
        on_record_(record);
    }
}

template <typename Fn>
auto LeverVault::guarded(OperationKind kind, const Address& caller, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const VaultError& e) {
        log::warn(std::string(to_string(kind)) + " rejected for " + addresses::to_hex(caller) +
                  ": " + e.what());
        throw;
    } catch (const std::exception& e) {
        log::warn(std::string(to_string(kind)) + " failed for " + addresses::to_hex(caller) +
                  ": " + e.what());
        throw;
    }
}

namespace {

OperationRecord make_record(OperationKind kind, const Address& caller, const Address& receiver,
                            const PositionSnapshot& before, const PositionSnapshot& after,
                            I128 supply_after) {
    OperationRecord r{};
    r.kind = kind;
    r.caller = caller;
    r.receiver = receiver;
    r.nav_delta = after.nav() - before.nav();
    r.collateral = after.collateral_amount;
    r.debt = after.debt_value;
    r.total_supply = supply_after;
    r.health_factor = after.health_factor;
    return r;
}

} // anonymous namespace

// =============================================================================
// Operations
// =============================================================================

I128 LeverVault::initialize(const Address& caller, const Address& receiver,
                            IOperationCallback& callback, const std::vector<uint8_t>& data) {
    return guarded(OperationKind::INITIALIZE, caller, [&]() -> I128 {
        if (session_.locked()) {
            throw VaultError(ErrorCode::ALREADY_LOCKED);
        }
        if (addresses::is_zero(receiver)) {
            throw VaultError(ErrorCode::ZERO_ADDRESS, "receiver");
        }

        Transaction tx(*this);
        I128 fee_shares = accrue_fees();
        session_.acquire(caller);

        PositionSnapshot before = read_snapshot();
        comparator_.check_initialize_pre(before);

        CallbackContext ctx{OperationKind::INITIALIZE, caller, receiver, before,
                            0, before.total_shares, 0, data};
        SessionHandle handle(actions_, session_, caller);
        callback.run(handle, ctx);
        session_.require_settled();

        PositionSnapshot after = read_snapshot();
        ComparisonContext cmp{before, after, std::nullopt, std::nullopt};
        comparator_.check_rate_stable(cmp);
        comparator_.check_initialize_post(cmp);

        I128 minted = after.nav();
        shares_.mint(receiver, minted);
        fee_.reset_high_water_mark(WAD);

        OperationRecord record = make_record(OperationKind::INITIALIZE, caller, receiver,
                                             before, after, shares_.total_supply());
        record.shares = minted;
        record.fee_shares = fee_shares;

        session_.release();
        tx.commit();
        emit(record);
        return minted;
    });
}

I128 LeverVault::deposit(const Address& caller, const Address& receiver,
                         IOperationCallback& callback, const std::vector<uint8_t>& data) {
    return guarded(OperationKind::DEPOSIT, caller, [&]() -> I128 {
        if (session_.locked()) {
            throw VaultError(ErrorCode::ALREADY_LOCKED);
        }
        if (addresses::is_zero(receiver)) {
            throw VaultError(ErrorCode::ZERO_ADDRESS, "receiver");
        }
        require_initialized();

        Transaction tx(*this);
        I128 fee_shares = accrue_fees();
        session_.acquire(caller);

        PositionSnapshot before = read_snapshot();

        CallbackContext ctx{OperationKind::DEPOSIT, caller, receiver, before,
                            0, before.total_shares, 0, data};
        SessionHandle handle(actions_, session_, caller);
        callback.run(handle, ctx);
        session_.require_settled();

        PositionSnapshot after = read_snapshot();
        ComparisonContext cmp{before, after, std::nullopt, before.total_shares};
        comparator_.check_rate_stable(cmp);
        comparator_.check_deposit(cmp);

        I128 minted = comparator_.shares_for_deposit(cmp);
        if (minted <= 0) {
            throw VaultError(ErrorCode::ZERO_SHARES);
        }
        shares_.mint(receiver, minted);

        OperationRecord record = make_record(OperationKind::DEPOSIT, caller, receiver,
                                             before, after, shares_.total_supply());
        record.shares = minted;
        record.fee_shares = fee_shares;

        session_.release();
        tx.commit();
        emit(record);
        return minted;
    });
}

void LeverVault::withdraw(const Address& caller, I128 shares, const Address& receiver,
                          IOperationCallback& callback, const std::vector<uint8_t>& data) {
    guarded(OperationKind::WITHDRAW, caller, [&]() {
        if (session_.locked()) {
            throw VaultError(ErrorCode::ALREADY_LOCKED);
        }
        if (shares <= 0) {
            throw VaultError(ErrorCode::ZERO_AMOUNT);
        }
        if (addresses::is_zero(receiver)) {
            throw VaultError(ErrorCode::ZERO_ADDRESS, "receiver");
        }
        require_initialized();
        if (shares > shares_.balance_of(caller)) {
            throw VaultError(ErrorCode::INSUFFICIENT_SHARES,
                             math::to_string(shares) + " > " +
                             math::to_string(shares_.balance_of(caller)));
        }

        Transaction tx(*this);
        I128 fee_shares = accrue_fees();
        session_.acquire(caller);

        PositionSnapshot before = read_snapshot();
        I128 supply_before = shares_.total_supply();

        // Burned up front so the callback cannot reuse them
        shares_.burn(caller, shares);

        CallbackContext ctx{OperationKind::WITHDRAW, caller, receiver, before,
                            shares, supply_before, 0, data};
        SessionHandle handle(actions_, session_, caller);
        callback.run(handle, ctx);
        session_.require_settled();

        PositionSnapshot after = read_snapshot();
        ComparisonContext cmp{before, after, shares, supply_before};
        comparator_.check_rate_stable(cmp);
        comparator_.check_withdraw(cmp);

        OperationRecord record = make_record(OperationKind::WITHDRAW, caller, receiver,
                                             before, after, shares_.total_supply());
        record.shares = shares;
        record.fee_shares = fee_shares;

        session_.release();
        tx.commit();
        emit(record);
    });
}

I128 LeverVault::unwind(const Address& caller, I128 collateral_amount,
                        IOperationCallback& callback, const std::vector<uint8_t>& data) {
    return guarded(OperationKind::UNWIND, caller, [&]() -> I128 {
        if (session_.locked()) {
            throw VaultError(ErrorCode::ALREADY_LOCKED);
        }
        if (!is_operator(caller)) {
            throw VaultError(ErrorCode::NOT_PERMITTED, "unwind requires an operator");
        }
        if (collateral_amount <= 0) {
            throw VaultError(ErrorCode::ZERO_AMOUNT);
        }

        Transaction tx(*this);
        session_.acquire(caller);

        PositionSnapshot before = read_snapshot();
        if (collateral_amount > before.collateral_amount) {
            throw VaultError(ErrorCode::AMOUNT_EXCEEDS_COLLATERAL,
                             math::to_string(collateral_amount) + " > " +
                             math::to_string(before.collateral_amount));
        }

        SessionHandle handle(actions_, session_, caller);
        I128 slice = handle.withdraw_collateral(collateral_amount);
        handle.send(Asset::COLLATERAL, caller, slice);

        CallbackContext ctx{OperationKind::UNWIND, caller, Address{}, before,
                            0, before.total_shares, slice, data};
        I128 proceeds = callback.run(handle, ctx);

        I128 redemption = collab_.staking.convert_to_assets(slice);
        comparator_.check_unwind(proceeds, redemption);
        handle.pull(Asset::BORROWED, caller, proceeds);

        I128 to_repay = math::min(proceeds, before.debt_value);
        if (to_repay > 0) {
            handle.repay(to_repay);
        }

        // Proceeds beyond the debt go back into the position; dust below
        // the staking minimum is returned
        I128 excess = handle.balance(Asset::BORROWED);
        I128 returned = 0;
        if (excess > 0 && excess >= config_.min_stake) {
            I128 received = handle.stake(excess);
            handle.supply_collateral(received);
        } else if (excess > 0) {
            handle.send(Asset::BORROWED, caller, excess);
            returned = excess;
        }
        session_.require_settled();

        PositionSnapshot after = read_snapshot();
        ComparisonContext cmp{before, after, std::nullopt, std::nullopt};
        comparator_.check_rate_stable(cmp);
        comparator_.check_unwind_post(cmp, proceeds, redemption, returned);

        OperationRecord record = make_record(OperationKind::UNWIND, caller, Address{},
                                             before, after, shares_.total_supply());
        record.proceeds = proceeds;

        session_.release();
        tx.commit();
        emit(record);
        return proceeds;
    });
}

void LeverVault::donate(const Address& caller, IOperationCallback& callback,
                        const std::vector<uint8_t>& data) {
    guarded(OperationKind::DONATE, caller, [&]() {
        if (session_.locked()) {
            throw VaultError(ErrorCode::ALREADY_LOCKED);
        }
        require_initialized();

        Transaction tx(*this);
        session_.acquire(caller);

        PositionSnapshot before = read_snapshot();

        CallbackContext ctx{OperationKind::DONATE, caller, Address{}, before,
                            0, before.total_shares, 0, data};
        SessionHandle handle(actions_, session_, caller);
        callback.run(handle, ctx);
        session_.require_settled();

        PositionSnapshot after = read_snapshot();
        ComparisonContext cmp{before, after, std::nullopt, std::nullopt};
        comparator_.check_rate_stable(cmp);
        comparator_.check_donate(cmp);

        session_.release();
        tx.commit();
        emit(make_record(OperationKind::DONATE, caller, Address{}, before, after,
                         shares_.total_supply()));
    });
}

// =============================================================================
// Views
// =============================================================================

PositionSnapshot LeverVault::snapshot() const {
    require_unlocked();
    return read_snapshot();
}

I128 LeverVault::nav() const {
    return snapshot().nav();
}

I128 LeverVault::share_rate() const {
    PositionSnapshot snap = snapshot();
    return share_math::rate(snap.nav(), snap.total_shares);
}

I128 LeverVault::convert_to_shares(I128 assets) const {
    PositionSnapshot snap = snapshot();
    return share_math::assets_to_shares(assets, snap.nav(), snap.total_shares, Rounding::FLOOR);
}

I128 LeverVault::convert_to_assets(I128 shares) const {
    PositionSnapshot snap = snapshot();
    return share_math::shares_to_assets(shares, snap.nav(), snap.total_shares, Rounding::FLOOR);
}

I128 LeverVault::pending_fee_shares() const {
    PositionSnapshot snap = snapshot();
    return snap.total_shares - shares_.total_supply();
}

I128 LeverVault::collateral_per_share() const {
    PositionSnapshot snap = snapshot();
    if (snap.total_shares == 0) {
        return 0;
    }
    return share_math::collateral_for_shares(snap.collateral_amount, WAD, snap.total_shares);
}

I128 LeverVault::debt_per_share() const {
    PositionSnapshot snap = snapshot();
    if (snap.total_shares == 0) {
        return 0;
    }
    return share_math::debt_for_shares(snap.debt_value, WAD, snap.total_shares);
}

// =============================================================================
// Shares
// =============================================================================

void LeverVault::transfer_shares(const Address& from, const Address& to, I128 amount) {
    require_unlocked();
    shares_.transfer(from, to, amount);
}

// =============================================================================
// Admin
// =============================================================================

void LeverVault::set_fee_rate(I128 rate) {
    require_unlocked();
    if (rate < 0 || rate > config_.max_fee_rate) {
        throw VaultError(ErrorCode::INVALID_CONFIG,
                         "fee rate " + math::to_decimal_string(rate, 18) + " above maximum " +
                         math::to_decimal_string(config_.max_fee_rate, 18));
    }
    if (rate > 0 && addresses::is_zero(fee_.state().fee_recipient)) {
        throw VaultError(ErrorCode::ZERO_ADDRESS, "fee recipient");
    }

    accrue_fees();

    // Growth while the fee was off is not charged retroactively
    if (fee_.state().fee_rate == 0 && rate > 0 && shares_.total_supply() > 0) {
        I128 current = share_math::rate(reader_.read(shares_.total_supply()).nav(),
                                        shares_.total_supply());
        if (current > fee_.state().all_time_high) {
            fee_.reset_high_water_mark(current);
        }
    }

    fee_.set_fee_rate(rate);
    config_.fee_rate = rate;
    log::info("fee rate set to " + math::to_decimal_string(rate, 18));
}

void LeverVault::set_fee_recipient(const Address& recipient) {
    require_unlocked();
    if (addresses::is_zero(recipient)) {
        throw VaultError(ErrorCode::ZERO_ADDRESS, "fee recipient");
    }
    accrue_fees();
    fee_.set_fee_recipient(recipient);
    config_.fee_recipient = recipient;
}

void LeverVault::set_target_health_factor(I128 hf) {
    require_unlocked();
    PositionData data = collab_.market.position_data(self_);
    I128 lt = data.liquidation_threshold_bps * BPS_TO_WAD;
    if (hf <= lt) {
        throw VaultError(ErrorCode::INVALID_CONFIG,
                         "target health factor must exceed the liquidation threshold " +
                         math::to_decimal_string(lt, 18));
    }
    VaultConfig candidate = config_;
    candidate.set_target_health_factor(hf);
    apply_config(candidate);
    log::info("target health factor set to " + math::to_decimal_string(hf, 18));
}

void LeverVault::set_deposit_tolerance(I128 low, I128 high) {
    require_unlocked();
    VaultConfig candidate = config_;
    candidate.set_deposit_tolerance(low, high);
    apply_config(candidate);
}

void LeverVault::set_minimum_deposit(I128 amount) {
    require_unlocked();
    VaultConfig candidate = config_;
    candidate.set_minimum_deposit(amount);
    apply_config(candidate);
}

void LeverVault::set_unwind_slippage(I128 slippage) {
    require_unlocked();
    VaultConfig candidate = config_;
    candidate.set_unwind_slippage(slippage);
    apply_config(candidate);
}

void LeverVault::set_operator(const Address& account, bool enabled) {
    require_unlocked();
    if (addresses::is_zero(account)) {
        throw VaultError(ErrorCode::ZERO_ADDRESS, "operator");
    }
    if (enabled) {
        operators_.insert(account);
    } else {
        operators_.erase(account);
    }
}

void LeverVault::set_rate_cap(IRateCap& rate_cap) {
    require_unlocked();
    accrue_fees();

    reader_.set_rate_cap(rate_cap);

    I128 supply = shares_.total_supply();
    I128 mark = supply > 0 ? share_math::rate(reader_.read(supply).nav(), supply) : WAD;
    fee_.reset_high_water_mark(mark);
    log::info("rate provider replaced, high-water mark reset to " +
              math::to_decimal_string(mark, 18));
}

} // namespace lever
