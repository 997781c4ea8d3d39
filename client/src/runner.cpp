// Lever scenario runner - step execution

#include "runner.hpp"

#include "lever/errors.hpp"
#include "lever/math.hpp"
#include "lever/records.hpp"
#include "lever/sim/routers.hpp"

using json = nlohmann::json;

namespace lever {
namespace cli {

namespace {

std::string text(const json& step, const char* key) {
    if (!step.contains(key) || !step[key].is_string()) {
        throw ConfigError(std::string("step is missing string field '") + key + "'");
    }
    return step[key].get<std::string>();
}

I128 decimal(const json& step, const char* key) {
    return math::parse_decimal(text(step, key), 18);
}

json failure(const char* error, const std::string& message) {
    return {{"error", error}, {"message", message}};
}

} // anonymous namespace

sim::WorldParams world_params(const json& doc) {
    sim::WorldParams params;
    if (!doc.contains("world")) {
        return params;
    }
    const json& w = doc["world"];
    if (w.contains("staking_rate")) {
        params.staking_rate = decimal(w, "staking_rate");
    }
    if (w.contains("ltv_bps")) {
        params.ltv_bps = w["ltv_bps"].get<int64_t>();
    }
    if (w.contains("liquidation_threshold_bps")) {
        params.liquidation_threshold_bps = w["liquidation_threshold_bps"].get<int64_t>();
    }
    if (w.contains("max_yearly_growth")) {
        params.max_yearly_growth = decimal(w, "max_yearly_growth");
    }
    return params;
}

//------------------------------------------------------------------------------
// Runner
//------------------------------------------------------------------------------

Runner::Runner(const json& doc, VaultConfig config)
    : world_(world_params(doc))
    , vault_(VAULT_ADDRESS, world_.collaborators(), std::move(config)) {
    if (doc.contains("accounts")) {
        uint32_t id = FIRST_ACCOUNT_ID;
        for (const auto& entry : doc["accounts"].items()) {
            Address addr = addresses::from_id(id++);
            accounts_[entry.key()] = addr;
            world_.fund(addr, math::parse_decimal(entry.value().get<std::string>(), 18));
        }
    }
    if (doc.contains("operators")) {
        for (const auto& name : doc["operators"]) {
            vault_.set_operator(account(name.get<std::string>()), true);
        }
    }
    vault_.set_record_callback([this](const OperationRecord& r) { last_ = to_json(r); });
}

json Runner::execute(const json& step) {
    try {
        return run(step);
    } catch (const VaultError& e) {
        json out = failure(to_string(e.code()), e.what());
        out["code"] = static_cast<int>(e.code());
        return out;
    } catch (const CollaboratorError& e) {
        return failure("CollaboratorError", e.what());
    } catch (const ConfigError& e) {
        return failure("InvalidStep", e.what());
    } catch (const json::exception& e) {
        return failure("InvalidStep", e.what());
    }
}

json Runner::run(const json& step) {
    last_ = json::object();
    std::string op = text(step, "op");

    if (op == "initialize") {
        Address caller = account(text(step, "caller"));
        sim::SeedCallback cb(world_.borrowed(), decimal(step, "amount"));
        vault_.initialize(caller, receiver(step, caller), cb);
    } else if (op == "deposit") {
        Address caller = account(text(step, "caller"));
        sim::LoopDepositCallback cb(world_.borrowed(), world_.market(), vault_.config(),
                                    decimal(step, "amount"));
        vault_.deposit(caller, receiver(step, caller), cb);
    } else if (op == "withdraw") {
        Address caller = account(text(step, "caller"));
        I128 shares = step.contains("shares")
            ? math::parse_decimal(text(step, "shares"), 0)
            : wad::mul(vault_.balance_of(caller), decimal(step, "fraction"), Rounding::FLOOR);
        sim::ProportionalWithdrawCallback cb(world_.borrowed());
        vault_.withdraw(caller, shares, receiver(step, caller), cb);
    } else if (op == "unwind") {
        Address caller = account(text(step, "caller"));
        I128 collateral = wad::mul(vault_.snapshot().collateral_amount,
                                   decimal(step, "fraction"), Rounding::FLOOR);
        I128 haircut = step.contains("haircut") ? decimal(step, "haircut") : 0;
        sim::SellCollateralCallback cb(world_.borrowed(), world_.staking(), world_.staking(),
                                       sim::ids::DEX, haircut);
        vault_.unwind(caller, collateral, cb);
    } else if (op == "donate") {
        Address caller = account(text(step, "caller"));
        sim::DonateCallback cb(world_.borrowed(), decimal(step, "amount"));
        vault_.donate(caller, cb);
    } else if (op == "set_staking_rate") {
        world_.staking().set_rate(decimal(step, "rate"));
        return state("set_staking_rate");
    } else if (op == "advance_time") {
        world_.advance_time(step.at("seconds").get<uint64_t>());
        return state("advance_time");
    } else if (op == "set_fee_rate") {
        if (step.contains("recipient")) {
            vault_.set_fee_recipient(account(text(step, "recipient")));
        }
        vault_.set_fee_rate(decimal(step, "rate"));
        return state("set_fee_rate");
    } else {
        throw ConfigError("unknown op: " + op);
    }
    return last_;
}

Address Runner::account(const std::string& name) const {
    auto it = accounts_.find(name);
    if (it == accounts_.end()) {
        throw ConfigError("unknown account: " + name);
    }
    return it->second;
}

Address Runner::receiver(const json& step, const Address& caller) const {
    return step.contains("receiver") ? account(text(step, "receiver")) : caller;
}

json Runner::state(const std::string& kind) const {
    PositionSnapshot snap = vault_.snapshot();
    return {
        {"kind", kind},
        {"nav", math::to_string(snap.nav())},
        {"share_rate", math::to_decimal_string(vault_.share_rate(), 18)},
        {"reference_rate", math::to_decimal_string(snap.reference_rate, 18)},
        {"total_supply", math::to_string(vault_.total_supply())}
    };
}

} // namespace cli
} // namespace lever
