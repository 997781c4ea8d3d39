#ifndef LEVER_CONFIG_HPP
#define LEVER_CONFIG_HPP

#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json_fwd.hpp>

#include "types.hpp"

namespace lever {

// =============================================================================
// VaultConfig - engine policy
// =============================================================================

struct VaultConfig {
    // Deposit acceptance band: [target*(1-low), target*(1+high)]
    I128 target_health_factor = WAD * 13 / 10;
    I128 deposit_tolerance_low = WAD / 1000;
    I128 deposit_tolerance_high = WAD / 10000;

    // Smallest NAV increase a deposit must create
    I128 minimum_deposit = WAD / 10000;

    // Staking granularity floor, borrowed-asset units
    I128 min_stake = 100;

    // High-water-mark performance fee
    I128 fee_rate = 0;
    I128 max_fee_rate = WAD / 2;
    Address fee_recipient{};

    // Unwind proceeds may undershoot redemption value by at most this fraction
    I128 unwind_slippage = WAD * 5 / 1000;

    // Safety margin applied to available borrow by the borrow-sizing helper
    I128 borrow_buffer = WAD / 1000;

    std::string log_level = "info";

    // Builder methods
    VaultConfig& set_target_health_factor(I128 hf) {
        target_health_factor = hf;
        return *this;
    }

    VaultConfig& set_deposit_tolerance(I128 low, I128 high) {
        deposit_tolerance_low = low;
        deposit_tolerance_high = high;
        return *this;
    }

    VaultConfig& set_minimum_deposit(I128 amount) {
        minimum_deposit = amount;
        return *this;
    }

    VaultConfig& set_min_stake(I128 amount) {
        min_stake = amount;
        return *this;
    }

    VaultConfig& set_fee(I128 rate, const Address& recipient) {
        fee_rate = rate;
        fee_recipient = recipient;
        return *this;
    }

    VaultConfig& set_unwind_slippage(I128 slippage) {
        unwind_slippage = slippage;
        return *this;
    }

    VaultConfig& set_borrow_buffer(I128 buffer) {
        borrow_buffer = buffer;
        return *this;
    }

    VaultConfig& set_log_level(std::string_view level) {
        log_level = std::string(level);
        return *this;
    }

    // First violated constraint, if any
    std::optional<std::string> check() const;

    // Throws ConfigError
    void validate() const;

    // Load from a JSON document. Ratios are decimal strings ("1.3"),
    // raw amounts are integer strings or integers.
    static VaultConfig parse(std::string_view content);
    static VaultConfig from_json(const nlohmann::json& doc);
    static VaultConfig from_file(std::string_view path);
};

} // namespace lever

#endif // LEVER_CONFIG_HPP
