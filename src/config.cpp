// =============================================================================
// config.cpp - VaultConfig validation and JSON loading
// =============================================================================

#include "lever/config.hpp"
#include "lever/errors.hpp"
#include "lever/math.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace lever {

namespace {

using json = nlohmann::json;

// WAD ratio from a decimal string, or a whole number
I128 read_ratio(const json& value, const std::string& key) {
    if (value.is_string()) {
        return math::parse_decimal(value.get<std::string>(), 18);
    }
    if (value.is_number_integer()) {
        return wad::from_int(value.get<int64_t>());
    }
    throw ConfigError(key + ": expected a decimal string");
}

// Raw integer amount from an integer string, or an integer
I128 read_amount(const json& value, const std::string& key) {
    if (value.is_string()) {
        return math::parse_decimal(value.get<std::string>(), 0);
    }
    if (value.is_number_integer()) {
        return static_cast<I128>(value.get<int64_t>());
    }
    throw ConfigError(key + ": expected an integer");
}

std::string read_string(const json& value, const std::string& key) {
    if (!value.is_string()) {
        throw ConfigError(key + ": expected a string");
    }
    return value.get<std::string>();
}

bool is_known_level(const std::string& level) {
    return level == "debug" || level == "info" || level == "warn" || level == "error" ||
           level == "off";
}

} // anonymous namespace

std::optional<std::string> VaultConfig::check() const {
    if (target_health_factor <= WAD) {
        return "target_health_factor must exceed 1.0";
    }
    if (deposit_tolerance_low < 0 || deposit_tolerance_low >= WAD) {
        return "deposit_tolerance.low must be in [0, 1)";
    }
    if (deposit_tolerance_high < 0 || deposit_tolerance_high >= WAD) {
        return "deposit_tolerance.high must be in [0, 1)";
    }
    if (minimum_deposit < 0) {
        return "minimum_deposit must be non-negative";
    }
    if (min_stake < 0) {
        return "min_stake must be non-negative";
    }
    if (max_fee_rate < 0 || max_fee_rate >= WAD) {
        return "max_fee_rate must be in [0, 1)";
    }
    if (fee_rate < 0 || fee_rate > max_fee_rate) {
        return "fee_rate must be in [0, max_fee_rate]";
    }
    if (fee_rate > 0 && addresses::is_zero(fee_recipient)) {
        return "fee_recipient is required when fee_rate > 0";
    }
    if (unwind_slippage < 0 || unwind_slippage >= WAD) {
        return "unwind_slippage must be in [0, 1)";
    }
    if (borrow_buffer < 0 || borrow_buffer >= WAD) {
        return "borrow_buffer must be in [0, 1)";
    }
    if (!is_known_level(log_level)) {
        return "log_level must be one of debug, info, warn, error, off";
    }
    return std::nullopt;
}

void VaultConfig::validate() const {
    if (auto problem = check()) {
        throw ConfigError(*problem);
    }
}

VaultConfig VaultConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

VaultConfig VaultConfig::parse(std::string_view content) {
    json doc;
    try {
        doc = json::parse(std::string(content));
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("invalid JSON: ") + e.what());
    }
    return from_json(doc);
}

VaultConfig VaultConfig::from_json(const json& doc) {
    if (!doc.is_object()) {
        throw ConfigError("vault config must be a JSON object");
    }

    VaultConfig config;

    if (doc.contains("target_health_factor")) {
        config.target_health_factor = read_ratio(doc["target_health_factor"], "target_health_factor");
    }
    if (doc.contains("deposit_tolerance")) {
        const json& tol = doc["deposit_tolerance"];
        if (!tol.is_object()) {
            throw ConfigError("deposit_tolerance must be an object with low and high");
        }
        if (tol.contains("low")) config.deposit_tolerance_low = read_ratio(tol["low"], "deposit_tolerance.low");
        if (tol.contains("high")) config.deposit_tolerance_high = read_ratio(tol["high"], "deposit_tolerance.high");
    }
    if (doc.contains("minimum_deposit")) {
        config.minimum_deposit = read_ratio(doc["minimum_deposit"], "minimum_deposit");
    }
    if (doc.contains("min_stake")) {
        config.min_stake = read_amount(doc["min_stake"], "min_stake");
    }
    if (doc.contains("fee_rate")) {
        config.fee_rate = read_ratio(doc["fee_rate"], "fee_rate");
    }
    if (doc.contains("max_fee_rate")) {
        config.max_fee_rate = read_ratio(doc["max_fee_rate"], "max_fee_rate");
    }
    if (doc.contains("fee_recipient")) {
        config.fee_recipient = addresses::from_hex(read_string(doc["fee_recipient"], "fee_recipient"));
    }
    if (doc.contains("unwind_slippage")) {
        config.unwind_slippage = read_ratio(doc["unwind_slippage"], "unwind_slippage");
    }
    if (doc.contains("borrow_buffer")) {
        config.borrow_buffer = read_ratio(doc["borrow_buffer"], "borrow_buffer");
    }
    if (doc.contains("log_level")) {
        config.log_level = read_string(doc["log_level"], "log_level");
    }

    config.validate();
    return config;
}

} // namespace lever
