// =============================================================================
// records.cpp - Operation record serialization
// =============================================================================

#include "lever/records.hpp"
#include "lever/math.hpp"

#include <nlohmann/json.hpp>

namespace lever {

nlohmann::json to_json(const OperationRecord& record) {
    nlohmann::json j;
    j["kind"] = to_string(record.kind);
    j["caller"] = addresses::to_hex(record.caller);
    j["receiver"] = addresses::to_hex(record.receiver);
    j["shares"] = math::to_string(record.shares);
    j["fee_shares"] = math::to_string(record.fee_shares);
    j["nav_delta"] = math::to_string(record.nav_delta);
    j["collateral"] = math::to_string(record.collateral);
    j["debt"] = math::to_string(record.debt);
    j["total_supply"] = math::to_string(record.total_supply);
    if (record.health_factor == HEALTH_FACTOR_MAX) {
        j["health_factor"] = "max";
    } else {
        j["health_factor"] = math::to_decimal_string(record.health_factor, 18);
    }
    if (record.kind == OperationKind::UNWIND) {
        j["proceeds"] = math::to_string(record.proceeds);
    }
    return j;
}

} // namespace lever
