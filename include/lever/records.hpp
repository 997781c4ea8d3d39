#ifndef LEVER_RECORDS_HPP
#define LEVER_RECORDS_HPP

#include <functional>
#include <nlohmann/json_fwd.hpp>

#include "types.hpp"

namespace lever {

// =============================================================================
// OperationRecord - emitted after every committed top-level operation
// =============================================================================

struct OperationRecord {
    OperationKind kind;
    Address caller;
    Address receiver;        // share receiver; zero for unwind and donate
    I128 shares;             // minted (initialize, deposit) or burned (withdraw)
    I128 fee_shares;         // minted to the fee recipient before the operation
    I128 nav_delta;          // signed
    I128 collateral;         // collateral amount after
    I128 debt;               // debt after
    I128 total_supply;       // share supply after
    I128 health_factor;      // WAD, after
    I128 proceeds;           // unwind only
};

using RecordCallback = std::function<void(const OperationRecord&)>;

// Amounts are serialized as decimal integer strings (values exceed 2^64)
nlohmann::json to_json(const OperationRecord& record);

} // namespace lever

#endif // LEVER_RECORDS_HPP
