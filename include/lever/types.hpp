#ifndef LEVER_TYPES_HPP
#define LEVER_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <string_view>
#include <cstddef>

namespace lever {

// =============================================================================
// Addresses (EVM 20-byte identities)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

constexpr Address ZERO = {};

// Deterministic address from a small integer id (big-endian in the low bytes)
constexpr Address from_id(uint32_t id) {
    Address addr = {};
    addr[16] = static_cast<uint8_t>((id >> 24) & 0xFF);
    addr[17] = static_cast<uint8_t>((id >> 16) & 0xFF);
    addr[18] = static_cast<uint8_t>((id >> 8) & 0xFF);
    addr[19] = static_cast<uint8_t>(id & 0xFF);
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (size_t i = 0; i < addr.size(); ++i) {
        if (addr[i] != 0) return false;
    }
    return true;
}

// "0x" + 40 hex digits
std::string to_hex(const Address& addr);

// Accepts with or without the 0x prefix; throws ConfigError on malformed input
Address from_hex(std::string_view hex);

} // namespace addresses

struct AddressHash {
    size_t operator()(const Address& a) const noexcept {
        uint64_t h = 0;
        for (uint8_t b : a) h = h * 31 + b;
        return static_cast<size_t>(h);
    }
};

// =============================================================================
// Fixed-Point Arithmetic
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

constexpr I128 WAD = 1000000000000000000LL;                         // 1e18
constexpr I128 RAY = static_cast<I128>(1000000000LL) * WAD;         // 1e27
constexpr I128 BPS_DENOMINATOR = 10000;
constexpr I128 BPS_TO_WAD = WAD / BPS_DENOMINATOR;                  // 1e14

constexpr I128 I128_MAX = static_cast<I128>((~static_cast<U128>(0)) >> 1);

// Health factor reported for a position without debt
constexpr I128 HEALTH_FACTOR_MAX = I128_MAX;

// =============================================================================
// Assets tracked by the session ledger
// =============================================================================

enum class Asset : uint8_t {
    BORROWED = 0,    // borrowed asset, also the reference currency
    COLLATERAL = 1   // yield-bearing staking token
};

inline constexpr const char* to_string(Asset asset) noexcept {
    return asset == Asset::BORROWED ? "borrowed" : "collateral";
}

// =============================================================================
// Top-level operation kinds
// =============================================================================

enum class OperationKind : uint8_t {
    INITIALIZE = 0,
    DEPOSIT = 1,
    WITHDRAW = 2,
    UNWIND = 3,
    DONATE = 4
};

inline constexpr const char* to_string(OperationKind kind) noexcept {
    switch (kind) {
        case OperationKind::INITIALIZE: return "initialize";
        case OperationKind::DEPOSIT: return "deposit";
        case OperationKind::WITHDRAW: return "withdraw";
        case OperationKind::UNWIND: return "unwind";
        case OperationKind::DONATE: return "donate";
    }
    return "unknown";
}

} // namespace lever

#endif // LEVER_TYPES_HPP
