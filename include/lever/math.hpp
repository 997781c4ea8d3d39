#ifndef LEVER_MATH_HPP
#define LEVER_MATH_HPP

#include <cstdint>
#include <string>
#include <string_view>

#include "types.hpp"

namespace lever {

// Every division in the engine names its rounding direction
enum class Rounding : uint8_t {
    FLOOR = 0,   // toward negative infinity
    CEIL = 1     // toward positive infinity
};

namespace math {

// a * b / denom with a 256-bit intermediate product.
// Throws VaultError(DIVISION_BY_ZERO) or VaultError(ARITHMETIC_OVERFLOW).
I128 mul_div(I128 a, I128 b, I128 denom, Rounding rounding);

// Quantities are non-negative; these fail instead of going below zero or wrapping
I128 checked_add(I128 a, I128 b);
I128 checked_sub(I128 a, I128 b);

inline I128 abs(I128 x) { return x < 0 ? -x : x; }
inline I128 min(I128 a, I128 b) { return a < b ? a : b; }
inline I128 max(I128 a, I128 b) { return a > b ? a : b; }

// Integer formatting (std::to_string has no __int128 overload)
std::string to_string(I128 v);

// Fixed-point formatting, e.g. to_decimal_string(13e17, 18) == "1.3"
std::string to_decimal_string(I128 v, int decimals);

// Exact decimal parsing: parse_decimal("1.3", 18) == 13e17.
// Throws ConfigError on malformed input or excess precision.
I128 parse_decimal(std::string_view text, int decimals);

} // namespace math

// =============================================================================
// WAD (1e18) helpers
// =============================================================================

namespace wad {

inline I128 mul(I128 a, I128 b, Rounding rounding) {
    return math::mul_div(a, b, WAD, rounding);
}

inline I128 div(I128 a, I128 b, Rounding rounding) {
    return math::mul_div(a, WAD, b, rounding);
}

inline I128 from_int(int64_t v) {
    return static_cast<I128>(v) * WAD;
}

inline I128 from_bps(int64_t bps) {
    return static_cast<I128>(bps) * BPS_TO_WAD;
}

inline I128 from_double(double v) {
    return static_cast<I128>(v * static_cast<double>(WAD));
}

inline double to_double(I128 v) {
    return static_cast<double>(v) / static_cast<double>(WAD);
}

} // namespace wad

} // namespace lever

#endif // LEVER_MATH_HPP
