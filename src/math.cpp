// =============================================================================
// math.cpp - Checked fixed-point arithmetic with explicit rounding
// =============================================================================

#include "lever/math.hpp"
#include "lever/errors.hpp"

#include <algorithm>

namespace lever {
namespace math {

namespace {

// =============================================================================
// 256-bit Arithmetic (U256 via two U128 limbs)
// =============================================================================

struct U256 {
    U128 lo;
    U128 hi;
};

inline U128 unsigned_abs(I128 x) {
    return x < 0 ? static_cast<U128>(0) - static_cast<U128>(x) : static_cast<U128>(x);
}

// Multiply two U128 values to produce U256
U256 mul_u128(U128 a, U128 b) {
    constexpr U128 MASK64 = (static_cast<U128>(1) << 64) - 1;
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);
    U128 carry = mid >> 64;

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + carry;
    return result;
}

struct DivResult {
    U128 quotient;
    bool inexact;
};

// 256 / 128 long division; quotient must fit in 128 bits
DivResult div_u256_u128(U256 num, U128 denom) {
    if (num.hi == 0) {
        return {num.lo / denom, (num.lo % denom) != 0};
    }
    if (num.hi >= denom) {
        throw VaultError(ErrorCode::ARITHMETIC_OVERFLOW, "mul_div quotient exceeds 128 bits");
    }

    // rem < denom holds on entry to every iteration
    U128 rem = num.hi;
    U128 quot = 0;
    for (int i = 127; i >= 0; --i) {
        U128 carry = rem >> 127;
        rem = (rem << 1) | ((num.lo >> i) & 1);
        if (carry != 0 || rem >= denom) {
            rem -= denom;
            quot |= static_cast<U128>(1) << i;
        }
    }
    return {quot, rem != 0};
}

} // anonymous namespace

// =============================================================================
// mul_div
// =============================================================================

I128 mul_div(I128 a, I128 b, I128 denom, Rounding rounding) {
    if (denom == 0) {
        throw VaultError(ErrorCode::DIVISION_BY_ZERO);
    }

    bool negative = (a < 0) != (b < 0);
    if (denom < 0) negative = !negative;
    if (a == 0 || b == 0) negative = false;

    U256 product = mul_u128(unsigned_abs(a), unsigned_abs(b));
    DivResult r = div_u256_u128(product, unsigned_abs(denom));

    U128 magnitude = r.quotient;
    if (r.inexact) {
        // Away from zero for floor of a negative or ceil of a positive result
        bool bump = negative ? (rounding == Rounding::FLOOR) : (rounding == Rounding::CEIL);
        if (bump) magnitude += 1;
    }

    if (magnitude > static_cast<U128>(I128_MAX)) {
        throw VaultError(ErrorCode::ARITHMETIC_OVERFLOW, "mul_div result exceeds int128");
    }

    I128 result = static_cast<I128>(magnitude);
    return negative ? -result : result;
}

I128 checked_add(I128 a, I128 b) {
    I128 out = 0;
    if (__builtin_add_overflow(a, b, &out)) {
        throw VaultError(ErrorCode::ARITHMETIC_OVERFLOW, "addition overflow");
    }
    return out;
}

I128 checked_sub(I128 a, I128 b) {
    if (b > a) {
        throw VaultError(ErrorCode::ARITHMETIC_UNDERFLOW,
                         to_string(a) + " - " + to_string(b));
    }
    return a - b;
}

// =============================================================================
// Formatting / Parsing
// =============================================================================

std::string to_string(I128 v) {
    if (v == 0) return "0";

    U128 mag = unsigned_abs(v);
    std::string digits;
    while (mag != 0) {
        digits.push_back(static_cast<char>('0' + static_cast<int>(mag % 10)));
        mag /= 10;
    }
    if (v < 0) digits.push_back('-');
    std::reverse(digits.begin(), digits.end());
    return digits;
}

std::string to_decimal_string(I128 v, int decimals) {
    U128 scale = 1;
    for (int i = 0; i < decimals; ++i) scale *= 10;

    U128 mag = unsigned_abs(v);
    std::string out = (v < 0) ? "-" : "";
    out += to_string(static_cast<I128>(mag / scale));

    U128 frac = mag % scale;
    if (frac == 0) return out;

    std::string frac_digits = to_string(static_cast<I128>(frac));
    frac_digits.insert(0, static_cast<size_t>(decimals) - frac_digits.size(), '0');
    while (!frac_digits.empty() && frac_digits.back() == '0') frac_digits.pop_back();
    return out + "." + frac_digits;
}

I128 parse_decimal(std::string_view text, int decimals) {
    std::string input{text};
    if (text.empty()) {
        throw ConfigError("empty decimal value");
    }

    size_t pos = 0;
    bool negative = false;
    if (text[0] == '-') {
        negative = true;
        pos = 1;
    }

    I128 value = 0;
    int frac_digits = -1;  // -1 until the decimal point is seen
    bool any_digit = false;

    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c == '.') {
            if (frac_digits >= 0) throw ConfigError("malformed decimal: " + input);
            frac_digits = 0;
            continue;
        }
        if (c < '0' || c > '9') {
            throw ConfigError("malformed decimal: " + input);
        }
        if (frac_digits >= 0 && ++frac_digits > decimals) {
            throw ConfigError("too many fractional digits: " + input);
        }
        any_digit = true;
        if (__builtin_mul_overflow(value, static_cast<I128>(10), &value) ||
            __builtin_add_overflow(value, static_cast<I128>(c - '0'), &value)) {
            throw ConfigError("decimal out of range: " + input);
        }
    }

    if (!any_digit) throw ConfigError("malformed decimal: " + input);

    int scale_digits = decimals - (frac_digits < 0 ? 0 : frac_digits);
    for (int i = 0; i < scale_digits; ++i) {
        if (__builtin_mul_overflow(value, static_cast<I128>(10), &value)) {
            throw ConfigError("decimal out of range: " + input);
        }
    }
    return negative ? -value : value;
}

} // namespace math
} // namespace lever
