// Lever - Fixed-point math tests

#include "test_support.hpp"

using namespace lever;
using lever::test::code_of;

TEST_CASE("mul_div rounding", "[math]") {
    SECTION("Exact results ignore the rounding mode") {
        REQUIRE(math::mul_div(6, 4, 3, Rounding::FLOOR) == 8);
        REQUIRE(math::mul_div(6, 4, 3, Rounding::CEIL) == 8);
    }

    SECTION("Positive inexact") {
        REQUIRE(math::mul_div(7, 3, 2, Rounding::FLOOR) == 10);
        REQUIRE(math::mul_div(7, 3, 2, Rounding::CEIL) == 11);
    }

    SECTION("Negative inexact rounds toward negative infinity on floor") {
        REQUIRE(math::mul_div(-7, 3, 2, Rounding::FLOOR) == -11);
        REQUIRE(math::mul_div(-7, 3, 2, Rounding::CEIL) == -10);
        REQUIRE(math::mul_div(7, 3, -2, Rounding::FLOOR) == -11);
    }

    SECTION("Zero operand") {
        REQUIRE(math::mul_div(0, 5, 3, Rounding::CEIL) == 0);
    }
}

TEST_CASE("mul_div uses a 256-bit intermediate", "[math]") {
    I128 big = WAD * WAD;  // 1e36, product with WAD overflows 128 bits
    REQUIRE(math::mul_div(big, WAD, WAD, Rounding::FLOOR) == big);
    REQUIRE(math::mul_div(I128_MAX, 3, 3, Rounding::FLOOR) == I128_MAX);
    REQUIRE(math::mul_div(I128_MAX, I128_MAX, I128_MAX, Rounding::CEIL) == I128_MAX);
}

TEST_CASE("mul_div failures", "[math]") {
    REQUIRE(code_of([] { math::mul_div(1, 1, 0, Rounding::FLOOR); }) ==
            ErrorCode::DIVISION_BY_ZERO);
    REQUIRE(code_of([] { math::mul_div(I128_MAX, 2, 1, Rounding::FLOOR); }) ==
            ErrorCode::ARITHMETIC_OVERFLOW);
}

TEST_CASE("Checked add and sub", "[math]") {
    REQUIRE(math::checked_add(2, 3) == 5);
    REQUIRE(math::checked_sub(5, 3) == 2);
    REQUIRE(code_of([] { math::checked_add(I128_MAX, 1); }) == ErrorCode::ARITHMETIC_OVERFLOW);
    REQUIRE(code_of([] { math::checked_sub(1, 2); }) == ErrorCode::ARITHMETIC_UNDERFLOW);
}

TEST_CASE("WAD helpers", "[math]") {
    REQUIRE(wad::mul(WAD * 3 / 2, WAD * 2, Rounding::FLOOR) == WAD * 3);
    REQUIRE(wad::div(WAD, WAD * 3, Rounding::FLOOR) == 333333333333333333LL);
    REQUIRE(wad::div(WAD, WAD * 3, Rounding::CEIL) == 333333333333333334LL);
    REQUIRE(wad::from_bps(9500) == WAD * 95 / 100);
    REQUIRE(wad::from_int(7) == 7 * WAD);
}

TEST_CASE("Integer formatting", "[math]") {
    REQUIRE(math::to_string(0) == "0");
    REQUIRE(math::to_string(-123) == "-123");
    REQUIRE(math::to_string(I128_MAX) == "170141183460469231731687303715884105727");

    REQUIRE(math::to_decimal_string(WAD * 13 / 10, 18) == "1.3");
    REQUIRE(math::to_decimal_string(WAD, 18) == "1");
    REQUIRE(math::to_decimal_string(-WAD / 4, 18) == "-0.25");
    REQUIRE(math::to_decimal_string(1, 18) == "0.000000000000000001");
}

TEST_CASE("Decimal parsing", "[math]") {
    SECTION("Exact values") {
        REQUIRE(math::parse_decimal("1.3", 18) == WAD * 13 / 10);
        REQUIRE(math::parse_decimal("0.0001", 18) == WAD / 10000);
        REQUIRE(math::parse_decimal("42", 0) == 42);
        REQUIRE(math::parse_decimal("-2.5", 18) == -WAD * 5 / 2);
        REQUIRE(math::parse_decimal(".5", 18) == WAD / 2);
    }

    SECTION("Malformed input") {
        REQUIRE_THROWS_AS(math::parse_decimal("", 18), ConfigError);
        REQUIRE_THROWS_AS(math::parse_decimal("1.2.3", 18), ConfigError);
        REQUIRE_THROWS_AS(math::parse_decimal("abc", 18), ConfigError);
        REQUIRE_THROWS_AS(math::parse_decimal("1.5", 0), ConfigError);
        REQUIRE_THROWS_AS(math::parse_decimal(".", 18), ConfigError);
    }
}

TEST_CASE("Address encoding", "[types]") {
    Address a = addresses::from_id(0x3002);
    std::string hex = addresses::to_hex(a);
    REQUIRE(hex == "0x0000000000000000000000000000000000003002");
    REQUIRE(addresses::from_hex(hex) == a);
    REQUIRE(addresses::from_hex(hex.substr(2)) == a);
    REQUIRE(addresses::is_zero(addresses::ZERO));
    REQUIRE_FALSE(addresses::is_zero(a));
    REQUIRE_THROWS_AS(addresses::from_hex("0x1234"), ConfigError);
    REQUIRE_THROWS_AS(addresses::from_hex("0xzz00000000000000000000000000000000003002"),
                      ConfigError);
}

TEST_CASE("Error names", "[errors]") {
    VaultError e(ErrorCode::NAV_INCREASE_BELOW_MIN, "5");
    REQUIRE(e.code() == ErrorCode::NAV_INCREASE_BELOW_MIN);
    REQUIRE(std::string(e.what()).find("5") != std::string::npos);
    REQUIRE(std::string(to_string(ErrorCode::ALREADY_LOCKED)).size() > 0);
    REQUIRE(std::string(to_string(ErrorCode::ALREADY_LOCKED)) !=
            std::string(to_string(ErrorCode::NOT_LOCKED)));
}
