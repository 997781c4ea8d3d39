// Lever - Session ledger tests

#include "test_support.hpp"

#include "lever/session.hpp"

using namespace lever;
using lever::test::code_of;

namespace {

constexpr Address CALLER = addresses::from_id(7);
constexpr Address OTHER = addresses::from_id(8);

} // namespace

TEST_CASE("Session lifecycle", "[session]") {
    Session s;
    REQUIRE_FALSE(s.locked());

    s.acquire(CALLER);
    REQUIRE(s.locked());
    REQUIRE(s.caller() == CALLER);
    REQUIRE(s.borrowed_balance() == 0);
    REQUIRE(s.collateral_balance() == 0);

    SECTION("Second acquire is rejected") {
        REQUIRE(code_of([&] { s.acquire(OTHER); }) == ErrorCode::ALREADY_LOCKED);
        REQUIRE(s.caller() == CALLER);
    }

    SECTION("Release with zero balances unlocks") {
        s.release();
        REQUIRE_FALSE(s.locked());
        REQUIRE(addresses::is_zero(s.caller()));
    }

    SECTION("Release with an open balance is rejected") {
        s.credit(Asset::BORROWED, 10);
        REQUIRE(code_of([&] { s.release(); }) == ErrorCode::SESSION_BALANCE_NON_ZERO);
        REQUIRE(s.locked());

        s.debit(Asset::BORROWED, 10);
        s.release();
        REQUIRE_FALSE(s.locked());
    }

    SECTION("Abort resets unconditionally") {
        s.credit(Asset::COLLATERAL, 5);
        s.abort();
        REQUIRE_FALSE(s.locked());
        REQUIRE(s.collateral_balance() == 0);

        s.acquire(OTHER);
        REQUIRE(s.caller() == OTHER);
    }
}

TEST_CASE("Session release requires a lock", "[session]") {
    Session s;
    REQUIRE(code_of([&] { s.release(); }) == ErrorCode::NOT_LOCKED);
}

TEST_CASE("Session caller checks", "[session]") {
    Session s;
    REQUIRE(code_of([&] { s.require_caller(CALLER); }) == ErrorCode::NOT_LOCKED);

    s.acquire(CALLER);
    REQUIRE(code_of([&] { s.require_caller(CALLER); }) == ErrorCode::OK);
    REQUIRE(code_of([&] { s.require_caller(OTHER); }) == ErrorCode::NOT_PERMITTED);
}

TEST_CASE("Session running balances", "[session]") {
    Session s;
    s.acquire(CALLER);

    s.credit(Asset::BORROWED, 100);
    s.credit(Asset::COLLATERAL, 40);
    REQUIRE(s.balance(Asset::BORROWED) == 100);
    REQUIRE(s.balance(Asset::COLLATERAL) == 40);

    s.debit(Asset::BORROWED, 60);
    REQUIRE(s.borrowed_balance() == 40);

    REQUIRE(code_of([&] { s.debit(Asset::COLLATERAL, 41); }) ==
            ErrorCode::INSUFFICIENT_SESSION_BALANCE);
    REQUIRE(s.collateral_balance() == 40);

    REQUIRE(code_of([&] { s.credit(Asset::BORROWED, I128_MAX); }) ==
            ErrorCode::ARITHMETIC_OVERFLOW);
}

TEST_CASE("Acquire zeroes stale balances", "[session]") {
    Session s;
    s.acquire(CALLER);
    s.credit(Asset::BORROWED, 3);
    s.abort();

    s.acquire(CALLER);
    REQUIRE(s.borrowed_balance() == 0);
}
