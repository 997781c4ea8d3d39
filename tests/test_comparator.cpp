// Lever - Snapshot comparator tests

#include "test_support.hpp"

#include "lever/comparator.hpp"

using namespace lever;
using lever::test::code_of;

namespace {

PositionSnapshot snap(I128 collateral, I128 debt, I128 hf) {
    PositionSnapshot s{};
    s.collateral_amount = collateral;
    s.collateral_value = collateral;
    s.debt_value = debt;
    s.health_factor = hf;
    s.liquidation_threshold = WAD * 95 / 100;
    s.ltv = WAD * 93 / 100;
    s.total_shares = WAD * 10;
    s.reference_rate = WAD;
    return s;
}

VaultConfig config() {
    return lever::test::quiet_config();
}

} // namespace

TEST_CASE("Rate stability", "[comparator]") {
    VaultConfig c = config();
    SnapshotComparator cmp(c);
    PositionSnapshot before = snap(WAD * 40, WAD * 29, WAD * 13 / 10);
    PositionSnapshot after = before;

    REQUIRE(code_of([&] { cmp.check_rate_stable({before, after, {}, {}}); }) == ErrorCode::OK);

    after.reference_rate += 1;
    REQUIRE(code_of([&] { cmp.check_rate_stable({before, after, {}, {}}); }) ==
            ErrorCode::RATE_CHANGED_DURING_SESSION);
}

TEST_CASE("Deposit health factor band", "[comparator]") {
    VaultConfig c = config();
    SnapshotComparator cmp(c);
    I128 target = c.target_health_factor;

    REQUIRE(cmp.band_low() == WAD * 12987 / 10000);
    REQUIRE(cmp.band_high() == WAD * 130013 / 100000);

    auto check = [&](I128 hf0, I128 hf1) {
        PositionSnapshot before = snap(WAD * 40, WAD * 29, hf0);
        PositionSnapshot after = snap(WAD * 50, WAD * 29, hf1);
        return code_of([&] { cmp.check_deposit({before, after, {}, {}}); });
    };

    SECTION("Starting at or above target stays within the band") {
        REQUIRE(check(target, target) == ErrorCode::OK);
        REQUIRE(check(HEALTH_FACTOR_MAX, cmp.band_low()) == ErrorCode::OK);
        REQUIRE(check(HEALTH_FACTOR_MAX, cmp.band_high()) == ErrorCode::OK);
        REQUIRE(check(target, cmp.band_low() - 1) == ErrorCode::HEALTH_FACTOR_OUT_OF_RANGE);
        REQUIRE(check(target, cmp.band_high() + 1) == ErrorCode::HEALTH_FACTOR_OUT_OF_RANGE);
        REQUIRE(check(HEALTH_FACTOR_MAX, HEALTH_FACTOR_MAX) ==
                ErrorCode::HEALTH_FACTOR_OUT_OF_RANGE);
    }

    SECTION("Starting below target may not move away from it") {
        I128 hf0 = WAD * 12 / 10;
        REQUIRE(check(hf0, hf0) == ErrorCode::OK);
        REQUIRE(check(hf0, WAD * 125 / 100) == ErrorCode::OK);
        REQUIRE(check(hf0, target) == ErrorCode::OK);
        REQUIRE(check(hf0, hf0 - 1) == ErrorCode::HEALTH_FACTOR_OUT_OF_RANGE);
        REQUIRE(check(hf0, cmp.band_high() + 1) == ErrorCode::HEALTH_FACTOR_OUT_OF_RANGE);
    }
}

TEST_CASE("Deposit NAV increase", "[comparator]") {
    VaultConfig c = config();
    SnapshotComparator cmp(c);
    I128 hf = c.target_health_factor;

    PositionSnapshot before = snap(WAD * 40, WAD * 30, hf);
    PositionSnapshot small = snap(WAD * 40 + c.minimum_deposit - 1, WAD * 30, hf);
    PositionSnapshot enough = snap(WAD * 40 + c.minimum_deposit, WAD * 30, hf);

    REQUIRE(code_of([&] { cmp.check_deposit({before, small, {}, {}}); }) ==
            ErrorCode::NAV_INCREASE_BELOW_MIN);
    REQUIRE(code_of([&] { cmp.check_deposit({before, enough, {}, {}}); }) == ErrorCode::OK);

    PositionSnapshot grown = snap(WAD * 60, WAD * 30, hf);
    ComparisonContext ctx{before, grown, {}, {}};
    REQUIRE(SnapshotComparator::nav_delta(ctx) == WAD * 20);
    // 10 shares * 20 / 10
    REQUIRE(cmp.shares_for_deposit(ctx) == WAD * 20);
}

TEST_CASE("Donate acceptance", "[comparator]") {
    VaultConfig c = config();
    SnapshotComparator cmp(c);
    PositionSnapshot before = snap(WAD * 40, WAD * 30, WAD * 13 / 10);

    PositionSnapshot richer = snap(WAD * 41, WAD * 30, WAD * 14 / 10);
    REQUIRE(code_of([&] { cmp.check_donate({before, richer, {}, {}}); }) == ErrorCode::OK);

    PositionSnapshot same = before;
    REQUIRE(code_of([&] { cmp.check_donate({before, same, {}, {}}); }) ==
            ErrorCode::NAV_INCREASE_BELOW_MIN);

    PositionSnapshot riskier = snap(WAD * 41, WAD * 30, WAD * 12 / 10);
    REQUIRE(code_of([&] { cmp.check_donate({before, riskier, {}, {}}); }) ==
            ErrorCode::HEALTH_FACTOR_OUT_OF_RANGE);
}

TEST_CASE("Withdraw tolerances", "[comparator]") {
    VaultConfig c = config();
    SnapshotComparator cmp(c);

    // 1 of 3 shares: debt 10 -> owes ceil(10/3) = 4, collateral 20 -> releases floor(20/3) = 6
    PositionSnapshot before = snap(20, 10, WAD * 13 / 10);
    WithdrawExpectation e = SnapshotComparator::expected_after_withdraw(before, 1, 3);
    REQUIRE(e.debt == 6);
    REQUIRE(e.collateral == 14);

    auto check = [&](I128 collateral, I128 debt) {
        PositionSnapshot after = snap(collateral, debt, WAD * 13 / 10);
        return code_of([&] { cmp.check_withdraw({before, after, I128(1), I128(3)}); });
    };

    REQUIRE(check(14, 6) == ErrorCode::OK);
    REQUIRE(check(15, 5) == ErrorCode::OK);
    REQUIRE(check(14, 7) == ErrorCode::INVALID_DEBT_AFTER_WITHDRAW);
    REQUIRE(check(14, 4) == ErrorCode::INVALID_DEBT_AFTER_WITHDRAW);
    REQUIRE(check(13, 6) == ErrorCode::INVALID_COLLATERAL_AFTER_WITHDRAW);
    REQUIRE(check(16, 6) == ErrorCode::INVALID_COLLATERAL_AFTER_WITHDRAW);
}

TEST_CASE("Initialize predicates", "[comparator]") {
    VaultConfig c = config();
    SnapshotComparator cmp(c);

    PositionSnapshot empty = snap(0, 0, HEALTH_FACTOR_MAX);
    empty.total_shares = 0;
    REQUIRE(code_of([&] { cmp.check_initialize_pre(empty); }) == ErrorCode::OK);

    PositionSnapshot minted = empty;
    minted.total_shares = 1;
    REQUIRE(code_of([&] { cmp.check_initialize_pre(minted); }) == ErrorCode::ALREADY_INITIALIZED);

    PositionSnapshot dusty = empty;
    dusty.collateral_amount = 1;
    REQUIRE(code_of([&] { cmp.check_initialize_pre(dusty); }) == ErrorCode::COLLATERAL_NON_ZERO);

    PositionSnapshot seeded = snap(WAD, 0, HEALTH_FACTOR_MAX);
    REQUIRE(code_of([&] { cmp.check_initialize_post({empty, seeded, {}, {}}); }) ==
            ErrorCode::OK);

    PositionSnapshot levered = snap(WAD * 2, WAD, WAD * 19 / 10);
    REQUIRE(code_of([&] { cmp.check_initialize_post({empty, levered, {}, {}}); }) ==
            ErrorCode::DEBT_AFTER_INIT_NON_ZERO);

    PositionSnapshot tiny = snap(c.minimum_deposit - 1, 0, HEALTH_FACTOR_MAX);
    REQUIRE(code_of([&] { cmp.check_initialize_post({empty, tiny, {}, {}}); }) ==
            ErrorCode::NAV_INCREASE_BELOW_MIN);
}

TEST_CASE("Unwind proceeds", "[comparator]") {
    VaultConfig c = config();
    SnapshotComparator cmp(c);

    REQUIRE(code_of([&] { cmp.check_unwind(WAD, WAD); }) == ErrorCode::OK);
    REQUIRE(code_of([&] { cmp.check_unwind(WAD * 995 / 1000, WAD); }) == ErrorCode::OK);
    REQUIRE(code_of([&] { cmp.check_unwind(WAD * 995 / 1000 - 1, WAD); }) ==
            ErrorCode::INSUFFICIENT_PROCEEDS);
}

TEST_CASE("Unwind leaves the position strictly safer", "[comparator]") {
    VaultConfig c = config();
    SnapshotComparator cmp(c);
    const I128 sale = WAD * 12 / 10;

    PositionSnapshot before = snap(WAD * 40, WAD * 30, WAD * 127 / 100);
    auto check = [&](const PositionSnapshot& after, I128 proceeds, I128 returned) {
        return code_of([&] {
            cmp.check_unwind_post({before, after, {}, {}}, proceeds, sale, returned);
        });
    };

    PositionSnapshot repaid = snap(WAD * 388 / 10, WAD * 288 / 10, WAD * 128 / 100);
    REQUIRE(check(repaid, sale, 0) == ErrorCode::OK);

    SECTION("Debt may not grow") {
        PositionSnapshot borrowed = snap(WAD * 41, WAD * 31, WAD * 128 / 100);
        REQUIRE(check(borrowed, sale, 0) == ErrorCode::INVALID_STATE_AFTER_UNWIND);
    }

    SECTION("Health factor must rise") {
        PositionSnapshot flat = snap(WAD * 388 / 10, WAD * 288 / 10, WAD * 127 / 100);
        REQUIRE(check(flat, sale, 0) == ErrorCode::INVALID_STATE_AFTER_UNWIND);
    }

    SECTION("NAV loss bounded by the sale discount") {
        PositionSnapshot drained = snap(WAD * 383 / 10, WAD * 288 / 10, WAD * 128 / 100);
        REQUIRE(check(drained, sale, 0) == ErrorCode::INVALID_STATE_AFTER_UNWIND);
        REQUIRE(check(drained, sale - WAD / 2, 0) == ErrorCode::OK);
    }

    SECTION("Returned dust counts against the bound") {
        PositionSnapshot dust = snap(WAD * 388 / 10 - 100, WAD * 288 / 10, WAD * 128 / 100);
        REQUIRE(check(dust, sale, 100) == ErrorCode::OK);
        REQUIRE(check(dust, sale, 0) == ErrorCode::INVALID_STATE_AFTER_UNWIND);
    }

    SECTION("Debt-free position only needs to stay debt-free") {
        before = snap(WAD * 10, 0, HEALTH_FACTOR_MAX);
        PositionSnapshot restaked = snap(WAD * 10, 0, HEALTH_FACTOR_MAX);
        REQUIRE(check(restaked, sale, 0) == ErrorCode::OK);
    }
}

TEST_CASE("Deficit fails loudly", "[comparator]") {
    PositionSnapshot underwater = snap(WAD, WAD * 2, WAD / 2);
    REQUIRE(code_of([&] { underwater.nav(); }) == ErrorCode::ARITHMETIC_UNDERFLOW);
}
