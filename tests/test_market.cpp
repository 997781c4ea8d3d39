// Lever - Simulated collaborator tests

#include "test_support.hpp"

using namespace lever;
using namespace lever::test;

namespace {

constexpr Address OWNER = addresses::from_id(0x4001);

// OWNER holds 12 WETH staked into 10 wstETH, all supplied
struct MarketFixture {
    sim::SimWorld world;

    MarketFixture() {
        world.fund(OWNER, wad::from_int(12));
        I128 shares = world.staking().stake(OWNER, wad::from_int(12));
        world.market().supply(sim::ids::STAKING_TOKEN, shares, OWNER);
    }
};

} // namespace

TEST_CASE("Token transfers and allowances", "[sim]") {
    sim::SimToken token(addresses::from_id(1), "TKN");
    token.mint(ALICE, 100);

    token.transfer(ALICE, BOB, 30);
    REQUIRE(token.balance_of(ALICE) == 70);
    REQUIRE(token.balance_of(BOB) == 30);
    REQUIRE_THROWS_AS(token.transfer(ALICE, BOB, 71), CollaboratorError);

    REQUIRE_THROWS_AS(token.transfer_from(KEEPER, ALICE, KEEPER, 1), CollaboratorError);
    token.approve(ALICE, KEEPER, 50);
    token.transfer_from(KEEPER, ALICE, KEEPER, 20);
    REQUIRE(token.allowance(ALICE, KEEPER) == 30);
    REQUIRE(token.balance_of(KEEPER) == 20);

    token.burn(KEEPER, 20);
    REQUIRE(token.total_supply() == 80);
}

TEST_CASE("Staking mints at the current rate", "[sim]") {
    sim::SimWorld world;
    world.fund(ALICE, wad::from_int(3));

    REQUIRE(world.staking().stake(ALICE, wad::from_int(3)) == wad::from_int(3) * 10 / 12);
    REQUIRE(world.borrowed().balance_of(ALICE) == 0);
    REQUIRE(world.staking().convert_to_assets(wad::from_int(10)) == wad::from_int(12));
    REQUIRE(world.staking().convert_to_shares(wad::from_int(12)) == wad::from_int(10));
    REQUIRE_THROWS_AS(world.staking().set_rate(0), CollaboratorError);
}

TEST_CASE("Position data", "[sim]") {
    MarketFixture f;
    PositionData p = f.world.market().position_data(OWNER);

    REQUIRE(p.collateral_value == wad::from_int(12));
    REQUIRE(p.debt_value == 0);
    REQUIRE(p.health_factor == HEALTH_FACTOR_MAX);
    REQUIRE(p.ltv_bps == 9300);
    REQUIRE(p.liquidation_threshold_bps == 9500);
    REQUIRE(p.available_borrow == wad::from_int(12) * 93 / 100);

    f.world.market().borrow(sim::ids::BORROWED_TOKEN, wad::from_int(6), OWNER);
    p = f.world.market().position_data(OWNER);
    REQUIRE(p.debt_value == wad::from_int(6));
    REQUIRE(p.health_factor == WAD * 19 / 10);    // 12 * 0.95 / 6
    REQUIRE(f.world.borrowed().balance_of(OWNER) == wad::from_int(6));
}

TEST_CASE("Market rejects unsafe operations", "[sim]") {
    MarketFixture f;
    auto& market = f.world.market();

    REQUIRE_THROWS_AS(market.borrow(sim::ids::BORROWED_TOKEN, wad::from_int(12), OWNER),
                      CollaboratorError);

    market.borrow(sim::ids::BORROWED_TOKEN, wad::from_int(10), OWNER);
    REQUIRE_THROWS_AS(market.withdraw(sim::ids::STAKING_TOKEN, wad::from_int(2), OWNER, OWNER),
                      CollaboratorError);
    REQUIRE_THROWS_AS(market.withdraw(sim::ids::STAKING_TOKEN, wad::from_int(11), OWNER, OWNER),
                      CollaboratorError);
    REQUIRE(market.supplied(OWNER, sim::ids::STAKING_TOKEN) == wad::from_int(10));
}

TEST_CASE("Repay returns the amount actually repaid", "[sim]") {
    MarketFixture f;
    auto& market = f.world.market();
    market.borrow(sim::ids::BORROWED_TOKEN, wad::from_int(2), OWNER);
    f.world.fund(OWNER, wad::from_int(1));

    REQUIRE(market.repay(sim::ids::BORROWED_TOKEN, wad::from_int(3), OWNER) == wad::from_int(2));
    REQUIRE(market.owed(OWNER, sim::ids::BORROWED_TOKEN) == 0);
    REQUIRE(f.world.borrowed().balance_of(OWNER) == wad::from_int(1));
}

TEST_CASE("Interest indices round in the market's favor", "[sim]") {
    MarketFixture f;
    auto& market = f.world.market();
    market.borrow(sim::ids::BORROWED_TOKEN, wad::from_int(5), OWNER);

    I128 index = RAY + RAY / 3;
    f.world.accrue_interest(index, index);

    ScaledBalance debt = market.debt_balance(OWNER, sim::ids::BORROWED_TOKEN);
    REQUIRE(debt.index == index);
    REQUIRE(market.owed(OWNER, sim::ids::BORROWED_TOKEN) ==
            math::mul_div(debt.scaled, index, RAY, Rounding::CEIL));

    I128 supplied = market.supplied(OWNER, sim::ids::STAKING_TOKEN);
    I128 out = market.withdraw(sim::ids::STAKING_TOKEN, WAD, OWNER, OWNER);
    REQUIRE(out == WAD);
    I128 left = market.supplied(OWNER, sim::ids::STAKING_TOKEN);
    REQUIRE(left >= supplied - WAD);
    REQUIRE(left <= supplied - WAD + 1);

    REQUIRE_THROWS_AS(f.world.accrue_interest(RAY - 1, RAY), CollaboratorError);
}

TEST_CASE("Injected failures fire once", "[sim]") {
    MarketFixture f;
    f.world.market().fail_next(sim::MarketCall::WITHDRAW);
    REQUIRE_THROWS_AS(
        f.world.market().withdraw(sim::ids::STAKING_TOKEN, WAD, OWNER, OWNER), CollaboratorError);
    REQUIRE(f.world.market().withdraw(sim::ids::STAKING_TOKEN, WAD, OWNER, OWNER) == WAD);
}

TEST_CASE("World journal restores checkpoints", "[sim]") {
    MarketFixture f;
    I128 rate = f.world.staking().current_rate();

    f.world.begin();
    f.world.fund(ALICE, WAD);
    f.world.staking().set_rate(WAD * 2);
    f.world.market().borrow(sim::ids::BORROWED_TOKEN, WAD, OWNER);

    f.world.begin();
    f.world.fund(BOB, WAD);
    f.world.rollback();
    REQUIRE(f.world.borrowed().balance_of(BOB) == 0);
    REQUIRE(f.world.borrowed().balance_of(ALICE) == WAD);

    f.world.rollback();
    REQUIRE(f.world.borrowed().balance_of(ALICE) == 0);
    REQUIRE(f.world.staking().current_rate() == rate);
    REQUIRE(f.world.market().owed(OWNER, sim::ids::BORROWED_TOKEN) == 0);
    REQUIRE(f.world.depth() == 0);

    f.world.begin();
    f.world.fund(ALICE, WAD);
    f.world.commit();
    REQUIRE(f.world.borrowed().balance_of(ALICE) == WAD);
}
