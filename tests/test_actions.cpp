// Lever - Primitive action tests

#include "test_support.hpp"

#include "lever/actions.hpp"
#include "lever/session.hpp"

using namespace lever;
using namespace lever::test;

namespace {

struct ActionFixture {
    sim::SimWorld world;
    VaultConfig config = quiet_config();
    Session session;
    ActionSet actions{world.borrowed(), world.staking(), world.staking(), world.market(),
                      VAULT, config};

    ActionFixture() {
        world.fund(ALICE, wad::from_int(10));
        world.borrowed().approve(ALICE, VAULT, wad::from_int(10));
    }
};

} // namespace

TEST_CASE("Actions require an open session", "[actions]") {
    ActionFixture f;

    REQUIRE(code_of([&] { f.actions.stake(f.session, ALICE, WAD); }) == ErrorCode::NOT_LOCKED);
    REQUIRE(code_of([&] { f.actions.borrow(f.session, ALICE, WAD); }) == ErrorCode::NOT_LOCKED);
    REQUIRE(code_of([&] { f.actions.pull(f.session, ALICE, Asset::BORROWED, ALICE, WAD); }) ==
            ErrorCode::NOT_LOCKED);
}

TEST_CASE("Actions are reserved to the session caller", "[actions]") {
    ActionFixture f;
    f.session.acquire(ALICE);

    REQUIRE(code_of([&] { f.actions.pull(f.session, BOB, Asset::BORROWED, ALICE, WAD); }) ==
            ErrorCode::NOT_PERMITTED);
    REQUIRE(code_of([&] { f.actions.repay(f.session, BOB, WAD); }) == ErrorCode::NOT_PERMITTED);
    REQUIRE(f.world.borrowed().balance_of(ALICE) == wad::from_int(10));
}

TEST_CASE("Pull, stake and supply move the running balances", "[actions]") {
    ActionFixture f;
    f.session.acquire(ALICE);
    SessionHandle h(f.actions, f.session, ALICE);

    h.pull(Asset::BORROWED, ALICE, wad::from_int(6));
    REQUIRE(h.balance(Asset::BORROWED) == wad::from_int(6));
    REQUIRE(f.world.borrowed().balance_of(VAULT) == wad::from_int(6));

    I128 received = h.stake(wad::from_int(6));
    REQUIRE(received == wad::from_int(5));    // rate 1.2
    REQUIRE(h.balance(Asset::BORROWED) == 0);
    REQUIRE(h.balance(Asset::COLLATERAL) == received);

    h.supply_collateral(received);
    REQUIRE(h.balance(Asset::COLLATERAL) == 0);
    REQUIRE(f.world.market().supplied(VAULT, sim::ids::STAKING_TOKEN) == received);

    f.session.release();
}

TEST_CASE("Borrow and repay", "[actions]") {
    ActionFixture f;
    f.session.acquire(ALICE);
    SessionHandle h(f.actions, f.session, ALICE);

    h.pull(Asset::BORROWED, ALICE, wad::from_int(6));
    h.supply_collateral(h.stake(wad::from_int(6)));

    h.borrow(wad::from_int(2));
    REQUIRE(h.balance(Asset::BORROWED) == wad::from_int(2));
    REQUIRE(f.world.market().owed(VAULT, sim::ids::BORROWED_TOKEN) == wad::from_int(2));

    SECTION("Exact repay") {
        REQUIRE(h.repay(wad::from_int(2)) == wad::from_int(2));
        REQUIRE(h.balance(Asset::BORROWED) == 0);
        f.session.release();
    }

    SECTION("Over-repay keeps the change in the session") {
        h.pull(Asset::BORROWED, ALICE, wad::from_int(1));
        REQUIRE(h.repay(wad::from_int(3)) == wad::from_int(2));
        REQUIRE(h.balance(Asset::BORROWED) == wad::from_int(1));
        h.send(Asset::BORROWED, ALICE, wad::from_int(1));
        f.session.release();
    }
}

TEST_CASE("Withdraw collateral credits the amount received", "[actions]") {
    ActionFixture f;
    f.session.acquire(ALICE);
    SessionHandle h(f.actions, f.session, ALICE);

    h.pull(Asset::BORROWED, ALICE, wad::from_int(6));
    h.supply_collateral(h.stake(wad::from_int(6)));

    I128 out = h.withdraw_collateral(wad::from_int(2));
    REQUIRE(out == wad::from_int(2));
    REQUIRE(h.balance(Asset::COLLATERAL) == wad::from_int(2));

    h.send(Asset::COLLATERAL, ALICE, out);
    REQUIRE(f.world.staking().balance_of(ALICE) == wad::from_int(2));
    f.session.release();
}

TEST_CASE("Action input validation", "[actions]") {
    ActionFixture f;
    f.session.acquire(ALICE);
    SessionHandle h(f.actions, f.session, ALICE);

    SECTION("Zero amounts") {
        REQUIRE(code_of([&] { h.stake(0); }) == ErrorCode::ZERO_AMOUNT);
        REQUIRE(code_of([&] { h.send(Asset::BORROWED, BOB, 0); }) == ErrorCode::ZERO_AMOUNT);
        REQUIRE(code_of([&] { h.pull(Asset::BORROWED, ALICE, 0); }) == ErrorCode::ZERO_AMOUNT);
    }

    SECTION("Zero address") {
        h.pull(Asset::BORROWED, ALICE, WAD);
        REQUIRE(code_of([&] { h.send(Asset::BORROWED, addresses::ZERO, WAD); }) ==
                ErrorCode::ZERO_ADDRESS);
        REQUIRE(code_of([&] { h.pull(Asset::BORROWED, addresses::ZERO, WAD); }) ==
                ErrorCode::ZERO_ADDRESS);
    }

    SECTION("Stake below the staking minimum") {
        h.pull(Asset::BORROWED, ALICE, WAD);
        REQUIRE(code_of([&] { h.stake(99); }) == ErrorCode::AMOUNT_BELOW_MINIMUM);
        REQUIRE(h.balance(Asset::BORROWED) == WAD);
    }

    SECTION("Spending more than the session holds") {
        REQUIRE(code_of([&] { h.stake(WAD); }) == ErrorCode::INSUFFICIENT_SESSION_BALANCE);
        REQUIRE(code_of([&] { h.supply_collateral(WAD); }) ==
                ErrorCode::INSUFFICIENT_SESSION_BALANCE);
        REQUIRE(code_of([&] { h.repay(WAD); }) == ErrorCode::INSUFFICIENT_SESSION_BALANCE);
    }
}

TEST_CASE("Collaborator failures propagate", "[actions]") {
    ActionFixture f;
    f.session.acquire(ALICE);
    SessionHandle h(f.actions, f.session, ALICE);

    h.pull(Asset::BORROWED, ALICE, wad::from_int(6));
    h.supply_collateral(h.stake(wad::from_int(6)));

    REQUIRE_THROWS_AS(h.borrow(wad::from_int(100)), CollaboratorError);
    REQUIRE(h.balance(Asset::BORROWED) == 0);

    f.world.market().fail_next(sim::MarketCall::BORROW);
    REQUIRE_THROWS_AS(h.borrow(WAD), CollaboratorError);
    h.borrow(WAD);
    REQUIRE(h.balance(Asset::BORROWED) == WAD);
}
