// Tumo Markets - Position Lifecycle Tests

#include <catch2/catch_test_macros.hpp>

#include "fixture.hpp"

using namespace tumo;
using namespace tumo::testing;

TEST_CASE("Opening a position", "[positions][open]") {
    EngineFixture fx(EngineConfig{}, 10, 100'000);

    SECTION("New position records price and timestamp") {
        auto result = fx.open(ALICE, Direction::LONG, 10'000, 1000);
        REQUIRE(result.status == errors::OK);
        REQUIRE_FALSE(result.merged);
        REQUIRE(result.position.has_value());

        auto pos = *fx.engine.get_position(MARKET_ID, ALICE);
        REQUIRE(pos.owner == ALICE);
        REQUIRE(pos.size == 10'000);
        REQUIRE(pos.collateral_amount == 1000);
        REQUIRE(pos.entry_price == PRICE_ONE);
        REQUIRE(pos.direction == Direction::LONG);
        REQUIRE(pos.open_timestamp == fx.clock);

        REQUIRE(fx.balance() == 101'000);
        REQUIRE(*fx.engine.locked_collateral(USDH) == 1000);
        REQUIRE(fx.engine.get_market(MARKET_ID)->open_positions == 1);
    }

    SECTION("Owners hold independent positions") {
        REQUIRE(fx.open(ALICE, Direction::LONG, 10'000, 1000).status == errors::OK);
        REQUIRE(fx.open(BOB, Direction::SHORT, 2000, 200).status == errors::OK);
        REQUIRE(fx.engine.get_positions(MARKET_ID).size() == 2);
        REQUIRE(fx.engine.get_position(MARKET_ID, BOB)->direction == Direction::SHORT);
    }

    SECTION("Invalid requests change nothing") {
        REQUIRE(fx.open(ALICE, Direction::LONG, 0, 1000).status == errors::INVALID_SIZE);
        REQUIRE(fx.open(ALICE, static_cast<Direction>(3), 10'000, 1000).status == errors::INVALID_DIRECTION);
        REQUIRE(fx.open(ALICE, Direction::LONG, 10'000, 0).status == errors::INVALID_COLLATERAL);
        REQUIRE(fx.open(ALICE, Direction::LONG, 10'000, 999).status == errors::INVALID_COLLATERAL);
        REQUIRE(fx.engine.open_position(MARKET_ID, ALICE, 10'000, Direction::LONG,
                                        Coin{OCT, 1000}, ++fx.clock).status == errors::INVALID_CURRENCY);

        REQUIRE_FALSE(fx.engine.get_position(MARKET_ID, ALICE).has_value());
        REQUIRE(fx.balance() == 100'000);
        REQUIRE(fx.events.empty());
        REQUIRE(fx.engine.get_stats().positions_opened == 0);
    }
}

TEST_CASE("Opening without a price", "[positions][open]") {
    EngineFixture fx;
    REQUIRE(fx.engine.create_price_feed(fx.oracle, DEPLOYER, 2) == errors::OK);
    REQUIRE(fx.engine.create_market(fx.admin, DEPLOYER, MarketParams{2, USDH, 2, 10}) == errors::OK);

    auto result = fx.engine.open_position(2, ALICE, 10'000, Direction::LONG,
                                          Coin{USDH, 1000}, ++fx.clock);
    REQUIRE(result.status == errors::INVALID_PRICE);
    REQUIRE(fx.balance() == 0);
}

TEST_CASE("Increasing a position", "[positions][merge]") {
    EngineFixture fx(EngineConfig{}, 10, 100'000);

    REQUIRE(fx.open(ALICE, Direction::LONG, 5000, 1000).status == errors::OK);
    uint64_t opened_at = fx.engine.get_position(MARKET_ID, ALICE)->open_timestamp;

    SECTION("Entry price is the size-weighted average") {
        REQUIRE(fx.set_price(2'000'000) == errors::OK);
        auto result = fx.open(ALICE, Direction::LONG, 5000, 1000);
        REQUIRE(result.status == errors::OK);
        REQUIRE(result.merged);

        auto pos = *fx.engine.get_position(MARKET_ID, ALICE);
        REQUIRE(pos.size == 10'000);
        REQUIRE(pos.collateral_amount == 2000);
        REQUIRE(pos.entry_price == 1'500'000);
        REQUIRE(pos.open_timestamp == opened_at);

        REQUIRE(fx.balance() == 102'000);
        REQUIRE(*fx.engine.locked_collateral(USDH) == 2000);
        REQUIRE(fx.engine.get_stats().positions_merged == 1);
    }

    SECTION("Zero added collateral is allowed while the total covers the size") {
        auto result = fx.open(ALICE, Direction::LONG, 5000, 0);
        REQUIRE(result.status == errors::OK);
        REQUIRE(result.position->size == 10'000);
        REQUIRE(result.position->collateral_amount == 1000);
    }

    SECTION("Opposite direction is refused") {
        auto result = fx.open(ALICE, Direction::SHORT, 5000, 1000);
        REQUIRE(result.status == errors::DIRECTION_MISMATCH);

        auto pos = *fx.engine.get_position(MARKET_ID, ALICE);
        REQUIRE(pos.size == 5000);
        REQUIRE(pos.collateral_amount == 1000);
        REQUIRE(fx.balance() == 101'000);
    }

    SECTION("Merged total must still be collateralized") {
        REQUIRE(fx.open(ALICE, Direction::LONG, 10'000, 400).status == errors::INVALID_COLLATERAL);
        REQUIRE(fx.engine.get_position(MARKET_ID, ALICE)->size == 5000);
        REQUIRE(fx.balance() == 101'000);
    }

    SECTION("Size overflow is reported") {
        REQUIRE(fx.open(ALICE, Direction::LONG, UINT64_MAX, 1000).status == errors::ARITHMETIC_OVERFLOW);
        REQUIRE(fx.engine.get_position(MARKET_ID, ALICE)->size == 5000);
    }
}

TEST_CASE("Closing a position", "[positions][close]") {
    EngineFixture fx(EngineConfig{}, 10, 100'000);
    REQUIRE(fx.open(ALICE, Direction::LONG, 5000, 1000).status == errors::OK);

    SECTION("Profit returns collateral plus gain") {
        REQUIRE(fx.set_price(1'200'000) == errors::OK);
        auto result = fx.close(ALICE);

        REQUIRE(result.status == errors::OK);
        REQUIRE(result.is_profit);
        REQUIRE(result.pnl == 1000);
        REQUIRE(result.exit_price == 1'200'000);
        REQUIRE(result.payout.asset == USDH);
        REQUIRE(result.payout.value == 2000);
        REQUIRE(fx.balance() == 99'000);
    }

    SECTION("Loss returns what is left of the collateral") {
        REQUIRE(fx.set_price(900'000) == errors::OK);
        auto result = fx.close(ALICE);

        REQUIRE(result.status == errors::OK);
        REQUIRE_FALSE(result.is_profit);
        REQUIRE(result.pnl == 500);
        REQUIRE(result.payout.value == 500);
        REQUIRE(fx.balance() == 100'500);
    }

    SECTION("Loss beyond the collateral returns nothing") {
        REQUIRE(fx.set_price(700'000) == errors::OK);
        auto result = fx.close(ALICE);

        REQUIRE(result.status == errors::OK);
        REQUIRE(result.pnl == 1500);
        REQUIRE(result.payout.value == 0);
        REQUIRE(fx.balance() == 101'000);
    }

    SECTION("Unchanged price returns the collateral") {
        auto result = fx.close(ALICE);
        REQUIRE(result.pnl == 0);
        REQUIRE_FALSE(result.is_profit);
        REQUIRE(result.payout.value == 1000);
    }

    SECTION("Position is gone afterwards") {
        REQUIRE(fx.close(ALICE).status == errors::OK);
        REQUIRE_FALSE(fx.engine.get_position(MARKET_ID, ALICE).has_value());
        REQUIRE(*fx.engine.locked_collateral(USDH) == 0);
        REQUIRE(fx.close(ALICE).status == errors::POSITION_NOT_FOUND);

        auto stats = fx.engine.get_stats();
        REQUIRE(stats.positions_closed == 1);
        REQUIRE(stats.open_positions == 0);
    }

    SECTION("Reopening after close starts fresh") {
        REQUIRE(fx.close(ALICE).status == errors::OK);
        REQUIRE(fx.set_price(2'000'000) == errors::OK);
        auto result = fx.open(ALICE, Direction::SHORT, 1000, 100);
        REQUIRE(result.status == errors::OK);
        REQUIRE_FALSE(result.merged);
        REQUIRE(result.position->entry_price == 2'000'000);
    }

    SECTION("Only the owner's position is closed") {
        REQUIRE(fx.close(BOB).status == errors::POSITION_NOT_FOUND);
        REQUIRE(fx.engine.get_position(MARKET_ID, ALICE).has_value());
    }
}

TEST_CASE("Closing a short position", "[positions][close]") {
    EngineFixture fx(EngineConfig{}, 10, 100'000);
    REQUIRE(fx.open(BOB, Direction::SHORT, 5000, 1000).status == errors::OK);

    SECTION("Price down is profit") {
        REQUIRE(fx.set_price(900'000) == errors::OK);
        auto result = fx.close(BOB);
        REQUIRE(result.is_profit);
        REQUIRE(result.payout.value == 1500);
    }

    SECTION("Price up is loss") {
        REQUIRE(fx.set_price(1'100'000) == errors::OK);
        auto result = fx.close(BOB);
        REQUIRE_FALSE(result.is_profit);
        REQUIRE(result.payout.value == 500);
    }
}

TEST_CASE("Close the pool cannot pay leaves state untouched", "[positions][close]") {
    // No provider liquidity: the pool holds only the trader's own collateral
    EngineFixture fx;
    REQUIRE(fx.open(ALICE, Direction::LONG, 5000, 1000).status == errors::OK);
    REQUIRE(fx.set_price(1'200'000) == errors::OK);
    fx.events.clear();

    auto result = fx.close(ALICE);
    REQUIRE(result.status == errors::INSUFFICIENT_LIQUIDITY);
    REQUIRE(result.payout.value == 0);

    auto pos = fx.engine.get_position(MARKET_ID, ALICE);
    REQUIRE(pos.has_value());
    REQUIRE(pos->size == 5000);
    REQUIRE(pos->collateral_amount == 1000);
    REQUIRE(fx.balance() == 1000);
    REQUIRE(*fx.engine.locked_collateral(USDH) == 1000);
    REQUIRE(fx.events.empty());

    SECTION("Succeeds once liquidity arrives") {
        REQUIRE(fx.engine.add_liquidity(fx.lp, DEPLOYER, Coin{USDH, 1000}) == errors::OK);
        auto retry = fx.close(ALICE);
        REQUIRE(retry.status == errors::OK);
        REQUIRE(retry.payout.value == 2000);
        REQUIRE(fx.balance() == 0);
    }
}

TEST_CASE("Collateral covers size at the market leverage", "[positions][invariant]") {
    EngineFixture fx(EngineConfig{}, 5, 1'000'000);
    const uint64_t prices[] = {1'000'000, 1'300'000, 800'000, 1'100'000};

    for (uint64_t price : prices) {
        REQUIRE(fx.set_price(price) == errors::OK);
        REQUIRE(fx.open(ALICE, Direction::LONG, 2500, 500).status == errors::OK);
        REQUIRE(fx.open(BOB, Direction::SHORT, 1000, 250).status == errors::OK);
    }

    for (const auto& pos : fx.engine.get_positions(MARKET_ID)) {
        REQUIRE(pos.collateral_amount * 5 >= pos.size);
    }

    auto alice = *fx.engine.get_position(MARKET_ID, ALICE);
    REQUIRE(alice.size == 10'000);
    REQUIRE(alice.collateral_amount == 2000);
    // Each merge truncates, so the result sits just under the exact 1.05
    REQUIRE(alice.entry_price == 1'049'999);
}
