// Tumo Markets - Shared test fixture

#ifndef TUMO_TESTS_FIXTURE_HPP
#define TUMO_TESTS_FIXTURE_HPP

#include <catch2/catch_test_macros.hpp>
#include <tumo/engine.hpp>

namespace tumo::testing {

inline const Address DEPLOYER = address::from_u64(0xD0);
inline const Address ALICE = address::from_u64(0xA11CE);
inline const Address BOB = address::from_u64(0xB0B);
inline const Address KEEPER = address::from_u64(0x4EE9);
inline const Currency USDH{address::from_u64(0x05D4)};
inline const Currency OCT{address::from_u64(0x0C7)};

constexpr uint64_t FEED_ID = 1;
constexpr uint32_t MARKET_ID = 1;
constexpr uint64_t PRICE_ONE = 1'000'000;  // 1.0 at 6 decimals

// Engine with one USDH pool, feed 1 at PRICE_ONE and market 1; events from
// setup are cleared.
struct EngineFixture {
    EventLog events;
    MarginEngine engine;
    Capability admin{};
    Capability lp{};
    Capability oracle{};
    uint64_t clock = 1'000;

    explicit EngineFixture(EngineConfig config = {}, uint8_t leverage = 10,
                           uint64_t liquidity = 0)
        : engine(DEPLOYER, std::move(config), &events) {
        admin = *engine.capability_of(DEPLOYER, Role::ADMIN);
        lp = *engine.capability_of(DEPLOYER, Role::LIQUIDITY_PROVIDER);
        oracle = *engine.capability_of(DEPLOYER, Role::ORACLE_OPERATOR);

        REQUIRE(engine.create_liquidity_pool(admin, DEPLOYER, USDH) == errors::OK);
        REQUIRE(engine.create_price_feed(oracle, DEPLOYER, FEED_ID) == errors::OK);
        REQUIRE(engine.create_market(admin, DEPLOYER,
                                     MarketParams{MARKET_ID, USDH, FEED_ID, leverage}) == errors::OK);
        if (liquidity > 0) {
            REQUIRE(engine.add_liquidity(lp, DEPLOYER, Coin{USDH, liquidity}) == errors::OK);
        }
        REQUIRE(set_price(PRICE_ONE) == errors::OK);
        events.clear();
    }

    int32_t set_price(uint64_t price) {
        clock += 1'000;
        return engine.update_price(oracle, DEPLOYER, FEED_ID, price, clock);
    }

    OpenResult open(const Address& owner, Direction direction, uint64_t size, uint64_t collateral) {
        return engine.open_position(MARKET_ID, owner, size, direction,
                                    Coin{USDH, collateral}, ++clock);
    }

    CloseResult close(const Address& owner) {
        return engine.close_position(MARKET_ID, owner, ++clock);
    }

    LiquidationResult liquidate(const Address& keeper, const Address& owner) {
        return engine.liquidate(MARKET_ID, keeper, owner, ++clock);
    }

    uint64_t balance() const { return *engine.pool_balance(USDH); }
};

} // namespace tumo::testing

#endif // TUMO_TESTS_FIXTURE_HPP
