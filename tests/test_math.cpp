// Tumo Markets - Margin Math Tests

#include <catch2/catch_test_macros.hpp>
#include <tumo/math.hpp>

using namespace tumo;
using namespace tumo::math;

TEST_CASE("calculate_pnl long positions", "[math][pnl]") {
    SECTION("Price up is profit") {
        auto pnl = calculate_pnl(5000, 1'000'000, 1'200'000, Direction::LONG);
        REQUIRE(pnl.has_value());
        REQUIRE(pnl->is_profit);
        REQUIRE(pnl->amount == 1000);
    }

    SECTION("Price down is loss") {
        auto pnl = calculate_pnl(5000, 1'000'000, 900'000, Direction::LONG);
        REQUIRE(pnl.has_value());
        REQUIRE_FALSE(pnl->is_profit);
        REQUIRE(pnl->amount == 500);
    }

    SECTION("Fractional results truncate") {
        // 7 * 1 / 3 = 2.33
        auto pnl = calculate_pnl(7, 3, 4, Direction::LONG);
        REQUIRE(pnl->amount == 2);
    }
}

TEST_CASE("calculate_pnl short positions", "[math][pnl]") {
    SECTION("Price down is profit") {
        auto pnl = calculate_pnl(5000, 1'000'000, 900'000, Direction::SHORT);
        REQUIRE(pnl->is_profit);
        REQUIRE(pnl->amount == 500);
    }

    SECTION("Price up is loss") {
        auto pnl = calculate_pnl(5000, 1'000'000, 1'200'000, Direction::SHORT);
        REQUIRE_FALSE(pnl->is_profit);
        REQUIRE(pnl->amount == 1000);
    }
}

TEST_CASE("calculate_pnl edge cases", "[math][pnl]") {
    SECTION("Equal prices are a zero loss") {
        for (auto dir : {Direction::LONG, Direction::SHORT}) {
            auto pnl = calculate_pnl(10'000, 1'000'000, 1'000'000, dir);
            REQUIRE(pnl.has_value());
            REQUIRE(pnl->amount == 0);
            REQUIRE_FALSE(pnl->is_profit);
        }
    }

    SECTION("Zero entry price is rejected") {
        REQUIRE_FALSE(calculate_pnl(10'000, 0, 1'000'000, Direction::LONG).has_value());
    }

    SECTION("Product wider than 64 bits still divides exactly") {
        // 10^12 * (10^13 - 10^6) overflows 64 bits before the division
        auto pnl = calculate_pnl(1'000'000'000'000ULL, 1'000'000,
                                 10'000'000'000'000ULL, Direction::LONG);
        REQUIRE(pnl.has_value());
        REQUIRE(pnl->is_profit);
        REQUIRE(pnl->amount == 9'999'999'000'000'000'000ULL);
    }

    SECTION("Quotient wider than 64 bits is reported") {
        REQUIRE_FALSE(calculate_pnl(UINT64_MAX, 1, 3, Direction::LONG).has_value());
    }
}

TEST_CASE("weighted_entry_price", "[math]") {
    SECTION("Equal sizes average the prices") {
        auto entry = weighted_entry_price(1'000'000, 5000, 2'000'000, 5000);
        REQUIRE(entry.has_value());
        REQUIRE(*entry == 1'500'000);
    }

    SECTION("Larger add pulls the average toward the new price") {
        // (100 * 1 + 300 * 2) / 4 = 175
        REQUIRE(*weighted_entry_price(100, 1, 200, 3) == 175);
    }

    SECTION("Intermediate products beyond 64 bits") {
        uint64_t price = 4'000'000'000'000'000'000ULL;
        auto entry = weighted_entry_price(price, 10, price, 10);
        REQUIRE(entry.has_value());
        REQUIRE(*entry == price);
    }

    SECTION("Zero total size") {
        REQUIRE_FALSE(weighted_entry_price(100, 0, 200, 0).has_value());
    }
}

TEST_CASE("has_sufficient_collateral", "[math]") {
    REQUIRE(has_sufficient_collateral(1000, 10, 10'000));
    REQUIRE_FALSE(has_sufficient_collateral(999, 10, 10'000));
    REQUIRE(has_sufficient_collateral(UINT64_MAX, 255, UINT64_MAX));
    REQUIRE_FALSE(has_sufficient_collateral(0, 10, 1));
}

TEST_CASE("maintenance_margin", "[math]") {
    SECTION("Leverage 10 is 10% of size") {
        REQUIRE(*maintenance_margin(10'000, 10) == 1000);
    }

    SECTION("Percentage truncates before scaling") {
        // 100 / 3 = 33%
        REQUIRE(*maintenance_margin(10'000, 3) == 3300);
        REQUIRE(*maintenance_margin(999, 10) == 99);
    }

    SECTION("Leverage above 100 has no maintenance requirement") {
        REQUIRE(*maintenance_margin(10'000, 200) == 0);
    }

    SECTION("Zero leverage is rejected") {
        REQUIRE_FALSE(maintenance_margin(10'000, 0).has_value());
    }
}

TEST_CASE("percent_of and checked_add", "[math]") {
    REQUIRE(percent_of(100, 10) == 10);
    REQUIRE(percent_of(100, 100) == 100);
    REQUIRE(percent_of(99, 50) == 49);
    REQUIRE(percent_of(UINT64_MAX, 100) == UINT64_MAX);
    REQUIRE(percent_of(0, 50) == 0);

    REQUIRE(*checked_add(1, 2) == 3);
    REQUIRE(*checked_add(UINT64_MAX, 0) == UINT64_MAX);
    REQUIRE_FALSE(checked_add(UINT64_MAX, 1).has_value());
}
