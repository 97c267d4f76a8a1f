// =============================================================================
// events.cpp - Event names and JSON encoding
// =============================================================================

#include "tumo/events.hpp"

#include <iterator>
#include <type_traits>

#include <nlohmann/json.hpp>

namespace tumo {

using json = nlohmann::json;

namespace {

std::string hex(const Address& addr) { return address::to_hex(addr); }
std::string hex(const Currency& c) { return address::to_hex(c.addr); }

json encode(const PoolCreated& e) {
    return {{"asset", hex(e.asset)}};
}

json encode(const PriceFeedCreated& e) {
    return {{"feed_id", e.feed_id}};
}

json encode(const MarketCreated& e) {
    return {
        {"market_id", e.market_id},
        {"asset", hex(e.asset)},
        {"feed_id", e.feed_id},
        {"leverage", e.leverage}
    };
}

json encode(const LiquidityAdded& e) {
    return {
        {"asset", hex(e.asset)},
        {"provider", hex(e.provider)},
        {"amount", e.amount},
        {"new_balance", e.new_balance}
    };
}

json encode(const LiquidityRemoved& e) {
    return {
        {"asset", hex(e.asset)},
        {"provider", hex(e.provider)},
        {"amount", e.amount},
        {"new_balance", e.new_balance}
    };
}

json encode(const PositionOpened& e) {
    return {
        {"market_id", e.market_id},
        {"owner", hex(e.owner)},
        {"size", e.size},
        {"collateral_amount", e.collateral_amount},
        {"entry_price", e.entry_price},
        {"direction", to_string(e.direction)},
        {"open_timestamp", e.open_timestamp}
    };
}

json encode(const PositionUpdated& e) {
    return {
        {"market_id", e.market_id},
        {"owner", hex(e.owner)},
        {"added_size", e.added_size},
        {"added_collateral", e.added_collateral},
        {"size", e.size},
        {"collateral_amount", e.collateral_amount},
        {"entry_price", e.entry_price},
        {"direction", to_string(e.direction)}
    };
}

json encode(const PositionClosed& e) {
    return {
        {"market_id", e.market_id},
        {"owner", hex(e.owner)},
        {"size", e.size},
        {"collateral_amount", e.collateral_amount},
        {"entry_price", e.entry_price},
        {"exit_price", e.exit_price},
        {"pnl", e.pnl},
        {"is_profit", e.is_profit},
        {"amount_returned", e.amount_returned},
        {"timestamp", e.timestamp}
    };
}

json encode(const PositionLiquidated& e) {
    return {
        {"market_id", e.market_id},
        {"owner", hex(e.owner)},
        {"liquidator", hex(e.liquidator)},
        {"size", e.size},
        {"collateral_amount", e.collateral_amount},
        {"loss", e.loss},
        {"exit_price", e.exit_price},
        {"reward", e.reward},
        {"timestamp", e.timestamp}
    };
}

json encode(const MarketPauseChanged& e) {
    return {{"market_id", e.market_id}, {"paused", e.paused}};
}

json encode(const LeverageUpdated& e) {
    return {
        {"market_id", e.market_id},
        {"old_leverage", e.old_leverage},
        {"new_leverage", e.new_leverage}
    };
}

json encode(const PriceUpdated& e) {
    return {{"feed_id", e.feed_id}, {"price", e.price}, {"timestamp", e.timestamp}};
}

json encode(const CapabilityTransferred& e) {
    return {
        {"capability_id", e.capability_id},
        {"role", to_string(e.role)},
        {"from", hex(e.from)},
        {"to", hex(e.to)}
    };
}

} // namespace

const char* event_name(const Event& event) {
    static constexpr const char* names[] = {
        "PoolCreated",
        "PriceFeedCreated",
        "MarketCreated",
        "LiquidityAdded",
        "LiquidityRemoved",
        "PositionOpened",
        "PositionUpdated",
        "PositionClosed",
        "PositionLiquidated",
        "MarketPauseChanged",
        "LeverageUpdated",
        "PriceUpdated",
        "CapabilityTransferred",
    };
    static_assert(std::size(names) == std::variant_size_v<Event>);
    return names[event.index()];
}

json to_json(const Event& event) {
    json out = std::visit([](const auto& e) { return encode(e); }, event);
    out["type"] = event_name(event);
    return out;
}

} // namespace tumo
