#ifndef TUMO_EVENTS_HPP
#define TUMO_EVENTS_HPP

#include <variant>
#include <vector>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"

namespace tumo {

// =============================================================================
// Event Records
// =============================================================================

struct PoolCreated {
    Currency asset;
};

struct PriceFeedCreated {
    uint64_t feed_id;
};

struct MarketCreated {
    uint32_t market_id;
    Currency asset;
    uint64_t feed_id;
    uint8_t leverage;
};

struct LiquidityAdded {
    Currency asset;
    Address provider;
    uint64_t amount;
    uint64_t new_balance;
};

struct LiquidityRemoved {
    Currency asset;
    Address provider;
    uint64_t amount;
    uint64_t new_balance;
};

struct PositionOpened {
    uint32_t market_id;
    Address owner;
    uint64_t size;
    uint64_t collateral_amount;
    uint64_t entry_price;
    Direction direction;
    uint64_t open_timestamp;
};

struct PositionUpdated {
    uint32_t market_id;
    Address owner;
    uint64_t added_size;
    uint64_t added_collateral;
    uint64_t size;
    uint64_t collateral_amount;
    uint64_t entry_price;
    Direction direction;
};

struct PositionClosed {
    uint32_t market_id;
    Address owner;
    uint64_t size;
    uint64_t collateral_amount;
    uint64_t entry_price;
    uint64_t exit_price;
    uint64_t pnl;
    bool is_profit;
    uint64_t amount_returned;
    uint64_t timestamp;
};

struct PositionLiquidated {
    uint32_t market_id;
    Address owner;
    Address liquidator;
    uint64_t size;
    uint64_t collateral_amount;
    uint64_t loss;
    uint64_t exit_price;
    uint64_t reward;
    uint64_t timestamp;
};

struct MarketPauseChanged {
    uint32_t market_id;
    bool paused;
};

struct LeverageUpdated {
    uint32_t market_id;
    uint8_t old_leverage;
    uint8_t new_leverage;
};

struct PriceUpdated {
    uint64_t feed_id;
    uint64_t price;
    uint64_t timestamp;
};

struct CapabilityTransferred {
    uint64_t capability_id;
    Role role;
    Address from;
    Address to;
};

using Event = std::variant<
    PoolCreated,
    PriceFeedCreated,
    MarketCreated,
    LiquidityAdded,
    LiquidityRemoved,
    PositionOpened,
    PositionUpdated,
    PositionClosed,
    PositionLiquidated,
    MarketPauseChanged,
    LeverageUpdated,
    PriceUpdated,
    CapabilityTransferred>;

// Record name, e.g. "PositionOpened"
const char* event_name(const Event& event);

// {"type": <name>, ...fields}; addresses as hex strings
nlohmann::json to_json(const Event& event);

// =============================================================================
// Event Sink Interface
// =============================================================================

// Fire-and-forget; called with the engine lock held, so implementations must
// not call back into the engine.
class IEventSink {
public:
    virtual ~IEventSink() = default;
    virtual void on_event(const Event& event) = 0;
};

// Discards everything
class NullEventSink : public IEventSink {
public:
    void on_event(const Event&) override {}
};

// Keeps every event in memory
class EventLog : public IEventSink {
public:
    void on_event(const Event& event) override { events_.push_back(event); }

    const std::vector<Event>& events() const { return events_; }
    size_t size() const { return events_.size(); }
    bool empty() const { return events_.empty(); }
    const Event& back() const { return events_.back(); }
    void clear() { events_.clear(); }

private:
    std::vector<Event> events_;
};

} // namespace tumo

#endif // TUMO_EVENTS_HPP
