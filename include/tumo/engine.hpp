#ifndef TUMO_ENGINE_HPP
#define TUMO_ENGINE_HPP

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "types.hpp"
#include "auth.hpp"
#include "config.hpp"
#include "events.hpp"
#include "market.hpp"
#include "oracle.hpp"
#include "pool.hpp"

namespace tumo {

// =============================================================================
// Call Results
// =============================================================================

struct OpenResult {
    int32_t status;
    bool merged;                     // true when an existing position grew
    std::optional<Position> position;
};

struct CloseResult {
    int32_t status;
    uint64_t pnl;
    bool is_profit;
    uint64_t exit_price;
    Coin payout;                     // Paid to the position owner
};

struct LiquidationResult {
    int32_t status;
    Address owner;
    Address liquidator;
    uint64_t size;
    uint64_t collateral_amount;
    uint64_t loss;
    uint64_t exit_price;
    bool bankrupt;                   // loss >= collateral
    Coin reward;                     // Paid to the liquidator
};

struct MarketInfo {
    uint32_t market_id;
    Currency asset;
    uint64_t feed_id;
    uint8_t leverage;
    bool is_paused;
    size_t open_positions;
};

struct WithdrawResult {
    int32_t status;
    Coin coin;
};

// =============================================================================
// MarginEngine - Pools, markets, feeds and the position lifecycle
// =============================================================================
//
// Every mutating call runs under one exclusive lock and checks every
// precondition before its first write, so a call either commits fully or
// returns an error with no state change. Reads take a shared lock.
//
// The deployer passed to the constructor receives one capability per role.
// Construction applies general.log_level to the process logger and throws
// ConfigError for an invalid config or an unknown level name.

class MarginEngine {
public:
    explicit MarginEngine(const Address& deployer, EngineConfig config = {},
                          IEventSink* sink = nullptr);
    ~MarginEngine() = default;

    // Non-copyable
    MarginEngine(const MarginEngine&) = delete;
    MarginEngine& operator=(const MarginEngine&) = delete;

    const EngineConfig& config() const { return config_; }

    // =========================================================================
    // Capabilities
    // =========================================================================

    std::optional<Capability> capability_of(const Address& holder, Role role) const;
    int32_t transfer_capability(const Capability& cap, const Address& from, const Address& to);

    // =========================================================================
    // Setup (admin / oracle operator)
    // =========================================================================

    int32_t create_liquidity_pool(const Capability& admin_cap, const Address& caller,
                                  const Currency& asset);
    int32_t create_price_feed(const Capability& oracle_cap, const Address& caller,
                              uint64_t feed_id);
    int32_t create_market(const Capability& admin_cap, const Address& caller,
                          const MarketParams& params);

    // =========================================================================
    // Liquidity (liquidity provider)
    // =========================================================================

    int32_t add_liquidity(const Capability& lp_cap, const Address& caller, const Coin& coin);
    WithdrawResult remove_liquidity(const Capability& lp_cap, const Address& caller,
                                    const Currency& asset, uint64_t amount);

    // =========================================================================
    // Position Lifecycle
    // =========================================================================

    OpenResult open_position(uint32_t market_id, const Address& caller, uint64_t size,
                             Direction direction, const Coin& collateral, uint64_t now_ms);

    CloseResult close_position(uint32_t market_id, const Address& caller, uint64_t now_ms);

    // Callable by anyone; the reward goes to `liquidator`
    LiquidationResult liquidate(uint32_t market_id, const Address& liquidator,
                                const Address& owner, uint64_t now_ms);

    // =========================================================================
    // Oracle (oracle operator)
    // =========================================================================

    int32_t update_price(const Capability& oracle_cap, const Address& caller,
                         uint64_t feed_id, uint64_t new_price, uint64_t now_ms);
    std::optional<PriceData> get_price(uint64_t feed_id) const;

    // =========================================================================
    // Market Administration (admin)
    // =========================================================================

    int32_t set_paused(const Capability& admin_cap, const Address& caller,
                       uint32_t market_id, bool paused);
    int32_t edit_market_leverage(const Capability& admin_cap, const Address& caller,
                                 uint32_t market_id, uint8_t new_leverage);

    // =========================================================================
    // Queries
    // =========================================================================

    std::optional<MarketInfo> get_market(uint32_t market_id) const;
    std::optional<bool> is_paused(uint32_t market_id) const;
    std::optional<uint8_t> leverage(uint32_t market_id) const;
    std::optional<Position> get_position(uint32_t market_id, const Address& owner) const;
    std::vector<Position> get_positions(uint32_t market_id) const;
    std::optional<uint64_t> pool_balance(const Currency& asset) const;
    std::optional<uint64_t> locked_collateral(const Currency& asset) const;

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_pools;
        uint64_t total_feeds;
        uint64_t total_markets;
        uint64_t open_positions;
        uint64_t positions_opened;
        uint64_t positions_merged;
        uint64_t positions_closed;
        uint64_t positions_liquidated;
    };
    Stats get_stats() const;

private:
    EngineConfig config_;
    IEventSink* sink_;
    NullEventSink null_sink_;

    // Guards everything below
    mutable std::shared_mutex state_mutex_;

    CapabilityRegistry capabilities_;
    std::map<Currency, LiquidityPool> pools_;
    std::unordered_map<uint64_t, PriceFeed> feeds_;
    std::map<uint32_t, Market> markets_;

    uint64_t positions_opened_ = 0;
    uint64_t positions_merged_ = 0;
    uint64_t positions_closed_ = 0;
    uint64_t positions_liquidated_ = 0;

    // Lookups (caller holds state_mutex_)
    Market* find_market(uint32_t market_id);
    const Market* find_market(uint32_t market_id) const;
    LiquidityPool* find_pool(const Currency& asset);
    const PriceFeed* find_feed(uint64_t feed_id) const;

    void emit(const Event& event);
    int32_t reject(const char* op, int32_t code) const;
};

} // namespace tumo

#endif // TUMO_ENGINE_HPP
