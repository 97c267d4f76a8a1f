#ifndef TUMO_MARKET_HPP
#define TUMO_MARKET_HPP

#include <map>
#include <optional>
#include <vector>

#include "types.hpp"

namespace tumo {

// =============================================================================
// Position
// =============================================================================

struct Position {
    Address owner;
    uint64_t size;               // Notional exposure
    uint64_t collateral_amount;
    uint64_t entry_price;        // Oracle scale; weighted average across merges
    Direction direction;
    uint64_t open_timestamp;     // ms, set on first open only
};

// =============================================================================
// Market Parameters
// =============================================================================

struct MarketParams {
    uint32_t market_id;
    Currency asset;       // Settlement asset, names the LiquidityPool
    uint64_t feed_id;     // PriceFeed used for every price read
    uint8_t leverage;     // 0 = engine default
};

// =============================================================================
// Market - Leverage cap, pause flag and the position table
// =============================================================================
//
// At most one Position per owner. insert() refuses to overwrite; merges go
// through find() and are written back in place.

class Market {
public:
    Market(uint32_t market_id, const Currency& asset, uint64_t feed_id, uint8_t leverage);

    uint32_t market_id() const { return market_id_; }
    const Currency& asset() const { return asset_; }
    uint64_t feed_id() const { return feed_id_; }

    uint8_t leverage() const { return leverage_; }
    void set_leverage(uint8_t leverage) { leverage_ = leverage; }

    bool is_paused() const { return is_paused_; }
    void set_paused(bool paused) { is_paused_ = paused; }

    // =========================================================================
    // Position Table
    // =========================================================================

    bool has_position(const Address& owner) const;
    Position* find(const Address& owner);
    const Position* find(const Address& owner) const;

    // false if owner already has a position
    bool insert(const Position& position);

    // Remove and return; nullopt if absent
    std::optional<Position> extract(const Address& owner);

    size_t position_count() const { return positions_.size(); }
    std::vector<Position> positions() const;

private:
    uint32_t market_id_;
    Currency asset_;
    uint64_t feed_id_;
    uint8_t leverage_;
    bool is_paused_ = false;
    std::map<Address, Position> positions_;
};

} // namespace tumo

#endif // TUMO_MARKET_HPP
