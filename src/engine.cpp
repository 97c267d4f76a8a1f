// =============================================================================
// engine.cpp - MarginEngine: pools, markets, feeds and position lifecycle
// =============================================================================

#include "tumo/engine.hpp"
#include "tumo/log.hpp"
#include "tumo/math.hpp"

namespace tumo {

// =============================================================================
// Constructor
// =============================================================================

MarginEngine::MarginEngine(const Address& deployer, EngineConfig config, IEventSink* sink)
    : config_(std::move(config)), sink_(sink ? sink : &null_sink_) {
    config_.validate();
    if (!log::set_level(config_.general.log_level)) {
        throw ConfigError("Unknown log level: " + config_.general.log_level);
    }

    capabilities_.mint(Role::ADMIN, deployer);
    capabilities_.mint(Role::LIQUIDITY_PROVIDER, deployer);
    capabilities_.mint(Role::ORACLE_OPERATOR, deployer);
}

// =============================================================================
// Internal Helpers
// =============================================================================

Market* MarginEngine::find_market(uint32_t market_id) {
    auto it = markets_.find(market_id);
    return (it != markets_.end()) ? &it->second : nullptr;
}

const Market* MarginEngine::find_market(uint32_t market_id) const {
    auto it = markets_.find(market_id);
    return (it != markets_.end()) ? &it->second : nullptr;
}

LiquidityPool* MarginEngine::find_pool(const Currency& asset) {
    auto it = pools_.find(asset);
    return (it != pools_.end()) ? &it->second : nullptr;
}

const PriceFeed* MarginEngine::find_feed(uint64_t feed_id) const {
    auto it = feeds_.find(feed_id);
    return (it != feeds_.end()) ? &it->second : nullptr;
}

void MarginEngine::emit(const Event& event) {
    sink_->on_event(event);
}

int32_t MarginEngine::reject(const char* op, int32_t code) const {
    log::logger()->debug("{} rejected: {}", op, errors::to_string(code));
    return code;
}

// =============================================================================
// Capabilities
// =============================================================================

std::optional<Capability> MarginEngine::capability_of(const Address& holder, Role role) const {
    std::shared_lock lock(state_mutex_);
    return capabilities_.find(holder, role);
}

int32_t MarginEngine::transfer_capability(const Capability& cap, const Address& from,
                                          const Address& to) {
    std::unique_lock lock(state_mutex_);

    int32_t result = capabilities_.transfer(cap, from, to);
    if (result != errors::OK) {
        return reject("transfer_capability", result);
    }

    log::logger()->info("capability {} ({}) transferred to {}",
                        cap.id, to_string(cap.role), address::to_hex(to));
    emit(CapabilityTransferred{cap.id, cap.role, from, to});
    return errors::OK;
}

// =============================================================================
// Setup
// =============================================================================

int32_t MarginEngine::create_liquidity_pool(const Capability& admin_cap, const Address& caller,
                                            const Currency& asset) {
    std::unique_lock lock(state_mutex_);

    if (!capabilities_.verify(admin_cap, Role::ADMIN, caller)) {
        return reject("create_liquidity_pool", errors::UNAUTHORIZED);
    }

    if (pools_.find(asset) != pools_.end()) {
        return reject("create_liquidity_pool", errors::ALREADY_EXISTS);
    }

    pools_.emplace(asset, LiquidityPool(asset));

    log::logger()->info("pool created for asset {}", address::to_hex(asset.addr));
    emit(PoolCreated{asset});
    return errors::OK;
}

int32_t MarginEngine::create_price_feed(const Capability& oracle_cap, const Address& caller,
                                        uint64_t feed_id) {
    std::unique_lock lock(state_mutex_);

    if (!capabilities_.verify(oracle_cap, Role::ORACLE_OPERATOR, caller)) {
        return reject("create_price_feed", errors::UNAUTHORIZED);
    }

    if (feeds_.find(feed_id) != feeds_.end()) {
        return reject("create_price_feed", errors::ALREADY_EXISTS);
    }

    feeds_.emplace(feed_id, PriceFeed(feed_id));

    log::logger()->info("price feed {} created", feed_id);
    emit(PriceFeedCreated{feed_id});
    return errors::OK;
}

int32_t MarginEngine::create_market(const Capability& admin_cap, const Address& caller,
                                    const MarketParams& params) {
    std::unique_lock lock(state_mutex_);

    if (!capabilities_.verify(admin_cap, Role::ADMIN, caller)) {
        return reject("create_market", errors::UNAUTHORIZED);
    }

    if (markets_.find(params.market_id) != markets_.end()) {
        return reject("create_market", errors::ALREADY_EXISTS);
    }

    if (pools_.find(params.asset) == pools_.end()) {
        return reject("create_market", errors::POOL_NOT_FOUND);
    }

    if (!find_feed(params.feed_id)) {
        return reject("create_market", errors::FEED_NOT_FOUND);
    }

    uint8_t leverage = params.leverage ? params.leverage : config_.market.default_leverage;
    markets_.emplace(params.market_id,
                     Market(params.market_id, params.asset, params.feed_id, leverage));

    log::logger()->info("market {} created (feed {}, leverage {}x)",
                        params.market_id, params.feed_id, leverage);
    emit(MarketCreated{params.market_id, params.asset, params.feed_id, leverage});
    return errors::OK;
}

// =============================================================================
// Liquidity
// =============================================================================

int32_t MarginEngine::add_liquidity(const Capability& lp_cap, const Address& caller,
                                    const Coin& coin) {
    std::unique_lock lock(state_mutex_);

    if (!capabilities_.verify(lp_cap, Role::LIQUIDITY_PROVIDER, caller)) {
        return reject("add_liquidity", errors::UNAUTHORIZED);
    }

    if (coin.value == 0) {
        return reject("add_liquidity", errors::ZERO_AMOUNT);
    }

    LiquidityPool* pool = find_pool(coin.asset);
    if (!pool) {
        return reject("add_liquidity", errors::POOL_NOT_FOUND);
    }

    if (config_.policy.pause_blocks_liquidity) {
        for (const auto& [id, market] : markets_) {
            if (market.asset() == coin.asset && market.is_paused()) {
                return reject("add_liquidity", errors::MARKET_PAUSED);
            }
        }
    }

    int32_t result = pool->deposit(coin.value);
    if (result != errors::OK) {
        return reject("add_liquidity", result);
    }

    log::logger()->info("liquidity added: {} (pool balance {})", coin.value, pool->balance());
    emit(LiquidityAdded{coin.asset, caller, coin.value, pool->balance()});
    return errors::OK;
}

WithdrawResult MarginEngine::remove_liquidity(const Capability& lp_cap, const Address& caller,
                                              const Currency& asset, uint64_t amount) {
    WithdrawResult out{errors::OK, Coin::zero(asset)};
    std::unique_lock lock(state_mutex_);

    if (!capabilities_.verify(lp_cap, Role::LIQUIDITY_PROVIDER, caller)) {
        out.status = reject("remove_liquidity", errors::UNAUTHORIZED);
        return out;
    }

    if (amount == 0) {
        out.status = reject("remove_liquidity", errors::ZERO_AMOUNT);
        return out;
    }

    LiquidityPool* pool = find_pool(asset);
    if (!pool) {
        out.status = reject("remove_liquidity", errors::POOL_NOT_FOUND);
        return out;
    }

    if (config_.policy.pause_blocks_liquidity) {
        for (const auto& [id, market] : markets_) {
            if (market.asset() == asset && market.is_paused()) {
                out.status = reject("remove_liquidity", errors::MARKET_PAUSED);
                return out;
            }
        }
    }

    // Without this policy providers may withdraw collateral backing open
    // positions; only the raw balance bounds the withdrawal.
    if (config_.policy.enforce_locked_collateral && amount > pool->available()) {
        out.status = reject("remove_liquidity", errors::INSUFFICIENT_LIQUIDITY);
        return out;
    }

    int32_t result = pool->withdraw(amount);
    if (result != errors::OK) {
        out.status = reject("remove_liquidity", result);
        return out;
    }

    out.coin.value = amount;

    log::logger()->info("liquidity removed: {} (pool balance {})", amount, pool->balance());
    emit(LiquidityRemoved{asset, caller, amount, pool->balance()});
    return out;
}

// =============================================================================
// Position Lifecycle
// =============================================================================

OpenResult MarginEngine::open_position(uint32_t market_id, const Address& caller, uint64_t size,
                                       Direction direction, const Coin& collateral,
                                       uint64_t now_ms) {
    OpenResult out{errors::OK, false, std::nullopt};
    std::unique_lock lock(state_mutex_);

    Market* market = find_market(market_id);
    if (!market) {
        out.status = reject("open_position", errors::MARKET_NOT_FOUND);
        return out;
    }

    if (market->is_paused()) {
        out.status = reject("open_position", errors::MARKET_PAUSED);
        return out;
    }

    if (size == 0) {
        out.status = reject("open_position", errors::INVALID_SIZE);
        return out;
    }

    if (!is_valid_direction(direction)) {
        out.status = reject("open_position", errors::INVALID_DIRECTION);
        return out;
    }

    if (collateral.asset != market->asset()) {
        out.status = reject("open_position", errors::INVALID_CURRENCY);
        return out;
    }

    LiquidityPool* pool = find_pool(market->asset());
    if (!pool) {
        out.status = reject("open_position", errors::POOL_NOT_FOUND);
        return out;
    }

    const PriceFeed* feed = find_feed(market->feed_id());
    if (!feed) {
        out.status = reject("open_position", errors::FEED_NOT_FOUND);
        return out;
    }

    uint64_t price = feed->get_price().price;
    if (price == 0) {
        out.status = reject("open_position", errors::INVALID_PRICE);
        return out;
    }

    uint8_t leverage = market->leverage();
    Position* existing = market->find(caller);

    if (!existing) {
        if (collateral.value == 0 ||
            !math::has_sufficient_collateral(collateral.value, leverage, size)) {
            out.status = reject("open_position", errors::INVALID_COLLATERAL);
            return out;
        }

        Position position{
            .owner = caller,
            .size = size,
            .collateral_amount = collateral.value,
            .entry_price = price,
            .direction = direction,
            .open_timestamp = now_ms
        };

        // Deposit is the only fallible write, so it goes first
        int32_t result = pool->deposit(collateral.value);
        if (result != errors::OK) {
            out.status = reject("open_position", result);
            return out;
        }
        pool->lock_collateral(collateral.value);
        market->insert(position);
        ++positions_opened_;

        log::logger()->info("market {}: {} opened {} {} @ {} (collateral {})",
                            market_id, address::to_hex(caller), to_string(direction),
                            size, price, collateral.value);
        emit(PositionOpened{market_id, caller, size, collateral.value, price,
                            direction, now_ms});

        out.position = position;
        return out;
    }

    // Merge into the existing position
    if (existing->direction != direction) {
        out.status = reject("open_position", errors::DIRECTION_MISMATCH);
        return out;
    }

    auto new_size = math::checked_add(existing->size, size);
    auto new_collateral = math::checked_add(existing->collateral_amount, collateral.value);
    if (!new_size || !new_collateral) {
        out.status = reject("open_position", errors::ARITHMETIC_OVERFLOW);
        return out;
    }

    if (!math::has_sufficient_collateral(*new_collateral, leverage, *new_size)) {
        out.status = reject("open_position", errors::INVALID_COLLATERAL);
        return out;
    }

    auto new_entry = math::weighted_entry_price(existing->entry_price, existing->size,
                                                price, size);
    if (!new_entry) {
        out.status = reject("open_position", errors::ARITHMETIC_OVERFLOW);
        return out;
    }

    int32_t result = pool->deposit(collateral.value);
    if (result != errors::OK) {
        out.status = reject("open_position", result);
        return out;
    }
    pool->lock_collateral(collateral.value);

    existing->size = *new_size;
    existing->collateral_amount = *new_collateral;
    existing->entry_price = *new_entry;
    ++positions_merged_;

    log::logger()->info("market {}: {} increased {} by {} to {} @ avg {}",
                        market_id, address::to_hex(caller), to_string(direction),
                        size, existing->size, existing->entry_price);
    emit(PositionUpdated{market_id, caller, size, collateral.value, existing->size,
                         existing->collateral_amount, existing->entry_price, direction});

    out.merged = true;
    out.position = *existing;
    return out;
}

CloseResult MarginEngine::close_position(uint32_t market_id, const Address& caller,
                                         uint64_t now_ms) {
    CloseResult out{errors::OK, 0, false, 0, Coin{}};
    std::unique_lock lock(state_mutex_);

    Market* market = find_market(market_id);
    if (!market) {
        out.status = reject("close_position", errors::MARKET_NOT_FOUND);
        return out;
    }
    out.payout = Coin::zero(market->asset());

    if (market->is_paused()) {
        out.status = reject("close_position", errors::MARKET_PAUSED);
        return out;
    }

    const Position* position = market->find(caller);
    if (!position) {
        out.status = reject("close_position", errors::POSITION_NOT_FOUND);
        return out;
    }

    LiquidityPool* pool = find_pool(market->asset());
    if (!pool) {
        out.status = reject("close_position", errors::POOL_NOT_FOUND);
        return out;
    }

    const PriceFeed* feed = find_feed(market->feed_id());
    if (!feed) {
        out.status = reject("close_position", errors::FEED_NOT_FOUND);
        return out;
    }

    uint64_t exit_price = feed->get_price().price;
    if (exit_price == 0) {
        out.status = reject("close_position", errors::INVALID_PRICE);
        return out;
    }

    auto pnl = math::calculate_pnl(position->size, position->entry_price, exit_price,
                                   position->direction);
    if (!pnl) {
        out.status = reject("close_position", errors::ARITHMETIC_OVERFLOW);
        return out;
    }

    // A loss at or beyond the collateral returns nothing; no debt is recorded
    uint64_t return_amount = 0;
    if (pnl->is_profit) {
        auto total = math::checked_add(position->collateral_amount, pnl->amount);
        if (!total) {
            out.status = reject("close_position", errors::ARITHMETIC_OVERFLOW);
            return out;
        }
        return_amount = *total;
    } else if (position->collateral_amount > pnl->amount) {
        return_amount = position->collateral_amount - pnl->amount;
    }

    // Payout is the last fallible step; the position is removed only after it
    int32_t result = pool->withdraw(return_amount);
    if (result != errors::OK) {
        out.status = reject("close_position", result);
        return out;
    }

    Position closed = *market->extract(caller);
    pool->release_collateral(closed.collateral_amount);
    ++positions_closed_;

    out.pnl = pnl->amount;
    out.is_profit = pnl->is_profit;
    out.exit_price = exit_price;
    out.payout.value = return_amount;

    log::logger()->info("market {}: {} closed {} {} @ {} ({} {}, returned {})",
                        market_id, address::to_hex(caller), to_string(closed.direction),
                        closed.size, exit_price, pnl->is_profit ? "profit" : "loss",
                        pnl->amount, return_amount);
    emit(PositionClosed{market_id, caller, closed.size, closed.collateral_amount,
                        closed.entry_price, exit_price, pnl->amount, pnl->is_profit,
                        return_amount, now_ms});
    return out;
}

LiquidationResult MarginEngine::liquidate(uint32_t market_id, const Address& liquidator,
                                          const Address& owner, uint64_t now_ms) {
    LiquidationResult out{};
    out.status = errors::OK;
    out.owner = owner;
    out.liquidator = liquidator;
    std::unique_lock lock(state_mutex_);

    Market* market = find_market(market_id);
    if (!market) {
        out.status = reject("liquidate", errors::MARKET_NOT_FOUND);
        return out;
    }
    out.reward = Coin::zero(market->asset());

    if (market->is_paused()) {
        out.status = reject("liquidate", errors::MARKET_PAUSED);
        return out;
    }

    const Position* position = market->find(owner);
    if (!position) {
        out.status = reject("liquidate", errors::POSITION_NOT_FOUND);
        return out;
    }

    LiquidityPool* pool = find_pool(market->asset());
    if (!pool) {
        out.status = reject("liquidate", errors::POOL_NOT_FOUND);
        return out;
    }

    const PriceFeed* feed = find_feed(market->feed_id());
    if (!feed) {
        out.status = reject("liquidate", errors::FEED_NOT_FOUND);
        return out;
    }

    uint64_t exit_price = feed->get_price().price;
    if (exit_price == 0) {
        out.status = reject("liquidate", errors::INVALID_PRICE);
        return out;
    }

    auto pnl = math::calculate_pnl(position->size, position->entry_price, exit_price,
                                   position->direction);
    if (!pnl) {
        out.status = reject("liquidate", errors::ARITHMETIC_OVERFLOW);
        return out;
    }

    // A position in profit is never liquidatable
    if (pnl->is_profit) {
        out.status = reject("liquidate", errors::CANNOT_LIQUIDATE);
        return out;
    }

    auto maintenance = math::maintenance_margin(position->size, market->leverage());
    if (!maintenance) {
        out.status = reject("liquidate", errors::INVALID_LEVERAGE);
        return out;
    }

    uint64_t loss = pnl->amount;
    bool bankrupt = loss >= position->collateral_amount;
    uint64_t remaining = bankrupt ? 0 : position->collateral_amount - loss;

    if (!bankrupt && remaining >= *maintenance) {
        out.status = reject("liquidate", errors::CANNOT_LIQUIDATE);
        return out;
    }

    uint64_t reward = math::percent_of(remaining, config_.policy.liquidation_reward_pct);
    int32_t result = pool->withdraw(reward);
    if (result != errors::OK) {
        out.status = reject("liquidate", result);
        return out;
    }

    Position liquidated = *market->extract(owner);
    pool->release_collateral(liquidated.collateral_amount);
    ++positions_liquidated_;

    out.size = liquidated.size;
    out.collateral_amount = liquidated.collateral_amount;
    out.loss = loss;
    out.exit_price = exit_price;
    out.bankrupt = bankrupt;
    out.reward.value = reward;

    log::logger()->info("market {}: {} liquidated by {} (size {}, loss {}, reward {})",
                        market_id, address::to_hex(owner), address::to_hex(liquidator),
                        liquidated.size, loss, reward);
    emit(PositionLiquidated{market_id, owner, liquidator, liquidated.size,
                            liquidated.collateral_amount, loss, exit_price, reward,
                            now_ms});
    return out;
}

// =============================================================================
// Oracle
// =============================================================================

int32_t MarginEngine::update_price(const Capability& oracle_cap, const Address& caller,
                                   uint64_t feed_id, uint64_t new_price, uint64_t now_ms) {
    std::unique_lock lock(state_mutex_);

    if (!capabilities_.verify(oracle_cap, Role::ORACLE_OPERATOR, caller)) {
        return reject("update_price", errors::UNAUTHORIZED);
    }

    auto it = feeds_.find(feed_id);
    if (it == feeds_.end()) {
        return reject("update_price", errors::FEED_NOT_FOUND);
    }

    int32_t result = it->second.update_price(new_price, now_ms);
    if (result != errors::OK) {
        return reject("update_price", result);
    }

    log::logger()->debug("feed {} price {} @ {}", feed_id, new_price, now_ms);
    emit(PriceUpdated{feed_id, new_price, now_ms});
    return errors::OK;
}

std::optional<PriceData> MarginEngine::get_price(uint64_t feed_id) const {
    std::shared_lock lock(state_mutex_);
    const PriceFeed* feed = find_feed(feed_id);
    if (!feed) return std::nullopt;
    return feed->get_price();
}

// =============================================================================
// Market Administration
// =============================================================================

int32_t MarginEngine::set_paused(const Capability& admin_cap, const Address& caller,
                                 uint32_t market_id, bool paused) {
    std::unique_lock lock(state_mutex_);

    if (!capabilities_.verify(admin_cap, Role::ADMIN, caller)) {
        return reject("set_paused", errors::UNAUTHORIZED);
    }

    Market* market = find_market(market_id);
    if (!market) {
        return reject("set_paused", errors::MARKET_NOT_FOUND);
    }

    market->set_paused(paused);

    log::logger()->info("market {} {}", market_id, paused ? "paused" : "resumed");
    emit(MarketPauseChanged{market_id, paused});
    return errors::OK;
}

int32_t MarginEngine::edit_market_leverage(const Capability& admin_cap, const Address& caller,
                                           uint32_t market_id, uint8_t new_leverage) {
    std::unique_lock lock(state_mutex_);

    if (!capabilities_.verify(admin_cap, Role::ADMIN, caller)) {
        return reject("edit_market_leverage", errors::UNAUTHORIZED);
    }

    // Zero would divide by zero in the maintenance margin
    if (new_leverage == 0) {
        return reject("edit_market_leverage", errors::INVALID_LEVERAGE);
    }

    Market* market = find_market(market_id);
    if (!market) {
        return reject("edit_market_leverage", errors::MARKET_NOT_FOUND);
    }

    uint8_t old_leverage = market->leverage();
    market->set_leverage(new_leverage);

    log::logger()->info("market {} leverage {}x -> {}x", market_id, old_leverage, new_leverage);
    emit(LeverageUpdated{market_id, old_leverage, new_leverage});
    return errors::OK;
}

// =============================================================================
// Queries
// =============================================================================

std::optional<MarketInfo> MarginEngine::get_market(uint32_t market_id) const {
    std::shared_lock lock(state_mutex_);
    const Market* market = find_market(market_id);
    if (!market) return std::nullopt;
    return MarketInfo{market->market_id(), market->asset(), market->feed_id(),
                      market->leverage(), market->is_paused(), market->position_count()};
}

std::optional<bool> MarginEngine::is_paused(uint32_t market_id) const {
    std::shared_lock lock(state_mutex_);
    const Market* market = find_market(market_id);
    if (!market) return std::nullopt;
    return market->is_paused();
}

std::optional<uint8_t> MarginEngine::leverage(uint32_t market_id) const {
    std::shared_lock lock(state_mutex_);
    const Market* market = find_market(market_id);
    if (!market) return std::nullopt;
    return market->leverage();
}

std::optional<Position> MarginEngine::get_position(uint32_t market_id,
                                                   const Address& owner) const {
    std::shared_lock lock(state_mutex_);
    const Market* market = find_market(market_id);
    if (!market) return std::nullopt;

    const Position* position = market->find(owner);
    if (!position) return std::nullopt;
    return *position;
}

std::vector<Position> MarginEngine::get_positions(uint32_t market_id) const {
    std::shared_lock lock(state_mutex_);
    const Market* market = find_market(market_id);
    if (!market) return {};
    return market->positions();
}

std::optional<uint64_t> MarginEngine::pool_balance(const Currency& asset) const {
    std::shared_lock lock(state_mutex_);
    auto it = pools_.find(asset);
    if (it == pools_.end()) return std::nullopt;
    return it->second.balance();
}

std::optional<uint64_t> MarginEngine::locked_collateral(const Currency& asset) const {
    std::shared_lock lock(state_mutex_);
    auto it = pools_.find(asset);
    if (it == pools_.end()) return std::nullopt;
    return it->second.locked_collateral();
}

// =============================================================================
// Statistics
// =============================================================================

MarginEngine::Stats MarginEngine::get_stats() const {
    std::shared_lock lock(state_mutex_);

    Stats stats{};
    stats.total_pools = pools_.size();
    stats.total_feeds = feeds_.size();
    stats.total_markets = markets_.size();
    for (const auto& [id, market] : markets_) {
        stats.open_positions += market.position_count();
    }
    stats.positions_opened = positions_opened_;
    stats.positions_merged = positions_merged_;
    stats.positions_closed = positions_closed_;
    stats.positions_liquidated = positions_liquidated_;
    return stats;
}

} // namespace tumo
