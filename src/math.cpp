// =============================================================================
// math.cpp - Margin and PnL arithmetic
// =============================================================================

#include "tumo/math.hpp"

namespace tumo::math {

namespace {

std::optional<uint64_t> narrow(U128 v) {
    if (v > U64_MAX_WIDE) return std::nullopt;
    return static_cast<uint64_t>(v);
}

} // namespace

// =============================================================================
// PnL
// =============================================================================

std::optional<PnL> calculate_pnl(uint64_t size, uint64_t entry_price,
                                 uint64_t exit_price, Direction direction) {
    if (entry_price == 0) return std::nullopt;

    bool is_profit = (direction == Direction::LONG)
        ? exit_price > entry_price
        : exit_price < entry_price;

    uint64_t diff = (exit_price > entry_price)
        ? exit_price - entry_price
        : entry_price - exit_price;

    U128 magnitude = static_cast<U128>(size) * diff / entry_price;
    auto amount = narrow(magnitude);
    if (!amount) return std::nullopt;

    return PnL{*amount, is_profit};
}

// =============================================================================
// Position Arithmetic
// =============================================================================

bool has_sufficient_collateral(uint64_t collateral, uint8_t leverage, uint64_t size) {
    return static_cast<U128>(collateral) * leverage >= size;
}

std::optional<uint64_t> weighted_entry_price(uint64_t old_entry, uint64_t old_size,
                                             uint64_t price, uint64_t added_size) {
    U128 total_size = static_cast<U128>(old_size) + added_size;
    if (total_size == 0) return std::nullopt;

    // Each product fits 128 bits; their sum can only exceed it near 2^128
    U128 old_value = static_cast<U128>(old_entry) * old_size;
    U128 new_value = static_cast<U128>(price) * added_size;
    if (old_value > ~static_cast<U128>(0) - new_value) return std::nullopt;

    return narrow((old_value + new_value) / total_size);
}

std::optional<uint64_t> maintenance_margin(uint64_t size, uint8_t leverage) {
    if (leverage == 0) return std::nullopt;
    uint64_t margin_pct = 100 / leverage;
    return narrow(static_cast<U128>(size) * margin_pct / 100);
}

uint64_t percent_of(uint64_t value, uint32_t pct) {
    if (pct >= 100) return value;
    return static_cast<uint64_t>(static_cast<U128>(value) * pct / 100);
}

std::optional<uint64_t> checked_add(uint64_t a, uint64_t b) {
    if (a > UINT64_MAX - b) return std::nullopt;
    return a + b;
}

} // namespace tumo::math
