#ifndef TUMO_MATH_HPP
#define TUMO_MATH_HPP

#include <optional>

#include "types.hpp"

namespace tumo::math {

// =============================================================================
// PnL
// =============================================================================

// Unsigned magnitude plus sign. Equal prices give {0, false}.
struct PnL {
    uint64_t amount;
    bool is_profit;
};

// size * |exit - entry| / entry, with the product taken in 128 bits.
// Long profits when exit > entry, short profits when exit < entry.
// nullopt if entry is zero or the quotient does not fit 64 bits.
std::optional<PnL> calculate_pnl(uint64_t size, uint64_t entry_price,
                                 uint64_t exit_price, Direction direction);

// =============================================================================
// Position Arithmetic
// =============================================================================

// collateral * leverage >= size
bool has_sufficient_collateral(uint64_t collateral, uint8_t leverage, uint64_t size);

// (old_entry * old_size + price * added_size) / (old_size + added_size)
std::optional<uint64_t> weighted_entry_price(uint64_t old_entry, uint64_t old_size,
                                             uint64_t price, uint64_t added_size);

// size * (100 / leverage) / 100, integer division at each step.
// Leverage above 100 yields zero. nullopt for zero leverage.
std::optional<uint64_t> maintenance_margin(uint64_t size, uint8_t leverage);

// value * pct / 100 for pct in [0, 100]
uint64_t percent_of(uint64_t value, uint32_t pct);

// a + b, nullopt on 64-bit overflow
std::optional<uint64_t> checked_add(uint64_t a, uint64_t b);

} // namespace tumo::math

#endif // TUMO_MATH_HPP
