#ifndef TUMO_POOL_HPP
#define TUMO_POOL_HPP

#include "types.hpp"

namespace tumo {

// =============================================================================
// LiquidityPool - Pooled balance of one settlement asset
// =============================================================================
//
// Holds liquidity-provider capital and trader collateral together. The balance
// only moves through deposit() and withdraw(); withdraw() is checked against
// the current balance so it can never go negative.
//
// locked_collateral() sums the collateral of open positions settled here. It is
// bookkeeping; the engine consults it only when its policy asks it to.
//
// Not thread-safe on its own: the owning MarginEngine serializes access.

class LiquidityPool {
public:
    explicit LiquidityPool(const Currency& asset) : asset_(asset) {}

    const Currency& asset() const { return asset_; }
    uint64_t balance() const { return balance_; }
    uint64_t locked_collateral() const { return locked_collateral_; }

    // balance - locked_collateral, floored at zero
    uint64_t available() const;

    // =========================================================================
    // Balance Movements
    // =========================================================================

    // ARITHMETIC_OVERFLOW if the new balance does not fit
    int32_t deposit(uint64_t amount);

    // INSUFFICIENT_LIQUIDITY if amount > balance
    int32_t withdraw(uint64_t amount);

    // =========================================================================
    // Collateral Bookkeeping
    // =========================================================================

    void lock_collateral(uint64_t amount);
    void release_collateral(uint64_t amount);

private:
    Currency asset_;
    uint64_t balance_ = 0;
    uint64_t locked_collateral_ = 0;
};

} // namespace tumo

#endif // TUMO_POOL_HPP
