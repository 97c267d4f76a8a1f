// =============================================================================
// pool.cpp - LiquidityPool balance accounting
// =============================================================================

#include "tumo/pool.hpp"
#include "tumo/math.hpp"

namespace tumo {

uint64_t LiquidityPool::available() const {
    return (balance_ > locked_collateral_) ? balance_ - locked_collateral_ : 0;
}

int32_t LiquidityPool::deposit(uint64_t amount) {
    auto total = math::checked_add(balance_, amount);
    if (!total) {
        return errors::ARITHMETIC_OVERFLOW;
    }
    balance_ = *total;
    return errors::OK;
}

int32_t LiquidityPool::withdraw(uint64_t amount) {
    if (amount > balance_) {
        return errors::INSUFFICIENT_LIQUIDITY;
    }
    balance_ -= amount;
    return errors::OK;
}

void LiquidityPool::lock_collateral(uint64_t amount) {
    // Saturate: the locked sum never exceeds what deposits could have produced
    auto total = math::checked_add(locked_collateral_, amount);
    locked_collateral_ = total ? *total : UINT64_MAX;
}

void LiquidityPool::release_collateral(uint64_t amount) {
    locked_collateral_ = (amount > locked_collateral_) ? 0 : locked_collateral_ - amount;
}

} // namespace tumo
