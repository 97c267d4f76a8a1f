// =============================================================================
// oracle.cpp - PriceFeed updates
// =============================================================================

#include "tumo/oracle.hpp"

namespace tumo {

int32_t PriceFeed::update_price(uint64_t new_price, uint64_t timestamp_ms) {
    if (new_price == 0) {
        return errors::INVALID_PRICE;
    }

    if (timestamp_ms < last_updated_) {
        return errors::STALE_UPDATE;
    }

    price_ = new_price;
    last_updated_ = timestamp_ms;
    return errors::OK;
}

} // namespace tumo
