#ifndef TUMO_ORACLE_HPP
#define TUMO_ORACLE_HPP

#include "types.hpp"

namespace tumo {

// =============================================================================
// Price Data
// =============================================================================

struct PriceData {
    uint64_t price;          // Fixed-point, scale agreed with the operator
    uint64_t last_updated;   // ms
};

// =============================================================================
// PriceFeed - Monotonic, staleness-protected price storage
// =============================================================================
//
// Starts at {0, 0}. An update must carry a nonzero price and a timestamp no
// earlier than the stored one; equal timestamps are accepted.

class PriceFeed {
public:
    explicit PriceFeed(uint64_t feed_id) : feed_id_(feed_id) {}

    uint64_t feed_id() const { return feed_id_; }

    // INVALID_PRICE for zero, STALE_UPDATE for timestamp < last_updated
    int32_t update_price(uint64_t new_price, uint64_t timestamp_ms);

    PriceData get_price() const { return {price_, last_updated_}; }

private:
    uint64_t feed_id_;
    uint64_t price_ = 0;
    uint64_t last_updated_ = 0;
};

} // namespace tumo

#endif // TUMO_ORACLE_HPP
