// =============================================================================
// market.cpp - Market position table
// =============================================================================

#include "tumo/market.hpp"

namespace tumo {

Market::Market(uint32_t market_id, const Currency& asset, uint64_t feed_id, uint8_t leverage)
    : market_id_(market_id), asset_(asset), feed_id_(feed_id), leverage_(leverage) {}

bool Market::has_position(const Address& owner) const {
    return positions_.find(owner) != positions_.end();
}

Position* Market::find(const Address& owner) {
    auto it = positions_.find(owner);
    return (it != positions_.end()) ? &it->second : nullptr;
}

const Position* Market::find(const Address& owner) const {
    auto it = positions_.find(owner);
    return (it != positions_.end()) ? &it->second : nullptr;
}

bool Market::insert(const Position& position) {
    return positions_.emplace(position.owner, position).second;
}

std::optional<Position> Market::extract(const Address& owner) {
    auto node = positions_.extract(owner);
    if (node.empty()) return std::nullopt;
    return std::move(node.mapped());
}

std::vector<Position> Market::positions() const {
    std::vector<Position> out;
    out.reserve(positions_.size());
    for (const auto& [owner, position] : positions_) {
        out.push_back(position);
    }
    return out;
}

} // namespace tumo
