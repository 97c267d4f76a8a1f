// =============================================================================
// types.cpp - Address parsing and enum names
// =============================================================================

#include "tumo/types.hpp"

namespace tumo {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

// =============================================================================
// Address
// =============================================================================

namespace address {

std::optional<Address> from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.empty() || hex.size() > 64) return std::nullopt;

    Address addr = {};
    // Walk from the least significant digit so short inputs are left-padded
    size_t nibble = 0;
    for (size_t i = hex.size(); i-- > 0; ++nibble) {
        int v = hex_value(hex[i]);
        if (v < 0) return std::nullopt;
        size_t byte = 31 - nibble / 2;
        if (nibble % 2 == 0) {
            addr[byte] = static_cast<uint8_t>(v);
        } else {
            addr[byte] |= static_cast<uint8_t>(v << 4);
        }
    }
    return addr;
}

std::string to_hex(const Address& addr) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + addr.size() * 2);
    for (auto b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

} // namespace address

// =============================================================================
// Enum Names
// =============================================================================

const char* to_string(Direction d) {
    switch (d) {
        case Direction::LONG: return "long";
        case Direction::SHORT: return "short";
    }
    return "invalid";
}

const char* to_string(Role r) {
    switch (r) {
        case Role::ADMIN: return "admin";
        case Role::LIQUIDITY_PROVIDER: return "liquidity_provider";
        case Role::ORACLE_OPERATOR: return "oracle_operator";
    }
    return "invalid";
}

namespace errors {

const char* to_string(int32_t code) {
    switch (code) {
        case OK: return "OK";
        case UNAUTHORIZED: return "Unauthorized";
        case MARKET_PAUSED: return "MarketPaused";
        case ZERO_AMOUNT: return "ZeroAmount";
        case INVALID_SIZE: return "InvalidSize";
        case INVALID_DIRECTION: return "InvalidDirection";
        case INVALID_PRICE: return "InvalidPrice";
        case INVALID_COLLATERAL: return "InvalidCollateral";
        case DIRECTION_MISMATCH: return "DirectionMismatch";
        case POSITION_NOT_FOUND: return "PositionNotFound";
        case INSUFFICIENT_LIQUIDITY: return "InsufficientLiquidity";
        case STALE_UPDATE: return "StaleUpdate";
        case CANNOT_LIQUIDATE: return "CannotLiquidate";
        case MARKET_NOT_FOUND: return "MarketNotFound";
        case POOL_NOT_FOUND: return "PoolNotFound";
        case FEED_NOT_FOUND: return "FeedNotFound";
        case ALREADY_EXISTS: return "AlreadyExists";
        case INVALID_CURRENCY: return "InvalidCurrency";
        case INVALID_LEVERAGE: return "InvalidLeverage";
        case ARITHMETIC_OVERFLOW: return "ArithmeticOverflow";
        default: return "Unknown";
    }
}

} // namespace errors

} // namespace tumo
