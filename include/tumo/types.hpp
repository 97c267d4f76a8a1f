#ifndef TUMO_TYPES_HPP
#define TUMO_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <string_view>
#include <optional>

namespace tumo {

// =============================================================================
// Account Address (32 bytes)
// =============================================================================

using Address = std::array<uint8_t, 32>;

namespace address {

// Parse "0x"-prefixed (or bare) hex; shorter inputs are left-padded with zeros
std::optional<Address> from_hex(std::string_view hex);

// Full 64-digit lowercase hex with "0x" prefix
std::string to_hex(const Address& addr);

// Address whose last 8 bytes hold `value` (big-endian)
constexpr Address from_u64(uint64_t value) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[31 - i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
    }
    return addr;
}

} // namespace address

// =============================================================================
// Wide Integers
// =============================================================================

using U128 = unsigned __int128;

constexpr U128 U64_MAX_WIDE = static_cast<U128>(UINT64_MAX);

// =============================================================================
// Currency (Settlement Asset Type)
// =============================================================================

struct Currency {
    Address addr;

    Currency() : addr{} {}
    explicit Currency(const Address& a) : addr(a) {}

    bool operator==(const Currency& other) const { return addr == other.addr; }
    bool operator!=(const Currency& other) const { return addr != other.addr; }
    bool operator<(const Currency& other) const { return addr < other.addr; }
};

// =============================================================================
// Coin (a quantity of one asset entering or leaving the engine)
// =============================================================================

struct Coin {
    Currency asset;
    uint64_t value = 0;

    static Coin zero(const Currency& asset) { return Coin{asset, 0}; }
};

// =============================================================================
// Position Direction
// =============================================================================

// Wire codes: 1 = long, 2 = short
enum class Direction : uint8_t {
    LONG = 1,
    SHORT = 2
};

constexpr bool is_valid_direction(Direction d) {
    return d == Direction::LONG || d == Direction::SHORT;
}

const char* to_string(Direction d);

// =============================================================================
// Capability Roles
// =============================================================================

enum class Role : uint8_t {
    ADMIN = 0,
    LIQUIDITY_PROVIDER = 1,
    ORACLE_OPERATOR = 2
};

const char* to_string(Role r);

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t UNAUTHORIZED = -1;
constexpr int32_t MARKET_PAUSED = -2;
constexpr int32_t ZERO_AMOUNT = -3;
constexpr int32_t INVALID_SIZE = -4;
constexpr int32_t INVALID_DIRECTION = -5;
constexpr int32_t INVALID_PRICE = -6;
constexpr int32_t INVALID_COLLATERAL = -7;
constexpr int32_t DIRECTION_MISMATCH = -8;
constexpr int32_t POSITION_NOT_FOUND = -9;
constexpr int32_t INSUFFICIENT_LIQUIDITY = -10;
constexpr int32_t STALE_UPDATE = -11;
constexpr int32_t CANNOT_LIQUIDATE = -12;
constexpr int32_t MARKET_NOT_FOUND = -20;
constexpr int32_t POOL_NOT_FOUND = -21;
constexpr int32_t FEED_NOT_FOUND = -22;
constexpr int32_t ALREADY_EXISTS = -23;
constexpr int32_t INVALID_CURRENCY = -24;
constexpr int32_t INVALID_LEVERAGE = -25;
constexpr int32_t ARITHMETIC_OVERFLOW = -30;

const char* to_string(int32_t code);
}

} // namespace tumo

#endif // TUMO_TYPES_HPP
