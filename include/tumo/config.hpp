#ifndef TUMO_CONFIG_HPP
#define TUMO_CONFIG_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tumo {

// Invalid or unreadable configuration
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// General settings
struct GeneralConfig {
    std::string log_level = "info";
};

// Market defaults
struct MarketDefaults {
    uint8_t default_leverage = 10;   // Used when create_market is given 0
};

// Engine behavior switches. By default the liquidator receives all remaining
// collateral, liquidity calls ignore pause, and withdrawals are checked only
// against the raw pool balance.
struct PolicyConfig {
    uint32_t liquidation_reward_pct = 100;
    bool pause_blocks_liquidity = false;
    bool enforce_locked_collateral = false;
};

// Engine configuration
class EngineConfig {
public:
    GeneralConfig general;
    MarketDefaults market;
    PolicyConfig policy;

    EngineConfig() = default;

    // Load from file; ".json" parses as JSON, anything else as TOML
    static EngineConfig from_file(std::string_view path);

    // Load from TOML string (sections [general], [market], [policy])
    static EngineConfig from_toml(std::string_view content);

    // Load from JSON string with the same sections as objects
    static EngineConfig from_json(std::string_view content);

    // Throws ConfigError on out-of-range values
    void validate() const;

    // Builder methods
    EngineConfig& set_log_level(std::string_view level) {
        general.log_level = std::string(level);
        return *this;
    }

    EngineConfig& set_default_leverage(uint8_t leverage) {
        market.default_leverage = leverage;
        return *this;
    }

    EngineConfig& set_liquidation_reward_pct(uint32_t pct) {
        policy.liquidation_reward_pct = pct;
        return *this;
    }

    EngineConfig& block_liquidity_when_paused(bool enabled = true) {
        policy.pause_blocks_liquidity = enabled;
        return *this;
    }

    EngineConfig& enforce_locked_collateral(bool enabled = true) {
        policy.enforce_locked_collateral = enabled;
        return *this;
    }
};

} // namespace tumo

#endif // TUMO_CONFIG_HPP
