// =============================================================================
// config.cpp - EngineConfig loading
// =============================================================================

#include "tumo/config.hpp"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace tumo {

// Simple TOML parser (handles the flat key = value sections used here)
namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s[0] == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

std::string strip_comment(const std::string& s) {
    bool in_string = false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '"') in_string = !in_string;
        if (s[i] == '#' && !in_string) return s.substr(0, i);
    }
    return s;
}

bool parse_bool(const std::string& key, const std::string& value) {
    if (value == "true") return true;
    if (value == "false") return false;
    throw ConfigError("Expected true or false for " + key + ", got: " + value);
}

uint64_t parse_uint(const std::string& key, const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw ConfigError("Expected unsigned integer for " + key + ", got: " + value);
    }
    try {
        return std::stoull(value);
    } catch (const std::out_of_range&) {
        throw ConfigError("Value out of range for " + key + ": " + value);
    }
}

uint8_t parse_leverage(const std::string& key, uint64_t value) {
    if (value == 0 || value > UINT8_MAX) {
        throw ConfigError(key + " must be in [1, 255], got: " + std::to_string(value));
    }
    return static_cast<uint8_t>(value);
}

uint32_t parse_pct(const std::string& key, uint64_t value) {
    if (value > 100) {
        throw ConfigError(key + " must be in [0, 100], got: " + std::to_string(value));
    }
    return static_cast<uint32_t>(value);
}

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

EngineConfig EngineConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (ends_with(path, ".json")) {
        return from_json(buffer.str());
    }
    return from_toml(buffer.str());
}

EngineConfig EngineConfig::from_toml(std::string_view content) {
    EngineConfig config;
    std::string current_section;

    std::string content_str{content};
    std::istringstream stream{content_str};
    std::string line;
    size_t line_no = 0;

    while (std::getline(stream, line)) {
        ++line_no;
        line = trim(strip_comment(line));

        if (line.empty()) continue;

        // Section header
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                throw ConfigError("Unterminated section header at line " + std::to_string(line_no));
            }
            current_section = trim(line.substr(1, end - 1));
            continue;
        }

        // Key-value pair
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigError("Expected key = value at line " + std::to_string(line_no));
        }

        std::string key = trim(line.substr(0, eq));
        std::string value = unquote(trim(line.substr(eq + 1)));

        // Unknown keys are ignored so newer files load on older builds
        if (current_section == "general") {
            if (key == "log_level") config.general.log_level = value;
        }
        else if (current_section == "market") {
            if (key == "default_leverage") {
                config.market.default_leverage = parse_leverage(key, parse_uint(key, value));
            }
        }
        else if (current_section == "policy") {
            if (key == "liquidation_reward_pct") {
                config.policy.liquidation_reward_pct = parse_pct(key, parse_uint(key, value));
            }
            else if (key == "pause_blocks_liquidity") config.policy.pause_blocks_liquidity = parse_bool(key, value);
            else if (key == "enforce_locked_collateral") config.policy.enforce_locked_collateral = parse_bool(key, value);
        }
    }

    config.validate();
    return config;
}

EngineConfig EngineConfig::from_json(std::string_view content) {
    using json = nlohmann::json;

    EngineConfig config;
    json doc;
    try {
        doc = json::parse(std::string(content));
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("Invalid JSON config: ") + e.what());
    }

    if (!doc.is_object()) {
        throw ConfigError("JSON config must be an object");
    }

    try {
        if (auto it = doc.find("general"); it != doc.end()) {
            config.general.log_level = it->value("log_level", config.general.log_level);
        }
        if (auto it = doc.find("market"); it != doc.end()) {
            if (it->contains("default_leverage")) {
                config.market.default_leverage = parse_leverage(
                    "default_leverage", it->at("default_leverage").get<uint64_t>());
            }
        }
        if (auto it = doc.find("policy"); it != doc.end()) {
            if (it->contains("liquidation_reward_pct")) {
                config.policy.liquidation_reward_pct = parse_pct(
                    "liquidation_reward_pct", it->at("liquidation_reward_pct").get<uint64_t>());
            }
            config.policy.pause_blocks_liquidity =
                it->value("pause_blocks_liquidity", config.policy.pause_blocks_liquidity);
            config.policy.enforce_locked_collateral =
                it->value("enforce_locked_collateral", config.policy.enforce_locked_collateral);
        }
    } catch (const json::type_error& e) {
        throw ConfigError(std::string("Invalid JSON config value: ") + e.what());
    }

    config.validate();
    return config;
}

void EngineConfig::validate() const {
    if (market.default_leverage == 0) {
        throw ConfigError("market.default_leverage must be nonzero");
    }
    if (policy.liquidation_reward_pct > 100) {
        throw ConfigError("policy.liquidation_reward_pct must be in [0, 100], got: " +
                          std::to_string(policy.liquidation_reward_pct));
    }
    if (general.log_level.empty()) {
        throw ConfigError("general.log_level must not be empty");
    }
}

}  // namespace tumo
