// =============================================================================
// log.cpp - Process logger
// =============================================================================

#include "tumo/log.hpp"

#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace tumo::log {

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(once, [] {
        instance = spdlog::get("tumo");
        if (!instance) {
            instance = spdlog::stderr_color_mt("tumo");
            instance->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            instance->set_level(spdlog::level::info);
        }
    });
    return instance;
}

bool set_level(std::string_view level) {
    std::string name{level};
    auto parsed = spdlog::level::from_str(name);
    // from_str maps unknown names to off; only accept "off" when asked for it
    if (parsed == spdlog::level::off && name != "off") {
        return false;
    }
    logger()->set_level(parsed);
    return true;
}

} // namespace tumo::log
