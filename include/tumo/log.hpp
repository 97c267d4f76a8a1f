#ifndef TUMO_LOG_HPP
#define TUMO_LOG_HPP

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace tumo::log {

// Process-wide "tumo" logger writing to stderr. Created on first use at info.
std::shared_ptr<spdlog::logger> logger();

// trace|debug|info|warn|error|critical|off; unknown names leave the level alone
bool set_level(std::string_view level);

} // namespace tumo::log

#endif // TUMO_LOG_HPP
