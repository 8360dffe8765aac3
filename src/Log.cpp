/**
 * @file Log.cpp
 * @brief Library logger implementation
 */

#include "cfgbind/Log.hpp"
#include "cfgbind/Errors.hpp"
#include "cfgbind/Naming.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace cfgbind {

namespace {

constexpr const char* kLoggerName = "cfgbind";

} // anonymous namespace

std::shared_ptr<spdlog::logger> logger() {
    static auto log = [] {
        if (auto existing = spdlog::get(kLoggerName)) {
            return existing;
        }
        auto created = spdlog::stderr_color_mt(kLoggerName);
        created->set_level(spdlog::level::info);
        created->set_pattern("[%n] [%l] %v");
        return created;
    }();
    return log;
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
    const std::string lowered = to_lower(name);
    // from_str maps every unknown name to off
    const auto level = spdlog::level::from_str(lowered);
    if (level == spdlog::level::off && lowered != "off") {
        throw ConfigError("Unknown log level: '" + name + "'");
    }
    return level;
}

} // namespace cfgbind
