/**
 * @file Log.hpp
 * @brief Library logger
 *
 * All diagnostics go through one spdlog category logger named "cfgbind".
 * Applications may register their own logger under that name before the
 * first call to logger(); it is then used as-is.
 */

#ifndef CFGBIND_LOG_HPP
#define CFGBIND_LOG_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace cfgbind {

/**
 * @brief Get the "cfgbind" logger, creating it on first use
 *
 * The default logger writes to stderr at info level.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Change the level of the "cfgbind" logger
 */
void set_log_level(spdlog::level::level_enum level);

/**
 * @brief Parse a level name such as "debug" or "WARNING"
 *
 * Accepts spdlog's level names plus "warn" and "err", case-insensitively.
 *
 * @throws ConfigError if the name is not a level
 */
spdlog::level::level_enum parse_log_level(const std::string& name);

} // namespace cfgbind

#endif // CFGBIND_LOG_HPP
