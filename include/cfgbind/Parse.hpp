/**
 * @file Parse.hpp
 * @brief String-to-Value parsing utilities
 *
 * Environment variables and flag text arrive as strings. These helpers
 * turn them into typed Values or into a specific scalar kind.
 *
 * parse_value() order (first match wins):
 * - Boolean ("true", "false" - case insensitive)
 * - Null ("null" - case insensitive)
 * - Integer (-?[0-9]+ within int64)
 * - Float (-?[0-9]+.[0-9]+ with optional exponent)
 * - JSON compound ({...} or [...])
 * - Quoted string ("...")
 * - Raw string (fallback)
 */

#ifndef CFGBIND_PARSE_HPP
#define CFGBIND_PARSE_HPP

#include "cfgbind/Value.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace cfgbind {

/**
 * @brief Parse string value to appropriate type
 *
 * Examples:
 * ```cpp
 * parse_value("true")       // → true (boolean)
 * parse_value("78")         // → 78 (integer)
 * parse_value("-2.5e10")    // → -2.5e10 (float)
 * parse_value("[1,2,3]")    // → [1, 2, 3] (array)
 * parse_value("\"hello\"")  // → "hello" (string, unquoted)
 * parse_value("Sixth")      // → "Sixth" (string)
 * ```
 */
Value parse_value(const std::string& str);

/**
 * @brief Parse a boolean literal
 *
 * Accepts 1, t, true, 0, f, false in any letter case.
 */
std::optional<bool> parse_bool(const std::string& str);

/**
 * @brief Parse a whole string as a signed 64-bit integer
 *
 * Leading/trailing whitespace is ignored; anything else makes it fail.
 */
std::optional<std::int64_t> parse_integer(const std::string& str);

/**
 * @brief Parse a whole string as a double
 */
std::optional<double> parse_float(const std::string& str);

} // namespace cfgbind

#endif // CFGBIND_PARSE_HPP
