/**
 * @file Naming.hpp
 * @brief Canonical external names for record fields
 *
 * A field declared as `FirstParam` is exposed on the command line as
 * `--first-param`. The derivation is total, deterministic and idempotent:
 * applying it to its own output returns the same string.
 */

#ifndef CFGBIND_NAMING_HPP
#define CFGBIND_NAMING_HPP

#include <string>

namespace cfgbind {

/**
 * @brief Convert an identifier to hyphen-delimited lower case
 *
 * Word boundaries:
 * - lower-case letter or digit followed by an upper-case letter
 * - end of an acronym (upper followed by upper+lower: "HTTPServer")
 * - any of '_', '-', '.', ' ' (collapsed, never leading or trailing)
 *
 * Examples:
 * - "FirstParam"   -> "first-param"
 * - "HTTPServer"   -> "http-server"
 * - "snake_case"   -> "snake-case"
 * - "first-param"  -> "first-param"
 *
 * @param identifier Field identifier
 * @return Canonical flag name
 */
std::string to_kebab_case(const std::string& identifier);

/**
 * @brief Convert string to lowercase (ASCII)
 */
std::string to_lower(std::string s);

/**
 * @brief Convert string to uppercase (ASCII)
 */
std::string to_upper(std::string s);

/**
 * @brief Case-insensitive ASCII equality
 */
bool iequals(const std::string& a, const std::string& b);

} // namespace cfgbind

#endif // CFGBIND_NAMING_HPP
