/**
 * @file DotPath.hpp
 * @brief Dot-notation path utilities for nested configuration access
 *
 * Store keys are dot-separated paths like "nested.fifthparam" or
 * "environments.0.name". Rules:
 * - find_by_dot() returns nullptr for missing segments, but raises
 *   for traversal into a scalar
 * - set_by_dot() creates intermediate objects and overwrites scalars on
 *   the way
 */

#ifndef CFGBIND_DOTPATH_HPP
#define CFGBIND_DOTPATH_HPP

#include "cfgbind/Value.hpp"
#include "cfgbind/Errors.hpp"

#include <string>
#include <vector>

namespace cfgbind {

/**
 * @brief Split a dot-path into segments
 *
 * Empty segments are dropped: "a..b" → ["a", "b"], "" → [].
 */
std::vector<std::string> split_dot_path(const std::string& path);

/**
 * @brief Join path segments with dots, skipping empty segments
 *
 * join_dot_path({"", "name"}) → "name", which lets callers prefix a key
 * with a possibly empty parent key.
 */
std::string join_dot_path(const std::vector<std::string>& segments);

/**
 * @brief Look up a dot-path, returning nullptr when a segment is missing
 *
 * Array elements are addressed by decimal index ("items.1.name").
 *
 * Example:
 * ```cpp
 * Value cfg = {{"db", {{"host", "localhost"}}}};
 * *find_by_dot(cfg, "db.host");  // "localhost"
 * find_by_dot(cfg, "db.port");   // nullptr
 * ```
 *
 * @throws TypeError if traversal hits a scalar before the final segment
 */
const Value* find_by_dot(const Value& data, const std::string& path);

/**
 * @brief Set value in nested structure using dot-path
 *
 * Intermediate objects are created as needed; a scalar met on the way is
 * replaced by an object. An empty path replaces the root.
 */
void set_by_dot(Value& data, const std::string& path, const Value& value);

} // namespace cfgbind

#endif // CFGBIND_DOTPATH_HPP
