/**
 * @file Merge.hpp
 * @brief Deep merge utilities for configuration layers and records
 *
 * Two flavours:
 * - deep_merge(): layer merge. The override layer wins wherever it has a
 *   non-null value; objects merge recursively, anything else replaces.
 * - merge_onto(): record merge with zero-value awareness. A zero value
 *   (see is_zero()) never counts as "set".
 */

#ifndef CFGBIND_MERGE_HPP
#define CFGBIND_MERGE_HPP

#include "cfgbind/Value.hpp"

#include <vector>

namespace cfgbind {

/**
 * @brief Deep merge two values
 *
 * Merging rules:
 * - Both objects: recursive merge (keys from both are combined)
 * - Null override: base is kept
 * - Otherwise: override replaces base
 *
 * Example:
 * ```cpp
 * Value base = {{"db", {{"host", "a"}, {"port", 1}}}};
 * Value over = {{"db", {{"port", 2}}}};
 * deep_merge(base, over);   // {"db": {"host": "a", "port": 2}}
 * ```
 */
Value deep_merge(const Value& base, const Value& override_val);

/**
 * @brief Deep merge multiple layers, lowest precedence first
 */
Value deep_merge_all(const std::vector<Value>& layers);

/**
 * @brief Merge `src` onto `dst` field by field, recursively for objects
 *
 * @param dst Destination (modified in place)
 * @param src Source
 * @param overwrite If true, every non-zero value in `src` overwrites the
 *                  corresponding value in `dst`. If false, `src` only
 *                  fills values that are zero (or absent) in `dst`.
 *
 * Example:
 * ```cpp
 * Value decoded = {{"port", 78}, {"host", "cfg"}};
 * Value flags   = {{"port", 102}, {"host", ""}};
 * merge_onto(decoded, flags, true);   // {"port": 102, "host": "cfg"}
 * ```
 */
void merge_onto(Value& dst, const Value& src, bool overwrite);

} // namespace cfgbind

#endif // CFGBIND_MERGE_HPP
