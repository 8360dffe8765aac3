/**
 * @file Value.hpp
 * @brief Value type for configuration data
 *
 * Uses nlohmann::json as the underlying value model. Every layer of the
 * store, every decoded record and every collection element is a Value:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...})
 */

#ifndef CFGBIND_VALUE_HPP
#define CFGBIND_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace cfgbind {

/**
 * @brief JSON-like value type for configuration
 *
 * This is an alias for nlohmann::json. See the nlohmann::json
 * documentation for the complete API.
 */
using Value = nlohmann::json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "object")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

/**
 * @brief Check if value is a container (array or object)
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

/**
 * @brief Check if a value is the zero value of its type
 *
 * null, false, 0, 0.0, "" and empty containers are zero. An object is
 * zero only when every member is zero, which mirrors a record whose
 * fields all hold their zero value.
 */
inline bool is_zero(const Value& val) {
    if (val.is_null()) return true;
    if (val.is_boolean()) return !val.get<bool>();
    if (val.is_number_integer()) return val.get<std::int64_t>() == 0;
    if (val.is_number_float()) return val.get<double>() == 0.0;
    if (val.is_string()) return val.get_ref<const std::string&>().empty();
    if (val.is_array()) return val.empty();
    if (val.is_object()) {
        for (const auto& item : val) {
            if (!is_zero(item)) return false;
        }
        return true;
    }
    return false;
}

/**
 * @brief Render a scalar as the text a user would type for it
 *
 * Strings are returned without quotes; everything else uses its JSON text.
 */
inline std::string to_text(const Value& val) {
    if (val.is_string()) return val.get<std::string>();
    if (val.is_null()) return "";
    return val.dump();
}

} // namespace cfgbind

#endif // CFGBIND_VALUE_HPP
