/**
 * @file EnvMapper.hpp
 * @brief Environment variable lookup for store keys
 *
 * With automatic environment lookup enabled, every store key has one
 * environment variable name:
 *
 *   key "nested.fifthparam", prefix ""     -> NESTED_FIFTHPARAM
 *   key "nested.fifthparam", prefix "app"  -> APP_NESTED_FIFTHPARAM
 *
 * Hyphens in keys become underscores too, so "second-param" maps to
 * SECOND_PARAM.
 */

#ifndef CFGBIND_ENVMAPPER_HPP
#define CFGBIND_ENVMAPPER_HPP

#include <optional>
#include <string>

namespace cfgbind {

/**
 * @brief Environment variable name for a store key
 *
 * @param prefix Optional prefix; trailing underscores are normalized to one
 * @param key Dot-path store key
 * @return Upper-case name with '.' and '-' replaced by '_'
 */
std::string env_var_name(const std::string& prefix, const std::string& key);

/**
 * @brief Get environment variable value.
 *
 * @return Value if set, nullopt otherwise
 */
std::optional<std::string> get_env_var(const std::string& name);

/**
 * @brief Set environment variable.
 *
 * @param overwrite If false, an existing variable is left untouched
 * @return true if the variable was set
 */
bool set_env_var(const std::string& name, const std::string& value, bool overwrite = true);

/**
 * @brief Remove an environment variable.
 */
void unset_env_var(const std::string& name);

/**
 * @brief Check if environment variable exists (even if empty).
 */
bool has_env_var(const std::string& name);

} // namespace cfgbind

#endif // CFGBIND_ENVMAPPER_HPP
