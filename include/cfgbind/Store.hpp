/**
 * @file Store.hpp
 * @brief Layered key/value configuration store
 *
 * Lookup precedence (highest to lowest):
 *   set() overrides > environment (automatic_env) > config file > set_default()
 *
 * Keys are case-insensitive dot paths ("Nested.FifthParam" and
 * "nested.fifthparam" are the same key). Object values merge across
 * layers; scalars and arrays come from the highest layer that has them.
 */

#ifndef CFGBIND_STORE_HPP
#define CFGBIND_STORE_HPP

#include "cfgbind/Loader.hpp"
#include "cfgbind/Record.hpp"
#include "cfgbind/Value.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace cfgbind {

/**
 * @brief Copy of `data` with every object key lower-cased, recursively
 */
Value lower_case_keys(const Value& data);

class Store {
public:
    Store() = default;

    // ========================================================================
    // Config file discovery and reading
    // ========================================================================

    /**
     * @brief Add a directory to search for the config file
     *
     * Directories are searched in the order they were added.
     */
    void add_config_path(const std::string& dir);

    /**
     * @brief Base name of the config file, without extension (default "config")
     */
    void set_config_name(const std::string& name);

    /**
     * @brief Force the config format ("json", "toml", "yaml", "yml")
     *
     * With a type set, "<dir>/<name>.<type>" and the extension-less
     * "<dir>/<name>" are searched before the other extensions.
     */
    void set_config_type(const std::string& type);

    /**
     * @brief Use this file instead of searching
     */
    void set_config_file(const std::string& path);

    /**
     * @brief Path of the config file the search would pick, if any
     */
    std::optional<std::string> find_config_file() const;

    /**
     * @brief Find and read the config file into the config layer
     *
     * @return false if no config file was found
     * @throws ConfigParseError if the file is malformed
     * @throws ConfigError if the format cannot be determined
     */
    bool read_in_config();

    /**
     * @brief Read config from a stream into the config layer
     *
     * @throws ConfigError on an unknown type
     * @throws ConfigParseError on malformed input
     */
    void read_config(std::istream& in, const std::string& type);

    /**
     * @brief Path of the file read by read_in_config(), empty if none
     */
    const std::string& config_file_used() const noexcept { return config_file_used_; }

    // ========================================================================
    // Environment
    // ========================================================================

    /**
     * @brief Prefix for environment lookups ("app" -> "APP_NESTED_FIFTHPARAM")
     */
    void set_env_prefix(const std::string& prefix);
    const std::string& env_prefix() const noexcept { return env_prefix_; }

    /**
     * @brief Consult the environment on every key lookup
     */
    void automatic_env(bool enabled = true) { automatic_env_ = enabled; }
    bool automatic_env_enabled() const noexcept { return automatic_env_; }

    /**
     * @brief Typed value of the environment variable for `key`, null if unset
     *
     * Looked up regardless of automatic_env().
     */
    Value env_value(const std::string& key) const;

    // ========================================================================
    // Getters
    // ========================================================================

    /**
     * @brief Resolved value of a key, null if no layer has it
     *
     * Object values are merged across layers (see sub()).
     */
    Value get(const std::string& key) const;

    bool is_set(const std::string& key) const;

    // Zero value when the key is missing. DecodeError when present but not
    // coercible.
    std::string get_string(const std::string& key) const;
    int get_int(const std::string& key) const;
    bool get_bool(const std::string& key) const;
    double get_float(const std::string& key) const;

    /**
     * @brief Merged sub-tree at `key` ("" for the whole store)
     *
     * @return Object (empty if nothing is configured under `key`)
     */
    Value sub(const std::string& key) const;

    /**
     * @brief Every setting, merged across layers
     */
    Value all_settings() const;

    /**
     * @brief Decode all settings onto a record
     * @throws DecodeError
     */
    template <typename T>
    void unmarshal(T& out) const {
        decode(all_settings(), out);
    }

    /**
     * @brief Decode the value at `key` onto a record
     * @throws DecodeError
     */
    template <typename T>
    void unmarshal_key(const std::string& key, T& out) const {
        decode(get(key), out, key);
    }

    // ========================================================================
    // Writers
    // ========================================================================

    /**
     * @brief Override a key (highest precedence)
     */
    void set(const std::string& key, const Value& value);

    /**
     * @brief Set the default of a key (lowest precedence)
     */
    void set_default(const std::string& key, const Value& value);

    /**
     * @brief Write all settings to the config file in use, in its format
     * @throws ConfigError if no config file is in use
     */
    void write_config() const;

    /**
     * @brief Write all settings to `path`, format chosen by extension
     * @throws ConfigError on an unsupported extension
     */
    void write_config_as(const std::string& path) const;

private:
    const Value* layer_value(const Value& layer, const std::string& key) const;
    void overlay_env(Value& tree, const std::string& path) const;

    std::vector<std::string> config_paths_;
    std::string config_name_ = "config";
    std::string config_type_;
    std::string config_file_;
    std::string config_file_used_;
    std::string env_prefix_;
    bool automatic_env_ = false;

    Value defaults_ = Value::object();
    Value config_ = Value::object();
    Value overrides_ = Value::object();
};

} // namespace cfgbind

#endif // CFGBIND_STORE_HPP
