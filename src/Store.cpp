/**
 * @file Store.cpp
 * @brief Layered configuration store implementation
 */

#include "cfgbind/Store.hpp"
#include "cfgbind/DotPath.hpp"
#include "cfgbind/EnvMapper.hpp"
#include "cfgbind/Errors.hpp"
#include "cfgbind/Merge.hpp"
#include "cfgbind/Naming.hpp"
#include "cfgbind/Parse.hpp"

#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace cfgbind {

Value lower_case_keys(const Value& data) {
    if (data.is_object()) {
        Value out = Value::object();
        for (auto it = data.begin(); it != data.end(); ++it) {
            out[to_lower(it.key())] = lower_case_keys(it.value());
        }
        return out;
    }
    if (data.is_array()) {
        Value out = Value::array();
        for (const auto& item : data) {
            out.push_back(lower_case_keys(item));
        }
        return out;
    }
    return data;
}

// ============================================================================
// Config file discovery and reading
// ============================================================================

void Store::add_config_path(const std::string& dir) {
    config_paths_.push_back(dir);
}

void Store::set_config_name(const std::string& name) {
    config_name_ = name;
    config_file_used_.clear();
}

void Store::set_config_type(const std::string& type) {
    config_type_ = to_lower(type);
}

void Store::set_config_file(const std::string& path) {
    config_file_ = path;
    config_file_used_.clear();
}

std::optional<std::string> Store::find_config_file() const {
    if (!config_file_.empty()) {
        if (file_exists(config_file_)) return config_file_;
        return std::nullopt;
    }

    for (const auto& dir : config_paths_) {
        const std::string base = (fs::path(dir) / config_name_).string();
        if (!config_type_.empty()) {
            if (file_exists(base + "." + config_type_)) return base + "." + config_type_;
            if (file_exists(base)) return base;
        }
        for (const auto& ext : supported_extensions()) {
            const std::string candidate = base + "." + ext;
            if (file_exists(candidate)) return candidate;
        }
    }
    return std::nullopt;
}

bool Store::read_in_config() {
    const auto file = find_config_file();
    if (!file) {
        return false;
    }

    const auto format = config_type_.empty() ? format_from_name(get_file_extension(*file))
                                             : format_from_name(config_type_);
    if (!format) {
        throw ConfigError("Unsupported config type for '" + *file + "'");
    }

    config_ = lower_case_keys(load_config_file(*file, format));
    config_file_used_ = *file;
    return true;
}

void Store::read_config(std::istream& in, const std::string& type) {
    const auto format = format_from_name(type);
    if (!format) {
        throw ConfigError("Unsupported config type: " + type);
    }
    config_ = lower_case_keys(parse_config(in, *format));
}

// ============================================================================
// Environment
// ============================================================================

void Store::set_env_prefix(const std::string& prefix) {
    env_prefix_ = prefix;
}

Value Store::env_value(const std::string& key) const {
    const auto raw = get_env_var(env_var_name(env_prefix_, key));
    if (!raw) {
        return Value();
    }
    return parse_value(*raw);
}

void Store::overlay_env(Value& tree, const std::string& path) const {
    for (auto it = tree.begin(); it != tree.end(); ++it) {
        const std::string child = path.empty() ? it.key() : path + "." + it.key();
        if (it.value().is_object()) {
            overlay_env(it.value(), child);
            continue;
        }
        Value env = env_value(child);
        if (!env.is_null()) {
            it.value() = std::move(env);
        }
    }
}

// ============================================================================
// Getters
// ============================================================================

const Value* Store::layer_value(const Value& layer, const std::string& key) const {
    if (key.empty()) {
        return &layer;
    }
    try {
        return find_by_dot(layer, key);
    } catch (const TypeError&) {
        // Key runs through a scalar in this layer: not set here
        return nullptr;
    }
}

Value Store::get(const std::string& key) const {
    const std::string k = to_lower(key);
    if (k.empty()) {
        return all_settings();
    }

    if (const Value* v = layer_value(overrides_, k); v != nullptr && !v->is_null()) {
        return v->is_object() ? sub(k) : *v;
    }
    if (automatic_env_) {
        Value env = env_value(k);
        if (!env.is_null()) return env;
    }
    for (const Value* layer : {&config_, &defaults_}) {
        const Value* v = layer_value(*layer, k);
        if (v != nullptr && !v->is_null()) {
            return v->is_object() ? sub(k) : *v;
        }
    }
    return Value();
}

bool Store::is_set(const std::string& key) const {
    return !get(key).is_null();
}

std::string Store::get_string(const std::string& key) const {
    const Value v = get(key);
    return v.is_null() ? std::string() : coerce_string(v, key);
}

int Store::get_int(const std::string& key) const {
    const Value v = get(key);
    return v.is_null() ? 0 : coerce_int(v, key);
}

bool Store::get_bool(const std::string& key) const {
    const Value v = get(key);
    return v.is_null() ? false : coerce_bool(v, key);
}

double Store::get_float(const std::string& key) const {
    const Value v = get(key);
    return v.is_null() ? 0.0 : coerce_float(v, key);
}

Value Store::sub(const std::string& key) const {
    const std::string k = to_lower(key);
    std::vector<Value> layers;
    for (const Value* layer : {&defaults_, &config_, &overrides_}) {
        const Value* v = layer_value(*layer, k);
        if (v != nullptr && v->is_object()) {
            layers.push_back(*v);
        }
    }
    Value merged = deep_merge_all(layers);
    if (automatic_env_) {
        overlay_env(merged, k);
    }
    return merged;
}

Value Store::all_settings() const {
    return sub("");
}

// ============================================================================
// Writers
// ============================================================================

void Store::set(const std::string& key, const Value& value) {
    set_by_dot(overrides_, to_lower(key), lower_case_keys(value));
}

void Store::set_default(const std::string& key, const Value& value) {
    set_by_dot(defaults_, to_lower(key), lower_case_keys(value));
}

void Store::write_config() const {
    std::string path = config_file_used_;
    if (path.empty()) path = config_file_;
    if (path.empty()) {
        throw ConfigError("No config file in use; call read_in_config() or set_config_file() first");
    }

    const auto format = config_type_.empty() ? format_from_name(get_file_extension(path))
                                             : format_from_name(config_type_);
    if (!format) {
        throw ConfigError("Unsupported config type for '" + path + "'");
    }
    write_config_file(path, all_settings(), *format);
}

void Store::write_config_as(const std::string& path) const {
    const auto format = format_from_name(get_file_extension(path));
    if (!format) {
        throw ConfigError("Unsupported config file type: " + path);
    }
    write_config_file(path, all_settings(), *format);
}

} // namespace cfgbind
