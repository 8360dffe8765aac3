/**
 * @file Loader.cpp
 * @brief Config file reading and writing implementation
 *
 * TOML and YAML documents are converted to and from the Value tree
 * node by node. Dates and times have no Value counterpart and are kept
 * as their TOML text.
 */

#include "cfgbind/Loader.hpp"
#include "cfgbind/Errors.hpp"
#include "cfgbind/Naming.hpp"

#include <toml++/toml.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

namespace fs = std::filesystem;

namespace cfgbind {

// ============================================================================
// TOML <-> Value
// ============================================================================

namespace {

Value toml_to_value(const toml::node& node) {
    if (const auto* table = node.as_table()) {
        Value obj = Value::object();
        for (const auto& [key, val] : *table) {
            obj[std::string(key.str())] = toml_to_value(val);
        }
        return obj;
    }
    if (const auto* array = node.as_array()) {
        Value arr = Value::array();
        for (const auto& elem : *array) {
            arr.push_back(toml_to_value(elem));
        }
        return arr;
    }
    if (const auto* v = node.as_string()) return Value(v->get());
    if (const auto* v = node.as_integer()) return Value(v->get());
    if (const auto* v = node.as_floating_point()) return Value(v->get());
    if (const auto* v = node.as_boolean()) return Value(v->get());

    std::ostringstream oss;
    if (const auto* v = node.as_date()) oss << *v;
    else if (const auto* v = node.as_time()) oss << *v;
    else if (const auto* v = node.as_date_time()) oss << *v;
    return Value(oss.str());
}

toml::table value_to_toml_table(const Value& obj);

toml::array value_to_toml_array(const Value& arr);

template <typename Sink>
void insert_toml_scalar(Sink&& sink, const Value& v) {
    if (v.is_string()) {
        sink(v.get<std::string>());
    } else if (v.is_boolean()) {
        sink(v.get<bool>());
    } else if (v.is_number_unsigned()) {
        const auto u = v.get<std::uint64_t>();
        if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            sink(static_cast<std::int64_t>(u));
        } else {
            sink(static_cast<double>(u));
        }
    } else if (v.is_number_integer()) {
        sink(v.get<std::int64_t>());
    } else if (v.is_number_float()) {
        sink(v.get<double>());
    } else if (v.is_null()) {
        sink(std::string{});
    } else if (v.is_object()) {
        sink(value_to_toml_table(v));
    } else if (v.is_array()) {
        sink(value_to_toml_array(v));
    }
}

toml::array value_to_toml_array(const Value& arr) {
    toml::array out;
    for (const auto& elem : arr) {
        insert_toml_scalar([&out](auto&& x) { out.push_back(std::forward<decltype(x)>(x)); }, elem);
    }
    return out;
}

toml::table value_to_toml_table(const Value& obj) {
    toml::table out;
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        const std::string& key = it.key();
        insert_toml_scalar([&out, &key](auto&& x) { out.insert(key, std::forward<decltype(x)>(x)); },
                           it.value());
    }
    return out;
}

// ============================================================================
// YAML <-> Value
// ============================================================================

Value yaml_scalar_to_value(const YAML::Node& node) {
    const std::string& s = node.Scalar();

    // Quoted scalars carry the "!" tag and stay strings.
    if (node.Tag() == "!") {
        return Value(s);
    }
    if (s == "~" || s == "null" || s == "Null" || s == "NULL") {
        return nullptr;
    }
    if (s == "true" || s == "True" || s == "TRUE") return true;
    if (s == "false" || s == "False" || s == "FALSE") return false;

    if (!s.empty()) {
        std::int64_t i = 0;
        if (YAML::convert<std::int64_t>::decode(node, i) &&
            s.find_first_of(".eE") == std::string::npos) {
            return i;
        }
        double d = 0.0;
        if (YAML::convert<double>::decode(node, d)) {
            return d;
        }
    }
    return Value(s);
}

Value yaml_to_value(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Scalar:
            return yaml_scalar_to_value(node);
        case YAML::NodeType::Sequence: {
            Value arr = Value::array();
            for (const auto& item : node) {
                arr.push_back(yaml_to_value(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            Value obj = Value::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = yaml_to_value(kv.second);
            }
            return obj;
        }
        default:
            return nullptr;
    }
}

YAML::Node value_to_yaml(const Value& v) {
    if (v.is_object()) {
        YAML::Node node(YAML::NodeType::Map);
        for (auto it = v.begin(); it != v.end(); ++it) {
            node[it.key()] = value_to_yaml(it.value());
        }
        return node;
    }
    if (v.is_array()) {
        YAML::Node node(YAML::NodeType::Sequence);
        for (const auto& elem : v) {
            node.push_back(value_to_yaml(elem));
        }
        return node;
    }
    if (v.is_string()) return YAML::Node(v.get<std::string>());
    if (v.is_boolean()) return YAML::Node(v.get<bool>());
    if (v.is_number_integer()) return YAML::Node(v.get<std::int64_t>());
    if (v.is_number_float()) return YAML::Node(v.get<double>());
    return YAML::Node(YAML::NodeType::Null);
}

std::string format_name(FileFormat format) {
    switch (format) {
        case FileFormat::Json: return "json";
        case FileFormat::Toml: return "toml";
        case FileFormat::Yaml: return "yaml";
    }
    return "unknown";
}

} // anonymous namespace

// ============================================================================
// Format detection
// ============================================================================

std::optional<FileFormat> format_from_name(const std::string& name) {
    std::string n = to_lower(name);
    if (!n.empty() && n.front() == '.') n.erase(0, 1);
    if (n == "json") return FileFormat::Json;
    if (n == "toml") return FileFormat::Toml;
    if (n == "yaml" || n == "yml") return FileFormat::Yaml;
    return std::nullopt;
}

const std::vector<std::string>& supported_extensions() {
    static const std::vector<std::string> exts = {"json", "toml", "yaml", "yml"};
    return exts;
}

std::string get_file_extension(const std::string& path) {
    return to_lower(fs::path(path).extension().string());
}

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

// ============================================================================
// Reading
// ============================================================================

Value parse_config(std::istream& in, FileFormat format, const std::string& source_name) {
    switch (format) {
        case FileFormat::Json:
            try {
                return Value::parse(in);
            } catch (const nlohmann::json::parse_error& e) {
                throw ConfigParseError(source_name, e.what());
            }

        case FileFormat::Toml:
            try {
                toml::table table = toml::parse(in, source_name);
                return toml_to_value(table);
            } catch (const toml::parse_error& e) {
                std::ostringstream details;
                details << e.description() << " (line " << e.source().begin.line
                        << ", column " << e.source().begin.column << ")";
                throw ConfigParseError(source_name, details.str());
            }

        case FileFormat::Yaml:
            try {
                Value result = yaml_to_value(YAML::Load(in));
                // An empty document is an empty config, not null.
                return result.is_null() ? Value::object() : result;
            } catch (const YAML::Exception& e) {
                throw ConfigParseError(source_name, e.what());
            }
    }
    throw ConfigError("Unsupported config format");
}

Value load_config_file(const std::string& path, std::optional<FileFormat> format) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    if (!format) {
        format = format_from_name(get_file_extension(path));
    }
    if (!format) {
        throw ConfigError("Unsupported config file type: " + get_file_extension(path) +
                          " (expected .json, .toml, .yaml or .yml)");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }
    return parse_config(file, *format, path);
}

// ============================================================================
// Writing
// ============================================================================

std::string serialize_config(const Value& data, FileFormat format) {
    std::ostringstream oss;
    switch (format) {
        case FileFormat::Json:
            oss << std::setw(2) << data << "\n";
            break;

        case FileFormat::Toml: {
            toml::table root;
            if (data.is_object()) {
                root = value_to_toml_table(data);
            } else {
                root = value_to_toml_table(Value{{"value", data}});
            }
            oss << root << "\n";
            break;
        }

        case FileFormat::Yaml: {
            YAML::Emitter emitter;
            emitter << value_to_yaml(data);
            oss << emitter.c_str() << "\n";
            break;
        }
    }
    return oss.str();
}

void write_config_file(const std::string& path, const Value& data, FileFormat format) {
    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs) {
        throw ConfigError("Failed to open for write (" + format_name(format) + "): " + path);
    }
    ofs << serialize_config(data, format);
}

} // namespace cfgbind
