/**
 * @file Loader.hpp
 * @brief Config file reading and writing
 *
 * Formats:
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++)
 * - YAML files (using yaml-cpp)
 *
 * Every format is read into, and written from, a Value tree. The format
 * is picked from the file extension unless the caller names one.
 */

#ifndef CFGBIND_LOADER_HPP
#define CFGBIND_LOADER_HPP

#include "cfgbind/Value.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace cfgbind {

/**
 * @brief Supported on-disk formats
 */
enum class FileFormat {
    Json,
    Toml,
    Yaml
};

/**
 * @brief Map an extension or type name to a format
 *
 * Accepts "json", "toml", "yaml", "yml", with or without a leading dot,
 * in any letter case.
 *
 * @return Format, or nullopt if unsupported
 */
std::optional<FileFormat> format_from_name(const std::string& name);

/**
 * @brief Extensions searched for a config base name, in order
 */
const std::vector<std::string>& supported_extensions();

/**
 * @brief Get file extension (lowercase).
 *
 * @return Extension including the dot (e.g., ".json"), or empty if none
 */
std::string get_file_extension(const std::string& path);

/**
 * @brief Parse config text from a stream
 *
 * @param in Input stream
 * @param format Document format
 * @param source_name Name used in error messages
 * @throws ConfigParseError on syntax errors
 */
Value parse_config(std::istream& in, FileFormat format,
                   const std::string& source_name = "<stream>");

/**
 * @brief Load configuration from file, detecting format by extension.
 *
 * @param path Path to config file
 * @param format Explicit format; overrides the extension when set
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ConfigParseError if the file has syntax errors
 * @throws ConfigError if the format cannot be determined
 */
Value load_config_file(const std::string& path,
                       std::optional<FileFormat> format = std::nullopt);

/**
 * @brief Serialize a Value tree in the given format
 *
 * TOML has no null; nulls are written as empty strings. A non-object
 * root is wrapped under the key "value" for TOML.
 */
std::string serialize_config(const Value& data, FileFormat format);

/**
 * @brief Write a Value tree to a file
 *
 * @throws ConfigError if the file cannot be opened for writing
 */
void write_config_file(const std::string& path, const Value& data, FileFormat format);

/**
 * @brief Check if a regular file exists
 */
bool file_exists(const std::string& path);

} // namespace cfgbind

#endif // CFGBIND_LOADER_HPP
