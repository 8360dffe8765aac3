/**
 * @file Errors.hpp
 * @brief Exception types for cfgbind errors
 *
 * Error taxonomy:
 * - ConfigError: Base class
 * - InvalidTargetKind: Binding called on a null record or sequence
 * - SchemaError: A record description is inconsistent
 * - DecodeError: A value cannot be coerced onto a record field
 * - FileNotFoundError: Config file not found
 * - ConfigParseError: JSON/TOML/YAML syntax errors
 * - TypeError: Traversal into non-container
 * - PathUnresolvable: Home directory or executable path unknown
 * - FlagParseError: Command line could not be parsed
 */

#ifndef CFGBIND_ERRORS_HPP
#define CFGBIND_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace cfgbind {

/**
 * @brief Base class for all cfgbind exceptions
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Binding target is not a usable record
 *
 * Programmer error, raised at bind time before any command runs.
 */
class InvalidTargetKind : public ConfigError {
public:
    /**
     * @param what_kind Description of the rejected target (e.g., "null record pointer")
     */
    explicit InvalidTargetKind(const std::string& what_kind)
        : ConfigError("Invalid binding target: " + what_kind)
    {}
};

/**
 * @brief Record description is inconsistent (e.g., duplicate flag names)
 */
class SchemaError : public ConfigError {
public:
    using ConfigError::ConfigError;
};

/**
 * @brief A config-sourced value cannot be coerced onto a record field
 */
class DecodeError : public ConfigError {
public:
    /**
     * @brief Construct with field path, expected kind and actual type
     * @param path Dotted field path (e.g., "nested.FifthParam")
     * @param expected Expected field kind (e.g., "integer")
     * @param actual Actual value type or text
     */
    DecodeError(std::string path, std::string expected, std::string actual)
        : ConfigError("Cannot decode '" + path + "': expected " + expected +
                      ", got " + actual)
        , path_(std::move(path))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& expected() const noexcept { return expected_; }
    const std::string& actual() const noexcept { return actual_; }

private:
    std::string path_;
    std::string expected_;
    std::string actual_;
};

/**
 * @brief Configuration file not found
 */
class FileNotFoundError : public ConfigError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : ConfigError("Configuration file not found: " + path)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the file path that was not found
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Configuration file parse error (JSON/TOML/YAML syntax)
 */
class ConfigParseError : public ConfigError {
public:
    /**
     * @brief Construct with file path and error details
     * @param file Path to the file with parse error (or "<stream>")
     * @param details Detailed error message from parser
     */
    ConfigParseError(std::string file, std::string details)
        : ConfigError("Parse error in '" + file + "': " + details)
        , file_(std::move(file))
        , details_(std::move(details))
    {}

    /**
     * @brief Get the file path with parse error
     */
    const std::string& file() const noexcept {
        return file_;
    }

    /**
     * @brief Get detailed error message
     */
    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    std::string details_;
};

/**
 * @brief Type mismatch during dot-path traversal
 *
 * Raised when attempting to traverse into a non-container type
 * (e.g., trying to access "scalar_value.sub_key").
 */
class TypeError : public ConfigError {
public:
    /**
     * @param path Full dot-path being accessed
     * @param expected Expected type (e.g., "object")
     * @param actual Actual type encountered (e.g., "integer")
     */
    TypeError(std::string path, std::string expected, std::string actual)
        : ConfigError("Cannot traverse into " + actual +
                      " (expected " + expected + ") at path '" + path + "'")
        , path_(std::move(path))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& expected() const noexcept {
        return expected_;
    }

    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string path_;
    std::string expected_;
    std::string actual_;
};

/**
 * @brief The home directory or executable path cannot be determined
 *
 * Without them the loader has nowhere to search; the default load step
 * treats this as fatal.
 */
class PathUnresolvable : public ConfigError {
public:
    using ConfigError::ConfigError;
};

/**
 * @brief Command line could not be parsed (unknown flag, bad value)
 */
class FlagParseError : public ConfigError {
public:
    using ConfigError::ConfigError;
};

} // namespace cfgbind

#endif // CFGBIND_ERRORS_HPP
