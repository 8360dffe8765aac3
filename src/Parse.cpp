/**
 * @file Parse.cpp
 * @brief Implementation of string parsing
 */

#include "cfgbind/Parse.hpp"
#include "cfgbind/Naming.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <regex>

namespace cfgbind {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

const std::regex& integer_pattern() {
    static const std::regex re("^-?[0-9]+$");
    return re;
}

const std::regex& float_pattern() {
    static const std::regex re("^-?[0-9]+\\.[0-9]+([eE][+-]?[0-9]+)?$");
    return re;
}

} // anonymous namespace

std::optional<bool> parse_bool(const std::string& str) {
    const std::string lower = to_lower(trim(str));
    if (lower == "1" || lower == "t" || lower == "true") return true;
    if (lower == "0" || lower == "f" || lower == "false") return false;
    return std::nullopt;
}

std::optional<std::int64_t> parse_integer(const std::string& str) {
    const std::string text = trim(str);
    if (text.empty()) return std::nullopt;

    errno = 0;
    char* end = nullptr;
    long long val = std::strtoll(text.c_str(), &end, 10);
    if (errno == ERANGE || end != text.c_str() + text.size()) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(val);
}

std::optional<double> parse_float(const std::string& str) {
    const std::string text = trim(str);
    if (text.empty()) return std::nullopt;

    errno = 0;
    char* end = nullptr;
    double val = std::strtod(text.c_str(), &end);
    if (errno == ERANGE || end != text.c_str() + text.size()) {
        return std::nullopt;
    }
    return val;
}

Value parse_value(const std::string& str) {
    if (str.empty()) {
        return "";
    }

    const std::string lower = to_lower(str);
    if (lower == "true") return true;
    if (lower == "false") return false;
    if (lower == "null") return nullptr;

    if (std::regex_match(str, integer_pattern())) {
        if (auto val = parse_integer(str)) {
            return *val;
        }
    }

    if (std::regex_match(str, float_pattern())) {
        if (auto val = parse_float(str)) {
            return *val;
        }
    }

    const bool compound = (str.front() == '{' && str.back() == '}') ||
                          (str.front() == '[' && str.back() == ']');
    const bool quoted = str.size() >= 2 && str.front() == '"' && str.back() == '"';
    if (compound || quoted) {
        Value parsed = Value::parse(str, nullptr, /*allow_exceptions=*/false);
        if (!parsed.is_discarded() && (compound || parsed.is_string())) {
            return parsed;
        }
    }

    return str;
}

} // namespace cfgbind
