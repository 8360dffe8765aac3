/**
 * @file Naming.cpp
 * @brief Implementation of canonical name derivation
 */

#include "cfgbind/Naming.hpp"

#include <algorithm>
#include <cctype>

namespace cfgbind {

namespace {

bool is_delimiter(char c) {
    return c == '_' || c == '-' || c == '.' || c == ' ';
}

bool is_upper(char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; }
bool is_lower(char c) { return std::islower(static_cast<unsigned char>(c)) != 0; }
bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

} // anonymous namespace

std::string to_kebab_case(const std::string& identifier) {
    std::string out;
    out.reserve(identifier.size() + 4);

    // A pending boundary is only emitted once a following word character
    // arrives, so delimiters never lead, trail or repeat.
    bool pending = false;

    for (std::size_t i = 0; i < identifier.size(); ++i) {
        const char c = identifier[i];

        if (is_delimiter(c)) {
            pending = !out.empty();
            continue;
        }

        if (is_upper(c) && i > 0 && !out.empty()) {
            const char prev = identifier[i - 1];
            const bool next_lower = i + 1 < identifier.size() && is_lower(identifier[i + 1]);
            if (is_lower(prev) || is_digit(prev) || (is_upper(prev) && next_lower)) {
                pending = true;
            }
        }

        if (pending) {
            out += '-';
            pending = false;
        }
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    return out;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return s;
}

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

} // namespace cfgbind
