/**
 * @file DotPath.cpp
 * @brief Implementation of dot-path utilities
 */

#include "cfgbind/DotPath.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace cfgbind {

std::vector<std::string> split_dot_path(const std::string& path) {
    std::vector<std::string> segments;
    std::string current;

    for (char c : path) {
        if (c == '.') {
            if (!current.empty()) {
                segments.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }

    if (!current.empty()) {
        segments.push_back(current);
    }

    return segments;
}

std::string join_dot_path(const std::vector<std::string>& segments) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& seg : segments) {
        if (seg.empty()) continue;
        if (!first) oss << '.';
        oss << seg;
        first = false;
    }
    return oss.str();
}

namespace {

/**
 * @brief Check if segment represents an array index
 *
 * Must be all digits, no leading zeros except "0" itself.
 */
bool is_array_index(const std::string& segment) {
    if (segment.empty()) return false;
    if (segment[0] == '0' && segment.size() > 1) return false;
    return std::all_of(segment.begin(), segment.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

/**
 * @brief Resolve one segment below `current`
 * @return Child pointer, or nullptr when the segment is missing
 */
const Value* step(const Value& current, const std::string& seg, const std::string& path) {
    if (current.is_object()) {
        auto it = current.find(seg);
        return it == current.end() ? nullptr : &*it;
    }
    if (current.is_array()) {
        if (!is_array_index(seg)) return nullptr;
        std::size_t idx = std::stoull(seg);
        return idx < current.size() ? &current[idx] : nullptr;
    }
    throw TypeError(path, "object or array", type_name(current));
}

} // anonymous namespace

const Value* find_by_dot(const Value& data, const std::string& path) {
    const Value* current = &data;
    for (const auto& seg : split_dot_path(path)) {
        current = step(*current, seg, path);
        if (current == nullptr) {
            return nullptr;
        }
    }
    return current;
}

void set_by_dot(Value& data, const std::string& path, const Value& value) {
    const auto segments = split_dot_path(path);
    if (segments.empty()) {
        data = value;
        return;
    }

    Value* current = &data;
    for (std::size_t i = 0; i + 1 < segments.size(); ++i) {
        if (!current->is_object()) {
            *current = Value::object();
        }
        current = &(*current)[segments[i]];
    }

    if (!current->is_object()) {
        *current = Value::object();
    }
    (*current)[segments.back()] = value;
}

} // namespace cfgbind
