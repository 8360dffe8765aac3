/**
 * @file Record.cpp
 * @brief Scalar coercion and field lookup for the record codec
 */

#include "cfgbind/Record.hpp"
#include "cfgbind/Parse.hpp"

#include <cmath>
#include <cstdint>
#include <limits>

namespace cfgbind {

const char* kind_name(FieldKind kind) {
    switch (kind) {
        case FieldKind::Boolean: return "bool";
        case FieldKind::String: return "string";
        case FieldKind::Integer: return "int";
        case FieldKind::Float: return "float";
        case FieldKind::Record: return "record";
        case FieldKind::Unsupported: return "unsupported";
    }
    return "unknown";
}

namespace {

std::string describe_value(const Value& v) {
    if (v.is_string()) return "string \"" + v.get<std::string>() + "\"";
    return type_name(v);
}

int checked_int(double d, const Value& v, const std::string& path) {
    if (!std::isfinite(d) ||
        d < static_cast<double>(std::numeric_limits<int>::min()) ||
        d > static_cast<double>(std::numeric_limits<int>::max())) {
        throw DecodeError(path, "int", describe_value(v) + " out of range");
    }
    return static_cast<int>(d);
}

} // anonymous namespace

bool coerce_bool(const Value& v, const std::string& path) {
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_number_integer()) return v.get<std::int64_t>() != 0;
    if (v.is_number_float()) return v.get<double>() != 0.0;
    if (v.is_string()) {
        const auto& s = v.get_ref<const std::string&>();
        if (s.empty()) return false;
        if (auto b = parse_bool(s)) return *b;
    }
    throw DecodeError(path, "bool", describe_value(v));
}

int coerce_int(const Value& v, const std::string& path) {
    if (v.is_number_unsigned()) {
        const auto u = v.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            throw DecodeError(path, "int", describe_value(v) + " out of range");
        }
        return static_cast<int>(u);
    }
    if (v.is_number_integer()) {
        const auto i = v.get<std::int64_t>();
        if (i < std::numeric_limits<int>::min() || i > std::numeric_limits<int>::max()) {
            throw DecodeError(path, "int", describe_value(v) + " out of range");
        }
        return static_cast<int>(i);
    }
    if (v.is_number_float()) return checked_int(v.get<double>(), v, path);
    if (v.is_boolean()) return v.get<bool>() ? 1 : 0;
    if (v.is_string()) {
        const auto& s = v.get_ref<const std::string&>();
        if (s.empty()) return 0;
        if (auto i = parse_integer(s)) return coerce_int(Value(*i), path);
    }
    throw DecodeError(path, "int", describe_value(v));
}

double coerce_float(const Value& v, const std::string& path) {
    if (v.is_number()) return v.get<double>();
    if (v.is_boolean()) return v.get<bool>() ? 1.0 : 0.0;
    if (v.is_string()) {
        const auto& s = v.get_ref<const std::string&>();
        if (s.empty()) return 0.0;
        if (auto d = parse_float(s)) return *d;
    }
    throw DecodeError(path, "float", describe_value(v));
}

std::string coerce_string(const Value& v, const std::string& path) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_boolean() || v.is_number()) return v.dump();
    throw DecodeError(path, "string", describe_value(v));
}

const Value* find_key_icase(const Value& obj, const std::string& key) {
    if (!obj.is_object()) return nullptr;
    auto exact = obj.find(key);
    if (exact != obj.end()) return &*exact;
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (iequals(it.key(), key)) return &it.value();
    }
    return nullptr;
}

const Value* find_field_value(const Value& obj, const FieldDescriptor& field) {
    if (const Value* v = find_key_icase(obj, field.name)) return v;
    if (field.flag_name != field.name) {
        return find_key_icase(obj, field.flag_name);
    }
    return nullptr;
}

} // namespace cfgbind
