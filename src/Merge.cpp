/**
 * @file Merge.cpp
 * @brief Implementation of deep merge
 */

#include "cfgbind/Merge.hpp"

namespace cfgbind {

Value deep_merge(const Value& base, const Value& override_val) {
    if (override_val.is_null()) {
        return base;
    }

    if (base.is_object() && override_val.is_object()) {
        Value result = base;
        for (auto it = override_val.begin(); it != override_val.end(); ++it) {
            auto existing = result.find(it.key());
            if (existing != result.end()) {
                *existing = deep_merge(*existing, it.value());
            } else {
                result[it.key()] = it.value();
            }
        }
        return result;
    }

    return override_val;
}

Value deep_merge_all(const std::vector<Value>& layers) {
    Value result = Value::object();
    for (const auto& layer : layers) {
        result = deep_merge(result, layer);
    }
    return result;
}

void merge_onto(Value& dst, const Value& src, bool overwrite) {
    if (dst.is_object() && src.is_object()) {
        for (auto it = src.begin(); it != src.end(); ++it) {
            auto existing = dst.find(it.key());
            if (existing == dst.end()) {
                if (!is_zero(it.value())) {
                    dst[it.key()] = it.value();
                }
                continue;
            }
            merge_onto(*existing, it.value(), overwrite);
        }
        return;
    }

    if (overwrite ? !is_zero(src) : is_zero(dst)) {
        dst = src;
    }
}

} // namespace cfgbind
