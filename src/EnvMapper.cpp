/**
 * @file EnvMapper.cpp
 * @brief Environment variable lookup implementation
 */

#include "cfgbind/EnvMapper.hpp"
#include "cfgbind/Naming.hpp"

#include <cstdlib>

#ifdef _WIN32
    #include <windows.h>
#endif

namespace cfgbind {

std::string env_var_name(const std::string& prefix, const std::string& key) {
    std::string name = to_upper(key);
    for (auto& ch : name) {
        if (ch == '.' || ch == '-') ch = '_';
    }

    std::string normalized = to_upper(prefix);
    while (!normalized.empty() && normalized.back() == '_') normalized.pop_back();
    if (normalized.empty()) {
        return name;
    }
    return normalized + "_" + name;
}

std::optional<std::string> get_env_var(const std::string& name) {
#ifdef _WIN32
    char buffer[32767];  // Max env var size on Windows
    DWORD result = GetEnvironmentVariableA(name.c_str(), buffer, sizeof(buffer));
    if (result == 0) {
        return std::nullopt;
    }
    return std::string(buffer, result);
#else
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
#endif
}

bool set_env_var(const std::string& name, const std::string& value, bool overwrite) {
    if (!overwrite && has_env_var(name)) {
        return false;
    }
#ifdef _WIN32
    return SetEnvironmentVariableA(name.c_str(), value.c_str()) != 0;
#else
    return setenv(name.c_str(), value.c_str(), 1) == 0;
#endif
}

void unset_env_var(const std::string& name) {
#ifdef _WIN32
    SetEnvironmentVariableA(name.c_str(), nullptr);
#else
    unsetenv(name.c_str());
#endif
}

bool has_env_var(const std::string& name) {
    return get_env_var(name).has_value();
}

} // namespace cfgbind
