/**
 * @file ConfigLoader.cpp
 * @brief Once-only loading and path discovery
 */

#include "cfgbind/ConfigLoader.hpp"
#include "cfgbind/EnvMapper.hpp"
#include "cfgbind/Errors.hpp"
#include "cfgbind/Log.hpp"

#include <cerrno>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <system_error>

#ifndef _WIN32
#include <pwd.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace cfgbind {

std::string executable_name() {
    std::error_code ec;
    const fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (!ec && !exe.filename().empty()) {
        return exe.filename().string();
    }
#ifdef __GLIBC__
    if (program_invocation_short_name != nullptr && *program_invocation_short_name != '\0') {
        return program_invocation_short_name;
    }
#endif
    throw PathUnresolvable("Cannot determine the executable name");
}

std::string home_directory() {
#ifdef _WIN32
    if (auto home = get_env_var("USERPROFILE"); home && !home->empty()) {
        return *home;
    }
#else
    if (auto home = get_env_var("HOME"); home && !home->empty()) {
        return *home;
    }
    if (const passwd* pw = getpwuid(getuid()); pw != nullptr && pw->pw_dir != nullptr) {
        return pw->pw_dir;
    }
#endif
    throw PathUnresolvable("Cannot determine the home directory");
}

ConfigLoader::ConfigLoader(Store& store, LoadFunction load)
    : store_(store)
    , load_(std::move(load))
{}

void ConfigLoader::set_load_function(LoadFunction load) {
    load_ = std::move(load);
}

void ConfigLoader::set_config_file(const std::string& path) {
    config_file_ = path;
}

void ConfigLoader::ensure_loaded() {
    std::exception_ptr failure;
    std::call_once(once_, [this, &failure] {
        try {
            if (load_) {
                load_(store_);
            } else {
                load_defaults();
            }
        } catch (...) {
            failure = std::current_exception();
        }
        loaded_.store(true);
    });
    if (failure) {
        std::rethrow_exception(failure);
    }
}

void ConfigLoader::load_defaults() {
    auto log = logger();

    try {
        if (!config_file_.empty()) {
            store_.set_config_file(config_file_);
        } else {
            const std::string home = home_directory();
            const std::string exe = executable_name();
            store_.add_config_path(home);
            store_.add_config_path(".");
            store_.set_config_name("." + exe);
        }
    } catch (const PathUnresolvable& e) {
        log->critical("{}", e.what());
        std::exit(EXIT_FAILURE);
    }

    store_.automatic_env();

    try {
        if (store_.read_in_config()) {
            log->info("Using config file: {}", store_.config_file_used());
        } else if (!config_file_.empty()) {
            log->warn("Config file not found: {}", config_file_);
        } else {
            log->debug("No config file found");
        }
    } catch (const ConfigError& e) {
        log->warn("Ignoring config file: {}", e.what());
    }
}

Store& global_store() {
    static Store store;
    return store;
}

ConfigLoader& global_loader() {
    static ConfigLoader loader(global_store());
    return loader;
}

} // namespace cfgbind
