/**
 * @file ConfigLoader.hpp
 * @brief Once-only population of a Store from file and environment
 *
 * The default load step:
 * 1. home directory and "." are config search paths
 * 2. config base name is "." + executable name (e.g. "~/.myapp.yaml")
 * 3. automatic environment lookup is enabled
 * 4. the config file is read if found; a malformed file is logged and
 *    ignored
 */

#ifndef CFGBIND_CONFIGLOADER_HPP
#define CFGBIND_CONFIGLOADER_HPP

#include "cfgbind/Store.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <string>

namespace cfgbind {

class ConfigLoader {
public:
    using LoadFunction = std::function<void(Store&)>;

    /**
     * @param store Store to populate (must outlive the loader)
     * @param load Load step; empty selects the default load step
     */
    explicit ConfigLoader(Store& store, LoadFunction load = {});

    ConfigLoader(const ConfigLoader&) = delete;
    ConfigLoader& operator=(const ConfigLoader&) = delete;

    /**
     * @brief Replace the load step (no effect once loaded)
     */
    void set_load_function(LoadFunction load);

    /**
     * @brief Read this file instead of searching (default load step only)
     */
    void set_config_file(const std::string& path);

    /**
     * @brief Run the load step if it has not run yet
     *
     * Concurrent first callers block until the single load finishes. If
     * the load step throws, the exception reaches that caller and the
     * loader still counts as loaded.
     */
    void ensure_loaded();

    bool loaded() const noexcept { return loaded_.load(); }

    Store& store() noexcept { return store_; }

    /**
     * @brief Default load step
     *
     * Exits the process with EXIT_FAILURE if the home directory or the
     * executable name cannot be determined.
     */
    void load_defaults();

private:
    Store& store_;
    LoadFunction load_;
    std::string config_file_;
    std::once_flag once_;
    std::atomic<bool> loaded_{false};
};

/**
 * @brief Name of the running executable (e.g. "myapp")
 * @throws PathUnresolvable
 */
std::string executable_name();

/**
 * @brief Home directory of the current user
 * @throws PathUnresolvable
 */
std::string home_directory();

/**
 * @brief Process-wide store
 */
Store& global_store();

/**
 * @brief Process-wide loader over global_store()
 */
ConfigLoader& global_loader();

/**
 * @brief Load the process-wide store (once) and decode all settings onto `out`
 * @throws DecodeError
 */
template <typename T>
void unmarshal(T& out) {
    global_loader().ensure_loaded();
    global_store().unmarshal(out);
}

/**
 * @brief Load the process-wide store (once) and decode the value at `key`
 * @throws DecodeError
 */
template <typename T>
void unmarshal_key(const std::string& key, T& out) {
    global_loader().ensure_loaded();
    global_store().unmarshal_key(key, out);
}

} // namespace cfgbind

#endif // CFGBIND_CONFIGLOADER_HPP
