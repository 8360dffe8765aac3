/**
 * @file test_config_loader.cpp
 * @brief Tests for once-only store loading (GoogleTest)
 */

#include <gtest/gtest.h>
#include "cfgbind/ConfigLoader.hpp"
#include "cfgbind/Errors.hpp"
#include "test_helpers.hpp"

#include <atomic>
#include <chrono>
#include <sstream>
#include <thread>
#include <vector>

using namespace cfgbind;
using cfgbind_test::ScopedEnvVar;
using cfgbind_test::TempDir;
using cfgbind_test::TempFile;

namespace {

struct Sample {
    std::string Text;
    int Count = 0;
};

} // anonymous namespace

namespace cfgbind {

template <>
struct Describe<Sample> {
    static void fields(Schema<Sample>& s) {
        s.field("Text", &Sample::Text).field("Count", &Sample::Count);
    }
};

} // namespace cfgbind

// ============================================================================
// Once-only loading
// ============================================================================

TEST(ConfigLoaderTest, LoadsOnce) {
    Store store;
    int loads = 0;
    ConfigLoader loader(store, [&](Store& s) {
        ++loads;
        s.set("loaded", true);
    });

    EXPECT_FALSE(loader.loaded());
    loader.ensure_loaded();
    loader.ensure_loaded();
    loader.ensure_loaded();

    EXPECT_EQ(loads, 1);
    EXPECT_TRUE(loader.loaded());
    EXPECT_TRUE(store.get_bool("loaded"));
    EXPECT_EQ(&loader.store(), &store);
}

TEST(ConfigLoaderTest, ConcurrentFirstTouchLoadsOnce) {
    Store store;
    std::atomic<int> loads{0};
    ConfigLoader loader(store, [&](Store& s) {
        ++loads;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        s.set("ready", true);
    });

    std::atomic<int> saw_ready{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            loader.ensure_loaded();
            if (loader.loaded()) ++saw_ready;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(loads.load(), 1);
    EXPECT_EQ(saw_ready.load(), 8);
    EXPECT_TRUE(store.get_bool("ready"));
}

TEST(ConfigLoaderTest, ThrowingLoadIsNotRetried) {
    Store store;
    int attempts = 0;
    ConfigLoader loader(store, [&](Store&) {
        ++attempts;
        throw ConfigError("broken");
    });

    EXPECT_THROW(loader.ensure_loaded(), ConfigError);
    EXPECT_TRUE(loader.loaded());
    EXPECT_NO_THROW(loader.ensure_loaded());
    EXPECT_EQ(attempts, 1);
}

TEST(ConfigLoaderTest, ConcurrentThrowingLoadReachesOneCaller) {
    Store store;
    std::atomic<int> attempts{0};
    ConfigLoader loader(store, [&](Store&) {
        ++attempts;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        throw ConfigError("broken");
    });

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&] {
            try {
                loader.ensure_loaded();
            } catch (const ConfigError&) {
                ++failures;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(attempts.load(), 1);
    EXPECT_EQ(failures.load(), 1);
    EXPECT_TRUE(loader.loaded());
}

TEST(ConfigLoaderTest, LoadFunctionReplacedBeforeUse) {
    Store store;
    std::string used;
    ConfigLoader loader(store, [&](Store&) { used = "first"; });
    loader.set_load_function([&](Store&) { used = "second"; });
    loader.ensure_loaded();
    EXPECT_EQ(used, "second");

    loader.set_load_function([&](Store&) { used = "third"; });
    loader.ensure_loaded();
    EXPECT_EQ(used, "second");
}

// ============================================================================
// Default load step
// ============================================================================

TEST(DefaultLoad, ReadsExplicitConfigFile) {
    TempFile file("firstparam: First\nnested:\n  fifthparam: 78\n", ".yaml");
    Store store;
    ConfigLoader loader(store);
    loader.set_config_file(file.path());
    loader.ensure_loaded();

    EXPECT_EQ(store.config_file_used(), file.path());
    EXPECT_EQ(store.get_string("FirstParam"), "First");
    EXPECT_EQ(store.get_int("nested.fifthparam"), 78);
    EXPECT_TRUE(store.automatic_env_enabled());
}

TEST(DefaultLoad, MalformedFileIsIgnored) {
    TempFile file("{ not json", ".json");
    Store store;
    ConfigLoader loader(store);
    loader.set_config_file(file.path());

    EXPECT_NO_THROW(loader.ensure_loaded());
    EXPECT_TRUE(loader.loaded());
    EXPECT_TRUE(store.all_settings().empty());
}

TEST(DefaultLoad, MissingExplicitFileIsNotFatal) {
    Store store;
    ConfigLoader loader(store);
    loader.set_config_file("/nonexistent/cfgbind/config.yaml");

    EXPECT_NO_THROW(loader.ensure_loaded());
    EXPECT_TRUE(loader.loaded());
    EXPECT_TRUE(store.config_file_used().empty());
}

TEST(DefaultLoad, FindsDotFileInHome) {
    TempDir home;
    ScopedEnvVar env("HOME", home.path());
    home.create_file("." + executable_name() + ".yaml", "sample:\n  value: from-home\n");

    Store store;
    ConfigLoader loader(store);
    loader.ensure_loaded();

    EXPECT_EQ(store.get_string("sample.value"), "from-home");
}

TEST(DefaultLoad, GlobalUnmarshal) {
    TempDir home;
    ScopedEnvVar env("HOME", home.path());
    home.create_file("." + executable_name() + ".json",
                     R"({"cfgbindglobalsample": {"text": "global", "count": 3}})");

    Sample sample;
    unmarshal_key("cfgbindglobalsample", sample);
    EXPECT_EQ(sample.Text, "global");
    EXPECT_EQ(sample.Count, 3);
    EXPECT_TRUE(global_loader().loaded());
}

// ============================================================================
// Path discovery
// ============================================================================

TEST(PathDiscovery, ExecutableName) {
    const std::string name = executable_name();
    EXPECT_FALSE(name.empty());
    EXPECT_EQ(name.find('/'), std::string::npos);
}

TEST(PathDiscovery, HomeDirectoryFollowsEnvironment) {
    ScopedEnvVar env("HOME", "/tmp/cfgbind-home");
    EXPECT_EQ(home_directory(), "/tmp/cfgbind-home");
}
