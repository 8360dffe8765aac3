/**
 * @file test_store.cpp
 * @brief Tests for the layered configuration store
 *
 * Tests cover:
 * - layer precedence: set() > environment > config file > set_default()
 * - case-insensitive dotted keys and merged sub-trees
 * - typed getters and unmarshal
 * - config file search, read and write back
 */

#include <catch2/catch_all.hpp>
#include "cfgbind/Errors.hpp"
#include "cfgbind/Store.hpp"
#include "test_helpers.hpp"

#include <sstream>

using namespace cfgbind;
using cfgbind_test::ScopedEnvVar;
using cfgbind_test::TempDir;

namespace {

struct Database {
    std::string Host = "default-host";
    int Port = 0;
};

struct Settings {
    std::string Name;
    bool Debug = false;
    Database DB;
};

const char* kFixtureYaml = R"(firstparam: First
SecondParam: Second
Nested:
   FourthParam: true
   FifthParam: 78
   SixthParam: Sixth
ThirdParam: false
)";

void read_yaml(Store& store, const std::string& yaml) {
    std::istringstream in(yaml);
    store.read_config(in, "yaml");
}

} // anonymous namespace

namespace cfgbind {

template <>
struct Describe<Database> {
    static void fields(Schema<Database>& s) {
        s.field("Host", &Database::Host).field("Port", &Database::Port);
    }
};

template <>
struct Describe<Settings> {
    static void fields(Schema<Settings>& s) {
        s.field("Name", &Settings::Name).field("Debug", &Settings::Debug).field("DB", &Settings::DB);
    }
};

} // namespace cfgbind

// ============================================================================
// Key Tests
// ============================================================================

TEST_CASE("lower_case_keys is recursive", "[store]") {
    const Value v = lower_case_keys(Value{{"A", {{"BcD", 1}}}, {"List", {{{"X", 2}}}}});
    CHECK(v["a"]["bcd"] == 1);
    CHECK(v["list"][0]["x"] == 2);
}

TEST_CASE("store keys", "[store]") {
    Store store;
    read_yaml(store, kFixtureYaml);

    SECTION("Case-insensitive dotted lookup") {
        CHECK(store.get("FirstParam") == "First");
        CHECK(store.get("secondparam") == "Second");
        CHECK(store.get("Nested.FifthParam") == 78);
        CHECK(store.get("NESTED.sixthparam") == "Sixth");
    }

    SECTION("Missing keys are null") {
        CHECK(store.get("nope").is_null());
        CHECK(store.get("firstparam.below").is_null());
        CHECK_FALSE(store.is_set("nope"));
        CHECK(store.is_set("thirdparam"));
    }

    SECTION("Sub-tree of a missing key is an empty object") {
        const Value sub = store.sub("missing");
        CHECK(sub.is_object());
        CHECK(sub.empty());
    }
}

// ============================================================================
// Layer Tests
// ============================================================================

TEST_CASE("store layers - precedence", "[store][layers]") {
    Store store;
    read_yaml(store, "port: 2\n");
    store.set_default("port", 1);
    CHECK(store.get_int("port") == 2);

    ScopedEnvVar env("PORT", "3");
    CHECK(store.get_int("port") == 2);  // automatic env is off
    store.automatic_env();
    CHECK(store.get_int("port") == 3);
    store.set("port", 4);
    CHECK(store.get_int("port") == 4);
}

TEST_CASE("store layers - defaults fill gaps", "[store][layers]") {
    Store store;
    read_yaml(store, "db:\n  host: filehost\n");
    store.set_default("db.port", 5432);
    store.set_default("db.host", "defaulthost");
    CHECK(store.get_string("db.host") == "filehost");
    CHECK(store.get_int("db.port") == 5432);
}

TEST_CASE("store layers - objects merge across layers", "[store][layers]") {
    Store store;
    read_yaml(store, "db:\n  host: filehost\n");
    store.set_default("DB", Value{{"Port", 5432}, {"Host", "defaulthost"}});
    store.set("db.user", "admin");

    const Value db = store.get("db");
    CHECK(db["host"] == "filehost");
    CHECK(db["port"] == 5432);
    CHECK(db["user"] == "admin");
}

TEST_CASE("store layers - sub folds layers lowest first", "[store][layers]") {
    Store store;
    store.set_default("db", Value{{"host", "defaulthost"}, {"port", 1}, {"pool", {{"size", 2}}}});
    read_yaml(store, "db:\n  port: 2\n  pool:\n    idle: 3\n");
    store.set("db.pool.size", 4);

    const Value db = store.sub("DB");
    CHECK(db["host"] == "defaulthost");
    CHECK(db["port"] == 2);
    CHECK(db["pool"]["size"] == 4);
    CHECK(db["pool"]["idle"] == 3);

    SECTION("A scalar at the key contributes nothing") {
        store.set("db", "flat");
        CHECK(store.sub("db").contains("host"));
        CHECK(store.get("db") == "flat");
    }
}

TEST_CASE("store layers - environment", "[store][layers][env]") {
    SECTION("Prefixed variables overlay sub-trees") {
        Store store;
        read_yaml(store, kFixtureYaml);
        store.set_env_prefix("cfgbindtest");
        store.automatic_env();

        ScopedEnvVar env("CFGBINDTEST_NESTED_FIFTHPARAM", "90");
        CHECK(store.get("nested.fifthparam") == 90);
        CHECK(store.sub("nested")["fifthparam"] == 90);
        CHECK(store.all_settings()["nested"]["fifthparam"] == 90);
    }

    SECTION("Values are typed") {
        Store store;
        ScopedEnvVar a("CFGBIND_TYPED_FLAG", "true");
        ScopedEnvVar b("CFGBIND_TYPED_NAME", "Sixth");
        CHECK(store.env_value("cfgbind.typed.flag") == true);
        CHECK(store.env_value("cfgbind_typed_name") == "Sixth");
        CHECK(store.env_value("cfgbind.typed.unset").is_null());
    }
}

// ============================================================================
// Getter Tests
// ============================================================================

TEST_CASE("store getters", "[store][getters]") {
    SECTION("Zero when missing") {
        Store store;
        CHECK(store.get_string("x") == "");
        CHECK(store.get_int("x") == 0);
        CHECK_FALSE(store.get_bool("x"));
        CHECK(store.get_float("x") == Catch::Approx(0.0));
    }

    SECTION("Coercion") {
        Store store;
        read_yaml(store, "port: \"8080\"\nratio: 1\nflag: \"t\"\n");
        CHECK(store.get_int("port") == 8080);
        CHECK(store.get_string("ratio") == "1");
        CHECK(store.get_float("ratio") == Catch::Approx(1.0));
        CHECK(store.get_bool("flag"));
        REQUIRE_THROWS_AS(store.get_int("flag"), DecodeError);
    }
}

TEST_CASE("store unmarshal", "[store][getters]") {
    Store store;
    read_yaml(store, "name: svc\ndebug: true\ndb:\n  port: 5432\n");

    Settings settings;
    store.unmarshal(settings);
    CHECK(settings.Name == "svc");
    CHECK(settings.Debug);
    CHECK(settings.DB.Port == 5432);
    CHECK(settings.DB.Host == "default-host");

    Database db;
    store.unmarshal_key("DB", db);
    CHECK(db.Port == 5432);
}

// ============================================================================
// File Tests
// ============================================================================

TEST_CASE("store files - search", "[store][files]") {
    SECTION("Paths are searched in order") {
        TempDir first;
        TempDir second;
        second.create_file(".app.yaml", "source: second\n");
        first.create_file(".app.json", R"({"source": "first"})");

        Store store;
        store.add_config_path(first.path());
        store.add_config_path(second.path());
        store.set_config_name(".app");
        REQUIRE(store.read_in_config());
        CHECK(store.get_string("source") == "first");
        CHECK(store.config_file_used().find(".app.json") != std::string::npos);
    }

    SECTION("Not found returns false") {
        TempDir dir;
        Store store;
        store.add_config_path(dir.path());
        store.set_config_name("absent");
        CHECK_FALSE(store.read_in_config());
        CHECK(store.config_file_used().empty());
    }

    SECTION("Config type allows an extensionless file") {
        TempDir dir;
        dir.create_file(".mw", "firstparam: First\n");
        Store store;
        store.add_config_path(dir.path());
        store.set_config_name(".mw");
        store.set_config_type("yaml");
        REQUIRE(store.read_in_config());
        CHECK(store.get_string("firstparam") == "First");
    }
}

TEST_CASE("store files - explicit file", "[store][files]") {
    SECTION("Malformed file throws") {
        TempDir dir;
        const std::string path = dir.create_file("bad.json", "{ nope");
        Store store;
        store.set_config_file(path);
        REQUIRE_THROWS_AS(store.read_in_config(), ConfigParseError);
    }

    SECTION("Missing file returns false") {
        Store store;
        store.set_config_file("/nonexistent/cfgbind.yaml");
        CHECK_FALSE(store.read_in_config());
    }
}

TEST_CASE("store files - write", "[store][files]") {
    TempDir dir;

    SECTION("Write back in the same format") {
        const std::string path = dir.create_file("app.toml", "name = \"a\"\nport = 1\n");
        Store store;
        store.set_config_file(path);
        REQUIRE(store.read_in_config());
        store.set("port", 2);
        store.write_config();

        Store reread;
        reread.set_config_file(path);
        REQUIRE(reread.read_in_config());
        CHECK(reread.get_string("name") == "a");
        CHECK(reread.get_int("port") == 2);
    }

    SECTION("Nothing to write to") {
        Store store;
        REQUIRE_THROWS_AS(store.write_config(), ConfigError);
    }

    SECTION("Write as another format") {
        Store store;
        read_yaml(store, kFixtureYaml);
        const std::string path = dir.path() + "/copy.json";
        store.write_config_as(path);

        Store reread;
        reread.set_config_file(path);
        REQUIRE(reread.read_in_config());
        CHECK(reread.get_int("nested.fifthparam") == 78);
        REQUIRE_THROWS_AS(store.write_config_as(dir.path() + "/copy.ini"), ConfigError);
    }
}
