#include <iostream>
#include <string>
#include <vector>

#include "cfgbind/Binder.hpp"
#include "cfgbind/Errors.hpp"
#include "cfgbind/Log.hpp"
#include "cfgbind/Parse.hpp"

using cfgbind::Command;

namespace {

struct AppConfig {
    std::string Environment = "development";
    std::string LogLevel = "info";
    bool Verbose = false;
};

struct Endpoint {
    std::string Name;
    std::string Host = "localhost";
    int Port = 8080;
    double Timeout = 2.5;
    bool Tls = false;
};

} // anonymous namespace

namespace cfgbind {

template <>
struct Describe<AppConfig> {
    static void fields(Schema<AppConfig>& s) {
        s.field("Environment", &AppConfig::Environment, "name of the environment to use")
         .field("LogLevel", &AppConfig::LogLevel, "log level (trace, debug, info, warn, error)")
         .field("Verbose", &AppConfig::Verbose, "shorthand for --log-level debug");
    }
};

template <>
struct Describe<Endpoint> {
    static void fields(Schema<Endpoint>& s) {
        s.field("Name", &Endpoint::Name, "environment name")
         .field("Host", &Endpoint::Host, "endpoint host")
         .field("Port", &Endpoint::Port, "endpoint port")
         .field("Timeout", &Endpoint::Timeout, "request timeout in seconds")
         .field("Tls", &Endpoint::Tls, "use TLS");
    }
};

} // namespace cfgbind

int main(int argc, char** argv) {
    AppConfig app;
    Endpoint endpoint;
    std::string config_file;

    Command root("cfgbind-demo", "Resolve typed settings from flags, config files and the environment");
    root.persistent_flags().add("config", &config_file,
                                "config file (default is $HOME/.cfgbind-demo.yaml)");

    Command& show = root.add_command("show", "Print the resolved settings");
    Command& env = root.add_command("env", "Print the selected element of 'environments'");
    Command& set = root.add_command("set", "Write KEY VALUE to the config file");

    auto& loader = cfgbind::global_loader();
    auto& binder = cfgbind::global_binder();

    try {
        // Runs before the first store access of any dispatch
        binder.attach(root, [&](Command&) {
            if (!config_file.empty()) loader.set_config_file(config_file);
        });
        binder.bind(root, &app);
        binder.attach(root, [&](Command&) {
            if (app.Verbose) {
                cfgbind::set_log_level(spdlog::level::debug);
            } else {
                cfgbind::set_log_level(cfgbind::parse_log_level(app.LogLevel));
            }
        });
        binder.bind_collection_item(env, &endpoint, {"environments", "Environment"});
    } catch (const cfgbind::ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    show.set_run([&](Command& cmd, const std::vector<std::string>&) {
        cmd.out() << cfgbind::encode(app).dump(2) << "\n";
        const auto& used = binder.store().config_file_used();
        cmd.out() << "config file: " << (used.empty() ? "(none)" : used) << "\n";
    });

    env.set_run([&](Command& cmd, const std::vector<std::string>&) {
        cmd.out() << "environment " << app.Environment << "\n"
                  << cfgbind::encode(endpoint).dump(2) << "\n";
    });

    set.set_run([&](Command& cmd, const std::vector<std::string>& args) {
        if (args.size() != 2) {
            throw cfgbind::ConfigError("set expects KEY VALUE");
        }
        loader.ensure_loaded();
        auto& store = binder.store();
        store.set(args[0], cfgbind::parse_value(args[1]));
        store.write_config();
        cmd.out() << "Set " << args[0] << " = " << store.get(args[0]).dump() << "\n";
    });

    return root.run(argc, argv);
}
