// Lever scenario runner
//
// Replays a JSON scenario of vault operations against the simulated
// environment and prints one JSON record per step on stdout.

#include "runner.hpp"

#include "lever/errors.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using json = nlohmann::json;
using namespace lever;

//------------------------------------------------------------------------------
// Options
//------------------------------------------------------------------------------

struct Options {
    std::string scenario_path;
    std::string config_path;
    bool verbose = false;
    bool stop_on_error = false;
};

//------------------------------------------------------------------------------
// Scenario
//------------------------------------------------------------------------------

json load_json(const std::string& path) {
    std::ifstream file{path};
    if (!file.is_open()) {
        throw ConfigError("Cannot open " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    try {
        return json::parse(buffer.str());
    } catch (const json::parse_error& e) {
        throw ConfigError(path + ": " + e.what());
    }
}

//------------------------------------------------------------------------------
// Command line
//------------------------------------------------------------------------------

void print_usage(const char* prog) {
    std::cout << "Lever vault scenario runner\n\n"
              << "Usage: " << prog << " [options] <scenario.json>\n\n"
              << "Options:\n"
              << "  -c, --config <file>  Vault configuration (overrides the scenario's)\n"
              << "  -s, --stop           Stop at the first failed step\n"
              << "  -v, --verbose        Debug logging\n"
              << "  -h, --help           Show this help message\n\n"
              << "Steps:\n"
              << "  initialize   caller, amount [, receiver]\n"
              << "  deposit      caller, amount [, receiver]\n"
              << "  withdraw     caller, fraction | shares [, receiver]\n"
              << "  unwind       caller, fraction [, haircut]\n"
              << "  donate       caller, amount\n"
              << "  set_staking_rate rate\n"
              << "  advance_time seconds\n"
              << "  set_fee_rate rate [, recipient]\n";
}

Options parse_args(int argc, char* argv[]) {
    Options options;

    int i = 1;
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Missing config file argument\n";
                std::exit(1);
            }
            options.config_path = argv[++i];
        } else if (arg == "-s" || arg == "--stop") {
            options.stop_on_error = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg[0] != '-' && options.scenario_path.empty()) {
            options.scenario_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        }
        ++i;
    }

    if (options.scenario_path.empty()) {
        print_usage(argv[0]);
        std::exit(1);
    }
    return options;
}

int main(int argc, char* argv[]) {
    Options options = parse_args(argc, argv);

    try {
        json doc = load_json(options.scenario_path);

        VaultConfig config;
        if (!options.config_path.empty()) {
            config = VaultConfig::from_file(options.config_path);
        } else if (doc.contains("config")) {
            config = VaultConfig::from_json(doc["config"]);
        }
        if (options.verbose) {
            config.set_log_level("debug");
        }

        cli::Runner runner(doc, config);

        int failures = 0;
        int index = 0;
        for (const auto& step : doc.at("steps")) {
            json out = runner.execute(step);
            if (out.contains("error")) {
                ++failures;
            }
            out["step"] = index++;
            std::cout << out.dump() << "\n";

            if (failures > 0 && options.stop_on_error) {
                break;
            }
        }
        return failures == 0 ? 0 : 2;
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    } catch (const json::exception& e) {
        std::cerr << "Scenario error: " << e.what() << "\n";
        return 1;
    }
}
