// zap-sim - Command-line zap simulator
//
// Builds a reference constant-product market from a JSON scenario, runs each
// zap action as an atomic transaction and prints the results as JSON.

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "zap/log.hpp"
#include "zap/sim/scenario.hpp"

using json = nlohmann::json;

//------------------------------------------------------------------------------
// Configuration
//------------------------------------------------------------------------------

struct Config {
    std::string scenario_path;
    bool verbose = false;
    bool pretty = true;
};

void print_usage(const char* prog) {
    std::cout << "Zap simulator\n\n"
              << "Usage: " << prog << " [options] <scenario.json>\n\n"
              << "Options:\n"
              << "  -v, --verbose        Debug logging to stderr\n"
              << "  -c, --compact        Single-line JSON output\n"
              << "  -h, --help           Show this help message\n\n"
              << "Scenario actions:\n"
              << "  zap_in        {account, input, pair, amount, slippage_bps, min_liquidity}\n"
              << "  zap_out       {account, output, pair, liquidity, slippage_bps, min_out}\n"
              << "  advance_time  {seconds}\n\n"
              << "Examples:\n"
              << "  " << prog << " examples/scenario.json\n"
              << "  " << prog << " -v examples/scenario.json    # With debug log\n";
}

Config parse_args(int argc, char* argv[]) {
    Config config;

    int i = 1;
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "-c" || arg == "--compact") {
            config.pretty = false;
        } else if (arg[0] != '-') {
            if (!config.scenario_path.empty()) {
                std::cerr << "Only one scenario file may be given\n";
                std::exit(1);
            }
            config.scenario_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        }
        ++i;
    }

    if (config.scenario_path.empty()) {
        print_usage(argv[0]);
        std::exit(1);
    }

    return config;
}

int main(int argc, char* argv[]) {
    Config config = parse_args(argc, argv);
    if (config.verbose) {
        zap::log::set_level(zap::log::Level::DEBUG);
    }

    std::unique_ptr<zap::sim::Scenario> scenario;
    try {
        scenario = zap::sim::Scenario::from_file(config.scenario_path);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load " << config.scenario_path << ": " << e.what() << "\n";
        return 1;
    }

    if (!config.verbose) {
        zap::log::set_level(scenario->config().log_level);
    }

    json report;
    try {
        report = scenario->run();
    } catch (const std::exception& e) {
        std::cerr << "Scenario aborted: " << e.what() << "\n";
        return 1;
    }

    std::cout << report.dump(config.pretty ? 2 : -1) << "\n";

    // Non-zero exit when any action reverted
    for (const auto& result : report["results"]) {
        if (!result.value("ok", false)) {
            return 2;
        }
    }
    return 0;
}
