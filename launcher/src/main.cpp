#include "config.hpp"
#include "errors.hpp"
#include "service.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <getopt.h>
#include <signal.h>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

std::unique_ptr<Service> service;

void signal_handler(int signum) {
    spdlog::info("Signal {} received, shutting down...", signum);
    if (service) {
        service->stop();
    }
}

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage:\n"
              << "  " << program << " [serve]\n"
              << "  " << program << " launch --name NAME --symbol SYMBOL --uri URL"
              << " [--buy SOL] [--slippage PCT] [--priority-fee SOL]\n"
              << "  " << program << " sell --mint ADDRESS\n";
}

double parse_amount(const char* option, const char* value) {
    char* end = nullptr;
    double parsed = std::strtod(value, &end);
    if (end == value || *end != '\0') {
        throw ValidationError(std::string("--") + option + " expects a number, got '" + value + "'");
    }
    return parsed;
}

struct CommandLine {
    std::string command = "serve";
    LaunchRequest request;
    bool has_buy = false;
    bool has_slippage = false;
    bool has_priority_fee = false;
    std::string mint;
};

CommandLine parse_args(int argc, char* argv[]) {
    CommandLine cli;
    if (argc > 1) {
        cli.command = argv[1];
    }
    if (cli.command != "serve" && cli.command != "launch" && cli.command != "sell") {
        throw ValidationError("Unknown command: " + cli.command);
    }

    static const struct option long_options[] = {
        {"name", required_argument, nullptr, 'n'},
        {"symbol", required_argument, nullptr, 's'},
        {"uri", required_argument, nullptr, 'u'},
        {"buy", required_argument, nullptr, 'b'},
        {"slippage", required_argument, nullptr, 'l'},
        {"priority-fee", required_argument, nullptr, 'f'},
        {"mint", required_argument, nullptr, 'm'},
        {nullptr, 0, nullptr, 0},
    };

    // Options follow the command word
    optind = 2;
    int opt;
    while ((opt = getopt_long(argc, argv, "", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'n': cli.request.name = optarg; break;
            case 's': cli.request.symbol = optarg; break;
            case 'u': cli.request.metadata_url = optarg; break;
            case 'b':
                cli.request.initial_buy_sol = parse_amount("buy", optarg);
                cli.has_buy = true;
                break;
            case 'l':
                cli.request.slippage_pct = parse_amount("slippage", optarg);
                cli.has_slippage = true;
                break;
            case 'f':
                cli.request.priority_fee_sol = parse_amount("priority-fee", optarg);
                cli.has_priority_fee = true;
                break;
            case 'm': cli.mint = optarg; break;
            default: throw ValidationError("Invalid option");
        }
    }
    if (optind < argc) {
        throw ValidationError(std::string("Unexpected argument: ") + argv[optind]);
    }

    if (cli.command == "sell" && cli.mint.empty()) {
        throw ValidationError("sell requires --mint");
    }
    return cli;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [tid %t] %v");

    CommandLine cli;
    try {
        cli = parse_args(argc, argv);
    } catch (const ValidationError& e) {
        std::cerr << e.what() << "\n";
        print_usage(argv[0]);
        return 2;
    }

    try {
        // 1. Load configuration
        Config config = Config::from_env();
        config.validate();

        // 2. Setup logging
        spdlog::set_level(spdlog::level::from_str(config.log_level));
        spdlog::info("Log level set to '{}'", config.log_level);
        spdlog::info("Starting {} ({})...", config.service_name, cli.command);

        // 3. Setup signal handling for graceful shutdown
        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        // 4. Initialize and run the requested command
        service = std::make_unique<Service>(config);

        if (cli.command == "launch") {
            auto defaults = service->launch_defaults();
            LaunchRequest request = cli.request;
            request.id = "cli-" + util::current_iso8601();
            if (!cli.has_buy) request.initial_buy_sol = defaults.initial_buy_sol;
            if (!cli.has_slippage) request.slippage_pct = defaults.slippage_pct;
            if (!cli.has_priority_fee) request.priority_fee_sol = defaults.priority_fee_sol;

            auto result = service->launch_once(request);
            std::cout << result.addresses.mint.to_base58() << " " << result.signature << "\n";
        } else if (cli.command == "sell") {
            auto result = service->sell_once(PublicKey::from_base58(cli.mint));
            std::cout << result.signature << " " << result.sol_received << "\n";
        } else {
            service->run();
        }

        service.reset();
        spdlog::info("{} has shut down.", config.service_name);

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error during initialization or runtime: {}", e.what());
        return 1;
    }

    return 0;
}
