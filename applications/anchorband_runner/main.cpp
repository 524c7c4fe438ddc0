// applications/anchorband_runner/main.cpp
#include "anchorband/data/gateway_client.hpp"
#include "anchorband/data/gateway_sources.hpp"
#include "anchorband/runner/run_orchestrator.hpp"
#include "anchorband/runner/runner_config.hpp"
#include "anchorband/utils/config.hpp"
#include "anchorband/utils/logger.hpp"
#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <string>

namespace {

std::atomic<bool> stop_requested{false};

void handle_signal(int) {
    stop_requested = true;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [--config <path>] [--once] [--help]\n"
              << "  --config <path>  configuration file (default: anchorband.conf)\n"
              << "  --once           run a single pass and exit\n"
              << "  --help           show this message\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path = "anchorband.conf";
    bool once = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--once") == 0) {
            once = true;
        } else if (std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << argv[i] << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    try {
        // Load configuration
        auto config = anchorband::utils::Config::instance();
        if (!config->load_from_file(config_path)) {
            anchorband::utils::Logger::warn() << "Failed to load configuration file " << config_path
                                              << ". Using defaults." << anchorband::utils::Logger::endl;
        }

        auto settings = anchorband::runner::RunnerConfiguration::from_config(*config);
        anchorband::utils::Logger::set_level(settings.log_level);

        // Gateway session shared by both sources
        anchorband::data::GatewayClient gateway(settings.gateway);
        if (!gateway.connect()) {
            std::cerr << "Failed to connect to gateway at " << settings.gateway.endpoint << std::endl;
            return 1;
        }

        anchorband::data::GatewayBarSource bars(gateway);
        anchorband::data::GatewayCalendarSource calendar(gateway);
        anchorband::runner::RunOrchestrator orchestrator(settings, bars, calendar);

        if (once) {
            auto summary = orchestrator.run_once();
            std::cout << "Run completed." << std::endl;
            std::cout << "Symbols: " << summary.symbols << std::endl;
            std::cout << "Signals: " << summary.signals << std::endl;
            gateway.disconnect();
            return summary.log_written ? 0 : 1;
        }

        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        orchestrator.run_loop(stop_requested);
        gateway.disconnect();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
