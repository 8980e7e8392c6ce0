// mcprouter
// Config-based router with CLI argument parsing

#include <filesystem>
#include <iostream>
#include <string>

#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"
#include "runtime/signal_handler.hpp"

int main(int argc, char **argv) {
    std::string config_path = "mcprouter.yaml";  // Default

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg.substr(0, 9) == "--config=") {
            config_path = arg.substr(9);
        } else if (arg == "--help" || arg == "-h") {
            std::cerr << "Usage: mcprouter [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to config file (default: mcprouter.yaml)\n";
            std::cerr << "  --help, -h       Show this help\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    if (!std::filesystem::exists(config_path)) {
        // Logger threshold not configured yet
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        std::cerr << "\nCreate a config file or specify path with --config=PATH\n";
        return 1;
    }

    LOG_INFO("mcprouter starting...");
    LOG_INFO("Loading config: " << config_path);

    mcprouter::runtime::RuntimeConfig config;
    std::string error;

    if (!mcprouter::runtime::load_config(config_path, config, error)) {
        LOG_ERROR("Failed to load config: " << error);
        return 1;
    }

    mcprouter::logging::Logger::set_level(mcprouter::logging::string_to_level(config.logging.level));

    mcprouter::runtime::Runtime runtime(config);

    if (!runtime.initialize(error)) {
        LOG_ERROR("Runtime initialization failed: " << error);
        return 1;
    }

    mcprouter::runtime::SignalHandler::install();

    LOG_INFO("Router Ready");
    LOG_INFO("  Services: " << config.services.size());
    LOG_INFO("  Max transient processes: " << config.router.max_concurrent_processes);

    // Blocks until SIGINT/SIGTERM
    runtime.run();
    runtime.shutdown();

    LOG_INFO("Shutdown complete");
    return 0;
}
