// avatarlink runtime
// Config-based runtime with CLI argument parsing

#include <filesystem>
#include <iostream>
#include <string>

#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"
#include "runtime/signal_handler.hpp"

int main(int argc, char **argv) {
    std::string config_path = "avatarlink.yaml";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg.rfind("--config=", 0) == 0) {
            config_path = arg.substr(9);
        } else if (arg == "--help" || arg == "-h") {
            std::cerr << "Usage: avatarlink-runtime [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to config file (default: avatarlink.yaml)\n";
            std::cerr << "  --help, -h       Show this help\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    if (!std::filesystem::exists(config_path)) {
        // Logger level is not configured yet
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        std::cerr << "\nCreate a config file or specify path with --config=PATH\n";
        return 1;
    }

    avatarlink::logging::Logger::init(avatarlink::logging::Level::LVL_INFO);
    LOG_INFO("avatarlink runtime starting...");
    LOG_INFO("Loading config: " << config_path);

    avatarlink::runtime::RuntimeConfig config;
    std::string error;

    if (!avatarlink::runtime::load_config(config_path, config, error)) {
        LOG_ERROR("Failed to load config: " << error);
        return 1;
    }

    avatarlink::logging::Logger::set_level(avatarlink::logging::string_to_level(config.logging.level));

    avatarlink::runtime::Runtime runtime(config, config_path);

    if (!runtime.initialize(error)) {
        LOG_ERROR("Runtime initialization failed: " << error);
        return 1;
    }

    avatarlink::runtime::SignalHandler::install();

    LOG_INFO("Runtime Ready");
    LOG_INFO("  Providers: " << config.providers.size());
    LOG_INFO("  Retry: " << config.retry.max_attempts << " attempts per provider");
    LOG_INFO("  Cache TTL: " << config.cache.ttl_ms << "ms");

    runtime.run();
    runtime.shutdown();

    LOG_INFO("Shutdown complete");
    return 0;
}
