#include "Application.hpp"
#include "models/Config.hpp"
#include "utils/Logger.hpp"
#include <iostream>
#include <csignal>

void signalHandler(int signum) {
    std::cout << "\nInterrupt signal (" << signum << ") received.\n";
    Yturl::stopApplication();
}

int main(int argc, char* argv[]) {
    auto& config = Yturl::getConfig();

    // Try loading from file first
    std::string configFile = "config/config.json";
    if (argc > 1) {
        configFile = argv[1];
    }

    bool fromFile = config.loadFromFile(configFile);
    if (!fromFile) {
        config.loadFromEnvironment();
    }
    config.loadOwnerFromEnvFile();

    // Initialize logger
    Yturl::Logger::initialize(config.logDir);

    LOG_BOT_INFO("=== yturl Starting ===");
    LOG_BOT_INFO("Build Date: {}", __DATE__);

    if (fromFile) {
        LOG_BOT_INFO("Configuration loaded from file: {}", configFile);
    } else {
        LOG_BOT_WARN("No usable config file at {}, using environment variables", configFile);
    }

    LOG_DL_INFO("Media tool: {}", config.ytDlpPath);
    LOG_DL_INFO("Temp directory: {}", config.tempDir);
    LOG_DL_INFO("Retention: {} s unfetched, {} s after fetch",
                config.retentionSeconds, config.servedDeleteSeconds);

    try {
        // Setup signal handlers
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
        std::signal(SIGPIPE, SIG_IGN);

        LOG_BOT_INFO("Signal handlers registered");

        Yturl::runApplication();

        LOG_BOT_INFO("Stopped normally");

    } catch (const std::exception& e) {
        LOG_BOT_ERROR("Fatal error: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << std::endl;
        Yturl::Logger::shutdown();
        return 1;
    }

    // Cleanup
    LOG_BOT_INFO("=== yturl Shutdown ===");
    Yturl::Logger::shutdown();

    return 0;
}
