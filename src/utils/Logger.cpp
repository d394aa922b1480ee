#include "utils/Logger.hpp"
#include <filesystem>
#include <iostream>
#include <mutex>

namespace Yturl {

std::shared_ptr<spdlog::logger> Logger::botLogger = nullptr;
std::shared_ptr<spdlog::logger> Logger::webLogger = nullptr;
std::shared_ptr<spdlog::logger> Logger::downloaderLogger = nullptr;

namespace {
std::once_flag initFlag;
std::string configuredLogDir = "logs";
}

void Logger::initialize(const std::string& logDir) {
    std::call_once(initFlag, [&logDir] {
        configuredLogDir = logDir;

        // Set global log level
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");

        std::error_code ec;
        std::filesystem::create_directories(configuredLogDir, ec);

        createLogger("bot", configuredLogDir + "/bot_log.txt", botLogger);
        createLogger("web", configuredLogDir + "/web_log.txt", webLogger);
        createLogger("downloader", configuredLogDir + "/downloader_log.txt", downloaderLogger);

        botLogger->info("Logging system initialized");
    });
}

void Logger::createLogger(
    const std::string& name,
    const std::string& filename,
    std::shared_ptr<spdlog::logger>& logger
) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(spdlog::level::info);
    std::vector<spdlog::sink_ptr> sinks{console_sink};

    try {
        // Rotating file sink: 10MB max size, 3 backup files
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            filename, 1024 * 1024 * 10, 3
        );
        file_sink->set_level(spdlog::level::trace);
        sinks.push_back(file_sink);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "File logging disabled for " << name << ": " << ex.what() << std::endl;
    }

    logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::debug);
    spdlog::register_logger(logger);
}

std::shared_ptr<spdlog::logger> Logger::getBotLogger() {
    initialize();
    return botLogger;
}

std::shared_ptr<spdlog::logger> Logger::getWebLogger() {
    initialize();
    return webLogger;
}

std::shared_ptr<spdlog::logger> Logger::getDownloaderLogger() {
    initialize();
    return downloaderLogger;
}

void Logger::shutdown() {
    if (botLogger) {
        botLogger->flush();
    }
    if (webLogger) {
        webLogger->flush();
    }
    if (downloaderLogger) {
        downloaderLogger->flush();
    }

    spdlog::shutdown();
}

} // namespace Yturl
