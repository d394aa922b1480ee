#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>

namespace Yturl {

/**
 * Logger utility class
 * Provides structured logging to files and console
 */
class Logger {
public:
    // Initialize logging system
    static void initialize(const std::string& logDir = "logs");

    // Get loggers
    static std::shared_ptr<spdlog::logger> getBotLogger();
    static std::shared_ptr<spdlog::logger> getWebLogger();
    static std::shared_ptr<spdlog::logger> getDownloaderLogger();

    // Shutdown logging system
    static void shutdown();

private:
    static std::shared_ptr<spdlog::logger> botLogger;
    static std::shared_ptr<spdlog::logger> webLogger;
    static std::shared_ptr<spdlog::logger> downloaderLogger;

    static void createLogger(
        const std::string& name,
        const std::string& filename,
        std::shared_ptr<spdlog::logger>& logger
    );
};

// Convenience macros
#define LOG_BOT_INFO(...)    Yturl::Logger::getBotLogger()->info(__VA_ARGS__)
#define LOG_BOT_WARN(...)    Yturl::Logger::getBotLogger()->warn(__VA_ARGS__)
#define LOG_BOT_ERROR(...)   Yturl::Logger::getBotLogger()->error(__VA_ARGS__)
#define LOG_BOT_DEBUG(...)   Yturl::Logger::getBotLogger()->debug(__VA_ARGS__)

#define LOG_WEB_INFO(...)    Yturl::Logger::getWebLogger()->info(__VA_ARGS__)
#define LOG_WEB_WARN(...)    Yturl::Logger::getWebLogger()->warn(__VA_ARGS__)
#define LOG_WEB_ERROR(...)   Yturl::Logger::getWebLogger()->error(__VA_ARGS__)

#define LOG_DL_INFO(...)     Yturl::Logger::getDownloaderLogger()->info(__VA_ARGS__)
#define LOG_DL_WARN(...)     Yturl::Logger::getDownloaderLogger()->warn(__VA_ARGS__)
#define LOG_DL_ERROR(...)    Yturl::Logger::getDownloaderLogger()->error(__VA_ARGS__)
#define LOG_DL_DEBUG(...)    Yturl::Logger::getDownloaderLogger()->debug(__VA_ARGS__)

} // namespace Yturl
