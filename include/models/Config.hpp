#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace Yturl {

using json = nlohmann::json;

/**
 * Configuration management class
 * Loads configuration from JSON file or environment variables
 */
class Config {
public:
    // Telegram
    std::string telegramToken;
    std::optional<int64_t> ownerId;
    std::string envFilePath;            // Where the claimed owner is persisted
    int presenceIntervalSeconds;
    int64_t telegramMaxBytes;

    // HTTP
    std::string bindAddress;
    unsigned short port;
    int httpThreads;

    // Downloads
    std::string ytDlpPath;
    std::string tempDir;
    int retentionSeconds;               // Safety net for never-fetched files
    int servedDeleteSeconds;            // Grace period after a successful fetch

    // Logging
    std::string logDir;

    // Singleton pattern
    static Config& getInstance();

    // Load configuration
    bool loadFromFile(const std::string& filename);
    bool loadFromEnvironment();
    bool loadFromJson(const json& config);

    // Fill ownerId from the env file when nothing configured it
    void loadOwnerFromEnvFile();

    bool botEnabled() const { return !telegramToken.empty(); }

    // Restore defaults (tests)
    void reset();

    ~Config() = default;

private:
    Config();

    // Prevent copying
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Raise intervals and counts that would disable a component to their minimum
    void clampLimits();

    // Helper methods
    std::string getEnv(const std::string& key, const std::string& defaultValue = "") const;
    int64_t getEnvInt(const std::string& key, int64_t defaultValue = 0) const;

    static std::unique_ptr<Config> instance;
};

/**
 * Get global configuration instance
 */
inline Config& getConfig() {
    return Config::getInstance();
}

/**
 * Parse an owner id value; empty or non-numeric yields nullopt
 */
std::optional<int64_t> parseOwnerId(const std::string& text);

} // namespace Yturl
