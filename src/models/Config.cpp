#include "models/Config.hpp"
#include "utils/EnvFile.hpp"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace Yturl {

std::unique_ptr<Config> Config::instance = nullptr;

Config::Config() {
    reset();
}

Config& Config::getInstance() {
    if (!instance) {
        instance = std::unique_ptr<Config>(new Config());
    }
    return *instance;
}

void Config::reset() {
    telegramToken.clear();
    ownerId.reset();
    envFilePath = "/app/.env";
    presenceIntervalSeconds = 4;
    telegramMaxBytes = 50LL * 1024 * 1024;

    bindAddress = "0.0.0.0";
    port = 8080;
    httpThreads = 4;

    ytDlpPath = "yt-dlp";
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    tempDir = ec ? "/tmp" : tmp.string();
    retentionSeconds = 600;
    servedDeleteSeconds = 5;

    logDir = "logs";
}

bool Config::loadFromFile(const std::string& filename) {
    try {
        std::ifstream file(filename);
        if (!file.is_open()) {
            return false;
        }

        json config;
        file >> config;
        return loadFromJson(config);
    } catch (const std::exception&) {
        return false;
    }
}

bool Config::loadFromJson(const json& config) {
    if (!config.is_object()) {
        return false;
    }

    // Telegram
    telegramToken = config.value("telegram_token", telegramToken);
    if (config.contains("owner_id")) {
        const auto& owner = config["owner_id"];
        if (owner.is_number_integer()) {
            ownerId = owner.get<int64_t>();
        } else if (owner.is_string()) {
            ownerId = parseOwnerId(owner.get<std::string>());
        }
    }
    envFilePath = config.value("env_file", envFilePath);
    presenceIntervalSeconds = config.value("presence_interval_seconds", presenceIntervalSeconds);
    telegramMaxBytes = config.value("telegram_max_bytes", telegramMaxBytes);

    // HTTP
    bindAddress = config.value("bind_address", bindAddress);
    port = config.value("port", port);
    httpThreads = config.value("http_threads", httpThreads);

    // Downloads
    ytDlpPath = config.value("ytdlp_path", ytDlpPath);
    tempDir = config.value("temp_dir", tempDir);
    retentionSeconds = config.value("retention_seconds", retentionSeconds);
    servedDeleteSeconds = config.value("served_delete_seconds", servedDeleteSeconds);

    logDir = config.value("log_dir", logDir);

    clampLimits();
    return true;
}

bool Config::loadFromEnvironment() {
    telegramToken = getEnv("TELEGRAM_BOT");
    ownerId = parseOwnerId(getEnv("TELEGRAM_OWNER"));
    envFilePath = getEnv("ENV_FILE", envFilePath);
    presenceIntervalSeconds = static_cast<int>(getEnvInt("PRESENCE_INTERVAL_SECONDS", presenceIntervalSeconds));
    telegramMaxBytes = getEnvInt("TELEGRAM_MAX_BYTES", telegramMaxBytes);

    bindAddress = getEnv("BIND_ADDRESS", bindAddress);
    port = static_cast<unsigned short>(getEnvInt("PORT", port));
    httpThreads = static_cast<int>(getEnvInt("HTTP_THREADS", httpThreads));

    ytDlpPath = getEnv("YTDLP_PATH", ytDlpPath);
    tempDir = getEnv("TEMP_DIR", tempDir);
    retentionSeconds = static_cast<int>(getEnvInt("RETENTION_SECONDS", retentionSeconds));
    servedDeleteSeconds = static_cast<int>(getEnvInt("SERVED_DELETE_SECONDS", servedDeleteSeconds));

    logDir = getEnv("LOG_DIR", logDir);
    clampLimits();

    // Every key has a usable default; the bot is simply disabled without a token
    return true;
}

void Config::loadOwnerFromEnvFile() {
    if (ownerId || envFilePath.empty()) {
        return;
    }

    EnvFile envFile(envFilePath);
    if (!envFile.load()) {
        return;
    }

    auto value = envFile.get("TELEGRAM_OWNER");
    if (value) {
        ownerId = parseOwnerId(*value);
    }
}

void Config::clampLimits() {
    // Zero would make the presence loop and the deletion timers spin
    presenceIntervalSeconds = std::max(presenceIntervalSeconds, 1);
    retentionSeconds = std::max(retentionSeconds, 1);
    servedDeleteSeconds = std::max(servedDeleteSeconds, 0);
    httpThreads = std::max(httpThreads, 1);
    if (telegramMaxBytes <= 0) {
        telegramMaxBytes = 50LL * 1024 * 1024;
    }
}

std::string Config::getEnv(const std::string& key, const std::string& defaultValue) const {
    const char* value = std::getenv(key.c_str());
    return (value && *value) ? std::string(value) : defaultValue;
}

int64_t Config::getEnvInt(const std::string& key, int64_t defaultValue) const {
    const char* value = std::getenv(key.c_str());
    if (!value || !*value) return defaultValue;

    try {
        return std::stoll(value);
    } catch (const std::exception&) {
        return defaultValue;
    }
}

std::optional<int64_t> parseOwnerId(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }

    try {
        size_t consumed = 0;
        int64_t id = std::stoll(text, &consumed);
        if (consumed != text.size() || id == 0) {
            return std::nullopt;
        }
        return id;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace Yturl
