#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace Yturl {

using json = nlohmann::json;

/**
 * Supported source platforms
 */
enum class Platform {
    YouTube,
    TikTok,
    Instagram,
    Unknown
};

/**
 * Detected platform plus the URL that matched it
 */
struct MediaReference {
    Platform platform = Platform::Unknown;
    std::string url;
};

/**
 * One encoding offered by the source, as reported by the tool
 */
struct FormatCandidate {
    std::string formatId;
    std::string containerExt;
    int height = 0;
    std::string videoCodec;
    std::string audioCodec;
    double bitrateKbps = 0.0;
    int64_t sizeBytes = 0;          // 0 = unknown
    bool sizeIsApproximate = false;
};

/**
 * User-facing projection of a candidate
 */
struct FormatChoice {
    std::string formatId;
    std::string qualityLabel;
    std::optional<int> height;
    std::optional<double> bitrateKbps;
    int64_t estimatedSizeBytes = 0;

    json toJson() const;
};

struct MediaMetadata {
    std::string id;
    std::string title;
    std::string uploaderName;
    double durationSeconds = 0.0;
    std::string thumbnailUrl;
    std::vector<FormatCandidate> formats;
};

enum class DownloadMode {
    Video,
    Audio
};

enum class ProgressStage {
    DownloadingVideo,
    DownloadingAudio,
    Merging,
    Converting,
    Done,
    Error
};

/**
 * Structured progress report for one job
 * percent == -1 means indeterminate
 */
struct ProgressEvent {
    ProgressStage stage = ProgressStage::DownloadingVideo;
    double percent = 0.0;
    std::string fileId;
    std::string ext;
    std::string errorMessage;

    bool isTerminal() const {
        return stage == ProgressStage::Done || stage == ProgressStage::Error;
    }

    json toJson() const;

    static ProgressEvent progress(ProgressStage stage, double percent);
    static ProgressEvent done(const std::string& fileId, const std::string& ext);
    static ProgressEvent error(const std::string& message);
};

/**
 * Completed artifact waiting on disk for a client fetch
 */
struct RetainedFile {
    std::string fileId;
    std::string path;
    std::string ext;
    std::chrono::system_clock::time_point createdAt;
};

// Enum conversions
std::string platformToString(Platform platform);
std::string modeToString(DownloadMode mode);
std::optional<DownloadMode> parseMode(const std::string& text);
std::string stageToString(ProgressStage stage);

// Output container for a mode ("mp4" / "mp3")
std::string extensionFor(DownloadMode mode);

// "m:ss" below one hour, "h:mm:ss" above
std::string formatDuration(double seconds);

} // namespace Yturl
