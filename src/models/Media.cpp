#include "models/Media.hpp"
#include <cstdio>

namespace Yturl {

json FormatChoice::toJson() const {
    json j = {
        {"formatId", formatId},
        {"quality", qualityLabel},
        {"filesize", estimatedSizeBytes}
    };
    if (height) {
        j["height"] = *height;
    }
    if (bitrateKbps) {
        j["bitrate"] = *bitrateKbps;
    }
    return j;
}

json ProgressEvent::toJson() const {
    json j = {
        {"stage", stageToString(stage)},
        {"percent", percent}
    };
    if (!fileId.empty()) {
        j["fileId"] = fileId;
    }
    if (!ext.empty()) {
        j["ext"] = ext;
    }
    if (!errorMessage.empty()) {
        j["error"] = errorMessage;
    }
    return j;
}

ProgressEvent ProgressEvent::progress(ProgressStage stage, double percent) {
    ProgressEvent event;
    event.stage = stage;
    event.percent = percent;
    return event;
}

ProgressEvent ProgressEvent::done(const std::string& fileId, const std::string& ext) {
    ProgressEvent event;
    event.stage = ProgressStage::Done;
    event.percent = 100.0;
    event.fileId = fileId;
    event.ext = ext;
    return event;
}

ProgressEvent ProgressEvent::error(const std::string& message) {
    ProgressEvent event;
    event.stage = ProgressStage::Error;
    event.percent = 0.0;
    event.errorMessage = message;
    return event;
}

std::string platformToString(Platform platform) {
    switch (platform) {
        case Platform::YouTube: return "youtube";
        case Platform::TikTok: return "tiktok";
        case Platform::Instagram: return "instagram";
        default: return "unknown";
    }
}

std::string modeToString(DownloadMode mode) {
    return mode == DownloadMode::Audio ? "audio" : "video";
}

std::optional<DownloadMode> parseMode(const std::string& text) {
    if (text.empty() || text == "video") {
        return DownloadMode::Video;
    }
    if (text == "audio") {
        return DownloadMode::Audio;
    }
    return std::nullopt;
}

std::string stageToString(ProgressStage stage) {
    switch (stage) {
        case ProgressStage::DownloadingVideo: return "downloading_video";
        case ProgressStage::DownloadingAudio: return "downloading_audio";
        case ProgressStage::Merging: return "merging";
        case ProgressStage::Converting: return "converting";
        case ProgressStage::Done: return "done";
        default: return "error";
    }
}

std::string extensionFor(DownloadMode mode) {
    return mode == DownloadMode::Audio ? "mp3" : "mp4";
}

std::string formatDuration(double seconds) {
    int total = seconds > 0 ? static_cast<int>(seconds) : 0;
    int h = total / 3600;
    int m = (total % 3600) / 60;
    int s = total % 60;

    char buffer[32];
    if (h > 0) {
        std::snprintf(buffer, sizeof(buffer), "%d:%02d:%02d", h, m, s);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%d:%02d", m, s);
    }
    return buffer;
}

} // namespace Yturl
