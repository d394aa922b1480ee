#include "utils/PlatformDetector.hpp"

namespace Yturl {

const std::vector<PlatformDetector::Pattern>& PlatformDetector::patterns() {
    // Host must be followed by a path, query or end of token so that
    // lookalikes such as "youtube.com.evil.net" do not match
    static const std::vector<Pattern> table = {
        {Platform::YouTube, std::regex(
            R"(https?://(?:www\.|m\.|music\.)?(?:youtube\.com|youtu\.be)(?:[/?#][^\s]*)?(?=\s|$))",
            std::regex::icase)},
        {Platform::TikTok, std::regex(
            R"(https?://(?:www\.|vm\.|vt\.|m\.)?tiktok\.com(?:[/?#][^\s]*)?(?=\s|$))",
            std::regex::icase)},
        {Platform::Instagram, std::regex(
            R"(https?://(?:www\.)?instagram\.com(?:[/?#][^\s]*)?(?=\s|$))",
            std::regex::icase)},
    };
    return table;
}

MediaReference PlatformDetector::detect(const std::string& text) {
    MediaReference ref;
    if (text.empty()) {
        return ref;
    }

    for (const auto& pattern : patterns()) {
        std::smatch match;
        if (std::regex_search(text, match, pattern.regex)) {
            ref.platform = pattern.platform;
            ref.url = match.str();
            return ref;
        }
    }
    return ref;
}

bool PlatformDetector::isSupported(const std::string& text) {
    return detect(text).platform != Platform::Unknown;
}

} // namespace Yturl
