#pragma once

#include "models/Media.hpp"
#include <regex>
#include <string>
#include <vector>

namespace Yturl {

/**
 * Platform detector
 * Finds the first supported video link in free text, e.g.
 * "look https://youtu.be/abc" -> { YouTube, "https://youtu.be/abc" }
 */
class PlatformDetector {
public:
    /**
     * Detect the platform of the first matching link
     * Platforms are tried in table order; no match yields Unknown with an empty URL
     */
    static MediaReference detect(const std::string& text);

    /**
     * Check if text contains a supported link
     */
    static bool isSupported(const std::string& text);

private:
    struct Pattern {
        Platform platform;
        std::regex regex;
    };

    static const std::vector<Pattern>& patterns();
};

} // namespace Yturl
