#pragma once

#include "models/Media.hpp"
#include <regex>
#include <string>
#include <vector>

namespace Yturl {

/**
 * Turns yt-dlp output lines into progress events
 *
 * Marker table, in evaluation order:
 *   [Merger]                  -> merging (indeterminate)        exclusive
 *   [ExtractAudio]            -> converting (indeterminate)     exclusive
 *   [download] Destination:   -> next download leg
 *   [download]  42.0%         -> percent of the current leg
 * Destination and percent may both fire on one line; the leg is advanced
 * first. In video mode the second leg is the audio track.
 */
class ProgressParser {
public:
    explicit ProgressParser(DownloadMode mode);

    std::vector<ProgressEvent> feed(const std::string& line);

    int legCount() const { return legs; }

private:
    enum class Marker {
        Merge,
        ExtractAudio,
        Destination,
        Percent
    };

    struct Rule {
        Marker marker;
        std::regex regex;
        bool exclusive;
    };

    static const std::vector<Rule>& rules();

    ProgressStage currentDownloadStage() const;

    DownloadMode mode;
    int legs;
};

} // namespace Yturl
