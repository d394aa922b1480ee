#pragma once

#include "models/Media.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Yturl {

/**
 * Format selector
 * Reduces the raw candidate list to a handful of distinct quality tiers
 */
class FormatSelector {
public:
    static constexpr size_t MaxChoices = 5;
    static constexpr double SizeInflation = 1.15;   // Audio track muxed into the video
    static constexpr int SafeHeight = 720;

    /**
     * mp4 video tracks, one per height, tallest first
     */
    static std::vector<FormatChoice> videoChoices(const std::vector<FormatCandidate>& formats);

    /**
     * Audio-only tracks, one per 10 kbps bucket, highest bitrate first
     */
    static std::vector<FormatChoice> audioChoices(const std::vector<FormatCandidate>& formats);

    static std::vector<FormatChoice> choicesFor(DownloadMode mode,
                                                const std::vector<FormatCandidate>& formats);

    /**
     * Pick the format the bot downloads:
     *   1. tallest whose inflated size is known and fits the ceiling
     *   2. tallest at or below 720p
     *   3. shortest available
     * nullopt when there is no mp4 video track at all
     */
    static std::optional<FormatCandidate> pickForCeiling(const std::vector<FormatCandidate>& formats,
                                                         int64_t ceilingBytes);

    // Rounded to the nearest 10 kbps
    static long bitrateBucket(double bitrateKbps);

private:
    static bool isVideoTrack(const FormatCandidate& candidate);
    static bool isAudioOnlyTrack(const FormatCandidate& candidate);
};

} // namespace Yturl
