#include "media/FormatSelector.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <set>

namespace Yturl {

namespace {

bool hasCodec(const std::string& codec) {
    return !codec.empty() && codec != "none";
}

} // namespace

bool FormatSelector::isVideoTrack(const FormatCandidate& candidate) {
    return candidate.containerExt == "mp4"
        && hasCodec(candidate.videoCodec)
        && candidate.height > 0;
}

bool FormatSelector::isAudioOnlyTrack(const FormatCandidate& candidate) {
    return hasCodec(candidate.audioCodec)
        && !hasCodec(candidate.videoCodec)
        && candidate.bitrateKbps > 0;
}

long FormatSelector::bitrateBucket(double bitrateKbps) {
    return std::lround(bitrateKbps / 10.0);
}

std::vector<FormatChoice> FormatSelector::videoChoices(const std::vector<FormatCandidate>& formats) {
    std::vector<FormatCandidate> video;
    std::copy_if(formats.begin(), formats.end(), std::back_inserter(video), isVideoTrack);

    // Stable: among equal heights the source order decides which one survives
    std::stable_sort(video.begin(), video.end(),
        [](const FormatCandidate& a, const FormatCandidate& b) { return a.height > b.height; });

    std::vector<FormatChoice> choices;
    std::set<int> seenHeights;
    for (const auto& candidate : video) {
        if (!seenHeights.insert(candidate.height).second) {
            continue;
        }

        FormatChoice choice;
        choice.formatId = candidate.formatId;
        choice.qualityLabel = std::to_string(candidate.height) + "p";
        choice.height = candidate.height;
        choice.estimatedSizeBytes = candidate.sizeBytes;
        choices.push_back(choice);

        if (choices.size() == MaxChoices) break;
    }
    return choices;
}

std::vector<FormatChoice> FormatSelector::audioChoices(const std::vector<FormatCandidate>& formats) {
    std::vector<FormatCandidate> audio;
    std::copy_if(formats.begin(), formats.end(), std::back_inserter(audio), isAudioOnlyTrack);

    std::stable_sort(audio.begin(), audio.end(),
        [](const FormatCandidate& a, const FormatCandidate& b) { return a.bitrateKbps > b.bitrateKbps; });

    std::vector<FormatChoice> choices;
    std::set<long> seenBuckets;
    for (const auto& candidate : audio) {
        if (!seenBuckets.insert(bitrateBucket(candidate.bitrateKbps)).second) {
            continue;
        }

        FormatChoice choice;
        choice.formatId = candidate.formatId;
        choice.qualityLabel = std::to_string(std::lround(candidate.bitrateKbps)) + " kbps";
        choice.bitrateKbps = candidate.bitrateKbps;
        choice.estimatedSizeBytes = candidate.sizeBytes;
        choices.push_back(choice);

        if (choices.size() == MaxChoices) break;
    }
    return choices;
}

std::vector<FormatChoice> FormatSelector::choicesFor(DownloadMode mode,
                                                     const std::vector<FormatCandidate>& formats) {
    return mode == DownloadMode::Audio ? audioChoices(formats) : videoChoices(formats);
}

std::optional<FormatCandidate> FormatSelector::pickForCeiling(const std::vector<FormatCandidate>& formats,
                                                              int64_t ceilingBytes) {
    std::vector<FormatCandidate> video;
    std::copy_if(formats.begin(), formats.end(), std::back_inserter(video), isVideoTrack);
    if (video.empty()) {
        return std::nullopt;
    }

    std::stable_sort(video.begin(), video.end(),
        [](const FormatCandidate& a, const FormatCandidate& b) { return a.height > b.height; });

    for (const auto& candidate : video) {
        if (candidate.sizeBytes <= 0) {
            continue;
        }
        double estimated = static_cast<double>(candidate.sizeBytes) * SizeInflation;
        if (estimated <= static_cast<double>(ceilingBytes)) {
            return candidate;
        }
    }

    for (const auto& candidate : video) {
        if (candidate.height <= SafeHeight) {
            return candidate;
        }
    }

    return *std::min_element(video.begin(), video.end(),
        [](const FormatCandidate& a, const FormatCandidate& b) { return a.height < b.height; });
}

} // namespace Yturl
