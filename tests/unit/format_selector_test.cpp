#include "media/FormatSelector.hpp"

#include <cassert>
#include <iostream>
#include <set>

namespace {

using Yturl::DownloadMode;
using Yturl::FormatCandidate;
using Yturl::FormatSelector;

constexpr int64_t MB = 1024 * 1024;

FormatCandidate Video(const std::string& id, int height, int64_t size = 0, const std::string& ext = "mp4") {
    FormatCandidate c;
    c.formatId = id;
    c.containerExt = ext;
    c.height = height;
    c.videoCodec = "avc1.640028";
    c.audioCodec = "none";
    c.sizeBytes = size;
    return c;
}

FormatCandidate Audio(const std::string& id, double kbps, int64_t size = 0) {
    FormatCandidate c;
    c.formatId = id;
    c.containerExt = "m4a";
    c.videoCodec = "none";
    c.audioCodec = "mp4a.40.2";
    c.bitrateKbps = kbps;
    c.sizeBytes = size;
    return c;
}

void TestVideoChoicesFilterSortAndDedup() {
    std::vector<FormatCandidate> formats = {
        Video("a", 360, 10),
        Video("b", 1080, 80),
        Video("webm", 1440, 0, "webm"),
        Video("c", 720, 40),
        Video("c2", 720, 45),
        Audio("aud", 128),
        Video("zero", 0),
    };

    auto choices = FormatSelector::videoChoices(formats);
    assert(choices.size() == 3);
    assert(choices[0].formatId == "b" && choices[0].qualityLabel == "1080p");
    assert(choices[1].formatId == "c");       // first 720p in source order wins
    assert(choices[1].estimatedSizeBytes == 40);
    assert(choices[2].formatId == "a");
    assert(choices[0].height && *choices[0].height == 1080);
    assert(!choices[0].bitrateKbps);
}

void TestVideoChoicesCappedAtFive() {
    std::vector<FormatCandidate> formats;
    for (int h : {144, 240, 360, 480, 720, 1080, 1440, 2160}) {
        formats.push_back(Video("v" + std::to_string(h), h));
    }

    auto choices = FormatSelector::videoChoices(formats);
    assert(choices.size() == FormatSelector::MaxChoices);
    for (size_t i = 1; i < choices.size(); ++i) {
        assert(*choices[i - 1].height > *choices[i].height);
    }
    assert(choices.front().qualityLabel == "2160p");
}

void TestAudioChoicesBucketByTenKbps() {
    std::vector<FormatCandidate> formats = {
        Audio("low", 48.5),
        Audio("hi", 129.6),
        Audio("hi2", 127.0),     // same bucket as 129.6 -> dropped
        Audio("mid", 70.2),
        Video("v", 720),
        Audio("none", 0),
    };

    auto choices = FormatSelector::audioChoices(formats);
    assert(choices.size() == 3);
    assert(choices[0].formatId == "hi" && choices[0].qualityLabel == "130 kbps");
    assert(choices[1].formatId == "mid" && choices[1].qualityLabel == "70 kbps");
    assert(choices[2].formatId == "low");

    std::set<long> buckets;
    for (size_t i = 0; i < choices.size(); ++i) {
        assert(buckets.insert(FormatSelector::bitrateBucket(*choices[i].bitrateKbps)).second);
        if (i > 0) {
            assert(FormatSelector::bitrateBucket(*choices[i - 1].bitrateKbps)
                   > FormatSelector::bitrateBucket(*choices[i].bitrateKbps));
        }
    }
}

void TestChoicesForDispatchesOnMode() {
    std::vector<FormatCandidate> formats = {Video("v", 720), Audio("a", 128)};
    assert(FormatSelector::choicesFor(DownloadMode::Video, formats).front().formatId == "v");
    assert(FormatSelector::choicesFor(DownloadMode::Audio, formats).front().formatId == "a");
    assert(FormatSelector::choicesFor(DownloadMode::Video, {}).empty());
}

void TestPickFirstInflatedSizeUnderCeiling() {
    std::vector<FormatCandidate> formats = {
        Video("1080", 1080, 80 * MB),
        Video("720", 720, 40 * MB),
        Video("480", 480, 20 * MB),
    };

    // 92, 46, 23 MB after inflation
    auto pick = FormatSelector::pickForCeiling(formats, 50 * MB);
    assert(pick);
    assert(pick->formatId == "720");
}

void TestPickFallsBackToLowestHeight() {
    std::vector<FormatCandidate> formats = {Video("1080", 1080)};

    auto pick = FormatSelector::pickForCeiling(formats, 50 * MB);
    assert(pick);
    assert(pick->formatId == "1080");
}

void TestPickPrefersSafeHeightWhenSizesUnknown() {
    std::vector<FormatCandidate> formats = {
        Video("2160", 2160),
        Video("480", 480),
        Video("720", 720),
        Video("1080", 1080),
    };

    auto pick = FormatSelector::pickForCeiling(formats, 50 * MB);
    assert(pick && pick->formatId == "720");
}

void TestPickWithoutVideoTracks() {
    assert(!FormatSelector::pickForCeiling({}, 50 * MB));
    assert(!FormatSelector::pickForCeiling({Audio("a", 128, MB)}, 50 * MB));
}

void TestPickIsDeterministic() {
    std::vector<FormatCandidate> formats = {
        Video("x", 720, 60 * MB),
        Video("y", 720, 30 * MB),
        Video("z", 360, 10 * MB),
    };
    auto first = FormatSelector::pickForCeiling(formats, 50 * MB);
    for (int i = 0; i < 10; ++i) {
        auto again = FormatSelector::pickForCeiling(formats, 50 * MB);
        assert(again && again->formatId == first->formatId);
    }
    assert(first->formatId == "y");
}

} // namespace

int main() {
    TestVideoChoicesFilterSortAndDedup();
    TestVideoChoicesCappedAtFive();
    TestAudioChoicesBucketByTenKbps();
    TestChoicesForDispatchesOnMode();
    TestPickFirstInflatedSizeUnderCeiling();
    TestPickFallsBackToLowestHeight();
    TestPickPrefersSafeHeightWhenSizesUnknown();
    TestPickWithoutVideoTracks();
    TestPickIsDeterministic();

    std::cout << "format_selector_test: pass\n";
    return 0;
}
