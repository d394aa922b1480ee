#include "media/ProgressParser.hpp"
#include <cstdlib>

namespace Yturl {

ProgressParser::ProgressParser(DownloadMode mode)
    : mode(mode)
    , legs(0) {
}

const std::vector<ProgressParser::Rule>& ProgressParser::rules() {
    static const std::vector<Rule> table = {
        {Marker::Merge, std::regex(R"(\[Merger\])"), true},
        {Marker::ExtractAudio, std::regex(R"(\[ExtractAudio\])"), true},
        {Marker::Destination, std::regex(R"(\[download\] Destination:)"), false},
        {Marker::Percent, std::regex(R"(\[download\]\s+([\d.]+)%)"), false},
    };
    return table;
}

ProgressStage ProgressParser::currentDownloadStage() const {
    if (mode == DownloadMode::Audio || legs >= 2) {
        return ProgressStage::DownloadingAudio;
    }
    return ProgressStage::DownloadingVideo;
}

std::vector<ProgressEvent> ProgressParser::feed(const std::string& line) {
    std::vector<ProgressEvent> events;

    for (const auto& rule : rules()) {
        std::smatch match;
        if (!std::regex_search(line, match, rule.regex)) {
            continue;
        }

        switch (rule.marker) {
            case Marker::Merge:
                events.push_back(ProgressEvent::progress(ProgressStage::Merging, -1));
                break;
            case Marker::ExtractAudio:
                events.push_back(ProgressEvent::progress(ProgressStage::Converting, -1));
                break;
            case Marker::Destination:
                ++legs;
                if (legs == 2 && mode == DownloadMode::Video) {
                    events.push_back(ProgressEvent::progress(ProgressStage::DownloadingAudio, 0));
                }
                break;
            case Marker::Percent: {
                double percent = std::strtod(match[1].str().c_str(), nullptr);
                events.push_back(ProgressEvent::progress(currentDownloadStage(), percent));
                break;
            }
        }

        if (rule.exclusive) {
            break;
        }
    }

    return events;
}

} // namespace Yturl
