#include "media/MetadataFetcher.hpp"
#include "utils/Logger.hpp"

namespace Yturl {

namespace {

// Tool JSON uses null for unknown values
std::string jsonString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

double jsonNumber(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) {
        return 0.0;
    }
    return it->get<double>();
}

int64_t jsonInteger(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) {
        return 0;
    }
    return static_cast<int64_t>(it->get<double>());
}

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

FormatCandidate parseFormat(const json& f) {
    FormatCandidate candidate;
    candidate.formatId = jsonString(f, "format_id");
    candidate.containerExt = jsonString(f, "ext");
    candidate.height = static_cast<int>(jsonInteger(f, "height"));
    candidate.videoCodec = jsonString(f, "vcodec");
    candidate.audioCodec = jsonString(f, "acodec");

    candidate.bitrateKbps = jsonNumber(f, "abr");
    if (candidate.bitrateKbps <= 0) {
        candidate.bitrateKbps = jsonNumber(f, "tbr");
    }

    int64_t exact = jsonInteger(f, "filesize");
    if (exact > 0) {
        candidate.sizeBytes = exact;
    } else {
        candidate.sizeBytes = jsonInteger(f, "filesize_approx");
        candidate.sizeIsApproximate = candidate.sizeBytes > 0;
    }
    return candidate;
}

} // namespace

MetadataFetcher::MetadataFetcher(std::shared_ptr<ToolRunner> runner)
    : runner(std::move(runner)) {
}

bool MetadataFetcher::parseMetadata(const std::string& document, MediaMetadata& out) {
    json root = json::parse(document, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        return false;
    }

    MediaMetadata metadata;
    metadata.id = jsonString(root, "id");
    metadata.title = jsonString(root, "title");
    metadata.uploaderName = jsonString(root, "uploader");
    if (metadata.uploaderName.empty()) {
        metadata.uploaderName = jsonString(root, "channel");
    }
    metadata.durationSeconds = jsonNumber(root, "duration");
    metadata.thumbnailUrl = jsonString(root, "thumbnail");

    auto formats = root.find("formats");
    if (formats != root.end() && formats->is_array()) {
        for (const auto& f : *formats) {
            if (f.is_object()) {
                metadata.formats.push_back(parseFormat(f));
            }
        }
    }

    out = std::move(metadata);
    return true;
}

MetadataResult MetadataFetcher::fetch(const std::string& url) const {
    MetadataResult result;

    std::unique_ptr<ToolProcess> process;
    try {
        process = runner->spawn({"--dump-json", "--no-warnings", "--no-playlist", url});
    } catch (const std::exception& e) {
        LOG_DL_ERROR("Metadata tool failed to start: {}", e.what());
        result.errorKind = MetadataErrorKind::ToolFailed;
        result.error = "failed to start metadata tool";
        return result;
    }

    std::string document;
    std::string diagnostic;
    std::string line;
    while (process->readLine(line)) {
        if (document.empty() && !line.empty() && line.front() == '{') {
            document = line;
        } else if (diagnostic.empty() && line.rfind("ERROR:", 0) == 0) {
            diagnostic = trim(line);
        }
    }

    int exitCode = process->wait();
    if (exitCode != 0) {
        LOG_DL_WARN("Metadata fetch for {} exited with {}", url, exitCode);
        result.errorKind = MetadataErrorKind::ToolFailed;
        result.error = diagnostic.empty()
            ? "metadata tool exited with code " + std::to_string(exitCode)
            : diagnostic;
        return result;
    }

    if (document.empty() || !parseMetadata(document, result.metadata)) {
        LOG_DL_WARN("Metadata fetch for {} returned unparseable output", url);
        result.metadata = MediaMetadata{};
        result.errorKind = MetadataErrorKind::Unparseable;
        result.error = "unparseable metadata";
        return result;
    }

    LOG_DL_INFO("Fetched metadata for {} ({} formats)", result.metadata.id, result.metadata.formats.size());
    result.success = true;
    return result;
}

} // namespace Yturl
