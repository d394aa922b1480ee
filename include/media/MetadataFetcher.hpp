#pragma once

#include "media/ToolRunner.hpp"
#include "models/Media.hpp"
#include <memory>
#include <string>

namespace Yturl {

enum class MetadataErrorKind {
    None,
    ToolFailed,     // Non-zero exit or spawn failure
    Unparseable     // Tool succeeded but produced no usable JSON
};

/**
 * Metadata fetch result
 * On failure metadata stays default-constructed
 */
struct MetadataResult {
    bool success = false;
    MediaMetadata metadata;
    MetadataErrorKind errorKind = MetadataErrorKind::None;
    std::string error;
};

/**
 * Runs the tool in dump-json mode and parses its description of a URL
 */
class MetadataFetcher {
public:
    explicit MetadataFetcher(std::shared_ptr<ToolRunner> runner);

    MetadataResult fetch(const std::string& url) const;

    // Parse one tool JSON document; exposed for tests
    static bool parseMetadata(const std::string& document, MediaMetadata& out);

private:
    std::shared_ptr<ToolRunner> runner;
};

} // namespace Yturl
