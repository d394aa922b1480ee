#pragma once

#include "data/DeletionScheduler.hpp"
#include "models/Media.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Yturl {

/**
 * Retained file store
 *
 * Finished artifacts stay in the temp directory until a client fetches them.
 * Two independent deletions race for every file: a long safety-net delay
 * scheduled at retain() and a short one scheduled at release() after a
 * fetch. Whichever fires first removes the file; the other finds nothing.
 */
class RetainedFileStore {
public:
    RetainedFileStore(std::string directory,
                      std::shared_ptr<DeletionScheduler> scheduler,
                      std::chrono::seconds retention,
                      std::chrono::seconds servedGrace);

    // Record a finished job's artifact and arm the safety-net deletion
    RetainedFile retain(const std::string& fileId, const std::string& ext);

    // Look up by id, trying mp4 before mp3; nullopt for bad ids or missing files
    std::optional<RetainedFile> open(const std::string& fileId) const;

    // Arm the short deletion once the file has been sent
    void release(const RetainedFile& file);

    size_t trackedCount() const;

    static const std::vector<std::string>& knownExtensions();

private:
    std::string directory;
    std::shared_ptr<DeletionScheduler> scheduler;
    std::chrono::seconds retention;
    std::chrono::seconds servedGrace;

    std::map<std::string, RetainedFile> files;
    mutable std::mutex mutex;

    void scheduleRemoval(const RetainedFile& file, std::chrono::seconds delay);
    void removeNow(const std::string& fileId, const std::string& path);
};

} // namespace Yturl
