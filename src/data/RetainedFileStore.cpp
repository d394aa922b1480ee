#include "data/RetainedFileStore.hpp"
#include "utils/FileId.hpp"
#include "utils/Logger.hpp"
#include <filesystem>

namespace fs = std::filesystem;

namespace Yturl {

RetainedFileStore::RetainedFileStore(std::string directory,
                                     std::shared_ptr<DeletionScheduler> scheduler,
                                     std::chrono::seconds retention,
                                     std::chrono::seconds servedGrace)
    : directory(std::move(directory))
    , scheduler(std::move(scheduler))
    , retention(retention)
    , servedGrace(servedGrace) {
}

const std::vector<std::string>& RetainedFileStore::knownExtensions() {
    static const std::vector<std::string> extensions = {"mp4", "mp3"};
    return extensions;
}

RetainedFile RetainedFileStore::retain(const std::string& fileId, const std::string& ext) {
    RetainedFile file;
    file.fileId = fileId;
    file.ext = ext;
    file.path = (fs::path(directory) / (fileId + "." + ext)).string();
    file.createdAt = std::chrono::system_clock::now();

    {
        std::lock_guard<std::mutex> lock(mutex);
        files[fileId] = file;
    }

    scheduleRemoval(file, retention);
    LOG_DL_INFO("Retaining {} for {}s", file.path, retention.count());
    return file;
}

std::optional<RetainedFile> RetainedFileStore::open(const std::string& fileId) const {
    if (!FileId::isValid(fileId)) {
        return std::nullopt;
    }

    for (const auto& ext : knownExtensions()) {
        fs::path path = fs::path(directory) / (fileId + "." + ext);
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            continue;
        }

        RetainedFile file;
        file.fileId = fileId;
        file.ext = ext;
        file.path = path.string();
        file.createdAt = std::chrono::system_clock::now();

        std::lock_guard<std::mutex> lock(mutex);
        auto it = files.find(fileId);
        if (it != files.end()) {
            file.createdAt = it->second.createdAt;
        }
        return file;
    }
    return std::nullopt;
}

void RetainedFileStore::release(const RetainedFile& file) {
    scheduleRemoval(file, servedGrace);
}

size_t RetainedFileStore::trackedCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return files.size();
}

void RetainedFileStore::scheduleRemoval(const RetainedFile& file, std::chrono::seconds delay) {
    auto fileId = file.fileId;
    auto path = file.path;
    scheduler->scheduleAfter(delay, [this, fileId, path] {
        removeNow(fileId, path);
    });
}

void RetainedFileStore::removeNow(const std::string& fileId, const std::string& path) {
    std::error_code ec;
    bool removed = fs::remove(path, ec);
    if (ec) {
        LOG_DL_WARN("Failed to remove {}: {}", path, ec.message());
    } else if (removed) {
        LOG_DL_INFO("Removed {}", path);
    }

    std::lock_guard<std::mutex> lock(mutex);
    auto it = files.find(fileId);
    if (it != files.end() && it->second.path == path) {
        files.erase(it);
    }
}

} // namespace Yturl
