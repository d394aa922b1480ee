#include "media/DownloadOrchestrator.hpp"
#include "utils/FileId.hpp"
#include "utils/Logger.hpp"
#include <cstdio>
#include <filesystem>

namespace fs = std::filesystem;

namespace Yturl {

namespace {
constexpr double BytesPerMegabyte = 1024.0 * 1024.0;
}

// DownloadJob implementation

DownloadJob::DownloadJob(std::shared_ptr<ToolRunner> runner, DownloadRequest request,
                         const std::string& tempDir)
    : runner(std::move(runner))
    , request(std::move(request))
    , fileId(FileId::generate())
    , ext(extensionFor(this->request.mode))
    , parser(this->request.mode)
    , state(State::Pending)
    , cancelled(false) {
    fs::path base = fs::path(tempDir);
    outputPath = (base / (fileId + "." + ext)).string();
    // Audio: the tool picks the intermediate extension, the converter writes .mp3
    outputTemplate = this->request.mode == DownloadMode::Audio
        ? (base / (fileId + ".%(ext)s")).string()
        : outputPath;
}

DownloadJob::~DownloadJob() {
    std::unique_ptr<ToolProcess> owned;
    {
        std::lock_guard<std::mutex> lock(processMutex);
        owned = std::move(process);
    }
    if (owned) {
        owned->terminate();
        owned->wait();
    }
}

void DownloadJob::cancel() {
    cancelled = true;
    std::lock_guard<std::mutex> lock(processMutex);
    if (process) {
        process->terminate();
    }
}

void DownloadJob::launch() {
    state = State::Running;
    pending.push_back(ProgressEvent::progress(
        request.mode == DownloadMode::Audio ? ProgressStage::DownloadingAudio
                                            : ProgressStage::DownloadingVideo,
        0));

    auto args = DownloadOrchestrator::buildArguments(request, outputTemplate);
    LOG_DL_INFO("Job {}: {} download of format {} from {}",
                fileId, modeToString(request.mode), request.formatId, request.url);

    std::unique_ptr<ToolProcess> spawned;
    try {
        spawned = runner->spawn(args);
    } catch (const std::exception& e) {
        LOG_DL_ERROR("Job {}: failed to start tool: {}", fileId, e.what());
        pending.push_back(ProgressEvent::error("Failed to start download"));
        return;
    }

    std::lock_guard<std::mutex> lock(processMutex);
    process = std::move(spawned);
    if (cancelled) {
        process->terminate();
    }
}

std::optional<ProgressEvent> DownloadJob::next() {
    if (state == State::Pending) {
        launch();
    }

    while (pending.empty() && state == State::Running && !cancelled) {
        std::string line;
        ToolProcess* running = nullptr;
        {
            std::lock_guard<std::mutex> lock(processMutex);
            running = process.get();
        }
        if (!running) {
            break;
        }

        if (running->readLine(line)) {
            LOG_DL_DEBUG("Job {}: {}", fileId, line);
            for (auto& event : parser.feed(line)) {
                pending.push_back(std::move(event));
            }
        } else {
            finish();
        }
    }

    if (cancelled) {
        if (state != State::Cancelled) {
            LOG_DL_INFO("Job {} cancelled", fileId);
            finish();
            state = State::Cancelled;
        }
        pending.clear();
        return std::nullopt;
    }

    if (pending.empty()) {
        state = State::Finished;
        return std::nullopt;
    }

    ProgressEvent event = std::move(pending.front());
    pending.pop_front();
    if (event.isTerminal()) {
        pending.clear();
        state = State::Finished;
    }
    return event;
}

void DownloadJob::finish() {
    std::unique_ptr<ToolProcess> owned;
    {
        std::lock_guard<std::mutex> lock(processMutex);
        owned = std::move(process);
    }

    int exitCode = 0;
    if (owned) {
        if (cancelled) {
            owned->terminate();
        }
        exitCode = owned->wait();
    }

    if (cancelled) {
        discardArtifact();
        return;
    }

    if (exitCode != 0) {
        LOG_DL_WARN("Job {}: tool exited with {}", fileId, exitCode);
        discardArtifact();
        pending.push_back(ProgressEvent::error("Download failed"));
        return;
    }

    pending.push_back(checkArtifact());
    if (pending.back().stage == ProgressStage::Error) {
        discardArtifact();
    } else {
        LOG_DL_INFO("Job {} finished: {}", fileId, outputPath);
    }
}

ProgressEvent DownloadJob::checkArtifact() const {
    std::error_code ec;
    auto size = fs::file_size(outputPath, ec);
    if (ec) {
        LOG_DL_ERROR("Job {}: expected output {} is missing", fileId, outputPath);
        return ProgressEvent::error("Downloaded file not found");
    }

    if (request.sizeCeilingBytes > 0 && static_cast<int64_t>(size) > request.sizeCeilingBytes) {
        char message[128];
        std::snprintf(message, sizeof(message),
                      "File too large (%.1f MB). Telegram limit is %.0f MB.",
                      static_cast<double>(size) / BytesPerMegabyte,
                      static_cast<double>(request.sizeCeilingBytes) / BytesPerMegabyte);
        LOG_DL_WARN("Job {}: {}", fileId, message);
        return ProgressEvent::error(message);
    }

    return ProgressEvent::done(fileId, ext);
}

void DownloadJob::discardArtifact() const {
    std::error_code ec;
    fs::remove(outputPath, ec);
}

// DownloadOrchestrator implementation

DownloadOrchestrator::DownloadOrchestrator(std::shared_ptr<ToolRunner> runner, std::string tempDir)
    : runner(std::move(runner))
    , tempDir(std::move(tempDir)) {
}

std::unique_ptr<DownloadJob> DownloadOrchestrator::start(const DownloadRequest& request) const {
    return std::make_unique<DownloadJob>(runner, request, tempDir);
}

std::optional<ProgressEvent> DownloadOrchestrator::run(DownloadJob& job, const EventCallback& onEvent) const {
    while (auto event = job.next()) {
        if (onEvent) {
            onEvent(*event);
        }
        if (event->isTerminal()) {
            return event;
        }
    }
    return std::nullopt;
}

std::vector<std::string> DownloadOrchestrator::buildArguments(const DownloadRequest& request,
                                                              const std::string& outputTemplate) {
    std::vector<std::string> args;

    if (request.mode == DownloadMode::Audio) {
        args = {
            "-f", request.formatId,
            "-x",
            "--audio-format", "mp3",
        };
    } else {
        const std::string& id = request.formatId;
        args = {
            "-f", id + "+bestaudio[ext=m4a]/" + id + "+bestaudio/" + id,
            "--merge-output-format", "mp4",
        };
    }

    args.insert(args.end(), {
        "--newline",
        "--no-playlist",
        "--no-warnings",
        "-o", outputTemplate,
        request.url
    });
    return args;
}

} // namespace Yturl
