#pragma once

#include "media/ProgressParser.hpp"
#include "media/ToolRunner.hpp"
#include "models/Media.hpp"
#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Yturl {

struct DownloadRequest {
    DownloadMode mode = DownloadMode::Video;
    std::string formatId;
    std::string url;
    int64_t sizeCeilingBytes = 0;   // 0 = no ceiling
};

/**
 * One download attempt
 *
 * next() yields the job's events in order and returns nullopt once the
 * stream is over: after the single done/error event, or immediately after
 * cancel(). The stream cannot be restarted.
 */
class DownloadJob {
public:
    enum class State {
        Pending,
        Running,
        Finished,
        Cancelled
    };

    DownloadJob(std::shared_ptr<ToolRunner> runner, DownloadRequest request, const std::string& tempDir);
    ~DownloadJob();

    // Prevent copying
    DownloadJob(const DownloadJob&) = delete;
    DownloadJob& operator=(const DownloadJob&) = delete;

    // Blocks on tool output until the next event is available
    std::optional<ProgressEvent> next();

    // Thread-safe; kills the tool process and suppresses further events
    void cancel();

    bool isCancelled() const { return cancelled; }
    State getState() const { return state; }

    const std::string& getFileId() const { return fileId; }
    const std::string& getExt() const { return ext; }
    const std::string& getOutputPath() const { return outputPath; }
    const DownloadRequest& getRequest() const { return request; }

private:
    std::shared_ptr<ToolRunner> runner;
    DownloadRequest request;
    std::string fileId;
    std::string ext;
    std::string outputPath;
    std::string outputTemplate;

    ProgressParser parser;
    std::deque<ProgressEvent> pending;
    std::atomic<State> state;
    std::atomic<bool> cancelled;

    std::mutex processMutex;
    std::unique_ptr<ToolProcess> process;

    void launch();
    void finish();
    ProgressEvent checkArtifact() const;
    void discardArtifact() const;
};

/**
 * Download orchestrator
 * Builds the tool invocation for a request and hands out jobs
 */
class DownloadOrchestrator {
public:
    using EventCallback = std::function<void(const ProgressEvent&)>;

    DownloadOrchestrator(std::shared_ptr<ToolRunner> runner, std::string tempDir);

    std::unique_ptr<DownloadJob> start(const DownloadRequest& request) const;

    /**
     * Run a job to completion, forwarding every event
     * Returns the terminal event, or nullopt if the job was cancelled
     */
    std::optional<ProgressEvent> run(DownloadJob& job, const EventCallback& onEvent) const;

    static std::vector<std::string> buildArguments(const DownloadRequest& request,
                                                   const std::string& outputTemplate);

    const std::string& getTempDir() const { return tempDir; }

private:
    std::shared_ptr<ToolRunner> runner;
    std::string tempDir;
};

} // namespace Yturl
