#pragma once

#include "data/DeletionScheduler.hpp"
#include "data/OwnerRegistry.hpp"
#include "handlers/ChatClient.hpp"
#include "media/ToolRunner.hpp"
#include "utils/FileId.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace YturlTest {

using Yturl::DeletionScheduler;
using Yturl::OwnerStore;
using Yturl::ToolProcess;
using Yturl::ToolRunner;

// What a fake tool invocation prints and how it ends
struct ToolScript {
    std::vector<std::string> lines;
    int exitCode = 0;
    bool holdOpen = false;      // keep the pipe open after the last line until terminated
    bool failSpawn = false;
    std::function<void(const std::vector<std::string>&)> onSpawn;
    std::function<bool(const std::vector<std::string>&)> holdIf;   // per-invocation holdOpen
};

// Survives the process object so tests can inspect it after the job let go
struct ProcessState {
    std::vector<std::string> args;
    bool terminated = false;
    bool waited = false;
    std::mutex mutex;
    std::condition_variable cv;
};

class FakeProcess : public ToolProcess {
public:
    FakeProcess(ToolScript script, std::shared_ptr<ProcessState> state)
        : script(std::move(script)), state(std::move(state)) {}

    bool readLine(std::string& line) override {
        std::unique_lock<std::mutex> lock(state->mutex);
        if (state->terminated) {
            return false;
        }
        if (next < script.lines.size()) {
            line = script.lines[next++];
            return true;
        }
        if (script.holdOpen) {
            state->cv.wait(lock, [this] { return state->terminated; });
        }
        return false;
    }

    int wait() override {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->waited = true;
        return state->terminated ? 128 + 9 : script.exitCode;
    }

    void terminate() override {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->terminated = true;
        state->cv.notify_all();
    }

private:
    ToolScript script;
    std::shared_ptr<ProcessState> state;
    size_t next = 0;
};

/**
 * Scripted stand-in for yt-dlp
 * Invocations with --dump-json follow the metadata script, all others the
 * download script
 */
class FakeToolRunner : public ToolRunner {
public:
    ToolScript metadata;
    ToolScript download;

    std::unique_ptr<ToolProcess> spawn(const std::vector<std::string>& args) override {
        bool isMetadata = std::find(args.begin(), args.end(), "--dump-json") != args.end();
        const ToolScript& script = isMetadata ? metadata : download;
        if (script.failSpawn) {
            throw std::runtime_error("No such file or directory");
        }
        if (script.onSpawn) {
            script.onSpawn(args);
        }

        auto state = std::make_shared<ProcessState>();
        state->args = args;
        {
            std::lock_guard<std::mutex> lock(mutex);
            spawned.push_back(state);
        }
        ToolScript effective = script;
        if (script.holdIf && script.holdIf(args)) {
            effective.holdOpen = true;
        }
        return std::make_unique<FakeProcess>(std::move(effective), state);
    }

    // Download invocations only, in spawn order
    std::vector<std::shared_ptr<ProcessState>> downloads() {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<std::shared_ptr<ProcessState>> result;
        for (const auto& state : spawned) {
            if (std::find(state->args.begin(), state->args.end(), "--dump-json") == state->args.end()) {
                result.push_back(state);
            }
        }
        return result;
    }

    std::vector<std::shared_ptr<ProcessState>> processes() {
        std::lock_guard<std::mutex> lock(mutex);
        return spawned;
    }

private:
    std::mutex mutex;
    std::vector<std::shared_ptr<ProcessState>> spawned;
};

inline bool isTerminated(const std::shared_ptr<ProcessState>& state) {
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->terminated;
}

// Stands in for the child being killed from outside
inline void killProcess(const std::shared_ptr<ProcessState>& state) {
    std::lock_guard<std::mutex> lock(state->mutex);
    state->terminated = true;
    state->cv.notify_all();
}

// Poll until the condition holds; false on timeout
inline bool waitFor(const std::function<bool()>& condition,
                    std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!condition()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
}

// Value following "-o" in a tool invocation
inline std::string outputArgument(const std::vector<std::string>& args) {
    auto it = std::find(args.begin(), args.end(), "-o");
    return (it != args.end() && it + 1 != args.end()) ? *(it + 1) : "";
}

inline void writeFile(const std::string& path, size_t size) {
    std::ofstream out(path, std::ios::binary);
    out << std::string(size, 'x');
}

/**
 * Deletion scheduler driven by hand
 */
class ManualScheduler : public DeletionScheduler {
public:
    void scheduleAfter(std::chrono::milliseconds delay, Task task) override {
        std::lock_guard<std::mutex> lock(mutex);
        tasks.push_back({now + delay, std::move(task)});
    }

    // Move the clock forward and run everything that came due, earliest first
    void advance(std::chrono::milliseconds by) {
        std::vector<Pending> due;
        {
            std::lock_guard<std::mutex> lock(mutex);
            now += by;
            auto split = std::stable_partition(tasks.begin(), tasks.end(),
                [this](const Pending& p) { return p.at > now; });
            due.assign(split, tasks.end());
            tasks.erase(split, tasks.end());
        }
        std::stable_sort(due.begin(), due.end(),
            [](const Pending& a, const Pending& b) { return a.at < b.at; });
        for (auto& pending : due) {
            pending.task();
        }
    }

    size_t pendingCount() {
        std::lock_guard<std::mutex> lock(mutex);
        return tasks.size();
    }

private:
    struct Pending {
        std::chrono::milliseconds at;
        Task task;
    };

    std::mutex mutex;
    std::chrono::milliseconds now{0};
    std::vector<Pending> tasks;
};

class MemoryOwnerStore : public OwnerStore {
public:
    bool failSaves = false;

    bool save(int64_t ownerId) override {
        std::lock_guard<std::mutex> lock(mutex);
        saved.push_back(ownerId);
        return !failSaves;
    }

    std::vector<int64_t> savedIds() {
        std::lock_guard<std::mutex> lock(mutex);
        return saved;
    }

private:
    std::mutex mutex;
    std::vector<int64_t> saved;
};

/**
 * Records everything the bot would have sent
 */
class FakeChatClient : public Yturl::ChatClient {
public:
    struct Text {
        int64_t chatId;
        int32_t replyTo;
        std::string text;
    };

    struct Video {
        int64_t chatId;
        int32_t replyTo;
        std::string path;
        bool existed;
    };

    std::string videoError;     // non-empty: sendVideo throws with this message

    void sendText(int64_t chatId, int32_t replyTo, const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex);
        texts.push_back({chatId, replyTo, text});
        calls.push_back("text");
    }

    void sendVideo(int64_t chatId, int32_t replyTo, const std::string& path) override {
        bool existed = std::filesystem::exists(path);
        {
            std::lock_guard<std::mutex> lock(mutex);
            videos.push_back({chatId, replyTo, path, existed});
            calls.push_back("video");
        }
        if (!videoError.empty()) {
            throw std::runtime_error(videoError);
        }
    }

    void sendUploadingAction(int64_t chatId) override {
        std::lock_guard<std::mutex> lock(mutex);
        actions.push_back(chatId);
        calls.push_back("action");
    }

    std::vector<Text> sentTexts() {
        std::lock_guard<std::mutex> lock(mutex);
        return texts;
    }

    std::vector<Video> sentVideos() {
        std::lock_guard<std::mutex> lock(mutex);
        return videos;
    }

    size_t actionCount() {
        std::lock_guard<std::mutex> lock(mutex);
        return actions.size();
    }

    // "action", "text" and "video", in call order
    std::vector<std::string> timeline() {
        std::lock_guard<std::mutex> lock(mutex);
        return calls;
    }

private:
    std::mutex mutex;
    std::vector<Text> texts;
    std::vector<Video> videos;
    std::vector<int64_t> actions;
    std::vector<std::string> calls;
};

/**
 * Fresh directory under the system temp dir, removed on destruction
 */
class TempDir {
public:
    TempDir()
        : path(std::filesystem::temp_directory_path() / ("yturl-test-" + Yturl::FileId::generate())) {
        std::filesystem::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string str() const { return path.string(); }
    std::string file(const std::string& name) const { return (path / name).string(); }

private:
    std::filesystem::path path;
};

} // namespace YturlTest
