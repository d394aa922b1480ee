#include "handlers/BotGateway.hpp"
#include "handlers/PresenceLoop.hpp"
#include "media/FormatSelector.hpp"
#include "utils/Logger.hpp"
#include "utils/PlatformDetector.hpp"
#include <algorithm>
#include <filesystem>

namespace Yturl {

namespace {

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

// Removes the temp file however the handler exits
class TempFileGuard {
public:
    explicit TempFileGuard(std::string path) : path(std::move(path)) {}
    ~TempFileGuard() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

private:
    std::string path;
};

} // namespace

BotGateway::BotGateway(std::shared_ptr<ChatClient> client,
                       std::shared_ptr<OwnerRegistry> registry,
                       std::shared_ptr<MetadataFetcher> fetcher,
                       std::shared_ptr<DownloadOrchestrator> orchestrator,
                       BotSettings settings)
    : client(std::move(client))
    , registry(std::move(registry))
    , fetcher(std::move(fetcher))
    , orchestrator(std::move(orchestrator))
    , settings(settings) {
}

BotGateway::~BotGateway() {
    waitForAll();
}

bool BotGateway::dispatch(const ChatMessage& message) {
    // Unknown senders get no reply at all
    if (!registry->isAuthorized(message.userId)) {
        LOG_BOT_DEBUG("Dropping message from unauthorized user {}", message.userId);
        return false;
    }

    if (trim(message.text).empty()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(tasksMutex);
    pruneFinishedTasks();
    tasks.push_back(std::async(std::launch::async, [this, message] {
        try {
            handle(message);
        } catch (const std::exception& e) {
            LOG_BOT_ERROR("Message {} from {} failed: {}", message.messageId, message.userId, e.what());
            client->sendText(message.chatId, message.messageId, "Download failed.");
        }
    }));
    return true;
}

void BotGateway::handle(const ChatMessage& message) {
    const std::string text = trim(message.text);
    LOG_BOT_INFO("Message from {}: {}", message.userId, text);

    MediaReference ref = PlatformDetector::detect(text);
    if (ref.platform == Platform::Unknown) {
        client->sendText(message.chatId, message.messageId, HelpText);
        return;
    }

    const int64_t chatId = message.chatId;
    PresenceLoop presence([this, chatId] { client->sendUploadingAction(chatId); },
                          settings.presenceInterval);

    // The indicator stops before any final reply goes out
    auto replyError = [&](const std::string& reply) {
        presence.cancel();
        client->sendText(chatId, message.messageId, reply);
    };

    MetadataResult info = fetcher->fetch(ref.url);
    if (!info.success) {
        replyError("Failed to get video info: " + info.error);
        return;
    }

    auto format = FormatSelector::pickForCeiling(info.metadata.formats, settings.maxFileBytes);
    if (!format) {
        replyError("No suitable format found under " + ceilingText() + ".");
        return;
    }

    DownloadRequest request;
    request.mode = DownloadMode::Video;
    request.formatId = format->formatId;
    request.url = ref.url;
    request.sizeCeilingBytes = settings.maxFileBytes;

    auto job = orchestrator->start(request);
    TempFileGuard tempFile(job->getOutputPath());
    LOG_BOT_INFO("Downloading {} ({}p) for {}", ref.url, format->height, message.userId);

    auto terminal = orchestrator->run(*job, nullptr);
    if (!terminal || terminal->stage == ProgressStage::Error) {
        replyError(terminal ? terminal->errorMessage : "Download failed");
        return;
    }

    try {
        client->sendVideo(chatId, message.messageId, job->getOutputPath());
        LOG_BOT_INFO("Sent {} to {}", job->getOutputPath(), chatId);
    } catch (const std::exception& e) {
        LOG_BOT_ERROR("Failed to send video to {}: {}", chatId, e.what());
        replyError(std::string("Failed to send video: ") + e.what());
        return;
    }
    presence.cancel();
}

void BotGateway::waitForAll() {
    std::vector<std::future<void>> pending;
    {
        std::lock_guard<std::mutex> lock(tasksMutex);
        pending.swap(tasks);
    }
    for (auto& task : pending) {
        if (task.valid()) {
            task.wait();
        }
    }
}

void BotGateway::pruneFinishedTasks() {
    tasks.erase(std::remove_if(tasks.begin(), tasks.end(), [](std::future<void>& task) {
        return !task.valid()
            || task.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }), tasks.end());
}

std::string BotGateway::ceilingText() const {
    return std::to_string(settings.maxFileBytes / (1024 * 1024)) + " MB";
}

} // namespace Yturl
