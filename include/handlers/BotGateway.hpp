#pragma once

#include "data/OwnerRegistry.hpp"
#include "handlers/ChatClient.hpp"
#include "media/DownloadOrchestrator.hpp"
#include "media/MetadataFetcher.hpp"
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <vector>

namespace Yturl {

struct BotSettings {
    int64_t maxFileBytes = 50LL * 1024 * 1024;
    std::chrono::milliseconds presenceInterval = std::chrono::seconds(4);
};

/**
 * Bot gateway
 *
 * Accepts chat messages from the owner only and answers each link with the
 * downloaded video. Every accepted message runs as its own task, so a slow
 * download never delays the next message.
 */
class BotGateway {
public:
    static constexpr const char* HelpText = "Send me a YouTube, TikTok, or Instagram link.";

    BotGateway(std::shared_ptr<ChatClient> client,
               std::shared_ptr<OwnerRegistry> registry,
               std::shared_ptr<MetadataFetcher> fetcher,
               std::shared_ptr<DownloadOrchestrator> orchestrator,
               BotSettings settings = BotSettings());
    ~BotGateway();

    // Prevent copying
    BotGateway(const BotGateway&) = delete;
    BotGateway& operator=(const BotGateway&) = delete;

    /**
     * Authorize and schedule a message
     * Returns false when the message was dropped
     */
    bool dispatch(const ChatMessage& message);

    // Run the whole pipeline for one authorized message on the calling thread
    void handle(const ChatMessage& message);

    // Block until every dispatched task has finished
    void waitForAll();

private:
    std::shared_ptr<ChatClient> client;
    std::shared_ptr<OwnerRegistry> registry;
    std::shared_ptr<MetadataFetcher> fetcher;
    std::shared_ptr<DownloadOrchestrator> orchestrator;
    BotSettings settings;

    std::mutex tasksMutex;
    std::vector<std::future<void>> tasks;

    void pruneFinishedTasks();
    std::string ceilingText() const;
};

} // namespace Yturl
