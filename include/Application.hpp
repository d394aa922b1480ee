#pragma once

#include "data/DeletionScheduler.hpp"
#include "data/OwnerRegistry.hpp"
#include "data/RetainedFileStore.hpp"
#include "handlers/BotGateway.hpp"
#include "media/DownloadOrchestrator.hpp"
#include "media/MetadataFetcher.hpp"
#include "media/ToolRunner.hpp"
#include "web/ApiHandler.hpp"
#include "web/HttpServer.hpp"
#include <tgbot/tgbot.h>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <atomic>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace Yturl {

/**
 * Main application class
 *
 * Wires the download pipeline to its two front ends: the HTTP API, served
 * from a small io_context thread pool, and the Telegram bot, polled on the
 * thread that calls run(). Without a bot token only the HTTP API runs.
 */
class Application {
public:
    Application();
    ~Application();

    // Prevent copying
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    // Build components, bind the listener and reach Telegram
    bool initialize();

    // Serve until stop() (blocking)
    void run();

    // Stop polling and serving; safe to call more than once
    void stop();

private:
    std::atomic<bool> running;

    boost::asio::io_context ioc;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work;
    std::vector<std::thread> ioThreads;

    // Pipeline
    std::shared_ptr<ToolRunner> runner;
    std::shared_ptr<MetadataFetcher> fetcher;
    std::shared_ptr<DownloadOrchestrator> orchestrator;
    std::shared_ptr<DeletionScheduler> scheduler;
    std::shared_ptr<RetainedFileStore> store;

    // HTTP
    std::shared_ptr<ApiHandler> api;
    std::unique_ptr<HttpServer> server;

    // Telegram
    std::unique_ptr<TgBot::Bot> bot;
    std::shared_ptr<OwnerRegistry> owners;
    std::unique_ptr<BotGateway> gateway;

    bool initializeBot();
    void registerHandlers();
    void pollBot();
    void shutdownServer();
};

// Global functions
void runApplication();
void stopApplication();

} // namespace Yturl
