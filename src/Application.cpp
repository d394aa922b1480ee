#include "Application.hpp"
#include "handlers/ChatClient.hpp"
#include "models/Config.hpp"
#include "utils/Logger.hpp"
#include <chrono>
#include <filesystem>
#include <stdexcept>

namespace Yturl {

// Global application instance
static std::unique_ptr<Application> globalApp = nullptr;

Application::Application()
    : running(false) {
}

Application::~Application() {
    stop();
    shutdownServer();
}

bool Application::initialize() {
    auto& config = getConfig();
    LOG_WEB_INFO("Initializing application...");

    try {
        std::filesystem::create_directories(config.tempDir);

        runner = std::make_shared<SubprocessRunner>(config.ytDlpPath);
        fetcher = std::make_shared<MetadataFetcher>(runner);
        orchestrator = std::make_shared<DownloadOrchestrator>(runner, config.tempDir);
        scheduler = std::make_shared<AsioDeletionScheduler>(ioc);
        store = std::make_shared<RetainedFileStore>(config.tempDir, scheduler,
                                                    std::chrono::seconds(config.retentionSeconds),
                                                    std::chrono::seconds(config.servedDeleteSeconds));

        api = std::make_shared<ApiHandler>(fetcher, orchestrator, store);
        auto address = net::ip::make_address(config.bindAddress);
        server = std::make_unique<HttpServer>(ioc, tcp::endpoint{address, config.port}, api);
        LOG_WEB_INFO("HTTP API bound to {}:{}", config.bindAddress, config.port);
    } catch (const std::exception& e) {
        LOG_WEB_ERROR("Failed to initialize HTTP API: {}", e.what());
        return false;
    }

    if (config.botEnabled()) {
        // The web API keeps running when Telegram is unreachable
        if (!initializeBot()) {
            bot.reset();
            gateway.reset();
        }
    } else {
        LOG_BOT_INFO("No bot token configured, Telegram bot disabled");
    }

    return true;
}

bool Application::initializeBot() {
    auto& config = getConfig();
    LOG_BOT_INFO("Initializing bot...");

    try {
        bot = std::make_unique<TgBot::Bot>(config.telegramToken);

        // Test bot connection
        auto me = bot->getApi().getMe();
        LOG_BOT_INFO("Bot initialized: @{} ({})", me->username, me->firstName);

        owners = std::make_shared<OwnerRegistry>(
            std::make_shared<EnvFileOwnerStore>(config.envFilePath), config.ownerId);
        if (auto owner = owners->currentOwner()) {
            LOG_BOT_INFO("Owner: {}", *owner);
        } else {
            LOG_BOT_INFO("No owner yet; the first user to write claims the bot");
        }

        BotSettings settings;
        settings.maxFileBytes = config.telegramMaxBytes;
        settings.presenceInterval = std::chrono::seconds(config.presenceIntervalSeconds);

        auto client = std::make_shared<TgBotChatClient>(bot->getApi());
        gateway = std::make_unique<BotGateway>(client, owners, fetcher, orchestrator, settings);

        registerHandlers();
        LOG_BOT_INFO("Handlers registered");
        return true;

    } catch (const std::exception& e) {
        LOG_BOT_ERROR("Failed to initialize bot: {}", e.what());
        return false;
    }
}

void Application::registerHandlers() {
    bot->getEvents().onAnyMessage([this](TgBot::Message::Ptr message) {
        auto chatMessage = TgBotChatClient::fromTelegram(message);
        if (!chatMessage) {
            return;
        }
        gateway->dispatch(*chatMessage);
    });
}

void Application::run() {
    auto& config = getConfig();
    running = true;

    work.emplace(boost::asio::make_work_guard(ioc));
    server->run();

    const int threads = config.httpThreads > 0 ? config.httpThreads : 1;
    for (int i = 0; i < threads; ++i) {
        ioThreads.emplace_back([this] {
            for (;;) {
                try {
                    ioc.run();
                    break;
                } catch (const std::exception& e) {
                    LOG_WEB_ERROR("I/O thread error: {}", e.what());
                }
            }
        });
    }
    LOG_WEB_INFO("HTTP API serving on {} threads", threads);

    if (bot) {
        pollBot();
    } else {
        while (running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    }

    shutdownServer();
}

void Application::pollBot() {
    LOG_BOT_INFO("Starting bot polling...");

    TgBot::TgLongPoll longPoll(*bot);

    while (running) {
        try {
            longPoll.start();
        } catch (const TgBot::TgException& e) {
            LOG_BOT_ERROR("Polling error: {}", e.what());
            std::this_thread::sleep_for(std::chrono::seconds(5));
        } catch (const std::exception& e) {
            LOG_BOT_ERROR("Polling transport error: {}", e.what());
            std::this_thread::sleep_for(std::chrono::seconds(5));
        }
    }

    LOG_BOT_INFO("Bot polling stopped");
}

void Application::stop() {
    if (running.exchange(false)) {
        LOG_BOT_INFO("Stopping...");
    }
}

void Application::shutdownServer() {
    if (server) {
        server->stop();
    }
    // Workers post to the io_context, so they finish before it stops
    if (api) {
        api->shutdown();
    }
    work.reset();
    ioc.stop();

    for (auto& thread : ioThreads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    ioThreads.clear();

    if (gateway) {
        gateway->waitForAll();
    }
}

// Global functions
void runApplication() {
    globalApp = std::make_unique<Application>();

    if (!globalApp->initialize()) {
        throw std::runtime_error("Failed to initialize application");
    }

    globalApp->run();
}

void stopApplication() {
    if (globalApp) {
        globalApp->stop();
    }
}

} // namespace Yturl
