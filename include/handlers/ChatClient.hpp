#pragma once

#include <tgbot/tgbot.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace Yturl {

/**
 * Inbound chat message, reduced to what the gateway needs
 */
struct ChatMessage {
    int64_t userId = 0;
    int64_t chatId = 0;
    int32_t messageId = 0;
    std::string text;
};

/**
 * Outbound side of the chat surface
 * Every reply quotes the message it answers
 */
class ChatClient {
public:
    virtual ~ChatClient() = default;

    virtual void sendText(int64_t chatId, int32_t replyTo, const std::string& text) = 0;

    // Throws on delivery failure so the caller can report it
    virtual void sendVideo(int64_t chatId, int32_t replyTo, const std::string& path) = 0;

    // "uploading video" indicator
    virtual void sendUploadingAction(int64_t chatId) = 0;
};

/**
 * ChatClient on top of the Telegram Bot API
 */
class TgBotChatClient : public ChatClient {
public:
    explicit TgBotChatClient(const TgBot::Api& api);

    void sendText(int64_t chatId, int32_t replyTo, const std::string& text) override;
    void sendVideo(int64_t chatId, int32_t replyTo, const std::string& path) override;
    void sendUploadingAction(int64_t chatId) override;

    // nullopt for updates without a sender (channel posts)
    static std::optional<ChatMessage> fromTelegram(const TgBot::Message::Ptr& message);

private:
    const TgBot::Api& api;
};

} // namespace Yturl
