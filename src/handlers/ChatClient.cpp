#include "handlers/ChatClient.hpp"
#include "utils/Logger.hpp"

namespace Yturl {

TgBotChatClient::TgBotChatClient(const TgBot::Api& api)
    : api(api) {
}

void TgBotChatClient::sendText(int64_t chatId, int32_t replyTo, const std::string& text) {
    try {
        api.sendMessage(chatId, text, false, replyTo);
    } catch (const std::exception& e) {
        LOG_BOT_ERROR("Failed to send message to {}: {}", chatId, e.what());
    }
}

void TgBotChatClient::sendVideo(int64_t chatId, int32_t replyTo, const std::string& path) {
    auto video = TgBot::InputFile::fromFile(path, "video/mp4");
    api.sendVideo(chatId, video, true, 0, 0, 0, "", "", replyTo);
}

void TgBotChatClient::sendUploadingAction(int64_t chatId) {
    try {
        api.sendChatAction(chatId, "upload_video");
    } catch (const std::exception& e) {
        LOG_BOT_WARN("Failed to send chat action to {}: {}", chatId, e.what());
    }
}

std::optional<ChatMessage> TgBotChatClient::fromTelegram(const TgBot::Message::Ptr& message) {
    if (!message || !message->from || !message->chat) {
        return std::nullopt;
    }

    ChatMessage result;
    result.userId = message->from->id;
    result.chatId = message->chat->id;
    result.messageId = message->messageId;
    result.text = message->text;
    return result;
}

} // namespace Yturl
