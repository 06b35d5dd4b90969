#include "parley/controller/ConversationController.hpp"
#include "parley/services/ConversationStore.hpp"
#include "parley/services/ChatService.hpp"
#include "parley/services/RecencyGrouper.hpp"
#include "parley/utils/Clock.hpp"
#include <iostream>

namespace parley {
namespace controller {

    namespace {
        std::string string_field(const nlohmann::json& request, const char* name) {
            if (request.contains(name) && request[name].is_string()) {
                return request[name].get<std::string>();
            }
            return "";
        }
    }

    ConversationController::ConversationController(
        services::ConversationStore& store,
        services::ChatService& chatService,
        const utils::Clock& clock
    ) : _store(store), _chatService(chatService), _clock(clock) {}

    ControllerResponse ConversationController::error(int status, const std::string& message) {
        ControllerResponse response;
        response.status = status;
        response.body = {{"success", false}, {"error", message}};
        return response;
    }

    ControllerResponse ConversationController::listChats(const std::string& userId) {
        if (userId.empty()) {
            return error(400, "userId is required");
        }

        auto chats = _store.list_conversations(userId);
        auto grouped = services::group_by_recency(chats, _clock.now());

        nlohmann::json all = nlohmann::json::array();
        for (const auto& chat : chats) {
            all.push_back(chat.toJson());
        }

        ControllerResponse response;
        response.body = {
            {"success", true},
            {"userId", userId},
            {"totalChats", chats.size()},
            {"groupedChats", grouped.toJson()},
            {"allChats", all}
        };
        return response;
    }

    ControllerResponse ConversationController::getChat(const std::string& userId, const std::string& chatId) {
        if (userId.empty()) {
            return error(400, "userId is required");
        }
        if (chatId.empty()) {
            return error(400, "chatId is required");
        }

        auto chat = _store.get_conversation(userId, chatId);
        if (!chat) {
            return error(404, "Chat not found or access denied");
        }

        ControllerResponse response;
        response.body = {{"success", true}, {"chat", chat->toJson()}};
        return response;
    }

    ControllerResponse ConversationController::chat(const nlohmann::json& request) {
        if (!request.is_object()) {
            return error(400, "Request body must be a JSON object");
        }

        const std::string userId = string_field(request, "userId");
        const std::string message = string_field(request, "message");
        if (userId.empty()) {
            return error(400, "userId is required");
        }
        if (message.empty()) {
            return error(400, "message is required");
        }

        services::ChatParameters params;
        params.conversation_id = string_field(request, "chatId");
        params.intent = string_field(request, "userIntent");
        if (request.contains("userProfile") && request["userProfile"].is_object()) {
            params.profile = request["userProfile"];
        }

        try {
            auto result = _chatService.handle_chat_message(userId, message, params);

            ControllerResponse response;
            response.body = {
                {"success", true},
                {"message", result.reply.message},
                {"type", result.reply.type},
                {"data", result.reply.data},
                {"chatId", result.conversation_id},
                {"userId", userId},
                {"chat", {
                    {"id", result.conversation.id},
                    {"title", result.conversation.title},
                    {"messageCount", result.conversation.message_count},
                    {"updatedAt", models::format_timestamp(result.conversation.updated_at)}
                }},
                {"timestamp", models::format_timestamp(_clock.now())}
            };
            return response;
        } catch (const std::invalid_argument& e) {
            return error(400, e.what());
        } catch (const services::ChatProcessingError& e) {
            ControllerResponse response;
            response.status = 500;
            response.body = {
                {"success", false},
                {"error", e.what()},
                {"message", "I apologize, but I encountered an error. Please try again."}
            };
            return response;
        }
    }

    ControllerResponse ConversationController::deleteChat(const std::string& userId, const std::string& chatId) {
        if (userId.empty() || chatId.empty()) {
            return error(400, "userId and chatId are required");
        }
        if (!_store.delete_conversation(userId, chatId)) {
            return error(404, "Chat not found or access denied");
        }

        ControllerResponse response;
        response.body = {{"success", true}, {"message", "Chat " + chatId + " deleted successfully"}};
        return response;
    }

    ControllerResponse ConversationController::updateTitle(const std::string& chatId, const nlohmann::json& request) {
        const std::string userId = request.is_object() ? string_field(request, "userId") : "";
        const std::string title = request.is_object() ? string_field(request, "title") : "";
        if (userId.empty() || chatId.empty() || title.empty()) {
            return error(400, "userId, chatId, and title are required");
        }
        if (!_store.rename_conversation(userId, chatId, title)) {
            return error(404, "Chat not found or access denied");
        }

        ControllerResponse response;
        response.body = {{"success", true}, {"message", "Chat title updated successfully"}, {"title", title}};
        return response;
    }

    ControllerResponse ConversationController::getStats() {
        ControllerResponse response;
        response.body = {
            {"success", true},
            {"stats", _store.stats().toJson()},
            {"timestamp", models::format_timestamp(_clock.now())}
        };
        return response;
    }

    ControllerResponse ConversationController::health() {
        ControllerResponse response;
        response.body = {
            {"status", "UP"},
            {"service", "parley"},
            {"timestamp", models::format_timestamp(_clock.now())}
        };
        return response;
    }

}
}
