#include "parley/services/ChatService.hpp"
#include "parley/utils/TextUtils.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>

namespace parley {
namespace services {

ChatService::ChatService(ConversationStore& store, Responder& responder, utils::IdGenerator& id_generator)
    : _store(store), _responder(responder), _id_generator(id_generator) {}

std::string ChatService::format_context(const std::vector<models::Message>& history) {
    if (history.empty()) {
        return "This is the start of a new conversation.";
    }

    std::ostringstream out;
    out << "Previous conversation:\n";
    for (size_t i = 0; i < history.size(); ++i) {
        if (i > 0) {
            out << "\n";
        }
        out << (history[i].role == models::MessageRole::USER ? "User" : "Assistant") << ": " << history[i].content;
    }
    out << "\n\nContinue the conversation naturally:";
    return out.str();
}

ChatResponse ChatService::handle_chat_message(const std::string& tenant_id,
                                              const std::string& message,
                                              const ChatParameters& params) {
    if (tenant_id.empty()) {
        throw std::invalid_argument("userId is required");
    }
    if (message.empty()) {
        throw std::invalid_argument("message is required");
    }

    const std::string conversation_id = params.conversation_id.empty()
        ? _id_generator.conversation_id()
        : params.conversation_id;

    std::cout << "[ChatService] Chat message - User: " << tenant_id << ", Chat: " << conversation_id
              << ", Intent: " << (params.intent.empty() ? "none" : params.intent) << std::endl;

    // 1. Save user message
    nlohmann::json user_metadata = nlohmann::json::object();
    if (!params.intent.empty()) {
        user_metadata["userIntent"] = params.intent;
    }
    const auto stored = _store.append_message(tenant_id, conversation_id, models::MessageRole::USER, message, user_metadata);

    // 2. Collect context without the message just stored. Concurrent turns on
    // the same chat may have appended after it, so match by id.
    auto context = _store.get_context_messages(tenant_id, conversation_id);
    context.erase(std::remove_if(context.begin(), context.end(),
                                 [&stored](const models::Message& m) { return m.id == stored.id; }),
                  context.end());

    ResponderRequest request;
    request.conversation_id = conversation_id;
    request.message = message;
    request.intent = params.intent;
    request.profile = params.profile.is_null() ? nlohmann::json::object() : params.profile;
    request.context = format_context(context);
    request.history = std::move(context);

    // 3. Ask the responder
    ResponderReply reply;
    try {
        reply = _responder.respond(request);
    } catch (const ResponderError& e) {
        std::cerr << "[ChatService] Responder failed for chat " << conversation_id << ": " << e.what() << std::endl;
        throw ChatProcessingError("Failed to process message");
    }
    if (reply.message.empty()) {
        std::cerr << "[ChatService] Responder returned an empty reply for chat " << conversation_id << std::endl;
        throw ChatProcessingError("Failed to process message");
    }

    // 4. Save assistant reply
    nlohmann::json assistant_metadata = nlohmann::json::object();
    if (!params.intent.empty()) {
        assistant_metadata["userIntent"] = params.intent;
    }
    assistant_metadata["responseType"] = reply.type;
    assistant_metadata["data"] = reply.data;
    _store.append_message(tenant_id, conversation_id, models::MessageRole::ASSISTANT, reply.message, assistant_metadata);

    // 5. Report the updated conversation
    ChatResponse response;
    response.conversation_id = conversation_id;
    response.reply = reply;
    response.conversation.id = conversation_id;
    if (auto updated = _store.get_conversation(tenant_id, conversation_id)) {
        response.conversation.title = updated->title;
        response.conversation.message_count = updated->message_count;
        response.conversation.created_at = updated->created_at;
        response.conversation.updated_at = updated->updated_at;
        response.conversation.last_message = utils::preview(reply.message);
    }
    return response;
}

} // namespace services
} // namespace parley
