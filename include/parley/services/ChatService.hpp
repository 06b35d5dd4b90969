#ifndef PARLEY_SERVICES_CHAT_SERVICE_HPP
#define PARLEY_SERVICES_CHAT_SERVICE_HPP

#include <string>
#include <vector>
#include <stdexcept>
#include <nlohmann/json.hpp>

#include "parley/services/ConversationStore.hpp"
#include "parley/services/Responder.hpp"
#include "parley/utils/IdGenerator.hpp"

namespace parley {
namespace services {

struct ChatParameters {
    std::string conversation_id;
    std::string intent;
    nlohmann::json profile = nlohmann::json::object();
};

struct ChatResponse {
    std::string conversation_id;
    ResponderReply reply;
    models::ConversationSummary conversation;
};

// The responder failed; the user's message is already stored.
class ChatProcessingError : public std::runtime_error {
public:
    explicit ChatProcessingError(const std::string& what) : std::runtime_error(what) {}
};

class ChatService {
public:
    ChatService(ConversationStore& store, Responder& responder, utils::IdGenerator& id_generator);

    /**
     * @brief Run one user turn through the store and the responder
     *
     * Appends the user message, hands the recent context to the responder and
     * appends its reply. Throws std::invalid_argument for missing input and
     * ChatProcessingError when the responder fails.
     */
    ChatResponse handle_chat_message(const std::string& tenant_id,
                                     const std::string& message,
                                     const ChatParameters& params);

    static std::string format_context(const std::vector<models::Message>& history);

private:
    ConversationStore& _store;
    Responder& _responder;
    utils::IdGenerator& _id_generator;
};

} // namespace services
} // namespace parley

#endif // PARLEY_SERVICES_CHAT_SERVICE_HPP
