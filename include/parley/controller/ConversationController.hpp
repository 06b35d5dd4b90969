#ifndef PARLEY_CONTROLLER_CONVERSATION_CONTROLLER_HPP
#define PARLEY_CONTROLLER_CONVERSATION_CONTROLLER_HPP

#include <string>
#include <nlohmann/json.hpp>

namespace parley {
    namespace services {
        class ConversationStore;
        class ChatService;
    }
    namespace utils {
        class Clock;
    }
}

namespace parley {
namespace controller {

    /**
     * @brief Controller result: HTTP status plus JSON body
     */
    struct ControllerResponse {
        int status = 200;
        nlohmann::json body;
    };

    /**
     * @brief Request handling for the chat history API
     *
     * Validates identifiers, calls the store or the chat service and maps
     * the outcome to a status code. Knows nothing about the HTTP library.
     */
    class ConversationController {
    public:
        ConversationController(
            services::ConversationStore& store,
            services::ChatService& chatService,
            const utils::Clock& clock
        );

        ControllerResponse listChats(const std::string& userId);
        ControllerResponse getChat(const std::string& userId, const std::string& chatId);
        ControllerResponse chat(const nlohmann::json& request);
        ControllerResponse deleteChat(const std::string& userId, const std::string& chatId);
        ControllerResponse updateTitle(const std::string& chatId, const nlohmann::json& request);
        ControllerResponse getStats();
        ControllerResponse health();

    private:
        static ControllerResponse error(int status, const std::string& message);

        services::ConversationStore& _store;
        services::ChatService& _chatService;
        const utils::Clock& _clock;
    };

}
}

#endif // PARLEY_CONTROLLER_CONVERSATION_CONTROLLER_HPP
