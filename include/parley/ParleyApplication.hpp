#ifndef PARLEY_PARLEY_APPLICATION_HPP
#define PARLEY_PARLEY_APPLICATION_HPP

#include <memory>

#include "parley/config/AppConfig.hpp"
#include "parley/controller/ConversationController.hpp"
#include "parley/services/ChatService.hpp"
#include "parley/services/ConversationStore.hpp"
#include "parley/services/HTTPServer.hpp"
#include "parley/services/OllamaResponder.hpp"
#include "parley/utils/Clock.hpp"
#include "parley/utils/IdGenerator.hpp"

namespace parley {

/**
 * @brief Application runner
 *
 * Owns every component for the lifetime of the process and wires them
 * together explicitly. There is one store per application object; nothing
 * is reachable through globals.
 */
class ParleyApplication {
public:
    /**
     * @brief Build the application from defaults, environment and config file
     */
    static std::unique_ptr<ParleyApplication> create();

    explicit ParleyApplication(const config::AppConfig& app_config);

    config::AppConfig& getConfig() { return _config; }
    services::ConversationStore& getStore() { return *_store; }

    /**
     * @brief Start the HTTP server and block until SIGINT or SIGTERM
     */
    int run();

    void shutdown();

    void printBanner() const;

private:
    config::AppConfig _config;
    utils::SystemClock _clock;
    std::unique_ptr<utils::RandomIdGenerator> _id_generator;
    std::unique_ptr<services::ConversationStore> _store;
    std::unique_ptr<services::OllamaResponder> _responder;
    std::unique_ptr<services::ChatService> _chat_service;
    std::unique_ptr<controller::ConversationController> _controller;
    std::unique_ptr<services::HTTPServer> _http_server;
};

} // namespace parley

#endif // PARLEY_PARLEY_APPLICATION_HPP
