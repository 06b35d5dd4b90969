#include "parley/ParleyApplication.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace parley {

namespace {
    std::atomic<bool> g_stop_requested(false);

    void request_stop(int) {
        g_stop_requested = true;
    }
}

std::unique_ptr<ParleyApplication> ParleyApplication::create() {
    auto app_config = config::AppConfig::builder()
        .withHttpAddress("0.0.0.0")
        .withHttpPort(3001);

    app_config.loadFromEnvironment();
    app_config.loadFromFile();

    return std::make_unique<ParleyApplication>(app_config);
}

ParleyApplication::ParleyApplication(const config::AppConfig& app_config)
    : _config(app_config) {
    _id_generator = std::make_unique<utils::RandomIdGenerator>(_clock);
    _store = std::make_unique<services::ConversationStore>(_config.storeLimits(), _clock, *_id_generator);
    _responder = std::make_unique<services::OllamaResponder>(
        _config.responder_url, _config.responder_model, std::chrono::seconds(_config.responder_timeout_seconds));
    _chat_service = std::make_unique<services::ChatService>(*_store, *_responder, *_id_generator);
    _controller = std::make_unique<controller::ConversationController>(*_store, *_chat_service, _clock);
    _http_server = std::make_unique<services::HTTPServer>(_config.http_address, _config.http_port, *_controller);
}

int ParleyApplication::run() {
    std::cout << "[ParleyApplication] Starting Parley..." << std::endl;
    std::cout << "[ParleyApplication] HTTP Server: " << _config.http_address << ":" << _config.http_port << std::endl;
    std::cout << "[ParleyApplication] Responder: " << _config.responder_url << " (" << _config.responder_model << ")" << std::endl;

    std::signal(SIGINT, request_stop);
    std::signal(SIGTERM, request_stop);

    try {
        _http_server->start();
    } catch (const std::exception& e) {
        std::cerr << "[ParleyApplication] Failed to start HTTP server: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "[ParleyApplication] Parley is ready!" << std::endl;

    while (!g_stop_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "\n[ParleyApplication] Received shutdown signal" << std::endl;
    shutdown();
    return 0;
}

void ParleyApplication::shutdown() {
    std::cout << "[ParleyApplication] Shutting down..." << std::endl;
    _http_server->stop();

    auto stats = _store->stats();
    std::cout << "[ParleyApplication] Discarding " << stats.conversation_count << " chats ("
              << stats.message_count << " messages) held in memory" << std::endl;
    std::cout << "[ParleyApplication] Shutdown complete" << std::endl;
}

void ParleyApplication::printBanner() const {
    std::cout << R"(
    ____             __
   / __ \____ ______/ /__  __  __
  / /_/ / __ `/ ___/ / _ \/ / / /
 / ____/ /_/ / /  / /  __/ /_/ /
/_/    \__,_/_/  /_/\___/\__, /
                        /____/
    )" << std::endl;
    std::cout << "Parley - Conversation Store" << std::endl;
    std::cout << "===========================" << std::endl;
}

} // namespace parley
