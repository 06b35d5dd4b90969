#ifndef PARLEY_SERVICES_HTTPSERVER_HPP
#define PARLEY_SERVICES_HTTPSERVER_HPP

#include <cpprest/http_listener.h>
#include <string>
#include <vector>
#include <cstdint>

namespace parley {
namespace controller {
    class ConversationController;
    struct ControllerResponse;
}
namespace services {

// Path segments of a request URI, each percent-decoded on its own.
std::vector<std::string> split_request_path(const utility::string_t& path);

/**
 * @brief REST front end for the chat history API
 *
 *   GET    /health
 *   GET    /api/chats?userId=...
 *   GET    /api/chats/{chatId}?userId=...
 *   POST   /api/chat
 *   DELETE /api/chats/{chatId}?userId=...
 *   PUT    /api/chats/{chatId}/title
 *   GET    /api/chat-stats
 */
class HTTPServer {
public:
    HTTPServer(const std::string& address, uint16_t port, controller::ConversationController& controller);
    ~HTTPServer();

    void start();
    void stop();

private:
    void handle_get(web::http::http_request request);
    void handle_post(web::http::http_request request);
    void handle_put(web::http::http_request request);
    void handle_delete(web::http::http_request request);
    void handle_options(web::http::http_request request);

    static void reply(web::http::http_request& request, const controller::ControllerResponse& result);
    static void reply_error(web::http::http_request& request, web::http::status_code status, const std::string& message);

    web::http::experimental::listener::http_listener _listener;
    controller::ConversationController& _controller;
    bool _running = false;
};

} // namespace services
} // namespace parley

#endif // PARLEY_SERVICES_HTTPSERVER_HPP
