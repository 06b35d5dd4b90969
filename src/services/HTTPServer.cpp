#include "parley/services/HTTPServer.hpp"
#include "parley/controller/ConversationController.hpp"
#include <cpprest/http_msg.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <vector>

using namespace web;
using namespace web::http;
using namespace web::http::experimental::listener;

namespace parley {
namespace services {

namespace {
    std::vector<std::string> path_segments(const http_request& request) {
        return split_request_path(request.relative_uri().path());
    }

    std::string query_param(const http_request& request, const std::string& name) {
        auto params = uri::split_query(request.relative_uri().query());
        auto it = params.find(utility::conversions::to_string_t(name));
        if (it == params.end()) {
            return "";
        }
        return utility::conversions::to_utf8string(uri::decode(it->second));
    }

    void add_cors_headers(http_response& response) {
        response.headers().add(U("Access-Control-Allow-Origin"), U("*"));
    }
}

std::vector<std::string> split_request_path(const utility::string_t& path) {
    // Split before decoding so an encoded '/' stays inside its segment.
    std::vector<std::string> segments;
    for (const auto& segment : uri::split_path(path)) {
        segments.push_back(utility::conversions::to_utf8string(uri::decode(segment)));
    }
    return segments;
}

HTTPServer::HTTPServer(const std::string& address, uint16_t port, controller::ConversationController& controller)
    : _listener(uri_builder().set_scheme(U("http"))
                             .set_host(utility::conversions::to_string_t(address))
                             .set_port(port)
                             .to_uri()),
      _controller(controller) {
    _listener.support(methods::GET, std::bind(&HTTPServer::handle_get, this, std::placeholders::_1));
    _listener.support(methods::POST, std::bind(&HTTPServer::handle_post, this, std::placeholders::_1));
    _listener.support(methods::PUT, std::bind(&HTTPServer::handle_put, this, std::placeholders::_1));
    _listener.support(methods::DEL, std::bind(&HTTPServer::handle_delete, this, std::placeholders::_1));
    _listener.support(methods::OPTIONS, std::bind(&HTTPServer::handle_options, this, std::placeholders::_1));
}

HTTPServer::~HTTPServer() {
    try {
        stop();
    } catch (const std::exception& e) {
        std::cerr << "[HTTPServer] Error while stopping: " << e.what() << std::endl;
    }
}

void HTTPServer::start() {
    _listener.open().wait();
    _running = true;
    std::cout << "[HTTPServer] Started on " << utility::conversions::to_utf8string(_listener.uri().to_string()) << std::endl;
}

void HTTPServer::stop() {
    if (!_running) {
        return;
    }
    _listener.close().wait();
    _running = false;
    std::cout << "[HTTPServer] Stopped." << std::endl;
}

void HTTPServer::reply(http_request& request, const controller::ControllerResponse& result) {
    http_response response(static_cast<status_code>(result.status));
    response.set_body(result.body.dump(), "application/json");
    add_cors_headers(response);
    request.reply(response);
}

void HTTPServer::reply_error(http_request& request, status_code status, const std::string& message) {
    controller::ControllerResponse result;
    result.status = status;
    result.body = {{"success", false}, {"error", message}};
    reply(request, result);
}

void HTTPServer::handle_get(http_request request) {
    auto segments = path_segments(request);
    try {
        if (segments.size() == 1 && segments[0] == "health") {
            reply(request, _controller.health());
        } else if (segments.size() == 2 && segments[0] == "api" && segments[1] == "chats") {
            reply(request, _controller.listChats(query_param(request, "userId")));
        } else if (segments.size() == 3 && segments[0] == "api" && segments[1] == "chats") {
            reply(request, _controller.getChat(query_param(request, "userId"), segments[2]));
        } else if (segments.size() == 2 && segments[0] == "api" && segments[1] == "chat-stats") {
            reply(request, _controller.getStats());
        } else {
            reply_error(request, status_codes::NotFound, "Not found");
        }
    } catch (const std::exception& e) {
        std::cerr << "[HTTPServer] GET error: " << e.what() << std::endl;
        reply_error(request, status_codes::InternalError, "Failed to retrieve chats");
    }
}

void HTTPServer::handle_post(http_request request) {
    auto segments = path_segments(request);
    if (!(segments.size() == 2 && segments[0] == "api" && segments[1] == "chat")) {
        reply_error(request, status_codes::NotFound, "Not found");
        return;
    }

    request.extract_utf8string().then([this, request](pplx::task<std::string> task) mutable {
        try {
            auto body = nlohmann::json::parse(task.get(), nullptr, false);
            if (body.is_discarded()) {
                reply_error(request, status_codes::BadRequest, "Invalid JSON body");
                return;
            }
            reply(request, _controller.chat(body));
        } catch (const std::exception& e) {
            std::cerr << "[HTTPServer] Chat error: " << e.what() << std::endl;
            reply_error(request, status_codes::InternalError, "Failed to process message");
        }
    });
}

void HTTPServer::handle_put(http_request request) {
    auto segments = path_segments(request);
    if (!(segments.size() == 4 && segments[0] == "api" && segments[1] == "chats" && segments[3] == "title")) {
        reply_error(request, status_codes::NotFound, "Not found");
        return;
    }
    const std::string chat_id = segments[2];

    request.extract_utf8string().then([this, request, chat_id](pplx::task<std::string> task) mutable {
        try {
            auto body = nlohmann::json::parse(task.get(), nullptr, false);
            if (body.is_discarded()) {
                reply_error(request, status_codes::BadRequest, "Invalid JSON body");
                return;
            }
            reply(request, _controller.updateTitle(chat_id, body));
        } catch (const std::exception& e) {
            std::cerr << "[HTTPServer] Update title error: " << e.what() << std::endl;
            reply_error(request, status_codes::InternalError, "Failed to update chat title");
        }
    });
}

void HTTPServer::handle_delete(http_request request) {
    auto segments = path_segments(request);
    try {
        if (segments.size() == 3 && segments[0] == "api" && segments[1] == "chats") {
            reply(request, _controller.deleteChat(query_param(request, "userId"), segments[2]));
        } else {
            reply_error(request, status_codes::NotFound, "Not found");
        }
    } catch (const std::exception& e) {
        std::cerr << "[HTTPServer] Delete chat error: " << e.what() << std::endl;
        reply_error(request, status_codes::InternalError, "Failed to delete chat");
    }
}

void HTTPServer::handle_options(http_request request) {
    http_response response(status_codes::OK);
    add_cors_headers(response);
    response.headers().add(U("Access-Control-Allow-Methods"), U("GET, POST, PUT, DELETE, OPTIONS"));
    response.headers().add(U("Access-Control-Allow-Headers"), U("Content-Type"));
    request.reply(response);
}

} // namespace services
} // namespace parley
