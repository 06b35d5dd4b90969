#include "parley/services/OllamaResponder.hpp"
#include <cpprest/http_client.h>
#include <iostream>

using namespace web;
using namespace web::http;
using namespace web::http::client;

namespace parley {
namespace services {

OllamaResponder::OllamaResponder(const std::string& base_url, const std::string& model, std::chrono::seconds timeout)
    : _base_url(base_url), _model(model), _timeout(timeout) {}

ResponderReply OllamaResponder::respond(const ResponderRequest& request) {
    std::cout << "[OllamaResponder] Generating reply for chat " << request.conversation_id
              << " (" << request.history.size() << " prior messages)" << std::endl;

    nlohmann::json messages = nlohmann::json::array();
    if (request.profile.is_object() && !request.profile.empty()) {
        messages.push_back({{"role", "system"}, {"content", "User profile: " + request.profile.dump()}});
    }
    for (const auto& msg : request.history) {
        messages.push_back({
            {"role", models::role_to_string(msg.role)},
            {"content", msg.content}
        });
    }
    messages.push_back({{"role", "user"}, {"content", request.message}});

    nlohmann::json body = {
        {"model", _model},
        {"messages", messages},
        {"stream", false}
    };

    http_client_config config;
    config.set_timeout(_timeout);

    try {
        http_client client(utility::conversions::to_string_t(_base_url), config);
        http_request http_req(methods::POST);
        http_req.set_request_uri(U("/api/chat"));
        http_req.set_body(body.dump(), "application/json");

        http_response response = client.request(http_req).get();
        if (response.status_code() != status_codes::OK) {
            std::cerr << "[OllamaResponder] Ollama API error: " << response.status_code() << std::endl;
            throw ResponderError("responder returned HTTP " + std::to_string(response.status_code()));
        }

        auto parsed = nlohmann::json::parse(response.extract_string().get());
        if (!parsed.contains("message") || !parsed["message"].is_object()) {
            throw ResponderError("responder reply has no message");
        }

        ResponderReply reply;
        reply.message = parsed["message"].value("content", "");
        reply.type = "text";
        reply.data = {{"model", parsed.value("model", _model)}};
        if (reply.message.empty()) {
            throw ResponderError("responder returned an empty reply");
        }
        return reply;
    } catch (const ResponderError&) {
        throw;
    } catch (const std::exception& e) {
        std::cerr << "[OllamaResponder] Request failed: " << e.what() << std::endl;
        throw ResponderError(e.what());
    }
}

} // namespace services
} // namespace parley
