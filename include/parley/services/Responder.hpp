#ifndef PARLEY_SERVICES_RESPONDER_HPP
#define PARLEY_SERVICES_RESPONDER_HPP

#include <string>
#include <vector>
#include <stdexcept>
#include <nlohmann/json.hpp>

#include "parley/models/Conversation.hpp"

namespace parley {
namespace services {

struct ResponderRequest {
    std::string conversation_id;
    std::string message;
    std::string intent;
    nlohmann::json profile = nlohmann::json::object();
    // Prior messages, oldest first, excluding `message` itself.
    std::vector<models::Message> history;
    std::string context;
};

struct ResponderReply {
    std::string message;
    std::string type = "text";
    nlohmann::json data;
};

class ResponderError : public std::runtime_error {
public:
    explicit ResponderError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Produces the assistant reply for one user turn
 *
 * Implementations may be slow and may fail; failures are reported by
 * throwing ResponderError.
 */
class Responder {
public:
    virtual ~Responder() = default;
    virtual ResponderReply respond(const ResponderRequest& request) = 0;
};

} // namespace services
} // namespace parley

#endif // PARLEY_SERVICES_RESPONDER_HPP
