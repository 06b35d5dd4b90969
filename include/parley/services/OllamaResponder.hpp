#ifndef PARLEY_SERVICES_OLLAMA_RESPONDER_HPP
#define PARLEY_SERVICES_OLLAMA_RESPONDER_HPP

#include <string>
#include <chrono>

#include "parley/services/Responder.hpp"

namespace parley {
namespace services {

/**
 * @brief Responder backed by an Ollama server's /api/chat endpoint
 */
class OllamaResponder : public Responder {
public:
    OllamaResponder(const std::string& base_url, const std::string& model, std::chrono::seconds timeout);

    ResponderReply respond(const ResponderRequest& request) override;

private:
    std::string _base_url;
    std::string _model;
    std::chrono::seconds _timeout;
};

} // namespace services
} // namespace parley

#endif // PARLEY_SERVICES_OLLAMA_RESPONDER_HPP
