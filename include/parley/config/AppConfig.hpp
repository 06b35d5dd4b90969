#ifndef PARLEY_CONFIG_APP_CONFIG_HPP
#define PARLEY_CONFIG_APP_CONFIG_HPP

#include <string>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <nlohmann/json.hpp>

#include "parley/services/ConversationStore.hpp"

namespace parley {
namespace config {

/**
 * @brief Application configuration
 *
 * Defaults are overridden by environment variables, then by the JSON
 * config file when one is set.
 */
class AppConfig {
public:
    // Server configuration
    std::string http_address = "0.0.0.0";
    uint16_t http_port = 3001;

    // Store bounds
    size_t max_conversations_per_tenant = 100;
    size_t max_messages_per_conversation = 100;
    size_t max_context_messages = 10;

    // Responder configuration
    std::string responder_url = "http://localhost:11434";
    std::string responder_model = "llama3:latest";
    uint32_t responder_timeout_seconds = 60;

    // Config persistence
    std::string config_file_path;

    static AppConfig builder() {
        return AppConfig();
    }

    AppConfig& withHttpAddress(const std::string& address) {
        http_address = address;
        return *this;
    }

    AppConfig& withHttpPort(uint16_t port) {
        http_port = port;
        return *this;
    }

    AppConfig& withMaxConversationsPerTenant(size_t count) {
        max_conversations_per_tenant = count;
        return *this;
    }

    AppConfig& withMaxMessagesPerConversation(size_t count) {
        max_messages_per_conversation = count;
        return *this;
    }

    AppConfig& withMaxContextMessages(size_t count) {
        max_context_messages = count;
        return *this;
    }

    AppConfig& withResponderUrl(const std::string& url) {
        responder_url = url;
        return *this;
    }

    AppConfig& withResponderModel(const std::string& model) {
        responder_model = model;
        return *this;
    }

    AppConfig& withConfigFilePath(const std::string& path) {
        config_file_path = path;
        return *this;
    }

    services::StoreLimits storeLimits() const {
        services::StoreLimits limits;
        limits.max_conversations_per_tenant = max_conversations_per_tenant;
        limits.max_messages_per_conversation = max_messages_per_conversation;
        limits.max_context_messages = max_context_messages;
        return limits;
    }

    /**
     * @brief Load configuration from environment variables
     *
     * Numbers must be plain decimal digits within the field's range.
     * Anything else is reported and the previous value is kept.
     */
    void loadFromEnvironment() {
        const char* env_value;

        if ((env_value = std::getenv("PARLEY_HTTP_ADDRESS")) != nullptr) {
            http_address = env_value;
        }

        if ((env_value = std::getenv("PARLEY_HTTP_PORT")) != nullptr) {
            http_port = static_cast<uint16_t>(
                parseNumber("PARLEY_HTTP_PORT", env_value, http_port, std::numeric_limits<uint16_t>::max()));
        }

        if ((env_value = std::getenv("PARLEY_MAX_CONVERSATIONS")) != nullptr) {
            max_conversations_per_tenant = parseNumber("PARLEY_MAX_CONVERSATIONS", env_value, max_conversations_per_tenant);
        }

        if ((env_value = std::getenv("PARLEY_MAX_MESSAGES")) != nullptr) {
            max_messages_per_conversation = parseNumber("PARLEY_MAX_MESSAGES", env_value, max_messages_per_conversation);
        }

        if ((env_value = std::getenv("PARLEY_CONTEXT_MESSAGES")) != nullptr) {
            max_context_messages = parseNumber("PARLEY_CONTEXT_MESSAGES", env_value, max_context_messages);
        }

        if ((env_value = std::getenv("OLLAMA_HOST")) != nullptr) {
            responder_url = env_value;
        }

        if ((env_value = std::getenv("OLLAMA_MODEL")) != nullptr) {
            responder_model = env_value;
        }

        if ((env_value = std::getenv("PARLEY_CONFIG_FILE")) != nullptr) {
            config_file_path = env_value;
        }
    }

    void loadFromFile() {
        if (config_file_path.empty()) return;

        std::ifstream file(config_file_path);
        if (!file.is_open()) {
            std::cerr << "[AppConfig] Config file not found: " << config_file_path << std::endl;
            return;
        }

        try {
            nlohmann::json j;
            file >> j;

            // Parse everything before assigning so a bad file changes nothing.
            AppConfig loaded = *this;
            loaded.http_address = j.value("http_address", loaded.http_address);
            loaded.http_port = static_cast<uint16_t>(
                fileNumber(j, "http_port", loaded.http_port, std::numeric_limits<uint16_t>::max()));
            loaded.max_conversations_per_tenant = fileNumber(j, "max_conversations_per_tenant", loaded.max_conversations_per_tenant);
            loaded.max_messages_per_conversation = fileNumber(j, "max_messages_per_conversation", loaded.max_messages_per_conversation);
            loaded.max_context_messages = fileNumber(j, "max_context_messages", loaded.max_context_messages);
            loaded.responder_url = j.value("responder_url", loaded.responder_url);
            loaded.responder_model = j.value("responder_model", loaded.responder_model);
            loaded.responder_timeout_seconds = static_cast<uint32_t>(
                fileNumber(j, "responder_timeout_seconds", loaded.responder_timeout_seconds, std::numeric_limits<uint32_t>::max()));
            *this = loaded;
            std::cout << "[AppConfig] Loaded configuration from " << config_file_path << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[AppConfig] Error parsing config file: " << e.what() << std::endl;
        }
    }

    bool saveToFile() const {
        if (config_file_path.empty()) return false;

        nlohmann::json j;
        j["http_address"] = http_address;
        j["http_port"] = http_port;
        j["max_conversations_per_tenant"] = max_conversations_per_tenant;
        j["max_messages_per_conversation"] = max_messages_per_conversation;
        j["max_context_messages"] = max_context_messages;
        j["responder_url"] = responder_url;
        j["responder_model"] = responder_model;
        j["responder_timeout_seconds"] = responder_timeout_seconds;

        std::ofstream file(config_file_path);
        if (!file.is_open()) {
            std::cerr << "[AppConfig] Failed to save configuration to " << config_file_path << std::endl;
            return false;
        }
        file << j.dump(4);
        std::cout << "[AppConfig] Saved configuration to " << config_file_path << std::endl;
        return true;
    }

private:
    static size_t parseNumber(const char* name, const std::string& value, size_t fallback,
                              size_t max_value = std::numeric_limits<size_t>::max()) {
        // Digits only: no sign, whitespace or suffix.
        if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
            std::cerr << "[AppConfig] Ignoring invalid " << name << "=" << value << std::endl;
            return fallback;
        }

        unsigned long long parsed = 0;
        try {
            parsed = std::stoull(value);
        } catch (const std::out_of_range&) {
            std::cerr << "[AppConfig] Ignoring out of range " << name << "=" << value << std::endl;
            return fallback;
        }
        if (parsed > max_value) {
            std::cerr << "[AppConfig] Ignoring out of range " << name << "=" << value
                      << " (max " << max_value << ")" << std::endl;
            return fallback;
        }
        return static_cast<size_t>(parsed);
    }

    // Missing keys keep the fallback; wrong types and out of range values throw.
    static size_t fileNumber(const nlohmann::json& j, const char* key, size_t fallback,
                             size_t max_value = std::numeric_limits<size_t>::max()) {
        auto it = j.find(key);
        if (it == j.end()) {
            return fallback;
        }
        if (!it->is_number_unsigned()) {
            throw std::invalid_argument(std::string(key) + " must be a non-negative integer");
        }
        const auto parsed = it->get<uint64_t>();
        if (parsed > max_value) {
            throw std::out_of_range(std::string(key) + " is out of range");
        }
        return static_cast<size_t>(parsed);
    }
};

} // namespace config
} // namespace parley

#endif // PARLEY_CONFIG_APP_CONFIG_HPP
