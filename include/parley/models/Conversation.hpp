#ifndef PARLEY_MODELS_CONVERSATION_HPP
#define PARLEY_MODELS_CONVERSATION_HPP

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace parley {
namespace models {

using Timestamp = std::chrono::system_clock::time_point;

enum class MessageRole {
    USER,
    ASSISTANT
};

std::string role_to_string(MessageRole role);

// Returns nullopt for anything other than "user" / "assistant".
std::optional<MessageRole> role_from_string(const std::string& role);

// ISO-8601 UTC with millisecond precision, e.g. 2026-10-19T08:15:02.123Z
std::string format_timestamp(Timestamp timestamp);

/**
 * @brief A single chat message
 *
 * Messages are immutable once appended. The metadata object is supplied by
 * the caller (intent, response type, structured payload) and is carried
 * through without interpretation.
 */
struct Message {
    std::string id;
    MessageRole role = MessageRole::USER;
    std::string content;
    Timestamp timestamp;
    nlohmann::json metadata = nlohmann::json::object();

    nlohmann::json toJson() const;
};

/**
 * @brief A conversation owned by exactly one tenant
 *
 * message_count always equals messages.size() once the store has applied
 * trimming.
 */
struct Conversation {
    std::string id;
    std::string tenant_id;
    std::string title;
    std::vector<Message> messages;
    Timestamp created_at;
    Timestamp updated_at;
    size_t message_count = 0;

    nlohmann::json toJson() const;
};

/**
 * @brief Sidebar listing entry
 */
struct ConversationSummary {
    std::string id;
    std::string title;
    size_t message_count = 0;
    Timestamp created_at;
    Timestamp updated_at;
    std::string last_message;

    nlohmann::json toJson() const;
};

struct StoreStats {
    size_t tenant_count = 0;
    size_t conversation_count = 0;
    size_t message_count = 0;
    size_t avg_conversations_per_tenant = 0;
    size_t avg_messages_per_conversation = 0;

    nlohmann::json toJson() const;
};

/**
 * @brief Listing partitioned by how recently each conversation was active
 *
 * Each bucket keeps the most-recent-first order of the listing it came from.
 */
struct RecencyGroups {
    std::vector<ConversationSummary> today;
    std::vector<ConversationSummary> yesterday;
    std::vector<ConversationSummary> last_week;
    std::vector<ConversationSummary> older;

    size_t total() const {
        return today.size() + yesterday.size() + last_week.size() + older.size();
    }

    nlohmann::json toJson() const;
};

} // namespace models
} // namespace parley

#endif // PARLEY_MODELS_CONVERSATION_HPP
