#include "parley/models/Conversation.hpp"
#include <ctime>
#include <cstdio>

namespace parley {
namespace models {

std::string role_to_string(MessageRole role) {
    switch (role) {
        case MessageRole::USER: return "user";
        case MessageRole::ASSISTANT: return "assistant";
    }
    return "user";
}

std::optional<MessageRole> role_from_string(const std::string& role) {
    if (role == "user") return MessageRole::USER;
    if (role == "assistant") return MessageRole::ASSISTANT;
    return std::nullopt;
}

std::string format_timestamp(Timestamp timestamp) {
    auto since_epoch = std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch());
    auto millis = since_epoch.count() % 1000;
    if (millis < 0) {
        millis += 1000;
    }

    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm utc{};
    gmtime_r(&time, &utc);

    char buf[32];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc) == 0) {
        return "";
    }
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(millis));
    return std::string(out);
}

nlohmann::json Message::toJson() const {
    // Caller metadata first so it can never shadow the core fields.
    nlohmann::json json = metadata.is_object() ? metadata : nlohmann::json::object();
    json["id"] = id;
    json["role"] = role_to_string(role);
    json["content"] = content;
    json["timestamp"] = format_timestamp(timestamp);
    return json;
}

nlohmann::json Conversation::toJson() const {
    nlohmann::json messages_json = nlohmann::json::array();
    for (const auto& message : messages) {
        messages_json.push_back(message.toJson());
    }

    nlohmann::json json;
    json["id"] = id;
    json["title"] = title;
    json["messages"] = messages_json;
    json["createdAt"] = format_timestamp(created_at);
    json["updatedAt"] = format_timestamp(updated_at);
    json["messageCount"] = message_count;
    return json;
}

nlohmann::json ConversationSummary::toJson() const {
    return {
        {"id", id},
        {"title", title},
        {"messageCount", message_count},
        {"createdAt", format_timestamp(created_at)},
        {"updatedAt", format_timestamp(updated_at)},
        {"lastMessage", last_message}
    };
}

nlohmann::json StoreStats::toJson() const {
    return {
        {"totalUsers", tenant_count},
        {"totalChats", conversation_count},
        {"totalMessages", message_count},
        {"averageChatsPerUser", avg_conversations_per_tenant},
        {"averageMessagesPerChat", avg_messages_per_conversation}
    };
}

namespace {
    nlohmann::json summaries_to_json(const std::vector<ConversationSummary>& summaries) {
        nlohmann::json array = nlohmann::json::array();
        for (const auto& summary : summaries) {
            array.push_back(summary.toJson());
        }
        return array;
    }
}

nlohmann::json RecencyGroups::toJson() const {
    return {
        {"today", summaries_to_json(today)},
        {"yesterday", summaries_to_json(yesterday)},
        {"lastWeek", summaries_to_json(last_week)},
        {"older", summaries_to_json(older)}
    };
}

} // namespace models
} // namespace parley
