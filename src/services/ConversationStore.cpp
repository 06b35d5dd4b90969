#include "parley/services/ConversationStore.hpp"
#include "parley/utils/TextUtils.hpp"
#include <algorithm>
#include <cstddef>
#include <iostream>
#include <stdexcept>

namespace parley {
namespace services {

namespace {
    // Half rounds up, matching the usual presentation of averages.
    size_t rounded_average(size_t total, size_t count) {
        if (count == 0) {
            return 0;
        }
        return (total + count / 2) / count;
    }

    nlohmann::json normalize_metadata(const nlohmann::json& metadata) {
        if (metadata.is_null()) {
            return nlohmann::json::object();
        }
        if (!metadata.is_object()) {
            throw std::invalid_argument("metadata must be a JSON object");
        }
        return metadata;
    }
}

ConversationStore::ConversationStore(const StoreLimits& limits, const utils::Clock& clock, utils::IdGenerator& id_generator)
    : _limits(limits), _clock(clock), _id_generator(id_generator) {
    if (_limits.max_conversations_per_tenant == 0 || _limits.max_messages_per_conversation == 0) {
        throw std::invalid_argument("store limits must be greater than zero");
    }
    if (_limits.max_context_messages == 0) {
        _limits.max_context_messages = _limits.max_messages_per_conversation;
    }
    std::cout << "[ConversationStore] Initialized (max " << _limits.max_conversations_per_tenant
              << " chats per user, " << _limits.max_messages_per_conversation << " messages per chat)" << std::endl;
}

models::Conversation ConversationStore::create_conversation(const std::string& tenant_id,
                                                            const std::string& conversation_id,
                                                            const std::string& seed_message) {
    if (tenant_id.empty()) {
        throw std::invalid_argument("tenant id is required");
    }

    bool created = false;
    auto partition = _repository.getOrCreatePartition(tenant_id, &created);
    if (created) {
        std::cout << "[ConversationStore] New user chat storage: " << tenant_id << std::endl;
    }

    std::unique_lock<std::shared_mutex> lock(partition->mutex);
    auto& conversation = insert_conversation_locked(*partition, tenant_id, conversation_id, seed_message);
    if (!seed_message.empty()) {
        append_locked(conversation, models::MessageRole::USER, seed_message, nlohmann::json::object());
    }
    return conversation;
}

models::Message ConversationStore::append_message(const std::string& tenant_id,
                                                  const std::string& conversation_id,
                                                  const std::string& role,
                                                  const std::string& content,
                                                  const nlohmann::json& metadata) {
    if (role.empty()) {
        throw std::invalid_argument("role is required");
    }
    auto parsed = models::role_from_string(role);
    if (!parsed) {
        throw std::invalid_argument("role must be either \"user\" or \"assistant\"");
    }
    return append_message(tenant_id, conversation_id, *parsed, content, metadata);
}

models::Message ConversationStore::append_message(const std::string& tenant_id,
                                                  const std::string& conversation_id,
                                                  models::MessageRole role,
                                                  const std::string& content,
                                                  const nlohmann::json& metadata) {
    if (tenant_id.empty() || conversation_id.empty() || content.empty()) {
        throw std::invalid_argument("tenant id, conversation id, role, and content are required");
    }
    nlohmann::json message_metadata = normalize_metadata(metadata);

    bool created = false;
    auto partition = _repository.getOrCreatePartition(tenant_id, &created);
    if (created) {
        std::cout << "[ConversationStore] New user chat storage: " << tenant_id << std::endl;
    }

    std::unique_lock<std::shared_mutex> lock(partition->mutex);

    models::Conversation* conversation = nullptr;
    auto it = partition->conversations.find(conversation_id);
    if (it != partition->conversations.end()) {
        conversation = &it->second.conversation;
    } else {
        const std::string seed = role == models::MessageRole::USER ? content : std::string();
        conversation = &insert_conversation_locked(*partition, tenant_id, conversation_id, seed);
    }

    return append_locked(*conversation, role, content, std::move(message_metadata));
}

std::optional<models::Conversation> ConversationStore::get_conversation(const std::string& tenant_id,
                                                                        const std::string& conversation_id) const {
    if (tenant_id.empty() || conversation_id.empty()) {
        return std::nullopt;
    }
    auto partition = _repository.findPartition(tenant_id);
    if (!partition) {
        return std::nullopt;
    }

    std::shared_lock<std::shared_mutex> lock(partition->mutex);
    auto it = partition->conversations.find(conversation_id);
    if (it == partition->conversations.end()) {
        return std::nullopt;
    }
    return it->second.conversation;
}

bool ConversationStore::has_conversation(const std::string& tenant_id, const std::string& conversation_id) const {
    if (tenant_id.empty() || conversation_id.empty()) {
        return false;
    }
    auto partition = _repository.findPartition(tenant_id);
    if (!partition) {
        return false;
    }

    std::shared_lock<std::shared_mutex> lock(partition->mutex);
    return partition->conversations.count(conversation_id) > 0;
}

std::vector<models::ConversationSummary> ConversationStore::list_conversations(const std::string& tenant_id) const {
    std::vector<models::ConversationSummary> summaries;
    if (tenant_id.empty()) {
        return summaries;
    }
    auto partition = _repository.findPartition(tenant_id);
    if (!partition) {
        return summaries;
    }

    std::vector<std::pair<uint64_t, models::ConversationSummary>> entries;
    {
        std::shared_lock<std::shared_mutex> lock(partition->mutex);
        entries.reserve(partition->conversations.size());
        for (const auto& pair : partition->conversations) {
            const auto& conversation = pair.second.conversation;

            models::ConversationSummary summary;
            summary.id = conversation.id;
            summary.title = conversation.title;
            summary.message_count = conversation.message_count;
            summary.created_at = conversation.created_at;
            summary.updated_at = conversation.updated_at;
            if (!conversation.messages.empty()) {
                summary.last_message = utils::preview(conversation.messages.back().content);
            }
            entries.emplace_back(pair.second.sequence, std::move(summary));
        }
    }

    std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
        if (a.second.updated_at != b.second.updated_at) {
            return a.second.updated_at > b.second.updated_at;
        }
        return a.first < b.first;
    });

    summaries.reserve(entries.size());
    for (auto& entry : entries) {
        summaries.push_back(std::move(entry.second));
    }
    return summaries;
}

std::vector<models::Message> ConversationStore::get_context_messages(const std::string& tenant_id,
                                                                     const std::string& conversation_id,
                                                                     std::optional<size_t> limit) const {
    std::vector<models::Message> context;
    if (tenant_id.empty() || conversation_id.empty()) {
        return context;
    }
    auto partition = _repository.findPartition(tenant_id);
    if (!partition) {
        return context;
    }

    const size_t wanted = limit.value_or(_limits.max_context_messages);

    std::shared_lock<std::shared_mutex> lock(partition->mutex);
    auto it = partition->conversations.find(conversation_id);
    if (it == partition->conversations.end()) {
        return context;
    }
    const auto& messages = it->second.conversation.messages;
    const size_t start = messages.size() > wanted ? messages.size() - wanted : 0;
    context.assign(messages.begin() + static_cast<std::ptrdiff_t>(start), messages.end());
    return context;
}

bool ConversationStore::delete_conversation(const std::string& tenant_id, const std::string& conversation_id) {
    if (tenant_id.empty() || conversation_id.empty()) {
        return false;
    }
    auto partition = _repository.findPartition(tenant_id);
    if (!partition) {
        return false;
    }

    bool deleted = false;
    {
        std::unique_lock<std::shared_mutex> lock(partition->mutex);
        deleted = partition->conversations.erase(conversation_id) > 0;
    }
    if (deleted) {
        std::cout << "[ConversationStore] Chat deleted: " << conversation_id << " for user " << tenant_id << std::endl;
    }
    return deleted;
}

bool ConversationStore::rename_conversation(const std::string& tenant_id,
                                            const std::string& conversation_id,
                                            const std::string& new_title) {
    if (tenant_id.empty() || conversation_id.empty() || utils::trim(new_title).empty()) {
        return false;
    }
    auto partition = _repository.findPartition(tenant_id);
    if (!partition) {
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(partition->mutex);
    auto it = partition->conversations.find(conversation_id);
    if (it == partition->conversations.end()) {
        return false;
    }
    it->second.conversation.title = new_title;
    it->second.conversation.updated_at = _clock.now();
    return true;
}

size_t ConversationStore::clear_tenant(const std::string& tenant_id) {
    if (tenant_id.empty()) {
        return 0;
    }
    auto partition = _repository.findPartition(tenant_id);
    if (!partition) {
        return 0;
    }

    size_t count = 0;
    {
        std::unique_lock<std::shared_mutex> lock(partition->mutex);
        count = partition->conversations.size();
        partition->conversations.clear();
    }
    std::cout << "[ConversationStore] All " << count << " chats cleared for user " << tenant_id << std::endl;
    return count;
}

void ConversationStore::clear_all() {
    auto before = stats();
    _repository.clear();
    std::cout << "[ConversationStore] All chat data cleared (" << before.conversation_count << " chats, "
              << before.message_count << " messages)" << std::endl;
}

models::StoreStats ConversationStore::stats() const {
    models::StoreStats result;
    for (const auto& partition : _repository.allPartitions()) {
        std::shared_lock<std::shared_mutex> lock(partition->mutex);
        if (partition->conversations.empty()) {
            continue;
        }
        ++result.tenant_count;
        result.conversation_count += partition->conversations.size();
        for (const auto& pair : partition->conversations) {
            result.message_count += pair.second.conversation.messages.size();
        }
    }
    result.avg_conversations_per_tenant = rounded_average(result.conversation_count, result.tenant_count);
    result.avg_messages_per_conversation = rounded_average(result.message_count, result.conversation_count);
    return result;
}

models::Conversation& ConversationStore::insert_conversation_locked(repository::TenantPartition& partition,
                                                                    const std::string& tenant_id,
                                                                    const std::string& conversation_id,
                                                                    const std::string& seed_message) {
    const std::string final_id = conversation_id.empty() ? unique_conversation_id_locked(partition) : conversation_id;
    const bool replacing = partition.conversations.count(final_id) > 0;

    if (!replacing && partition.conversations.size() >= _limits.max_conversations_per_tenant) {
        evict_oldest_locked(partition, tenant_id);
    }

    const auto now = _clock.now();
    models::Conversation conversation;
    conversation.id = final_id;
    conversation.tenant_id = tenant_id;
    conversation.title = utils::derive_title(seed_message);
    conversation.created_at = now;
    conversation.updated_at = now;
    conversation.message_count = 0;

    auto& record = partition.conversations[final_id];
    record.conversation = std::move(conversation);
    record.sequence = partition.next_sequence++;

    std::cout << "[ConversationStore] New chat created: " << final_id << " for user " << tenant_id << std::endl;
    return record.conversation;
}

models::Message ConversationStore::append_locked(models::Conversation& conversation,
                                                 models::MessageRole role,
                                                 const std::string& content,
                                                 nlohmann::json metadata) {
    if (conversation.messages.empty() && role == models::MessageRole::USER) {
        conversation.title = utils::derive_title(content);
    }

    models::Message message;
    message.id = unique_message_id(conversation);
    message.role = role;
    message.content = content;
    message.timestamp = _clock.now();
    message.metadata = std::move(metadata);

    conversation.messages.push_back(message);
    conversation.updated_at = message.timestamp;

    const size_t bound = _limits.max_messages_per_conversation;
    if (conversation.messages.size() > bound) {
        const size_t excess = conversation.messages.size() - bound;
        conversation.messages.erase(conversation.messages.begin(),
                                    conversation.messages.begin() + static_cast<std::ptrdiff_t>(excess));
        std::cout << "[ConversationStore] Trimmed " << excess << " old messages from chat " << conversation.id << std::endl;
    }
    conversation.message_count = conversation.messages.size();

    std::cout << "[ConversationStore] Message added to chat " << conversation.id << ": "
              << models::role_to_string(role) << " - " << utils::preview(content, 30) << std::endl;
    return message;
}

void ConversationStore::evict_oldest_locked(repository::TenantPartition& partition, const std::string& tenant_id) {
    auto oldest = partition.conversations.end();
    for (auto it = partition.conversations.begin(); it != partition.conversations.end(); ++it) {
        if (oldest == partition.conversations.end()) {
            oldest = it;
            continue;
        }
        const auto& candidate = it->second;
        const auto& current = oldest->second;
        if (candidate.conversation.created_at < current.conversation.created_at ||
            (candidate.conversation.created_at == current.conversation.created_at &&
             candidate.sequence < current.sequence)) {
            oldest = it;
        }
    }
    if (oldest == partition.conversations.end()) {
        return;
    }
    std::cout << "[ConversationStore] Removed oldest chat " << oldest->first << " for user " << tenant_id << std::endl;
    partition.conversations.erase(oldest);
}

std::string ConversationStore::unique_conversation_id_locked(const repository::TenantPartition& partition) {
    std::string id = _id_generator.conversation_id();
    while (partition.conversations.count(id) > 0) {
        id = _id_generator.conversation_id();
    }
    return id;
}

std::string ConversationStore::unique_message_id(const models::Conversation& conversation) {
    auto taken = [&conversation](const std::string& candidate) {
        return std::any_of(conversation.messages.begin(), conversation.messages.end(),
                           [&candidate](const models::Message& m) { return m.id == candidate; });
    };
    std::string id = _id_generator.message_id();
    while (taken(id)) {
        id = _id_generator.message_id();
    }
    return id;
}

} // namespace services
} // namespace parley
