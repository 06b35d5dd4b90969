#ifndef PARLEY_SERVICES_CONVERSATION_STORE_HPP
#define PARLEY_SERVICES_CONVERSATION_STORE_HPP

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

#include "parley/models/Conversation.hpp"
#include "parley/repository/ConversationRepository.hpp"
#include "parley/utils/Clock.hpp"
#include "parley/utils/IdGenerator.hpp"

namespace parley {
namespace services {

struct StoreLimits {
    size_t max_conversations_per_tenant = 100;
    size_t max_messages_per_conversation = 100;
    size_t max_context_messages = 10;
};

/**
 * @brief Volatile, multi-tenant conversation store
 *
 * Holds tenant -> conversation -> messages for the lifetime of the process.
 * Writers of one tenant are serialized on that tenant's partition; readers
 * get copies taken under a shared lock, so they never see a half-applied
 * append. Missing required arguments raise std::invalid_argument; absence
 * of a record is reported through std::optional or a false return.
 */
class ConversationStore {
public:
    ConversationStore(const StoreLimits& limits, const utils::Clock& clock, utils::IdGenerator& id_generator);

    /**
     * @brief Create a conversation for a tenant
     *
     * An empty conversation_id asks for a generated one. A non-empty seed
     * becomes the title source and the first user message. When the tenant
     * is already at its cap, the conversation with the oldest creation time
     * is evicted first. An existing id is replaced in place.
     */
    models::Conversation create_conversation(const std::string& tenant_id,
                                             const std::string& conversation_id = "",
                                             const std::string& seed_message = "");

    /**
     * @brief Append a message, creating the conversation if needed
     *
     * The title is derived from the content when this is the first message
     * and it comes from the user. Oldest messages are trimmed once the
     * per-conversation bound is exceeded.
     */
    models::Message append_message(const std::string& tenant_id,
                                   const std::string& conversation_id,
                                   models::MessageRole role,
                                   const std::string& content,
                                   const nlohmann::json& metadata = nlohmann::json::object());

    // Same as above with the role given as "user" / "assistant".
    models::Message append_message(const std::string& tenant_id,
                                   const std::string& conversation_id,
                                   const std::string& role,
                                   const std::string& content,
                                   const nlohmann::json& metadata = nlohmann::json::object());

    std::optional<models::Conversation> get_conversation(const std::string& tenant_id,
                                                         const std::string& conversation_id) const;

    bool has_conversation(const std::string& tenant_id, const std::string& conversation_id) const;

    // Most recently updated first.
    std::vector<models::ConversationSummary> list_conversations(const std::string& tenant_id) const;

    // Last `limit` messages, oldest first. Defaults to max_context_messages.
    std::vector<models::Message> get_context_messages(const std::string& tenant_id,
                                                      const std::string& conversation_id,
                                                      std::optional<size_t> limit = std::nullopt) const;

    bool delete_conversation(const std::string& tenant_id, const std::string& conversation_id);

    bool rename_conversation(const std::string& tenant_id,
                             const std::string& conversation_id,
                             const std::string& new_title);

    // Removes every conversation of the tenant and returns how many there were.
    size_t clear_tenant(const std::string& tenant_id);

    void clear_all();

    models::StoreStats stats() const;

    const StoreLimits& limits() const { return _limits; }

private:
    // All *_locked helpers require the owning partition's unique lock.
    models::Conversation& insert_conversation_locked(repository::TenantPartition& partition,
                                                     const std::string& tenant_id,
                                                     const std::string& conversation_id,
                                                     const std::string& seed_message);
    models::Message append_locked(models::Conversation& conversation,
                                  models::MessageRole role,
                                  const std::string& content,
                                  nlohmann::json metadata);
    void evict_oldest_locked(repository::TenantPartition& partition, const std::string& tenant_id);
    std::string unique_conversation_id_locked(const repository::TenantPartition& partition);
    std::string unique_message_id(const models::Conversation& conversation);

    StoreLimits _limits;
    const utils::Clock& _clock;
    utils::IdGenerator& _id_generator;
    repository::ConversationRepository _repository;
};

} // namespace services
} // namespace parley

#endif // PARLEY_SERVICES_CONVERSATION_STORE_HPP
