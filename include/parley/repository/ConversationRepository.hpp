#ifndef PARLEY_REPOSITORY_CONVERSATION_REPOSITORY_HPP
#define PARLEY_REPOSITORY_CONVERSATION_REPOSITORY_HPP

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <shared_mutex>
#include <mutex>
#include <cstdint>

#include "parley/models/Conversation.hpp"

namespace parley {
namespace repository {

/**
 * @brief Stored conversation plus its insertion sequence
 *
 * The sequence number breaks ties between conversations created at the same
 * instant and keeps listings stable.
 */
struct ConversationRecord {
    models::Conversation conversation;
    uint64_t sequence = 0;
};

/**
 * @brief All conversations of one tenant
 *
 * The partition lock serializes writers of this tenant and lets readers of
 * the same tenant proceed together. Other tenants are never blocked by it.
 */
struct TenantPartition {
    mutable std::shared_mutex mutex;
    std::map<std::string, ConversationRecord> conversations;
    uint64_t next_sequence = 0;
};

/**
 * @brief Two-level mapping: tenant -> conversation id -> record
 *
 * Lookups never create anything. A partition only comes into existence
 * through getOrCreatePartition(), which is called on the write paths.
 * Partitions are handed out as shared pointers so a caller can release the
 * outer lock and keep working on its tenant under the partition lock.
 */
class ConversationRepository {
public:
    ConversationRepository() = default;

    std::shared_ptr<TenantPartition> findPartition(const std::string& tenant_id) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = partitions_.find(tenant_id);
        if (it != partitions_.end()) {
            return it->second;
        }
        return nullptr;
    }

    /**
     * @brief Explicit creation-on-first-access step for a tenant
     *
     * @param created set to true when this call allocated the partition
     */
    std::shared_ptr<TenantPartition> getOrCreatePartition(const std::string& tenant_id, bool* created = nullptr) {
        if (created) {
            *created = false;
        }
        if (auto existing = findPartition(tenant_id)) {
            return existing;
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = partitions_.find(tenant_id);
        if (it != partitions_.end()) {
            return it->second;
        }
        auto partition = std::make_shared<TenantPartition>();
        partitions_.emplace(tenant_id, partition);
        if (created) {
            *created = true;
        }
        return partition;
    }

    std::vector<std::shared_ptr<TenantPartition>> allPartitions() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<std::shared_ptr<TenantPartition>> result;
        result.reserve(partitions_.size());
        for (const auto& pair : partitions_) {
            result.push_back(pair.second);
        }
        return result;
    }

    size_t partitionCount() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return partitions_.size();
    }

    void clear() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        partitions_.clear();
    }

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<TenantPartition>> partitions_;
};

} // namespace repository
} // namespace parley

#endif // PARLEY_REPOSITORY_CONVERSATION_REPOSITORY_HPP
