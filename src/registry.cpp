#include "registry.h"
#include "logger.h"
#include <algorithm>

#define LOG_REGISTRY_DEBUG(message) LOG_DEBUG("registry", message)
#define LOG_REGISTRY_INFO(message)  LOG_INFO("registry", message)

namespace filepunch {

size_t FirstRegisteredPolicy::select(const std::vector<PublisherRecord>&) {
    return 0;
}

RandomPolicy::RandomPolicy() : rng_(std::random_device{}()) {
}

RandomPolicy::RandomPolicy(uint32_t seed) : rng_(seed) {
}

size_t RandomPolicy::select(const std::vector<PublisherRecord>& records) {
    std::lock_guard<std::mutex> lock(rng_mutex_);
    std::uniform_int_distribution<size_t> distribution(0, records.size() - 1);
    return distribution(rng_);
}

std::unique_ptr<PublisherSelectionPolicy> create_selection_policy(const std::string& name) {
    if (name == "first") {
        return std::make_unique<FirstRegisteredPolicy>();
    }
    if (name == "random") {
        return std::make_unique<RandomPolicy>();
    }
    return nullptr;
}

//=============================================================================
// Registry Implementation
//=============================================================================

Registry::Registry(std::unique_ptr<PublisherSelectionPolicy> policy)
    : policy_(policy ? std::move(policy) : std::make_unique<FirstRegisteredPolicy>()) {
}

Registry::Shard& Registry::shard_for(const ContentId& content_id) {
    return shards_[ContentIdHash()(content_id) % SHARD_COUNT];
}

const Registry::Shard& Registry::shard_for(const ContentId& content_id) const {
    return shards_[ContentIdHash()(content_id) % SHARD_COUNT];
}

bool Registry::insert(const PublisherRecord& record) {
    Shard& shard = shard_for(record.content_id);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto& records = shard.records[record.content_id];
    auto duplicate = std::find_if(records.begin(), records.end(), [&record](const PublisherRecord& existing) {
        return existing.connection_id == record.connection_id;
    });
    if (duplicate != records.end()) {
        LOG_REGISTRY_DEBUG("Connection " << record.connection_id << " already publishes "
                           << record.content_id.to_hex());
        return false;
    }

    records.push_back(record);
    LOG_REGISTRY_DEBUG("Registered publisher " << record.address.external << " for "
                       << record.content_id.to_hex() << " (" << records.size() << " total)");
    return true;
}

size_t Registry::remove_connection(ConnectionId connection_id) {
    size_t removed = 0;
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (auto it = shard.records.begin(); it != shard.records.end();) {
            auto& records = it->second;
            size_t before = records.size();
            records.erase(std::remove_if(records.begin(), records.end(),
                                         [connection_id](const PublisherRecord& record) {
                                             return record.connection_id == connection_id;
                                         }),
                          records.end());
            removed += before - records.size();

            if (records.empty()) {
                it = shard.records.erase(it);
            } else {
                ++it;
            }
        }
    }

    if (removed > 0) {
        LOG_REGISTRY_INFO("Removed " << removed << " records of connection " << connection_id);
    }
    return removed;
}

bool Registry::remove(const ContentId& content_id, ConnectionId connection_id) {
    Shard& shard = shard_for(content_id);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.records.find(content_id);
    if (it == shard.records.end()) {
        return false;
    }

    auto& records = it->second;
    auto record = std::find_if(records.begin(), records.end(), [connection_id](const PublisherRecord& r) {
        return r.connection_id == connection_id;
    });
    if (record == records.end()) {
        return false;
    }

    records.erase(record);
    if (records.empty()) {
        shard.records.erase(it);
    }
    return true;
}

bool Registry::select(const ContentId& content_id, PublisherRecord& record) {
    Shard& shard = shard_for(content_id);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.records.find(content_id);
    if (it == shard.records.end() || it->second.empty()) {
        return false;
    }

    size_t index = policy_->select(it->second);
    if (index >= it->second.size()) {
        index = 0;
    }
    record = it->second[index];
    return true;
}

std::vector<PublisherRecord> Registry::lookup(const ContentId& content_id) const {
    const Shard& shard = shard_for(content_id);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.records.find(content_id);
    if (it == shard.records.end()) {
        return {};
    }
    return it->second;
}

size_t Registry::size() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (const auto& entry : shard.records) {
            total += entry.second.size();
        }
    }
    return total;
}

size_t Registry::publisher_count(const ContentId& content_id) const {
    const Shard& shard = shard_for(content_id);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.records.find(content_id);
    return it == shard.records.end() ? 0 : it->second.size();
}

} // namespace filepunch
