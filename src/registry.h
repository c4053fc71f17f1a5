#pragma once

#include "content_id.h"
#include "socket.h"
#include "types.h"
#include <array>
#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace filepunch {

using ConnectionId = uint64_t;

/**
 * One advertisement of a ContentId. Fixed at registration, destroyed with
 * its control connection.
 */
struct PublisherRecord {
    ContentId content_id;
    PeerAddress address;              // local as announced, external as observed (or overridden)
    SocketAddress observed_address;   // server's view of the control connection
    uint64_t file_size;
    ConnectionId connection_id;
    uint32_t request_id;              // publish request, introductions are tagged with it
    TimePoint registered_at;

    PublisherRecord() : file_size(0), connection_id(0), request_id(0) {}
};

/**
 * Chooses one publisher among the records registered for a ContentId
 */
class PublisherSelectionPolicy {
public:
    virtual ~PublisherSelectionPolicy() = default;

    /**
     * @param records Non-empty, in registration order
     * @return Index into records
     */
    virtual size_t select(const std::vector<PublisherRecord>& records) = 0;
    virtual const char* name() const = 0;
};

class FirstRegisteredPolicy : public PublisherSelectionPolicy {
public:
    size_t select(const std::vector<PublisherRecord>& records) override;
    const char* name() const override { return "first"; }
};

class RandomPolicy : public PublisherSelectionPolicy {
public:
    RandomPolicy();
    explicit RandomPolicy(uint32_t seed);

    size_t select(const std::vector<PublisherRecord>& records) override;
    const char* name() const override { return "random"; }

private:
    std::mutex rng_mutex_;
    std::mt19937 rng_;
};

/**
 * Create a policy by name ("first" or "random")
 * @return nullptr for an unknown name
 */
std::unique_ptr<PublisherSelectionPolicy> create_selection_policy(const std::string& name);

/**
 * ContentId -> publishers, in registration order.
 *
 * The map is split into shards keyed by the ContentId so that unrelated
 * publish and subscribe requests never contend. A shard lock is held only
 * for a single lookup, insert or remove.
 */
class Registry {
public:
    static constexpr size_t SHARD_COUNT = 16;

    explicit Registry(std::unique_ptr<PublisherSelectionPolicy> policy = nullptr);

    /**
     * Add a record. A second publish of the same ContentId from the same
     * connection is ignored.
     * @return true if the record was added
     */
    bool insert(const PublisherRecord& record);

    /**
     * Remove every record owned by a connection
     * @return Number of records removed
     */
    size_t remove_connection(ConnectionId connection_id);

    /**
     * Remove a single record
     */
    bool remove(const ContentId& content_id, ConnectionId connection_id);

    /**
     * Pick a publisher through the selection policy
     * @return false if nobody publishes the ContentId
     */
    bool select(const ContentId& content_id, PublisherRecord& record);

    std::vector<PublisherRecord> lookup(const ContentId& content_id) const;

    size_t size() const;
    size_t publisher_count(const ContentId& content_id) const;
    const PublisherSelectionPolicy& policy() const { return *policy_; }

private:
    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<ContentId, std::vector<PublisherRecord>, ContentIdHash> records;
    };

    Shard& shard_for(const ContentId& content_id);
    const Shard& shard_for(const ContentId& content_id) const;

    std::unique_ptr<PublisherSelectionPolicy> policy_;
    std::array<Shard, SHARD_COUNT> shards_;
};

} // namespace filepunch
