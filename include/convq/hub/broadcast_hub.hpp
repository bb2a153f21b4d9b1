// ============================================================================
// convq/hub/broadcast_hub.hpp - Group Publish/Subscribe
// ============================================================================
//
// BroadcastHub fans events out to connections by group. Each registered
// connection owns an Outbox; Publish() pushes the shared event into the
// outbox of every member of the target group(s) and returns. It never
// blocks on a slow connection: a full outbox drops its oldest event and the
// connection is recorded as lagging.
//
// ORDERING:
// ---------
// Each group has its own mutex, held for the whole fan-out. Two publishes
// to the same group are therefore seen in the same order by every member.
// Nothing is promised across groups.
//
// LOCKING:
// --------
//   index_mutex_ (shared)  connection table and group table
//   Group::mutex           that group's member list
//
// Membership changes take index then group. Publish takes the index only
// long enough to look the group up, then group locks (several in name
// order for a multi-group publish).
//
// ============================================================================

#pragma once

#include "convq/core/result.hpp"
#include "convq/engine/engine_error.hpp"
#include "convq/engine/event.hpp"
#include "convq/hub/groups.hpp"
#include "convq/hub/outbox.hpp"

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace convq {

using ConnectionId = std::string;

class BroadcastHub {
   public:
    struct Stats {
        uint64_t published = 0;
        uint64_t delivered = 0;
        uint64_t dropped = 0;
        size_t lagging_connections = 0;
    };

    // One "connection-lagging" diagnostic
    struct LaggingRecord {
        ConnectionId connection;
        std::string group;
        uint64_t dropped_total = 0;
    };

    static constexpr size_t kLaggingHistory = 64;

    BroadcastHub() = default;

    BroadcastHub(const BroadcastHub&) = delete;
    BroadcastHub& operator=(const BroadcastHub&) = delete;

    // Registers the connection and joins it to the global group.
    // Conflict if the id is already registered.
    Result<void, EngineError> AddConnection(const ConnectionId& id, std::shared_ptr<Outbox> outbox);

    // Drops every membership and closes the outbox. False if unknown.
    bool RemoveConnection(const ConnectionId& id);

    // Idempotent. NotFound for an unknown connection, ValidationError for a
    // malformed group name.
    Result<void, EngineError> Join(const ConnectionId& id, std::string_view group);
    Result<void, EngineError> Leave(const ConnectionId& id, std::string_view group);

    // Returns the number of outboxes the event was queued in
    size_t Publish(std::string_view group, const EventPtr& event);

    // Delivers once per connection even if it is in several of `groups`
    size_t PublishToGroups(const std::vector<std::string>& groups, const EventPtr& event);

    [[nodiscard]] Stats GetStats() const;
    [[nodiscard]] std::vector<LaggingRecord> RecentLagging() const;

    [[nodiscard]] size_t ConnectionCount() const;
    [[nodiscard]] size_t GroupSize(std::string_view group) const;
    [[nodiscard]] std::vector<std::string> GroupsOf(const ConnectionId& id) const;
    [[nodiscard]] bool HasConnection(const ConnectionId& id) const;

   private:
    struct Group {
        std::mutex mutex;
        std::map<ConnectionId, std::shared_ptr<Outbox>> members;
    };

    struct Connection {
        std::shared_ptr<Outbox> outbox;
        std::set<std::string, std::less<>> groups;
    };

    // Callers hold index_mutex_ exclusively
    void JoinLocked(const ConnectionId& id, Connection& connection, const std::string& group);

    std::shared_ptr<Group> FindGroup(std::string_view group) const;

    // Callers hold the group's mutex
    bool Deliver(const ConnectionId& id, Outbox& outbox, std::string_view group, const EventPtr& event);

    void RecordLagging(const ConnectionId& id, std::string_view group, uint64_t dropped_total);

    mutable std::shared_mutex index_mutex_;
    std::unordered_map<ConnectionId, Connection> connections_;
    std::map<std::string, std::shared_ptr<Group>, std::less<>> groups_;

    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> dropped_{0};

    mutable std::mutex lagging_mutex_;
    std::unordered_set<ConnectionId> lagging_;
    std::deque<LaggingRecord> recent_lagging_;
};

}  // namespace convq
