// ============================================================================
// convq/hub/broadcast_hub.cpp - Group Publish/Subscribe
// ============================================================================

#include "convq/hub/broadcast_hub.hpp"

#include "convq/core/logging.hpp"

#include <algorithm>
#include <utility>

namespace convq {

namespace {

constexpr const char* kComponent = "hub";

}  // namespace

// ============================================================================
// Membership
// ============================================================================

Result<void, EngineError> BroadcastHub::AddConnection(const ConnectionId& id, std::shared_ptr<Outbox> outbox) {
    if (!outbox) {
        return Err(EngineError::Validation("connection needs an outbox"));
    }
    std::unique_lock<std::shared_mutex> lock(index_mutex_);
    auto [it, inserted] = connections_.try_emplace(id);
    if (!inserted) {
        return Err(EngineError::Conflict("connection '" + id + "' already registered"));
    }
    it->second.outbox = std::move(outbox);
    JoinLocked(id, it->second, std::string(kGlobalGroup));
    CONVQ_LOG_DEBUG(kComponent, "connection " << id << " registered");
    return Ok();
}

bool BroadcastHub::RemoveConnection(const ConnectionId& id) {
    std::shared_ptr<Outbox> outbox;
    {
        std::unique_lock<std::shared_mutex> lock(index_mutex_);
        auto it = connections_.find(id);
        if (it == connections_.end()) return false;

        for (const auto& name : it->second.groups) {
            auto group_it = groups_.find(name);
            if (group_it == groups_.end()) continue;
            bool empty = false;
            {
                std::lock_guard<std::mutex> group_lock(group_it->second->mutex);
                group_it->second->members.erase(id);
                empty = group_it->second->members.empty();
            }
            if (empty) groups_.erase(group_it);
        }
        outbox = std::move(it->second.outbox);
        connections_.erase(it);
    }
    {
        std::lock_guard<std::mutex> lock(lagging_mutex_);
        lagging_.erase(id);
    }
    outbox->Close();
    CONVQ_LOG_DEBUG(kComponent, "connection " << id << " removed");
    return true;
}

Result<void, EngineError> BroadcastHub::Join(const ConnectionId& id, std::string_view group) {
    if (!IsValidGroupName(group)) {
        return Err(EngineError::Validation("invalid group name '" + std::string(group) + "'"));
    }
    std::unique_lock<std::shared_mutex> lock(index_mutex_);
    auto it = connections_.find(id);
    if (it == connections_.end()) {
        return Err(EngineError::NotFound("connection", id));
    }
    JoinLocked(id, it->second, std::string(group));
    return Ok();
}

Result<void, EngineError> BroadcastHub::Leave(const ConnectionId& id, std::string_view group) {
    if (!IsValidGroupName(group)) {
        return Err(EngineError::Validation("invalid group name '" + std::string(group) + "'"));
    }
    std::unique_lock<std::shared_mutex> lock(index_mutex_);
    auto it = connections_.find(id);
    if (it == connections_.end()) {
        return Err(EngineError::NotFound("connection", id));
    }

    auto membership = it->second.groups.find(group);
    if (membership == it->second.groups.end()) {
        return Ok();
    }
    it->second.groups.erase(membership);

    auto group_it = groups_.find(group);
    if (group_it != groups_.end()) {
        bool empty = false;
        {
            std::lock_guard<std::mutex> group_lock(group_it->second->mutex);
            group_it->second->members.erase(id);
            empty = group_it->second->members.empty();
        }
        if (empty) groups_.erase(group_it);
    }
    CONVQ_LOG_DEBUG(kComponent, id << " left " << group);
    return Ok();
}

void BroadcastHub::JoinLocked(const ConnectionId& id, Connection& connection, const std::string& group) {
    if (!connection.groups.insert(group).second) return;

    auto group_it = groups_.find(group);
    if (group_it == groups_.end()) {
        group_it = groups_.emplace(group, std::make_shared<Group>()).first;
    }
    std::lock_guard<std::mutex> group_lock(group_it->second->mutex);
    group_it->second->members.emplace(id, connection.outbox);
    CONVQ_LOG_DEBUG(kComponent, id << " joined " << group);
}

// ============================================================================
// Publishing
// ============================================================================

size_t BroadcastHub::Publish(std::string_view group, const EventPtr& event) {
    published_.fetch_add(1, std::memory_order_relaxed);
    auto target = FindGroup(group);
    if (!target) return 0;

    size_t delivered = 0;
    std::lock_guard<std::mutex> group_lock(target->mutex);
    for (const auto& [id, outbox] : target->members) {
        if (Deliver(id, *outbox, group, event)) ++delivered;
    }
    return delivered;
}

size_t BroadcastHub::PublishToGroups(const std::vector<std::string>& groups, const EventPtr& event) {
    published_.fetch_add(1, std::memory_order_relaxed);

    // Name order keeps concurrent multi-group publishes from deadlocking
    std::vector<std::pair<std::string, std::shared_ptr<Group>>> targets;
    {
        std::shared_lock<std::shared_mutex> lock(index_mutex_);
        for (const auto& name : groups) {
            auto it = groups_.find(name);
            if (it != groups_.end()) targets.emplace_back(it->first, it->second);
        }
    }
    std::sort(targets.begin(), targets.end(), [](const auto& a, const auto& b) { return a.first < b.first; });
    targets.erase(std::unique(targets.begin(), targets.end(),
                              [](const auto& a, const auto& b) { return a.first == b.first; }),
                  targets.end());

    std::vector<std::unique_lock<std::mutex>> locks;
    locks.reserve(targets.size());
    for (auto& [name, group] : targets) {
        locks.emplace_back(group->mutex);
    }

    size_t delivered = 0;
    std::unordered_set<ConnectionId> seen;
    for (auto& [name, group] : targets) {
        for (const auto& [id, outbox] : group->members) {
            if (!seen.insert(id).second) continue;
            if (Deliver(id, *outbox, name, event)) ++delivered;
        }
    }
    return delivered;
}

bool BroadcastHub::Deliver(const ConnectionId& id, Outbox& outbox, std::string_view group, const EventPtr& event) {
    switch (outbox.Push(event)) {
        case Outbox::PushResult::Queued:
            delivered_.fetch_add(1, std::memory_order_relaxed);
            return true;
        case Outbox::PushResult::DroppedOldest:
            delivered_.fetch_add(1, std::memory_order_relaxed);
            dropped_.fetch_add(1, std::memory_order_relaxed);
            RecordLagging(id, group, outbox.DroppedCount());
            return true;
        case Outbox::PushResult::Closed:
            return false;
    }
    return false;
}

void BroadcastHub::RecordLagging(const ConnectionId& id, std::string_view group, uint64_t dropped_total) {
    bool first = false;
    {
        std::lock_guard<std::mutex> lock(lagging_mutex_);
        first = lagging_.insert(id).second;
        recent_lagging_.push_back(LaggingRecord{id, std::string(group), dropped_total});
        if (recent_lagging_.size() > kLaggingHistory) {
            recent_lagging_.pop_front();
        }
    }
    if (first) {
        CONVQ_LOG_WARN(kComponent, "connection-lagging: " << id << " in " << group << " (dropped=" << dropped_total << ")");
    } else {
        CONVQ_LOG_DEBUG(kComponent, "connection-lagging: " << id << " in " << group << " (dropped=" << dropped_total << ")");
    }
}

// ============================================================================
// Diagnostics
// ============================================================================

BroadcastHub::Stats BroadcastHub::GetStats() const {
    Stats stats;
    stats.published = published_.load(std::memory_order_relaxed);
    stats.delivered = delivered_.load(std::memory_order_relaxed);
    stats.dropped = dropped_.load(std::memory_order_relaxed);
    std::lock_guard<std::mutex> lock(lagging_mutex_);
    stats.lagging_connections = lagging_.size();
    return stats;
}

std::vector<BroadcastHub::LaggingRecord> BroadcastHub::RecentLagging() const {
    std::lock_guard<std::mutex> lock(lagging_mutex_);
    return {recent_lagging_.begin(), recent_lagging_.end()};
}

size_t BroadcastHub::ConnectionCount() const {
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    return connections_.size();
}

size_t BroadcastHub::GroupSize(std::string_view group) const {
    auto target = FindGroup(group);
    if (!target) return 0;
    std::lock_guard<std::mutex> lock(target->mutex);
    return target->members.size();
}

std::vector<std::string> BroadcastHub::GroupsOf(const ConnectionId& id) const {
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    auto it = connections_.find(id);
    if (it == connections_.end()) return {};
    return {it->second.groups.begin(), it->second.groups.end()};
}

bool BroadcastHub::HasConnection(const ConnectionId& id) const {
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    return connections_.count(id) != 0;
}

std::shared_ptr<BroadcastHub::Group> BroadcastHub::FindGroup(std::string_view group) const {
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    auto it = groups_.find(group);
    if (it == groups_.end()) return nullptr;
    return it->second;
}

}  // namespace convq
