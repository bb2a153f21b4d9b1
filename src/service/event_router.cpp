// ============================================================================
// convq/service/event_router.cpp - Registry Events to Hub Groups
// ============================================================================

#include "convq/service/event_router.hpp"

#include "convq/core/logging.hpp"
#include "convq/hub/groups.hpp"

namespace convq {

std::vector<std::string> EventRouter::GroupsFor(const Event& event) {
    std::vector<std::string> groups;

    if (event.kind == EventKind::SpaceStatusChanged) {
        groups.emplace_back(kSpaceMonitorGroup);
        groups.emplace_back(kGlobalGroup);
        return groups;
    }

    const ConversionTask* task = event.TaskSnapshot();
    if (!task) return groups;

    groups.push_back(TaskGroupName(task->id));
    if (task->owner && !task->owner->empty()) {
        groups.push_back(UserGroupName(*task->owner));
    }
    if (event.kind != EventKind::ProgressUpdated) {
        groups.emplace_back(kGlobalGroup);
    }
    return groups;
}

void EventRouter::OnEvent(const EventPtr& event) {
    if (!event) return;

    if (accountant_) {
        const ConversionTask* task = event->TaskSnapshot();
        bool finished = task && (event->kind == EventKind::Deleted || IsTerminal(task->status));
        if (finished && accountant_->Release(task->id)) {
            released_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    size_t delivered = hub_.PublishToGroups(GroupsFor(*event), event);
    routed_.fetch_add(1, std::memory_order_relaxed);
    CONVQ_LOG_TRACE("router", ToString(event->kind) << " delivered to " << delivered << " connections");
}

}  // namespace convq
