// ============================================================================
// convq/engine/event.cpp - Engine Events
// ============================================================================

#include "convq/engine/event.hpp"

#include <utility>

namespace convq {

std::string_view ToString(EventKind kind) {
    switch (kind) {
        case EventKind::Created:
            return "Created";
        case EventKind::ProgressUpdated:
            return "ProgressUpdated";
        case EventKind::StatusChanged:
            return "StatusChanged";
        case EventKind::Completed:
            return "Completed";
        case EventKind::Deleted:
            return "Deleted";
        case EventKind::SpaceStatusChanged:
            return "SpaceStatusChanged";
    }
    return "Unknown";
}

const ConversionTask* Event::TaskSnapshot() const {
    if (const auto* task_event = std::get_if<TaskEvent>(&payload)) {
        return &task_event->task;
    }
    return nullptr;
}

const SpaceEvent* Event::Space() const {
    return std::get_if<SpaceEvent>(&payload);
}

EventPtr MakeTaskEvent(EventKind kind, ConversionTask task, SystemTime timestamp,
                       std::optional<TaskStatus> previous_status) {
    return std::make_shared<const Event>(
        Event{kind, timestamp, TaskEvent{std::move(task), previous_status}});
}

EventPtr MakeSpaceEvent(SpaceUsageSnapshot snapshot, std::string reason, SystemTime timestamp) {
    return std::make_shared<const Event>(
        Event{EventKind::SpaceStatusChanged, timestamp, SpaceEvent{std::move(snapshot), std::move(reason)}});
}

}  // namespace convq
