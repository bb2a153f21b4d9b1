// ============================================================================
// convq/engine/event.hpp - Engine Events
// ============================================================================
//
// Every successful registry mutation produces exactly one Event; the space
// monitor produces SpaceStatusChanged. Events are immutable once built and
// are shared (EventPtr) between every outbox they are delivered to.
//
//   Kind                 Payload      Produced by
//   -------------------  -----------  ---------------------------------
//   Created              TaskEvent    TaskRegistry::Create
//   ProgressUpdated      TaskEvent    TaskRegistry::UpdateProgress
//   StatusChanged        TaskEvent    Start / Fail / Cancel (+previous)
//   Completed            TaskEvent    TaskRegistry::Complete
//   Deleted              TaskEvent    TaskRegistry::Delete (last snapshot)
//   SpaceStatusChanged   SpaceEvent   SpaceMonitor, SetSpaceConfig
//
// ============================================================================

#pragma once

#include "convq/core/clock.hpp"
#include "convq/engine/conversion_task.hpp"
#include "convq/engine/space_types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace convq {

enum class EventKind : uint8_t {
    Created,
    ProgressUpdated,
    StatusChanged,
    Completed,
    Deleted,
    SpaceStatusChanged,
};

std::string_view ToString(EventKind kind);

struct TaskEvent {
    ConversionTask task;
    std::optional<TaskStatus> previous_status;
};

struct SpaceEvent {
    SpaceUsageSnapshot snapshot;
    std::string reason;
};

struct Event {
    EventKind kind;
    SystemTime timestamp;
    std::variant<TaskEvent, SpaceEvent> payload;

    // nullptr for space events
    [[nodiscard]] const ConversionTask* TaskSnapshot() const;
    // nullptr for task events
    [[nodiscard]] const SpaceEvent* Space() const;
};

using EventPtr = std::shared_ptr<const Event>;

EventPtr MakeTaskEvent(EventKind kind, ConversionTask task, SystemTime timestamp,
                       std::optional<TaskStatus> previous_status = std::nullopt);

EventPtr MakeSpaceEvent(SpaceUsageSnapshot snapshot, std::string reason, SystemTime timestamp);

// ============================================================================
// EventSink - where the registry and monitor send their events
// ============================================================================
class EventSink {
   public:
    virtual ~EventSink() = default;

    // Called synchronously on the mutating thread, under the task's lock
    // for task events. Must not call back into the registry for that task.
    virtual void OnEvent(const EventPtr& event) = 0;
};

}  // namespace convq
