// ============================================================================
// convq/engine/task_status.hpp - Conversion Task Lifecycle
// ============================================================================
//
//   Pending    -> Converting | Failed | Cancelled
//   Converting -> Completed  | Failed | Cancelled
//
// Completed, Failed and Cancelled are terminal: no transition leaves them.
//
// The table below is the single source of truth for names, terminality and
// allowed transitions. It is checked at compile time for order and for
// terminal states having no outgoing edges.
//
// ============================================================================

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace convq {

enum class TaskStatus : uint8_t {
    Pending = 0,
    Converting,
    Completed,
    Failed,
    Cancelled,
};

inline constexpr size_t kTaskStatusCount = 5;

namespace detail {

struct StatusTraits {
    TaskStatus status;
    std::string_view name;
    bool terminal;
    // next[to] is true if status -> to is allowed
    std::array<bool, kTaskStatusCount> next;
};

// next[]: Pending, Converting, Completed, Failed, Cancelled
inline constexpr std::array<StatusTraits, kTaskStatusCount> kStatusTable{{
    {TaskStatus::Pending, "Pending", false, {false, true, false, true, true}},
    {TaskStatus::Converting, "Converting", false, {false, false, true, true, true}},
    {TaskStatus::Completed, "Completed", true, {false, false, false, false, false}},
    {TaskStatus::Failed, "Failed", true, {false, false, false, false, false}},
    {TaskStatus::Cancelled, "Cancelled", true, {false, false, false, false, false}},
}};

constexpr bool TableMatchesEnumOrder() {
    for (size_t i = 0; i < kStatusTable.size(); ++i) {
        if (static_cast<size_t>(kStatusTable[i].status) != i) return false;
    }
    return true;
}

constexpr bool TerminalStatesAreSinks() {
    for (const auto& row : kStatusTable) {
        if (!row.terminal) continue;
        for (bool allowed : row.next) {
            if (allowed) return false;
        }
    }
    return true;
}

constexpr bool NoSelfTransitions() {
    for (size_t i = 0; i < kStatusTable.size(); ++i) {
        if (kStatusTable[i].next[i]) return false;
    }
    return true;
}

static_assert(TableMatchesEnumOrder(), "kStatusTable rows must follow TaskStatus order");
static_assert(TerminalStatesAreSinks(), "terminal statuses must not have outgoing transitions");
static_assert(NoSelfTransitions(), "a status cannot transition to itself");

constexpr const StatusTraits& Traits(TaskStatus status) {
    return kStatusTable[static_cast<size_t>(status)];
}

}  // namespace detail

constexpr std::string_view ToString(TaskStatus status) {
    return detail::Traits(status).name;
}

constexpr bool IsTerminal(TaskStatus status) {
    return detail::Traits(status).terminal;
}

constexpr bool IsActive(TaskStatus status) {
    return !IsTerminal(status);
}

constexpr bool CanTransition(TaskStatus from, TaskStatus to) {
    return detail::Traits(from).next[static_cast<size_t>(to)];
}

constexpr std::optional<TaskStatus> ParseTaskStatus(std::string_view name) {
    for (const auto& row : detail::kStatusTable) {
        if (row.name == name) return row.status;
    }
    return std::nullopt;
}

static_assert(CanTransition(TaskStatus::Pending, TaskStatus::Converting));
static_assert(!CanTransition(TaskStatus::Pending, TaskStatus::Completed));
static_assert(CanTransition(TaskStatus::Pending, TaskStatus::Failed));
static_assert(IsTerminal(TaskStatus::Cancelled) && !IsTerminal(TaskStatus::Converting));

}  // namespace convq
