// ============================================================================
// convq/hub/groups.hpp - Broadcast Group Names
// ============================================================================
//
//   all              every connection, joined on registration
//   space-monitor    space usage updates
//   task:<id>        events of one task
//   user:<id>        events of every task owned by one user
//
// ============================================================================

#pragma once

#include <string>
#include <string_view>

namespace convq {

inline constexpr std::string_view kGlobalGroup = "all";
inline constexpr std::string_view kSpaceMonitorGroup = "space-monitor";
inline constexpr std::string_view kTaskGroupPrefix = "task:";
inline constexpr std::string_view kUserGroupPrefix = "user:";

inline std::string TaskGroupName(std::string_view task_id) {
    std::string name(kTaskGroupPrefix);
    name += task_id;
    return name;
}

inline std::string UserGroupName(std::string_view user_id) {
    std::string name(kUserGroupPrefix);
    name += user_id;
    return name;
}

inline bool IsValidGroupName(std::string_view name) {
    if (name == kGlobalGroup || name == kSpaceMonitorGroup) return true;
    for (auto prefix : {kTaskGroupPrefix, kUserGroupPrefix}) {
        if (name.size() > prefix.size() && name.substr(0, prefix.size()) == prefix) return true;
    }
    return false;
}

}  // namespace convq
