// ============================================================================
// convq/engine/space_types.hpp - Storage Budget and Usage Values
// ============================================================================
//
//   available = max_total - reserved - used - pending_reservations
//
// `used` is measured from disk (source + output + temp roots). Pending
// reservations are admission estimates for tasks that have not finished;
// they are the reason two concurrent starts cannot both take the last free
// gigabytes.
//
// ============================================================================

#pragma once

#include "convq/core/clock.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace convq {

inline constexpr int64_t kGiB = 1024LL * 1024 * 1024;
inline constexpr int64_t kMiB = 1024LL * 1024;

inline constexpr int64_t kDefaultMaxTotalBytes = 100 * kGiB;
inline constexpr int64_t kDefaultReservedBytes = 5 * kGiB;

inline constexpr double kWarningUsagePercent = 80.0;
inline constexpr double kCriticalUsagePercent = 90.0;

struct SpaceBudget {
    int64_t max_total_bytes = kDefaultMaxTotalBytes;
    int64_t reserved_bytes = kDefaultReservedBytes;
    bool enabled = true;
    SystemTime updated_at{};
    std::string updated_by = "system";
};

struct UsageBreakdown {
    int64_t source_bytes = 0;
    int64_t output_bytes = 0;
    int64_t temp_bytes = 0;

    [[nodiscard]] int64_t Total() const { return source_bytes + output_bytes + temp_bytes; }
};

enum class SpaceLevel : uint8_t {
    Normal,
    Warning,
    Critical,
};

constexpr std::string_view ToString(SpaceLevel level) {
    switch (level) {
        case SpaceLevel::Normal:
            return "normal";
        case SpaceLevel::Warning:
            return "warning";
        case SpaceLevel::Critical:
            return "critical";
    }
    return "normal";
}

constexpr SpaceLevel LevelForUsage(double usage_percent) {
    if (usage_percent > kCriticalUsagePercent) return SpaceLevel::Critical;
    if (usage_percent > kWarningUsagePercent) return SpaceLevel::Warning;
    return SpaceLevel::Normal;
}

struct SpaceUsageSnapshot {
    int64_t total_bytes = 0;     // configured budget
    int64_t reserved_bytes = 0;  // untouchable part of the budget
    int64_t used_bytes = 0;      // measured on disk
    int64_t pending_reservations = 0;
    int64_t available_bytes = 0;
    double usage_percent = 0.0;
    bool has_sufficient_space = true;
    bool enabled = true;
    bool stale = false;
    SpaceLevel level = SpaceLevel::Normal;
    UsageBreakdown breakdown;
    SystemTime computed_at{};
};

// Bytes a new task needs. The source itself is already on disk and counted
// in `used`; it is carried for reporting only.
struct SpaceRequirement {
    int64_t source_bytes = 0;
    int64_t estimated_output_bytes = 0;
    int64_t temp_bytes = 0;

    [[nodiscard]] int64_t Total() const { return estimated_output_bytes + temp_bytes; }
};

struct SpaceCheckDetails {
    int64_t original_file_bytes = 0;
    int64_t estimated_output_bytes = 0;
    int64_t temp_file_bytes = 0;
    int64_t reserved_bytes = 0;
    int64_t pending_reservations = 0;
    int64_t current_used_bytes = 0;
    int64_t total_configured_bytes = 0;
};

struct SpaceCheckResult {
    bool has_enough_space = false;
    int64_t required_bytes = 0;
    int64_t available_bytes = 0;
    std::string message;
    SpaceCheckDetails details;
};

}  // namespace convq
