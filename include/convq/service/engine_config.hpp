// ============================================================================
// convq/service/engine_config.hpp - Engine Configuration
// ============================================================================
//
// Everything an EngineContext needs to know up front, with defaults. A
// config is usually read from a SettingsStore:
//
//   auto store = FileSettingsStore::Open("convq.conf").Value();
//   Settings settings(*store);
//   EngineConfig config = EngineConfig::FromSettings(settings);
//   if (auto valid = config.Validate(); valid.IsErr()) { ... }
//
// Keys (see settings_keys below) that are absent keep their default. The
// space budget is the only part written back at runtime, by SetSpaceConfig.
//
// ============================================================================

#pragma once

#include "convq/core/logging.hpp"
#include "convq/core/result.hpp"
#include "convq/core/settings.hpp"
#include "convq/engine/engine_error.hpp"
#include "convq/engine/space_types.hpp"
#include "convq/engine/storage_probe.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>

namespace convq {

namespace settings_keys {

inline constexpr const char* kSpaceMaxTotalBytes = "space.max_total_bytes";
inline constexpr const char* kSpaceReservedBytes = "space.reserved_bytes";
inline constexpr const char* kSpaceEnabled = "space.enabled";
inline constexpr const char* kSpaceUpdatedBy = "space.updated_by";
inline constexpr const char* kSpaceRefreshIntervalMs = "space.refresh_interval_ms";
inline constexpr const char* kSpaceRootSource = "space.roots.source";
inline constexpr const char* kSpaceRootOutput = "space.roots.output";
inline constexpr const char* kSpaceRootTemp = "space.roots.temp";
inline constexpr const char* kHubOutboxCapacity = "hub.outbox_capacity";
inline constexpr const char* kNetHost = "net.host";
inline constexpr const char* kNetPort = "net.port";
inline constexpr const char* kNetPingIntervalMs = "net.ping_interval_ms";
inline constexpr const char* kNetPongTimeoutMs = "net.pong_timeout_ms";
inline constexpr const char* kTasksMaxRetries = "tasks.max_retries";
inline constexpr const char* kLogLevel = "log.level";

}  // namespace settings_keys

struct EngineConfig {
    SpaceBudget budget;
    StorageRoots roots;
    std::chrono::milliseconds space_refresh_interval{30000};

    size_t outbox_capacity = 256;

    std::string host = "127.0.0.1";
    uint16_t port = 7300;
    std::chrono::milliseconds ping_interval{30000};
    std::chrono::milliseconds pong_timeout{90000};

    int max_retries = 3;
    std::optional<LogLevel> log_level;

    static EngineConfig FromSettings(const Settings& settings);

    // ValidationError naming the first offending field
    [[nodiscard]] Result<void, EngineError> Validate() const;

    // Writes the budget fields back under the space.* keys
    static Result<void, std::error_code> SaveBudget(Settings& settings, const SpaceBudget& budget);
};

// Shared by Validate() and SetSpaceConfig
Result<void, EngineError> ValidateBudget(int64_t max_total_bytes, int64_t reserved_bytes);

}  // namespace convq
