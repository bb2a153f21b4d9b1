// ============================================================================
// convq/service/engine_config.cpp - Engine Configuration
// ============================================================================

#include "convq/service/engine_config.hpp"

#include <limits>

namespace convq {

namespace keys = settings_keys;

Result<void, EngineError> ValidateBudget(int64_t max_total_bytes, int64_t reserved_bytes) {
    if (max_total_bytes <= 0) {
        return Err(EngineError::Validation("max total bytes must be positive"));
    }
    if (reserved_bytes < 0) {
        return Err(EngineError::Validation("reserved bytes must not be negative"));
    }
    if (reserved_bytes >= max_total_bytes) {
        return Err(EngineError::Validation("reserved bytes must be less than max total bytes"));
    }
    return Ok();
}

EngineConfig EngineConfig::FromSettings(const Settings& settings) {
    EngineConfig config;

    config.budget.max_total_bytes = settings.GetInt(keys::kSpaceMaxTotalBytes, config.budget.max_total_bytes);
    config.budget.reserved_bytes = settings.GetInt(keys::kSpaceReservedBytes, config.budget.reserved_bytes);
    config.budget.enabled = settings.GetBool(keys::kSpaceEnabled, config.budget.enabled);
    config.budget.updated_by = settings.GetString(keys::kSpaceUpdatedBy, config.budget.updated_by);
    config.space_refresh_interval = std::chrono::milliseconds(
        settings.GetInt(keys::kSpaceRefreshIntervalMs, config.space_refresh_interval.count()));

    config.roots.source = settings.GetString(keys::kSpaceRootSource, "");
    config.roots.output = settings.GetString(keys::kSpaceRootOutput, "");
    config.roots.temp = settings.GetString(keys::kSpaceRootTemp, "");

    int64_t capacity = settings.GetInt(keys::kHubOutboxCapacity, static_cast<int64_t>(config.outbox_capacity));
    config.outbox_capacity = capacity > 0 ? static_cast<size_t>(capacity) : 0;

    config.host = settings.GetString(keys::kNetHost, config.host);
    int64_t port = settings.GetInt(keys::kNetPort, config.port);
    if (port >= 0 && port <= std::numeric_limits<uint16_t>::max()) {
        config.port = static_cast<uint16_t>(port);
    } else {
        CONVQ_LOG_WARN("config", keys::kNetPort << "=" << port << " is not a port, using " << config.port);
    }
    config.ping_interval =
        std::chrono::milliseconds(settings.GetInt(keys::kNetPingIntervalMs, config.ping_interval.count()));
    config.pong_timeout =
        std::chrono::milliseconds(settings.GetInt(keys::kNetPongTimeoutMs, config.pong_timeout.count()));

    config.max_retries = static_cast<int>(settings.GetInt(keys::kTasksMaxRetries, config.max_retries));

    std::string level = settings.GetString(keys::kLogLevel, "");
    if (!level.empty()) {
        config.log_level = Logger::ParseLevel(level);
        if (!config.log_level) {
            CONVQ_LOG_WARN("config", "unknown log level '" << level << "'");
        }
    }
    return config;
}

Result<void, EngineError> EngineConfig::Validate() const {
    if (auto budget_ok = ValidateBudget(budget.max_total_bytes, budget.reserved_bytes); budget_ok.IsErr()) {
        return budget_ok;
    }
    if (space_refresh_interval.count() <= 0) {
        return Err(EngineError::Validation("space refresh interval must be positive"));
    }
    if (outbox_capacity == 0) {
        return Err(EngineError::Validation("outbox capacity must be positive"));
    }
    if (host.empty()) {
        return Err(EngineError::Validation("host must not be empty"));
    }
    if (ping_interval.count() <= 0) {
        return Err(EngineError::Validation("ping interval must be positive"));
    }
    if (pong_timeout < ping_interval) {
        return Err(EngineError::Validation("pong timeout must not be shorter than the ping interval"));
    }
    if (max_retries < 0) {
        return Err(EngineError::Validation("max retries must not be negative"));
    }
    return Ok();
}

Result<void, std::error_code> EngineConfig::SaveBudget(Settings& settings, const SpaceBudget& budget) {
    if (auto put = settings.SetInt(keys::kSpaceMaxTotalBytes, budget.max_total_bytes); put.IsErr()) {
        return put;
    }
    if (auto put = settings.SetInt(keys::kSpaceReservedBytes, budget.reserved_bytes); put.IsErr()) {
        return put;
    }
    if (auto put = settings.SetBool(keys::kSpaceEnabled, budget.enabled); put.IsErr()) {
        return put;
    }
    return settings.SetString(keys::kSpaceUpdatedBy, budget.updated_by);
}

}  // namespace convq
