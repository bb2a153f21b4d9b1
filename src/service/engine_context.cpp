// ============================================================================
// convq/service/engine_context.cpp - Engine Composition Root
// ============================================================================

#include "convq/service/engine_context.hpp"

#include "convq/core/logging.hpp"

#include <utility>

namespace convq {

namespace {

constexpr const char* kComponent = "engine";

}  // namespace

EngineResult<std::unique_ptr<EngineContext>> EngineContext::Create(EngineConfig config, EngineDependencies deps) {
    if (auto valid = config.Validate(); valid.IsErr()) {
        return Err(std::move(valid).Error());
    }
    if (config.log_level) {
        Logger::SetLevel(*config.log_level);
    }
    return Ok(std::unique_ptr<EngineContext>(new EngineContext(std::move(config), deps)));
}

EngineContext::EngineContext(EngineConfig config, EngineDependencies deps) : config_(std::move(config)) {
    if (!deps.clock) {
        owned_clock_ = std::make_unique<SystemClock>();
        deps.clock = owned_clock_.get();
    }
    if (!deps.ids) {
        owned_ids_ = std::make_unique<UuidGenerator>();
        deps.ids = owned_ids_.get();
    }
    if (!deps.task_store) {
        owned_task_store_ = std::make_unique<MemoryTaskStore>();
        deps.task_store = owned_task_store_.get();
    }
    if (!deps.settings) {
        owned_settings_store_ = std::make_unique<MemorySettingsStore>();
        deps.settings = owned_settings_store_.get();
    }
    if (!deps.probe) {
        owned_probe_ = std::make_unique<DirectoryStorageProbe>(config_.roots);
        deps.probe = owned_probe_.get();
    }
    clock_ = deps.clock;
    ids_ = deps.ids;
    task_store_ = deps.task_store;
    settings_store_ = deps.settings;
    probe_ = deps.probe;

    settings_ = std::make_unique<Settings>(*settings_store_);
    accountant_ = std::make_unique<SpaceAccountant>(*probe_, *clock_, config_.budget);
    hub_ = std::make_unique<BroadcastHub>();
    router_ = std::make_unique<EventRouter>(*hub_, accountant_.get());
    registry_ = std::make_unique<TaskRegistry>(*clock_, *ids_, router_.get(), task_store_);
    admission_ = std::make_unique<AdmissionController>(*accountant_, *registry_, *ids_, config_.max_retries);
    monitor_ = std::make_unique<SpaceMonitor>(*accountant_, *router_, *clock_,
                                              SpaceMonitorOptions{config_.space_refresh_interval});
}

EngineContext::~EngineContext() {
    Shutdown();
}

// ============================================================================
// Lifecycle
// ============================================================================

Result<void, EngineError> EngineContext::Init() {
    if (initialized_) return Ok();

    auto recovered = registry_->Recover();
    if (recovered.IsErr()) {
        return Err(EngineError::Internal(kComponent, "task recovery failed: " + recovered.Error().message()));
    }

    size_t restored = 0;
    for (const auto& task : recovered.Value()) {
        if (IsActive(task.status) && task.reserved_bytes > 0) {
            accountant_->Restore(task.id, task.reserved_bytes);
            ++restored;
        }
    }

    if (auto ec = accountant_->Refresh()) {
        CONVQ_LOG_WARN(kComponent, "initial space measurement failed: " << ec.message());
    }
    monitor_->Start();
    initialized_ = true;

    CONVQ_LOG_INFO(kComponent, "initialized: " << recovered.Value().size() << " tasks recovered, " << restored
                                               << " reservations restored");
    return Ok();
}

std::error_code EngineContext::Shutdown() {
    if (!initialized_) return {};
    initialized_ = false;

    std::error_code ec = monitor_->Stop();
    if (ec) {
        CONVQ_LOG_WARN(kComponent, "space monitor ended with: " << ec.message());
    }
    CONVQ_LOG_INFO(kComponent, "shut down with " << registry_->ListActive().size() << " active tasks");
    return ec;
}

// ============================================================================
// Request Operations
// ============================================================================

EngineResult<Admission> EngineContext::StartTask(StartTaskRequest request) {
    return admission_->Admit(std::move(request));
}

EngineResult<ConversionTask> EngineContext::CancelTask(const TaskId& id) {
    return registry_->Cancel(id);
}

Result<void, EngineError> EngineContext::DeleteTask(const TaskId& id) {
    return registry_->Delete(id);
}

EngineResult<ConversionTask> EngineContext::GetTask(const TaskId& id) const {
    return registry_->Get(id);
}

std::vector<ConversionTask> EngineContext::ListActiveTasks() const {
    return registry_->ListActive();
}

EngineResult<std::vector<ConversionTask>> EngineContext::ListCompletedTasks(int page, int page_size) const {
    return registry_->ListCompleted(page, page_size);
}

SpaceUsageSnapshot EngineContext::GetSpaceUsage() const {
    return accountant_->Snapshot();
}

EngineResult<SpaceCheckResult> EngineContext::CheckSpace(int64_t required_bytes) const {
    if (required_bytes < 0) {
        return Err(EngineError::Validation("required bytes must not be negative"));
    }
    return Ok(accountant_->CheckBytes(required_bytes));
}

EngineResult<SpaceUsageSnapshot> EngineContext::SetSpaceConfig(int64_t max_total_bytes, int64_t reserved_bytes,
                                                               bool enabled, std::string updated_by) {
    if (auto valid = ValidateBudget(max_total_bytes, reserved_bytes); valid.IsErr()) {
        return Err(std::move(valid).Error());
    }

    SpaceBudget budget;
    budget.max_total_bytes = max_total_bytes;
    budget.reserved_bytes = reserved_bytes;
    budget.enabled = enabled;
    budget.updated_at = clock_->Now();
    budget.updated_by = std::move(updated_by);
    accountant_->SetBudget(budget);

    // The new budget is in effect either way; a settings write failure only
    // means it will not survive a restart
    if (auto saved = EngineConfig::SaveBudget(*settings_, budget); saved.IsErr()) {
        CONVQ_LOG_ERROR(kComponent, "cannot persist space budget: " << saved.Error().message());
    }

    CONVQ_LOG_INFO(kComponent, "space budget set by " << budget.updated_by << ": max " << max_total_bytes / kMiB
                                                      << " MiB, reserved " << reserved_bytes / kMiB << " MiB, "
                                                      << (enabled ? "enabled" : "disabled"));
    if (auto ec = monitor_->RefreshNow("config-changed")) {
        CONVQ_LOG_WARN(kComponent, "space snapshot after budget change is stale: " << ec.message());
    }
    return Ok(accountant_->Snapshot());
}

// ============================================================================
// Worker Operations
// ============================================================================

EngineResult<ConversionTask> EngineContext::BeginConversion(const TaskId& id) {
    return registry_->Start(id);
}

EngineResult<ConversionTask> EngineContext::ReportProgress(const TaskId& id, int progress, std::optional<double> speed,
                                                           std::optional<std::chrono::seconds> eta) {
    return registry_->UpdateProgress(id, progress, speed, eta);
}

EngineResult<ConversionTask> EngineContext::ReportCompleted(const TaskId& id) {
    return registry_->Complete(id);
}

EngineResult<ConversionTask> EngineContext::ReportFailed(const TaskId& id, std::string message) {
    auto failed = registry_->Fail(id, std::move(message));
    if (failed.IsOk()) {
        const auto& task = failed.Value();
        CONVQ_LOG_WARN(kComponent, "task " << task.id << " failed (attempt " << task.retry_count << "/"
                                           << task.max_retries << "): " << task.error_message.value_or(""));
    }
    return failed;
}

}  // namespace convq
