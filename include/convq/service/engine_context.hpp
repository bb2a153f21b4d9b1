// ============================================================================
// convq/service/engine_context.hpp - Engine Composition Root
// ============================================================================
//
// EngineContext owns one instance of every engine component and wires them:
//
//   TaskRegistry --events--> EventRouter --groups--> BroadcastHub
//        ^                       |
//        |                       +--terminal/deleted--> SpaceAccountant.Release
//   AdmissionController --reserve--> SpaceAccountant <--refresh-- SpaceMonitor
//
// It is created explicitly (there are no globals) and has a two-step
// lifecycle: Init() recovers persisted tasks, restores their reservations,
// takes a first space measurement and starts the monitor; Shutdown() stops
// the monitor and reports how it ended.
//
// The request operations are what RequestDispatcher exposes on the wire; the
// worker operations are how the external transcoder reports back. Worker
// failures arrive as ReportFailed(), never as exceptions.
//
// Collaborators not passed in EngineDependencies are created with defaults:
// SystemClock, UuidGenerator, MemoryTaskStore, MemorySettingsStore and a
// DirectoryStorageProbe over config.roots.
//
// ============================================================================

#pragma once

#include "convq/core/clock.hpp"
#include "convq/core/result.hpp"
#include "convq/core/settings.hpp"
#include "convq/engine/admission_controller.hpp"
#include "convq/engine/engine_error.hpp"
#include "convq/engine/space_accountant.hpp"
#include "convq/engine/storage_probe.hpp"
#include "convq/engine/task_registry.hpp"
#include "convq/engine/task_store.hpp"
#include "convq/hub/broadcast_hub.hpp"
#include "convq/service/engine_config.hpp"
#include "convq/service/event_router.hpp"
#include "convq/service/space_monitor.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace convq {

// Borrowed collaborators; each must outlive the context
struct EngineDependencies {
    const Clock* clock = nullptr;
    IdGenerator* ids = nullptr;
    TaskStore* task_store = nullptr;
    SettingsStore* settings = nullptr;
    StorageProbe* probe = nullptr;
};

class EngineContext {
   public:
    // ValidationError if the config does not validate
    static EngineResult<std::unique_ptr<EngineContext>> Create(EngineConfig config, EngineDependencies deps = {});

    ~EngineContext();

    EngineContext(const EngineContext&) = delete;
    EngineContext& operator=(const EngineContext&) = delete;

    // Idempotent. Fails only if the task store cannot be read.
    Result<void, EngineError> Init();

    // Stops the space monitor; returns its last refresh error
    std::error_code Shutdown();

    [[nodiscard]] bool IsInitialized() const { return initialized_; }

    // ========================================================================
    // Request Operations
    // ========================================================================

    EngineResult<Admission> StartTask(StartTaskRequest request);
    EngineResult<ConversionTask> CancelTask(const TaskId& id);
    Result<void, EngineError> DeleteTask(const TaskId& id);
    [[nodiscard]] EngineResult<ConversionTask> GetTask(const TaskId& id) const;
    [[nodiscard]] std::vector<ConversionTask> ListActiveTasks() const;
    [[nodiscard]] EngineResult<std::vector<ConversionTask>> ListCompletedTasks(int page, int page_size) const;
    [[nodiscard]] SpaceUsageSnapshot GetSpaceUsage() const;
    [[nodiscard]] EngineResult<SpaceCheckResult> CheckSpace(int64_t required_bytes) const;

    // Replaces the budget, persists it, re-measures and publishes the new
    // snapshot. Returns that snapshot.
    EngineResult<SpaceUsageSnapshot> SetSpaceConfig(int64_t max_total_bytes, int64_t reserved_bytes, bool enabled,
                                                    std::string updated_by = "api");

    // ========================================================================
    // Worker Operations
    // ========================================================================

    EngineResult<ConversionTask> BeginConversion(const TaskId& id);
    EngineResult<ConversionTask> ReportProgress(const TaskId& id, int progress, std::optional<double> speed = std::nullopt,
                                                std::optional<std::chrono::seconds> eta = std::nullopt);
    EngineResult<ConversionTask> ReportCompleted(const TaskId& id);
    EngineResult<ConversionTask> ReportFailed(const TaskId& id, std::string message);

    // ========================================================================
    // Components
    // ========================================================================

    [[nodiscard]] const EngineConfig& Config() const { return config_; }
    [[nodiscard]] const Clock& GetClock() const { return *clock_; }
    [[nodiscard]] TaskRegistry& Registry() { return *registry_; }
    [[nodiscard]] SpaceAccountant& Accountant() { return *accountant_; }
    [[nodiscard]] BroadcastHub& Hub() { return *hub_; }
    [[nodiscard]] EventRouter& Router() { return *router_; }
    [[nodiscard]] SpaceMonitor& Monitor() { return *monitor_; }
    [[nodiscard]] Settings& GetSettings() { return *settings_; }

   private:
    EngineContext(EngineConfig config, EngineDependencies deps);

    EngineConfig config_;

    // Defaults for collaborators the caller did not supply
    std::unique_ptr<Clock> owned_clock_;
    std::unique_ptr<IdGenerator> owned_ids_;
    std::unique_ptr<TaskStore> owned_task_store_;
    std::unique_ptr<SettingsStore> owned_settings_store_;
    std::unique_ptr<StorageProbe> owned_probe_;

    const Clock* clock_;
    IdGenerator* ids_;
    TaskStore* task_store_;
    SettingsStore* settings_store_;
    StorageProbe* probe_;

    // Declaration order is construction order
    std::unique_ptr<Settings> settings_;
    std::unique_ptr<SpaceAccountant> accountant_;
    std::unique_ptr<BroadcastHub> hub_;
    std::unique_ptr<EventRouter> router_;
    std::unique_ptr<TaskRegistry> registry_;
    std::unique_ptr<AdmissionController> admission_;
    std::unique_ptr<SpaceMonitor> monitor_;

    bool initialized_ = false;
};

}  // namespace convq
