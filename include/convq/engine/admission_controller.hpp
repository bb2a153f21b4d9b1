// ============================================================================
// convq/engine/admission_controller.hpp - Task Start Gate
// ============================================================================
//
// Admit() is the only way a start request becomes a task:
//
//   1. validate the request
//   2. estimate output + temp bytes (output_estimator.hpp)
//   3. atomically reserve them in the SpaceAccountant, keyed by a fresh id
//   4. create the task in the registry under that id
//
// If step 4 fails the reservation is released before returning. The
// reservation is otherwise released by the EventRouter once the task
// reaches a terminal status or is deleted.
//
// ============================================================================

#pragma once

#include "convq/core/clock.hpp"
#include "convq/engine/conversion_task.hpp"
#include "convq/engine/engine_error.hpp"
#include "convq/engine/space_accountant.hpp"
#include "convq/engine/task_registry.hpp"

#include <optional>
#include <string>

namespace convq {

struct StartTaskRequest {
    std::string name;
    std::string source_path;
    int64_t source_size_bytes = 0;
    ConversionParameters parameters;
    std::optional<std::string> owner;
};

struct Admission {
    ConversionTask task;
    SpaceCheckResult check;
};

class AdmissionController {
   public:
    AdmissionController(SpaceAccountant& accountant, TaskRegistry& registry, IdGenerator& ids, int max_retries = 3)
        : accountant_(accountant), registry_(registry), ids_(ids), max_retries_(max_retries) {}

    // ValidationError or InsufficientSpace (with the failed check); nothing
    // is reserved or created on failure
    EngineResult<Admission> Admit(StartTaskRequest request);

    void SetMaxRetries(int max_retries) { max_retries_ = max_retries; }

   private:
    SpaceAccountant& accountant_;
    TaskRegistry& registry_;
    IdGenerator& ids_;
    int max_retries_;
};

}  // namespace convq
