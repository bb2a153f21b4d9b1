// ============================================================================
// convq/engine/admission_controller.cpp - Task Start Gate
// ============================================================================

#include "convq/engine/admission_controller.hpp"

#include "convq/core/defer.hpp"
#include "convq/core/logging.hpp"
#include "convq/engine/output_estimator.hpp"

#include <string>
#include <utility>

namespace convq {

EngineResult<Admission> AdmissionController::Admit(StartTaskRequest request) {
    if (NormalizeName(request.name).empty()) {
        return Err(EngineError::Validation("task name must not be empty"));
    }
    if (request.source_size_bytes <= 0) {
        return Err(EngineError::Validation("source size must be positive"));
    }
    if (request.source_size_bytes > kMaxSourceBytes) {
        return Err(EngineError::Validation("source size exceeds " + std::to_string(kMaxSourceBytes) + " bytes"));
    }

    SpaceRequirement requirement = EstimateRequirement(request.source_size_bytes, request.parameters);
    TaskId id = ids_.Next();

    auto reserved = accountant_.TryReserve(id, requirement);
    if (reserved.IsErr()) {
        return Err(std::move(reserved).Error());
    }

    Defer release([this, &id] {
        accountant_.Release(id);
        CONVQ_LOG_DEBUG("admission", "reservation for " << id << " rolled back");
    });

    NewTask task;
    task.id = id;
    task.name = std::move(request.name);
    task.owner = std::move(request.owner);
    task.source = SourceDescriptor{std::move(request.source_path), request.source_size_bytes};
    task.parameters = std::move(request.parameters);
    task.max_retries = max_retries_;
    task.estimated_output_bytes = requirement.estimated_output_bytes;
    task.reserved_bytes = requirement.Total();

    auto created = registry_.Create(std::move(task));
    if (created.IsErr()) {
        return Err(std::move(created).Error());
    }

    release.Cancel();
    return Ok(Admission{std::move(created).Value(), std::move(reserved).Value()});
}

}  // namespace convq
