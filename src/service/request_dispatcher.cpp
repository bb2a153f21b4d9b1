// ============================================================================
// convq/service/request_dispatcher.cpp - Wire Operations
// ============================================================================

#include "convq/service/request_dispatcher.hpp"

#include "convq/core/logging.hpp"

#include <algorithm>
#include <limits>
#include <string>
#include <utility>

namespace convq {

namespace {

constexpr const char* kComponent = "dispatch";

// 10 Gbps
constexpr int64_t kMaxVideoBitrateKbps = 10'000'000;

EngineError MissingArgument(std::string_view name) {
    return EngineError::Validation("missing or invalid argument '" + std::string(name) + "'");
}

Result<std::string, EngineError> RequireString(const Json& args, std::string_view name) {
    auto value = OptString(args, name);
    if (!value) return Err(MissingArgument(name));
    return Ok(std::move(*value));
}

Result<int64_t, EngineError> RequireInt(const Json& args, std::string_view name) {
    auto value = OptInt(args, name);
    if (!value) return Err(MissingArgument(name));
    return Ok(*value);
}

Result<bool, EngineError> RequireBool(const Json& args, std::string_view name) {
    auto value = OptBool(args, name);
    if (!value) return Err(MissingArgument(name));
    return Ok(*value);
}

}  // namespace

Result<Json, EngineError> RequestDispatcher::Handle(std::string_view op_name, const Json& args) {
    handled_.fetch_add(1, std::memory_order_relaxed);
    auto result = Dispatch(op_name, args);
    if (result.IsErr()) {
        failed_.fetch_add(1, std::memory_order_relaxed);
        CONVQ_LOG_DEBUG(kComponent, op_name << " failed: " << ErrcName(result.Error().code) << ": "
                                            << result.Error().message);
    } else {
        CONVQ_LOG_TRACE(kComponent, op_name << " ok");
    }
    return result;
}

Result<Json, EngineError> RequestDispatcher::Dispatch(std::string_view op_name, const Json& args) {
    if (op_name == op::kStartTask) return StartTask(args);
    if (op_name == op::kCancelTask) return CancelTask(args);
    if (op_name == op::kDeleteTask) return DeleteTask(args);
    if (op_name == op::kGetTask) return GetTask(args);
    if (op_name == op::kListActiveTasks) return ListActiveTasks();
    if (op_name == op::kListCompletedTasks) return ListCompletedTasks(args);
    if (op_name == op::kGetSpaceUsage) return GetSpaceUsage();
    if (op_name == op::kCheckSpace) return CheckSpace(args);
    if (op_name == op::kSetSpaceConfig) return SetSpaceConfig(args);
    return Err(EngineError::NotFound("operation", op_name));
}

// ============================================================================
// Tasks
// ============================================================================

Result<Json, EngineError> RequestDispatcher::StartTask(const Json& args) {
    auto name = RequireString(args, "name");
    if (name.IsErr()) return Err(std::move(name).Error());
    auto size = RequireInt(args, "sourceSizeBytes");
    if (size.IsErr()) return Err(std::move(size).Error());

    StartTaskRequest request;
    request.name = std::move(name).Value();
    request.source_size_bytes = size.Value();
    request.source_path = OptString(args, "sourcePath").value_or("");
    request.owner = OptString(args, "owner");
    auto params = args.find("parameters");
    if (params != args.end()) {
        if (!params->is_object()) return Err(MissingArgument("parameters"));
        auto bitrate = OptInt(*params, "videoBitrateKbps");
        if (bitrate && (*bitrate < 0 || *bitrate > kMaxVideoBitrateKbps)) {
            return Err(EngineError::Validation("videoBitrateKbps must be within [0, " +
                                               std::to_string(kMaxVideoBitrateKbps) + "]"));
        }
        request.parameters = ParametersFromJson(*params);
    }

    auto admitted = engine_.StartTask(std::move(request));
    if (admitted.IsErr()) return Err(std::move(admitted).Error());
    const Admission& admission = admitted.Value();
    return Ok(Json{
        {"taskId", admission.task.id},
        {"task", TaskToJson(admission.task)},
        {"spaceCheck", CheckToJson(admission.check)},
    });
}

Result<Json, EngineError> RequestDispatcher::CancelTask(const Json& args) {
    auto id = RequireString(args, "taskId");
    if (id.IsErr()) return Err(std::move(id).Error());
    auto cancelled = engine_.CancelTask(id.Value());
    if (cancelled.IsErr()) return Err(std::move(cancelled).Error());
    return Ok(TaskToJson(cancelled.Value()));
}

Result<Json, EngineError> RequestDispatcher::DeleteTask(const Json& args) {
    auto id = RequireString(args, "taskId");
    if (id.IsErr()) return Err(std::move(id).Error());
    auto deleted = engine_.DeleteTask(id.Value());
    if (deleted.IsErr()) return Err(std::move(deleted).Error());
    return Ok(Json{{"taskId", id.Value()}});
}

Result<Json, EngineError> RequestDispatcher::GetTask(const Json& args) {
    auto id = RequireString(args, "taskId");
    if (id.IsErr()) return Err(std::move(id).Error());
    auto task = engine_.GetTask(id.Value());
    if (task.IsErr()) return Err(std::move(task).Error());
    return Ok(TaskToJson(task.Value()));
}

Result<Json, EngineError> RequestDispatcher::ListActiveTasks() {
    Json tasks = Json::array();
    for (const auto& task : engine_.ListActiveTasks()) {
        tasks.push_back(TaskToJson(task));
    }
    return Ok(std::move(tasks));
}

Result<Json, EngineError> RequestDispatcher::ListCompletedTasks(const Json& args) {
    int64_t page = OptInt(args, "page").value_or(1);
    int64_t page_size = OptInt(args, "pageSize").value_or(kDefaultPageSize);
    if (page < 1 || page_size < 1 || page_size > kMaxPageSize) {
        return Err(EngineError::Validation("page must be >= 1 and pageSize within [1, " +
                                           std::to_string(kMaxPageSize) + "]"));
    }
    // Any page past INT_MAX is past the end
    page = std::min<int64_t>(page, std::numeric_limits<int>::max());
    auto listed = engine_.ListCompletedTasks(static_cast<int>(page), static_cast<int>(page_size));
    if (listed.IsErr()) return Err(std::move(listed).Error());
    Json tasks = Json::array();
    for (const auto& task : listed.Value()) {
        tasks.push_back(TaskToJson(task));
    }
    return Ok(std::move(tasks));
}

// ============================================================================
// Space
// ============================================================================

Result<Json, EngineError> RequestDispatcher::GetSpaceUsage() {
    return Ok(SnapshotToJson(engine_.GetSpaceUsage()));
}

Result<Json, EngineError> RequestDispatcher::CheckSpace(const Json& args) {
    auto required = RequireInt(args, "requiredBytes");
    if (required.IsErr()) return Err(std::move(required).Error());
    auto check = engine_.CheckSpace(required.Value());
    if (check.IsErr()) return Err(std::move(check).Error());
    return Ok(CheckToJson(check.Value()));
}

Result<Json, EngineError> RequestDispatcher::SetSpaceConfig(const Json& args) {
    auto max_total = RequireInt(args, "maxTotalBytes");
    if (max_total.IsErr()) return Err(std::move(max_total).Error());
    auto reserved = RequireInt(args, "reservedBytes");
    if (reserved.IsErr()) return Err(std::move(reserved).Error());
    auto enabled = RequireBool(args, "enabled");
    if (enabled.IsErr()) return Err(std::move(enabled).Error());

    auto snapshot = engine_.SetSpaceConfig(max_total.Value(), reserved.Value(), enabled.Value(),
                                           OptString(args, "updatedBy").value_or("api"));
    if (snapshot.IsErr()) return Err(std::move(snapshot).Error());
    return Ok(SnapshotToJson(snapshot.Value()));
}

}  // namespace convq
