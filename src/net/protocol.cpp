// ============================================================================
// convq/net/protocol.cpp - JSON Wire Protocol
// ============================================================================

#include "convq/net/protocol.hpp"

#include <chrono>
#include <limits>
#include <utility>

namespace convq {

namespace {

template <typename T>
void PutOptional(Json& object, const char* key, const std::optional<T>& value) {
    if (value) {
        object[key] = *value;
    } else {
        object[key] = nullptr;
    }
}

void PutOptionalTime(Json& object, const char* key, const std::optional<SystemTime>& value) {
    if (value) {
        object[key] = ToUnixMillis(*value);
    } else {
        object[key] = nullptr;
    }
}

const Json* Field(const Json& object, std::string_view key) {
    if (!object.is_object()) return nullptr;
    auto it = object.find(std::string(key));
    if (it == object.end() || it->is_null()) return nullptr;
    return &*it;
}

}  // namespace

// ============================================================================
// Framing
// ============================================================================

Result<Message, std::error_code> ParseMessage(std::string_view line) {
    Json frame = Json::parse(line.begin(), line.end(), nullptr, false);
    if (frame.is_discarded() || !frame.is_object()) {
        return Err(make_error_code(Errc::ProtocolError));
    }
    auto type = OptString(frame, "type");
    if (!type || type->empty()) {
        return Err(make_error_code(Errc::ProtocolError));
    }
    return Ok(Message{std::move(*type), std::move(frame)});
}

std::string EncodeFrame(const Json& frame) {
    std::string line = frame.dump(-1, ' ', false, Json::error_handler_t::replace);
    line.push_back('\n');
    return line;
}

// ============================================================================
// Builders
// ============================================================================

Json MakePing() {
    return Json{{"type", msg::kPing}};
}

Json MakePong() {
    return Json{{"type", msg::kPong}};
}

Json MakeConnected(std::string_view connection_id) {
    return Json{{"type", msg::kConnected}, {"connectionId", connection_id}};
}

Json MakeJoinGroup(std::string_view group) {
    return Json{{"type", msg::kJoinGroup}, {"name", group}};
}

Json MakeLeaveGroup(std::string_view group) {
    return Json{{"type", msg::kLeaveGroup}, {"name", group}};
}

Json MakeGroupAck(std::string_view op_name, std::string_view group, const std::optional<EngineError>& error) {
    Json ack{{"type", msg::kGroupAck}, {"op", op_name}, {"name", group}, {"success", !error.has_value()}};
    if (error) {
        ack["error"] = ErrorToJson(*error);
    }
    return ack;
}

Json MakeRequest(uint64_t request_id, std::string_view op_name, Json args) {
    return Json{{"type", msg::kRequest}, {"requestId", request_id}, {"op", op_name}, {"args", std::move(args)}};
}

Json MakeOkResponse(uint64_t request_id, Json result) {
    return Json{{"type", msg::kResponse}, {"requestId", request_id}, {"ok", true}, {"result", std::move(result)}};
}

Json MakeErrorResponse(uint64_t request_id, const EngineError& error) {
    return Json{{"type", msg::kResponse}, {"requestId", request_id}, {"ok", false}, {"error", ErrorToJson(error)}};
}

Json MakeProtocolError(std::error_code code, std::string_view message) {
    std::string_view name = "Internal";
    if (code.category() == ConvqCategory()) {
        name = ErrcName(static_cast<Errc>(code.value()));
    }
    return Json{{"type", msg::kError}, {"code", name}, {"message", message}};
}

// ============================================================================
// Payload Codecs
// ============================================================================

Json ParametersToJson(const ConversionParameters& params) {
    Json json{
        {"outputFormat", params.output_format}, {"videoCodec", params.video_codec},
        {"audioCodec", params.audio_codec},     {"quality", params.quality},
        {"resolution", params.resolution},
    };
    PutOptional(json, "videoBitrateKbps", params.video_bitrate_kbps);
    return json;
}

ConversionParameters ParametersFromJson(const Json& json) {
    ConversionParameters params;
    params.output_format = OptString(json, "outputFormat").value_or("");
    params.video_codec = OptString(json, "videoCodec").value_or("");
    params.audio_codec = OptString(json, "audioCodec").value_or("");
    params.quality = OptString(json, "quality").value_or("");
    params.resolution = OptString(json, "resolution").value_or("");
    // Values that do not fit an int are treated as absent
    auto bitrate = OptInt(json, "videoBitrateKbps");
    if (bitrate && *bitrate >= std::numeric_limits<int>::min() && *bitrate <= std::numeric_limits<int>::max()) {
        params.video_bitrate_kbps = static_cast<int>(*bitrate);
    }
    return params;
}

Json TaskToJson(const ConversionTask& task) {
    Json json{
        {"id", task.id},
        {"name", task.name},
        {"sourcePath", task.source.path},
        {"sourceSizeBytes", task.source.size_bytes},
        {"parameters", ParametersToJson(task.parameters)},
        {"status", ToString(task.status)},
        {"progress", task.progress},
        {"createdAt", ToUnixMillis(task.created_at)},
        {"retryCount", task.retry_count},
        {"maxRetries", task.max_retries},
        {"estimatedOutputBytes", task.estimated_output_bytes},
        {"reservedBytes", task.reserved_bytes},
    };
    PutOptional(json, "owner", task.owner);
    PutOptional(json, "speed", task.speed);
    if (task.eta) {
        json["etaSeconds"] = task.eta->count();
    } else {
        json["etaSeconds"] = nullptr;
    }
    PutOptional(json, "errorMessage", task.error_message);
    PutOptionalTime(json, "startedAt", task.started_at);
    PutOptionalTime(json, "completedAt", task.completed_at);
    return json;
}

Result<ConversionTask, std::error_code> TaskFromJson(const Json& json) {
    auto id = OptString(json, "id");
    auto name = OptString(json, "name");
    auto status_name = OptString(json, "status");
    if (!id || !name || !status_name) {
        return Err(make_error_code(Errc::ProtocolError));
    }
    auto status = ParseTaskStatus(*status_name);
    if (!status) {
        return Err(make_error_code(Errc::ProtocolError));
    }

    ConversionTask task;
    task.id = std::move(*id);
    task.name = std::move(*name);
    task.status = *status;
    task.owner = OptString(json, "owner");
    task.source.path = OptString(json, "sourcePath").value_or("");
    task.source.size_bytes = OptInt(json, "sourceSizeBytes").value_or(0);
    if (const Json* params = Field(json, "parameters")) {
        task.parameters = ParametersFromJson(*params);
    }
    task.progress = static_cast<int>(OptInt(json, "progress").value_or(0));
    task.speed = OptDouble(json, "speed");
    if (auto eta = OptInt(json, "etaSeconds")) {
        task.eta = std::chrono::seconds(*eta);
    }
    task.error_message = OptString(json, "errorMessage");
    task.created_at = FromUnixMillis(OptInt(json, "createdAt").value_or(0));
    if (auto started = OptInt(json, "startedAt")) {
        task.started_at = FromUnixMillis(*started);
    }
    if (auto completed = OptInt(json, "completedAt")) {
        task.completed_at = FromUnixMillis(*completed);
    }
    task.retry_count = static_cast<int>(OptInt(json, "retryCount").value_or(0));
    task.max_retries = static_cast<int>(OptInt(json, "maxRetries").value_or(3));
    task.estimated_output_bytes = OptInt(json, "estimatedOutputBytes").value_or(0);
    task.reserved_bytes = OptInt(json, "reservedBytes").value_or(0);
    return Ok(std::move(task));
}

Json SnapshotToJson(const SpaceUsageSnapshot& snapshot) {
    return Json{
        {"totalBytes", snapshot.total_bytes},
        {"reservedBytes", snapshot.reserved_bytes},
        {"usedBytes", snapshot.used_bytes},
        {"pendingReservations", snapshot.pending_reservations},
        {"availableBytes", snapshot.available_bytes},
        {"usagePercent", snapshot.usage_percent},
        {"hasSufficientSpace", snapshot.has_sufficient_space},
        {"enabled", snapshot.enabled},
        {"stale", snapshot.stale},
        {"level", ToString(snapshot.level)},
        {"breakdown",
         {
             {"sourceBytes", snapshot.breakdown.source_bytes},
             {"outputBytes", snapshot.breakdown.output_bytes},
             {"tempBytes", snapshot.breakdown.temp_bytes},
         }},
        {"computedAt", ToUnixMillis(snapshot.computed_at)},
    };
}

Json CheckToJson(const SpaceCheckResult& check) {
    const SpaceCheckDetails& details = check.details;
    return Json{
        {"hasEnoughSpace", check.has_enough_space},
        {"requiredBytes", check.required_bytes},
        {"availableBytes", check.available_bytes},
        {"message", check.message},
        {"details",
         {
             {"originalFileBytes", details.original_file_bytes},
             {"estimatedOutputBytes", details.estimated_output_bytes},
             {"tempFileBytes", details.temp_file_bytes},
             {"reservedBytes", details.reserved_bytes},
             {"pendingReservations", details.pending_reservations},
             {"currentUsedBytes", details.current_used_bytes},
             {"totalConfiguredBytes", details.total_configured_bytes},
         }},
    };
}

Json ErrorToJson(const EngineError& error) {
    Json json{{"code", ErrcName(error.code)}, {"message", error.message}};
    if (error.transition) {
        json["current"] = ToString(error.transition->current);
        json["requested"] = ToString(error.transition->requested);
    }
    if (error.space_check) {
        json["spaceCheck"] = CheckToJson(*error.space_check);
    }
    return json;
}

std::string_view EventTypeName(EventKind kind) {
    switch (kind) {
        case EventKind::Created:
            return "TaskCreated";
        case EventKind::ProgressUpdated:
            return "ProgressUpdate";
        case EventKind::StatusChanged:
            return "StatusUpdate";
        case EventKind::Completed:
            return "TaskCompleted";
        case EventKind::Deleted:
            return "TaskDeleted";
        case EventKind::SpaceStatusChanged:
            return "SpaceStatusUpdate";
    }
    return "Unknown";
}

std::optional<EventKind> EventKindFromTypeName(std::string_view type) {
    for (auto kind : {EventKind::Created, EventKind::ProgressUpdated, EventKind::StatusChanged, EventKind::Completed,
                      EventKind::Deleted, EventKind::SpaceStatusChanged}) {
        if (EventTypeName(kind) == type) return kind;
    }
    return std::nullopt;
}

Json EventToJson(const Event& event) {
    Json envelope{{"type", EventTypeName(event.kind)}, {"timestamp", ToUnixMillis(event.timestamp)}};

    if (const auto* space = event.Space()) {
        Json payload = SnapshotToJson(space->snapshot);
        payload["reason"] = space->reason;
        envelope["payload"] = std::move(payload);
        return envelope;
    }

    const auto& task_event = std::get<TaskEvent>(event.payload);
    envelope["taskId"] = task_event.task.id;
    Json payload = TaskToJson(task_event.task);
    if (task_event.previous_status) {
        payload["previousStatus"] = ToString(*task_event.previous_status);
    }
    envelope["payload"] = std::move(payload);
    return envelope;
}

RemoteError RemoteErrorFromJson(const Json& error) {
    RemoteError remote;
    if (auto code = OptString(error, "code")) {
        remote.code = ErrcFromName(*code).value_or(Errc::Internal);
    }
    remote.message = OptString(error, "message").value_or("");
    return remote;
}

// ============================================================================
// Field Access
// ============================================================================

std::optional<std::string> OptString(const Json& object, std::string_view key) {
    const Json* field = Field(object, key);
    if (!field || !field->is_string()) return std::nullopt;
    return field->get<std::string>();
}

std::optional<int64_t> OptInt(const Json& object, std::string_view key) {
    const Json* field = Field(object, key);
    if (!field || !field->is_number_integer()) return std::nullopt;
    return field->get<int64_t>();
}

std::optional<double> OptDouble(const Json& object, std::string_view key) {
    const Json* field = Field(object, key);
    if (!field || !field->is_number()) return std::nullopt;
    return field->get<double>();
}

std::optional<bool> OptBool(const Json& object, std::string_view key) {
    const Json* field = Field(object, key);
    if (!field || !field->is_boolean()) return std::nullopt;
    return field->get<bool>();
}

}  // namespace convq
