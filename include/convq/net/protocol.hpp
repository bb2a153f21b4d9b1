// ============================================================================
// convq/net/protocol.hpp - JSON Wire Protocol
// ============================================================================
//
// Every frame is one JSON object on one line. The "type" field says what
// it is:
//
//   Ping / Pong                         liveness, either direction
//   Connected     {connectionId}        server -> client on accept
//   JoinGroup     {name}                client -> server
//   LeaveGroup    {name}                client -> server
//   GroupAck      {op, name, success, error?}
//   Request       {requestId, op, args}
//   Response      {requestId, ok, result | error{code, message, ...}}
//   Error         {code, message}       protocol-level failure
//
// Events use the envelope {type, taskId?, payload, timestamp}, where type is
// TaskCreated, ProgressUpdate, StatusUpdate, TaskCompleted, TaskDeleted or
// SpaceStatusUpdate. All timestamps are milliseconds since the Unix epoch.
//
// ============================================================================

#pragma once

#include "convq/core/error.hpp"
#include "convq/core/result.hpp"
#include "convq/engine/conversion_task.hpp"
#include "convq/engine/engine_error.hpp"
#include "convq/engine/event.hpp"
#include "convq/engine/space_types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace convq {

using Json = nlohmann::json;

namespace msg {
inline constexpr std::string_view kPing = "Ping";
inline constexpr std::string_view kPong = "Pong";
inline constexpr std::string_view kConnected = "Connected";
inline constexpr std::string_view kJoinGroup = "JoinGroup";
inline constexpr std::string_view kLeaveGroup = "LeaveGroup";
inline constexpr std::string_view kGroupAck = "GroupAck";
inline constexpr std::string_view kRequest = "Request";
inline constexpr std::string_view kResponse = "Response";
inline constexpr std::string_view kError = "Error";
}  // namespace msg

namespace op {
inline constexpr std::string_view kStartTask = "StartTask";
inline constexpr std::string_view kCancelTask = "CancelTask";
inline constexpr std::string_view kDeleteTask = "DeleteTask";
inline constexpr std::string_view kGetTask = "GetTask";
inline constexpr std::string_view kListActiveTasks = "ListActiveTasks";
inline constexpr std::string_view kListCompletedTasks = "ListCompletedTasks";
inline constexpr std::string_view kGetSpaceUsage = "GetSpaceUsage";
inline constexpr std::string_view kCheckSpace = "CheckSpace";
inline constexpr std::string_view kSetSpaceConfig = "SetSpaceConfig";
}  // namespace op

struct Message {
    std::string type;
    Json body;  // the whole frame, "type" included
};

// Errc::ProtocolError for malformed JSON, a non-object, or a missing "type"
Result<Message, std::error_code> ParseMessage(std::string_view line);

// Serialized frame with its trailing newline
std::string EncodeFrame(const Json& frame);

// ============================================================================
// Builders
// ============================================================================

Json MakePing();
Json MakePong();
Json MakeConnected(std::string_view connection_id);
Json MakeJoinGroup(std::string_view group);
Json MakeLeaveGroup(std::string_view group);
Json MakeGroupAck(std::string_view op_name, std::string_view group, const std::optional<EngineError>& error);
Json MakeRequest(uint64_t request_id, std::string_view op_name, Json args = Json::object());
Json MakeOkResponse(uint64_t request_id, Json result);
Json MakeErrorResponse(uint64_t request_id, const EngineError& error);
Json MakeProtocolError(std::error_code code, std::string_view message);

// ============================================================================
// Payload Codecs
// ============================================================================

Json ParametersToJson(const ConversionParameters& params);
ConversionParameters ParametersFromJson(const Json& json);

Json TaskToJson(const ConversionTask& task);
Result<ConversionTask, std::error_code> TaskFromJson(const Json& json);

Json SnapshotToJson(const SpaceUsageSnapshot& snapshot);
Json CheckToJson(const SpaceCheckResult& check);
Json ErrorToJson(const EngineError& error);

// Event envelope
Json EventToJson(const Event& event);
std::string_view EventTypeName(EventKind kind);
std::optional<EventKind> EventKindFromTypeName(std::string_view type);

// An error reported by the other side of a Response
struct RemoteError {
    Errc code = Errc::Internal;
    std::string message;
};

RemoteError RemoteErrorFromJson(const Json& error);

// ============================================================================
// Field Access
// ============================================================================
// Lenient readers for incoming frames: a missing or mistyped field yields
// nullopt instead of throwing.

std::optional<std::string> OptString(const Json& object, std::string_view key);
std::optional<int64_t> OptInt(const Json& object, std::string_view key);
std::optional<double> OptDouble(const Json& object, std::string_view key);
std::optional<bool> OptBool(const Json& object, std::string_view key);

}  // namespace convq
