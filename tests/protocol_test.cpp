// ============================================================================
// Protocol Tests
// ============================================================================

#include "convq/net/protocol.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>

using namespace convq;

namespace {

ConversionTask SampleTask() {
    ConversionTask task;
    task.id = "task-7";
    task.name = "holiday";
    task.owner = "alice";
    task.source = {"/media/in/holiday.mkv", 1'000'000'000};
    task.parameters.output_format = "mp4";
    task.parameters.video_codec = "libx265";
    task.parameters.video_bitrate_kbps = 2500;
    task.status = TaskStatus::Converting;
    task.progress = 42;
    task.speed = 1.5;
    task.eta = std::chrono::seconds(90);
    task.created_at = FromUnixMillis(1'700'000'000'000);
    task.started_at = FromUnixMillis(1'700'000'001'000);
    task.retry_count = 1;
    task.estimated_output_bytes = 510'000'000;
    task.reserved_bytes = 610'000'000;
    return task;
}

}  // namespace

// ============================================================================
// Framing
// ============================================================================

TEST(ProtocolTest, ParseMessageReadsType) {
    auto message = ParseMessage(R"({"type":"JoinGroup","name":"task:t1"})");

    ASSERT_TRUE(message.IsOk());
    EXPECT_EQ(message.Value().type, "JoinGroup");
    EXPECT_EQ(OptString(message.Value().body, "name"), "task:t1");
}

TEST(ProtocolTest, ParseMessageRejectsMalformedFrames) {
    for (const char* line : {"{not json", "[1,2,3]", "\"Ping\"", "{}", R"({"type":""})", R"({"type":7})"}) {
        auto message = ParseMessage(line);
        ASSERT_TRUE(message.IsErr()) << line;
        EXPECT_EQ(message.Error(), Errc::ProtocolError) << line;
    }
}

TEST(ProtocolTest, EncodeFrameIsOneLine) {
    Json frame = MakeRequest(3, op::kGetTask, Json{{"taskId", "line\nbreak"}});
    std::string line = EncodeFrame(frame);

    ASSERT_FALSE(line.empty());
    EXPECT_EQ(line.back(), '\n');
    EXPECT_EQ(line.find('\n'), line.size() - 1);

    auto parsed = ParseMessage(std::string_view(line).substr(0, line.size() - 1));
    ASSERT_TRUE(parsed.IsOk());
    EXPECT_EQ(parsed.Value().body["args"]["taskId"], "line\nbreak");
}

// ============================================================================
// Builders
// ============================================================================

TEST(ProtocolTest, GroupAckCarriesError) {
    Json ok = MakeGroupAck(msg::kJoinGroup, "task:t1", std::nullopt);
    EXPECT_EQ(ok["success"], true);
    EXPECT_FALSE(ok.contains("error"));

    Json failed = MakeGroupAck(msg::kJoinGroup, "bogus", EngineError::Validation("invalid group name 'bogus'"));
    EXPECT_EQ(failed["success"], false);
    EXPECT_EQ(failed["error"]["code"], "ValidationError");
}

TEST(ProtocolTest, ErrorResponseIncludesTransitionDetail) {
    Json response = MakeErrorResponse(9, EngineError::InvalidTransition(TaskStatus::Completed, TaskStatus::Cancelled));

    EXPECT_EQ(response["type"], "Response");
    EXPECT_EQ(response["requestId"], 9);
    EXPECT_EQ(response["ok"], false);
    EXPECT_EQ(response["error"]["code"], "InvalidTransition");
    EXPECT_EQ(response["error"]["current"], "Completed");
    EXPECT_EQ(response["error"]["requested"], "Cancelled");
}

TEST(ProtocolTest, InsufficientSpaceIncludesCheck) {
    SpaceCheckResult check;
    check.has_enough_space = false;
    check.required_bytes = 610;
    check.available_bytes = 100;
    check.details.pending_reservations = 50;

    Json error = ErrorToJson(EngineError::InsufficientSpace(check));

    EXPECT_EQ(error["code"], "InsufficientSpace");
    EXPECT_EQ(error["spaceCheck"]["requiredBytes"], 610);
    EXPECT_EQ(error["spaceCheck"]["details"]["pendingReservations"], 50);
}

TEST(ProtocolTest, ProtocolErrorUsesCodeName) {
    Json error = MakeProtocolError(make_error_code(Errc::FrameTooLarge), "frame exceeds limit");
    EXPECT_EQ(error["type"], "Error");
    EXPECT_EQ(error["code"], "FrameTooLarge");

    Json foreign = MakeProtocolError(std::make_error_code(std::errc::connection_reset), "reset");
    EXPECT_EQ(foreign["code"], "Internal");
}

TEST(ProtocolTest, RemoteErrorFallsBackToInternal) {
    auto known = RemoteErrorFromJson(Json{{"code", "NotFound"}, {"message", "task 'x' not found"}});
    EXPECT_EQ(known.code, Errc::NotFound);
    EXPECT_EQ(known.message, "task 'x' not found");

    auto unknown = RemoteErrorFromJson(Json{{"code", "SomethingNew"}});
    EXPECT_EQ(unknown.code, Errc::Internal);
    EXPECT_TRUE(unknown.message.empty());
}

// ============================================================================
// Task Codec
// ============================================================================

TEST(ProtocolTest, TaskJsonUsesWireNames) {
    Json json = TaskToJson(SampleTask());

    EXPECT_EQ(json["id"], "task-7");
    EXPECT_EQ(json["status"], "Converting");
    EXPECT_EQ(json["sourceSizeBytes"], 1'000'000'000);
    EXPECT_EQ(json["parameters"]["videoCodec"], "libx265");
    EXPECT_EQ(json["parameters"]["videoBitrateKbps"], 2500);
    EXPECT_EQ(json["etaSeconds"], 90);
    EXPECT_EQ(json["createdAt"], 1'700'000'000'000);
    EXPECT_TRUE(json["completedAt"].is_null());
    EXPECT_TRUE(json["errorMessage"].is_null());
}

TEST(ProtocolTest, TaskDecodesFromEncoding) {
    auto decoded = TaskFromJson(TaskToJson(SampleTask()));

    ASSERT_TRUE(decoded.IsOk());
    const auto& task = decoded.Value();
    EXPECT_EQ(task.owner, "alice");
    EXPECT_EQ(task.status, TaskStatus::Converting);
    EXPECT_EQ(task.progress, 42);
    EXPECT_EQ(task.eta, std::chrono::seconds(90));
    EXPECT_EQ(task.parameters.video_bitrate_kbps, 2500);
    EXPECT_EQ(ToUnixMillis(*task.started_at), 1'700'000'001'000);
    EXPECT_FALSE(task.completed_at.has_value());
    EXPECT_EQ(task.reserved_bytes, 610'000'000);
}

TEST(ProtocolTest, TaskDecodeRequiresIdentityAndStatus) {
    Json json = TaskToJson(SampleTask());
    json["status"] = "Paused";
    EXPECT_EQ(TaskFromJson(json).Error(), Errc::ProtocolError);

    Json no_id = TaskToJson(SampleTask());
    no_id.erase("id");
    EXPECT_EQ(TaskFromJson(no_id).Error(), Errc::ProtocolError);
}

// ============================================================================
// Events
// ============================================================================

TEST(ProtocolTest, TaskEventEnvelope) {
    auto event = MakeTaskEvent(EventKind::StatusChanged, SampleTask(), FromUnixMillis(1'700'000'002'000),
                               TaskStatus::Pending);

    Json envelope = EventToJson(*event);

    EXPECT_EQ(envelope["type"], "StatusUpdate");
    EXPECT_EQ(envelope["taskId"], "task-7");
    EXPECT_EQ(envelope["timestamp"], 1'700'000'002'000);
    EXPECT_EQ(envelope["payload"]["status"], "Converting");
    EXPECT_EQ(envelope["payload"]["previousStatus"], "Pending");
}

TEST(ProtocolTest, SpaceEventEnvelope) {
    SpaceUsageSnapshot snapshot;
    snapshot.total_bytes = 100;
    snapshot.usage_percent = 92.5;
    snapshot.level = SpaceLevel::Critical;

    Json envelope = EventToJson(*MakeSpaceEvent(snapshot, "level-change", FromUnixMillis(5)));

    EXPECT_EQ(envelope["type"], "SpaceStatusUpdate");
    EXPECT_FALSE(envelope.contains("taskId"));
    EXPECT_EQ(envelope["payload"]["level"], "critical");
    EXPECT_EQ(envelope["payload"]["reason"], "level-change");
}

TEST(ProtocolTest, EventTypeNamesAreReversible) {
    for (auto kind : {EventKind::Created, EventKind::ProgressUpdated, EventKind::StatusChanged, EventKind::Completed,
                      EventKind::Deleted, EventKind::SpaceStatusChanged}) {
        EXPECT_EQ(EventKindFromTypeName(EventTypeName(kind)), kind);
    }
    EXPECT_FALSE(EventKindFromTypeName("TaskPaused").has_value());
}

// ============================================================================
// Field Access
// ============================================================================

TEST(ProtocolTest, LenientReadersIgnoreWrongTypes) {
    Json object{{"s", "text"}, {"i", 12}, {"d", 2.5}, {"b", true}, {"n", nullptr}};

    EXPECT_EQ(OptString(object, "s"), "text");
    EXPECT_EQ(OptInt(object, "i"), 12);
    EXPECT_EQ(OptDouble(object, "i"), 12.0);
    EXPECT_EQ(OptDouble(object, "d"), 2.5);
    EXPECT_EQ(OptBool(object, "b"), true);

    EXPECT_FALSE(OptInt(object, "s").has_value());
    EXPECT_FALSE(OptInt(object, "d").has_value());
    EXPECT_FALSE(OptString(object, "n").has_value());
    EXPECT_FALSE(OptBool(object, "missing").has_value());
    EXPECT_FALSE(OptString(Json::array(), "s").has_value());
}
