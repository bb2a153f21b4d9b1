// ============================================================================
// convq/service/request_dispatcher.hpp - Wire Operations
// ============================================================================
//
// RequestDispatcher is the RequestHandler the server hands Request frames
// to. It decodes the op's arguments, calls the matching EngineContext
// operation and encodes the result:
//
//   StartTask          {name, sourceSizeBytes, sourcePath?, parameters?, owner?}
//                      -> {taskId, task, spaceCheck}
//   CancelTask         {taskId}                 -> task
//   DeleteTask         {taskId}                 -> {taskId}
//   GetTask            {taskId}                 -> task
//   ListActiveTasks    {}                       -> [task]
//   ListCompletedTasks {page = 1, pageSize = 20} -> [task]
//   GetSpaceUsage      {}                       -> snapshot
//   CheckSpace         {requiredBytes}          -> check
//   SetSpaceConfig     {maxTotalBytes, reservedBytes, enabled, updatedBy?}
//                      -> snapshot
//
// A missing or mistyped argument is a ValidationError; an unknown op is
// NotFound.
//
// ============================================================================

#pragma once

#include "convq/net/request_handler.hpp"
#include "convq/service/engine_context.hpp"

#include <atomic>
#include <cstdint>
#include <string_view>

namespace convq {

inline constexpr int kDefaultPageSize = 20;

class RequestDispatcher : public RequestHandler {
   public:
    explicit RequestDispatcher(EngineContext& engine) : engine_(engine) {}

    Result<Json, EngineError> Handle(std::string_view op_name, const Json& args) override;

    [[nodiscard]] uint64_t HandledCount() const { return handled_.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t FailedCount() const { return failed_.load(std::memory_order_relaxed); }

   private:
    Result<Json, EngineError> Dispatch(std::string_view op_name, const Json& args);

    Result<Json, EngineError> StartTask(const Json& args);
    Result<Json, EngineError> CancelTask(const Json& args);
    Result<Json, EngineError> DeleteTask(const Json& args);
    Result<Json, EngineError> GetTask(const Json& args);
    Result<Json, EngineError> ListActiveTasks();
    Result<Json, EngineError> ListCompletedTasks(const Json& args);
    Result<Json, EngineError> GetSpaceUsage();
    Result<Json, EngineError> CheckSpace(const Json& args);
    Result<Json, EngineError> SetSpaceConfig(const Json& args);

    EngineContext& engine_;
    std::atomic<uint64_t> handled_{0};
    std::atomic<uint64_t> failed_{0};
};

}  // namespace convq
