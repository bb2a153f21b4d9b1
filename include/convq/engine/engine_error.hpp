// ============================================================================
// convq/engine/engine_error.hpp - Engine Operation Errors
// ============================================================================
//
// EngineError is the error half of every engine operation's Result. It is
// an Errc from the engine taxonomy plus a human-readable message and, where
// a caller can act on it, structured detail:
//
//   InvalidTransition  -> transition {current, requested}
//   InsufficientSpace  -> space_check (the failed SpaceCheckResult)
//
// Internal errors carry a generic message; their detail goes to the log.
//
// ============================================================================

#pragma once

#include "convq/core/error.hpp"
#include "convq/core/result.hpp"
#include "convq/engine/space_types.hpp"
#include "convq/engine/task_status.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace convq {

struct TransitionDetail {
    TaskStatus current;
    TaskStatus requested;
};

struct EngineError {
    Errc code = Errc::Internal;
    std::string message;
    std::optional<TransitionDetail> transition;
    std::optional<SpaceCheckResult> space_check;

    [[nodiscard]] std::error_code ErrorCode() const { return make_error_code(code); }

    static EngineError Validation(std::string message);
    static EngineError NotFound(std::string_view what, std::string_view id);
    static EngineError InvalidTransition(TaskStatus current, TaskStatus requested);
    static EngineError OutOfRange(std::string message);
    static EngineError InsufficientSpace(SpaceCheckResult check);
    static EngineError Conflict(std::string message);
    // Logs `detail` and returns an error with a generic message
    static EngineError Internal(std::string_view component, std::string_view detail);
};

template <typename T>
using EngineResult = Result<T, EngineError>;

}  // namespace convq
