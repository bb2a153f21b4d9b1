// ============================================================================
// convq/engine/engine_error.cpp - Engine Operation Errors
// ============================================================================

#include "convq/engine/engine_error.hpp"

#include "convq/core/logging.hpp"

#include <utility>

namespace convq {

EngineError EngineError::Validation(std::string message) {
    return EngineError{Errc::ValidationError, std::move(message), std::nullopt, std::nullopt};
}

EngineError EngineError::NotFound(std::string_view what, std::string_view id) {
    std::string message(what);
    message += " '";
    message += id;
    message += "' not found";
    return EngineError{Errc::NotFound, std::move(message), std::nullopt, std::nullopt};
}

EngineError EngineError::InvalidTransition(TaskStatus current, TaskStatus requested) {
    std::string message = "cannot move from ";
    message += ToString(current);
    message += " to ";
    message += ToString(requested);
    return EngineError{Errc::InvalidTransition, std::move(message), TransitionDetail{current, requested}, std::nullopt};
}

EngineError EngineError::OutOfRange(std::string message) {
    return EngineError{Errc::OutOfRange, std::move(message), std::nullopt, std::nullopt};
}

EngineError EngineError::InsufficientSpace(SpaceCheckResult check) {
    std::string message = check.message;
    return EngineError{Errc::InsufficientSpace, std::move(message), std::nullopt, std::move(check)};
}

EngineError EngineError::Conflict(std::string message) {
    return EngineError{Errc::Conflict, std::move(message), std::nullopt, std::nullopt};
}

EngineError EngineError::Internal(std::string_view component, std::string_view detail) {
    CONVQ_LOG_ERROR(component, "internal error: " << detail);
    return EngineError{Errc::Internal, "internal error", std::nullopt, std::nullopt};
}

}  // namespace convq
