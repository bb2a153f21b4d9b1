// ============================================================================
// convq/core/check.hpp - Always-On Invariant Checks
// ============================================================================
//
// CONVQ_CHECK(cond, msg) guards programming errors: a coroutine awaited
// twice, a component used before Init(), a lock-order violation. It stays
// enabled in Release builds.
//
// Recoverable conditions (bad input, missing tasks, full disks) never go
// through CONVQ_CHECK; they are returned as EngineError / std::error_code.
//
// ============================================================================

#pragma once

#include <cstdio>
#include <cstdlib>
#include <source_location>

namespace convq::detail {

[[noreturn]] inline void CheckFail(const char* cond_str, const char* msg, const std::source_location& loc) {
    std::fprintf(stderr, "CONVQ_CHECK(%s) failed: %s\n  in %s (%s:%u)\n", cond_str, msg, loc.function_name(),
                 loc.file_name(), static_cast<unsigned>(loc.line()));
    std::abort();
}

}  // namespace convq::detail

#define CONVQ_CHECK(cond, msg)                                                       \
    do {                                                                             \
        if (!(cond)) [[unlikely]] {                                                  \
            ::convq::detail::CheckFail(#cond, msg, std::source_location::current()); \
        }                                                                            \
    } while (0)
