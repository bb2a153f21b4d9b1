// ============================================================================
// convq/io/timer.hpp - Async Sleep
// ============================================================================
//
// AsyncSleep suspends the calling coroutine and resumes it on the current
// executor after the given duration. The example conversion server paces its
// simulated worker with it.
//
//   co_await AsyncSleep(std::chrono::milliseconds(200));
//
// Outside a running executor there is nothing to resume us later, so the
// await completes immediately.
//
// ============================================================================

#pragma once

#include "convq/io/executor.hpp"

#include <chrono>
#include <coroutine>

namespace convq {

class AsyncSleep {
   public:
    template <typename Rep, typename Period>
    explicit AsyncSleep(std::chrono::duration<Rep, Period> duration)
        : duration_(std::chrono::duration_cast<std::chrono::milliseconds>(duration)) {}

    bool await_ready() const noexcept { return duration_.count() <= 0; }

    bool await_suspend(std::coroutine_handle<> handle) const {
        Executor* executor = GetCurrentExecutor();
        if (executor == nullptr) {
            return false;
        }
        executor->ScheduleAfter(duration_, handle);
        return true;
    }

    void await_resume() const noexcept {}

   private:
    std::chrono::milliseconds duration_;
};

}  // namespace convq
