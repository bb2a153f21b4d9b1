// ============================================================================
// convq/io/executor.hpp - Abstract Event Loop Interface
// ============================================================================
//
// An Executor owns one event loop thread and resumes coroutines on it. The
// network layer (ConnectionManager, ReconnectingClient) runs entirely on an
// Executor; the engine core does not depend on one.
//
// Schedule() and Post() are safe from any thread. That is how the broadcast
// hub, publishing from whichever thread mutated a task, hands an event to a
// connection's writer coroutine on the loop thread.
//
// USAGE:
// ------
//   Executor* exec = GetCurrentExecutor();   // set while Run() is active
//   exec->Schedule(handle);
//   exec->ScheduleAfter(100ms, handle);
//
// ============================================================================

#pragma once

#include <chrono>
#include <coroutine>
#include <functional>

namespace convq {

class Executor {
   public:
    virtual ~Executor() = default;

    // Run until Stop() is called or the loop has no more work
    virtual void Run() = 0;

    // One non-blocking iteration
    virtual void RunOnce() = 0;

    virtual void Stop() = 0;

    [[nodiscard]] virtual bool IsRunning() const = 0;

    // Resume `handle` on the loop thread as soon as possible
    virtual void Schedule(std::coroutine_handle<> handle) = 0;

    // Resume `handle` on the loop thread after `delay`
    virtual void ScheduleAfter(std::chrono::milliseconds delay, std::coroutine_handle<> handle) = 0;

    // Run `callback` on the loop thread
    virtual void Post(std::function<void()> callback) = 0;
};

// The executor whose loop is running on this thread (nullptr if none)
[[nodiscard]] Executor* GetCurrentExecutor();

void SetCurrentExecutor(Executor* executor);

// Sets the current executor for a scope and restores the previous one
class ExecutorGuard {
   public:
    explicit ExecutorGuard(Executor* executor);
    ~ExecutorGuard();

    ExecutorGuard(const ExecutorGuard&) = delete;
    ExecutorGuard& operator=(const ExecutorGuard&) = delete;

   private:
    Executor* previous_;
};

}  // namespace convq
