// ============================================================================
// convq/io/libuv_executor.hpp - libuv-based Event Loop
// ============================================================================
//
// LibuvExecutor is the Executor the server and client run on. It owns a
// uv_loop_t which the TCP streams, listeners and periodic timers of the
// network layer register with directly (GetLoop()).
//
// ARCHITECTURE:
// -------------
// - uv_async_t wakes the loop when another thread calls Schedule/Post
// - uv_idle_t drains the ready queue while it is non-empty
// - one heap-allocated uv_timer_t per ScheduleAfter() request, created on
//   the loop thread
//
// ============================================================================

#pragma once

#include "convq/core/error.hpp"
#include "convq/core/result.hpp"
#include "convq/io/executor.hpp"

#include <atomic>
#include <chrono>
#include <coroutine>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <uv.h>

namespace convq {

class LibuvExecutor : public Executor {
   public:
    static Result<std::unique_ptr<LibuvExecutor>, std::error_code> Create();

    ~LibuvExecutor() override;

    LibuvExecutor(const LibuvExecutor&) = delete;
    LibuvExecutor& operator=(const LibuvExecutor&) = delete;

    void Run() override;
    void RunOnce() override;
    void Stop() override;
    bool IsRunning() const override;

    void Schedule(std::coroutine_handle<> handle) override;
    void ScheduleAfter(std::chrono::milliseconds delay, std::coroutine_handle<> handle) override;
    void Post(std::function<void()> callback) override;

    uv_loop_t* GetLoop() { return &loop_; }

   private:
    LibuvExecutor() = default;

    struct DelayedResume {
        std::chrono::milliseconds delay;
        std::coroutine_handle<> handle;
    };

    static void OnAsync(uv_async_t* handle);
    static void OnIdle(uv_idle_t* handle);
    static void OnTimer(uv_timer_t* handle);

    void Wake();
    void Drain();
    void StartTimer(const DelayedResume& request);

    uv_loop_t loop_{};
    uv_async_t async_{};
    uv_idle_t idle_{};
    std::atomic<bool> running_{false};
    bool idle_active_ = false;

    // Guarded by queue_mutex_; shared with other threads
    std::mutex queue_mutex_;
    std::deque<std::function<void()>> ready_;
    std::deque<DelayedResume> delayed_;
};

}  // namespace convq
