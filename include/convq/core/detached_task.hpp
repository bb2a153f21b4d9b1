// ============================================================================
// convq/core/detached_task.hpp - Self-Destroying Coroutine
// ============================================================================
//
// DetachedTask runs a Task<void> without an owner: its frame destroys itself
// on completion, after an optional completion callback. The connection
// manager uses it for the accept loop, the per-connection reader and writer
// and the heartbeat; the reconnecting client for its run loop.
//
// USAGE:
// ------
//   auto reader = MakeDetached(ReadLoop(session));
//   reader.SetCallback([this] { --live_coroutines_; });
//   reader.Start();
//
// ============================================================================

#pragma once

#include "convq/core/task.hpp"

#include <coroutine>
#include <cstdlib>
#include <functional>
#include <utility>

namespace convq {

class DetachedTask {
   public:
    struct promise_type {
        std::function<void()> callback;

        DetachedTask get_return_object() noexcept {
            return DetachedTask{std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        std::suspend_always initial_suspend() noexcept { return {}; }

        auto final_suspend() noexcept {
            struct FinalAwaiter {
                bool await_ready() noexcept { return false; }
                void await_suspend(std::coroutine_handle<promise_type> h) noexcept {
                    auto callback = std::move(h.promise().callback);
                    h.destroy();
                    if (callback) {
                        callback();
                    }
                }
                void await_resume() noexcept {}
            };
            return FinalAwaiter{};
        }

        void return_void() noexcept {}

        void unhandled_exception() noexcept { std::abort(); }
    };

    using Handle = std::coroutine_handle<promise_type>;

    explicit DetachedTask(Handle h) noexcept : handle_(h) {}

    DetachedTask(DetachedTask&& other) noexcept
        : handle_(std::exchange(other.handle_, nullptr)), started_(other.started_) {}

    DetachedTask& operator=(DetachedTask&& other) noexcept {
        if (this != &other) {
            if (handle_ && !started_) {
                handle_.destroy();
            }
            handle_ = std::exchange(other.handle_, nullptr);
            started_ = other.started_;
        }
        return *this;
    }

    DetachedTask(const DetachedTask&) = delete;
    DetachedTask& operator=(const DetachedTask&) = delete;

    // A started coroutine owns itself; only a never-started one is destroyed here
    ~DetachedTask() {
        if (handle_ && !started_) {
            handle_.destroy();
        }
    }

    void SetCallback(std::function<void()> cb) {
        if (handle_) {
            handle_.promise().callback = std::move(cb);
        }
    }

    void Start() {
        if (handle_ && !started_) {
            started_ = true;
            handle_.resume();
        }
    }

   private:
    Handle handle_;
    bool started_ = false;
};

inline DetachedTask MakeDetached(Task<void> task) {
    co_await std::move(task);
}

}  // namespace convq
