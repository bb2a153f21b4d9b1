// ============================================================================
// convq/core/task.hpp - Lazy Async Coroutine
// ============================================================================
//
// Task<T> is the coroutine type used by the network layer: the accept loop,
// each connection's reader and writer, the heartbeat and the reconnecting
// client all are Task<void> coroutines running on the libuv loop thread.
//
// KEY POINTS:
// -----------
// 1. LAZY: a Task does not run until it is co_awaited (or its handle is
//    resumed by an executor / MakeDetached()).
// 2. SYMMETRIC TRANSFER: when a Task finishes it transfers control straight
//    to its awaiter, so long chains of awaits do not grow the stack.
// 3. MOVE-ONLY: the Task owns its coroutine frame and destroys it.
//
// Not to be confused with ConversionTask (engine/conversion_task.hpp), which
// is the record of a conversion job.
//
// USAGE:
// ------
//   Task<int> ReadLength() { co_return 42; }
//
//   Task<void> Caller() {
//       int n = co_await ReadLength();
//   }
//
// ============================================================================

#pragma once

#include "convq/core/check.hpp"

#include <coroutine>
#include <cstdlib>
#include <optional>
#include <utility>

namespace convq {

// ============================================================================
// Symmetric Transfer Helper
// ============================================================================
// GCC under AddressSanitizer does not emit the tail call symmetric transfer
// relies on (GCC bug 100897). In that configuration we resume the target
// directly instead of returning its handle.
//
#if defined(__GNUG__) && !defined(__clang__) && defined(__SANITIZE_ADDRESS__)
#define CONVQ_ASAN_SYMMETRIC_TRANSFER_BROKEN 1
#else
#define CONVQ_ASAN_SYMMETRIC_TRANSFER_BROKEN 0
#endif

#if CONVQ_ASAN_SYMMETRIC_TRANSFER_BROKEN
using SymmetricTransferResult = void;

inline void SymmetricTransfer(std::coroutine_handle<> target) noexcept {
    target.resume();
}
#else
using SymmetricTransferResult = std::coroutine_handle<>;

inline std::coroutine_handle<> SymmetricTransfer(std::coroutine_handle<> target) noexcept {
    return target;
}
#endif

template <typename T>
class Task;

namespace detail {

// Continuation bookkeeping shared by TaskPromise<T> and TaskPromise<void>
class TaskPromiseBase {
   public:
    std::suspend_always initial_suspend() noexcept { return {}; }

    template <typename Promise>
    struct FinalAwaiter {
        bool await_ready() noexcept { return false; }

        SymmetricTransferResult await_suspend(std::coroutine_handle<Promise> finishing) noexcept {
            auto cont = finishing.promise().Continuation();
            return SymmetricTransfer(cont ? cont : std::noop_coroutine());
        }

        void await_resume() noexcept {}
    };

    void unhandled_exception() noexcept { std::abort(); }

    void SetContinuation(std::coroutine_handle<> cont) noexcept {
        CONVQ_CHECK(!awaited_, "Task co_awaited twice");
        awaited_ = true;
        continuation_ = cont;
    }

    std::coroutine_handle<> Continuation() const noexcept { return continuation_; }

   private:
    std::coroutine_handle<> continuation_;
    bool awaited_ = false;
};

}  // namespace detail

// ============================================================================
// Promise Types
// ============================================================================

template <typename T>
class TaskPromise : public detail::TaskPromiseBase {
   public:
    Task<T> get_return_object() noexcept;

    detail::TaskPromiseBase::FinalAwaiter<TaskPromise> final_suspend() noexcept { return {}; }

    void return_value(T value) noexcept { result_ = std::move(value); }

    T&& TakeResult() noexcept { return std::move(result_.value()); }

   private:
    std::optional<T> result_;
};

template <>
class TaskPromise<void> : public detail::TaskPromiseBase {
   public:
    Task<void> get_return_object() noexcept;

    detail::TaskPromiseBase::FinalAwaiter<TaskPromise> final_suspend() noexcept { return {}; }

    void return_void() noexcept {}

    void TakeResult() noexcept {}
};

// ============================================================================
// Task<T> - The Coroutine Return Type
// ============================================================================
template <typename T>
class [[nodiscard("Task must be co_awaited")]] Task {
   public:
    using promise_type = TaskPromise<T>;
    using Handle = std::coroutine_handle<promise_type>;

    explicit Task(Handle handle) noexcept : handle_(handle) {}

    ~Task() {
        if (handle_) {
            handle_.destroy();
        }
    }

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    Task(Task&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

    Task& operator=(Task&& other) noexcept {
        if (this != &other) {
            if (handle_) {
                handle_.destroy();
            }
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    struct Awaiter {
        Handle handle_;

        bool await_ready() noexcept { return false; }

        // Record who is waiting, then jump into the task body
        SymmetricTransferResult await_suspend(std::coroutine_handle<> awaiting) noexcept {
            handle_.promise().SetContinuation(awaiting);
            return SymmetricTransfer(handle_);
        }

        T await_resume() noexcept { return handle_.promise().TakeResult(); }
    };

    [[nodiscard]] Awaiter operator co_await() noexcept { return Awaiter{handle_}; }

    [[nodiscard]] Handle GetHandle() const noexcept { return handle_; }

   private:
    Handle handle_;
};

template <typename T>
Task<T> TaskPromise<T>::get_return_object() noexcept {
    return Task<T>{Task<T>::Handle::from_promise(*this)};
}

inline Task<void> TaskPromise<void>::get_return_object() noexcept {
    return Task<void>{Task<void>::Handle::from_promise(*this)};
}

}  // namespace convq
