// ============================================================================
// convq/core/sync_wait.hpp - Blocking Wait for Coroutines
// ============================================================================
//
// SyncWait() blocks the calling thread until a Task completes and returns
// its result. It is the bridge between plain code (main(), tests) and
// coroutines that finish without needing the event loop.
//
// USAGE:
// ------
//   Task<int> Answer() { co_return 42; }
//
//   int main() {
//       int value = SyncWait(Answer());
//   }
//
// WARNING:
// --------
// The task is resumed inline on the calling thread. A task that awaits
// something only the loop can complete (AsyncSleep, TcpStream::Read, an
// Outbox with an executor) would block forever unless another thread is
// running that loop. Never call SyncWait from inside a coroutine.
//
// ============================================================================

#pragma once

#include "convq/core/task.hpp"

#include <condition_variable>
#include <mutex>
#include <optional>
#include <utility>

namespace convq {

namespace detail {

// One-shot signal
class SyncWaitEvent {
   public:
    void Signal() {
        std::lock_guard lock(mutex_);
        signaled_ = true;
        cv_.notify_one();
    }

    void Wait() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return signaled_; });
    }

   private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool signaled_ = false;
};

}  // namespace detail

template <typename T>
T SyncWait(Task<T> task) {
    detail::SyncWaitEvent event;
    std::optional<T> result;

    auto wrapper = [&]() -> Task<void> {
        result = co_await std::move(task);
        event.Signal();
    };

    auto wrapper_task = wrapper();
    wrapper_task.GetHandle().resume();
    event.Wait();

    return std::move(*result);
}

inline void SyncWait(Task<void> task) {
    detail::SyncWaitEvent event;

    auto wrapper = [&]() -> Task<void> {
        co_await std::move(task);
        event.Signal();
    };

    auto wrapper_task = wrapper();
    wrapper_task.GetHandle().resume();
    event.Wait();
}

}  // namespace convq
