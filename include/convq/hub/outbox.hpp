// ============================================================================
// convq/hub/outbox.hpp - Bounded Per-Connection Event Queue
// ============================================================================
//
// An Outbox sits between the BroadcastHub and one connection's writer
// coroutine. Publishers push from any thread and never wait: when the queue
// is full the oldest unsent event is dropped to make room. The single
// consumer co_awaits Receive(), which yields the next event or nullopt once
// the outbox is closed and drained.
//
//   publisher threads --Push()--> [ e1 e2 e3 ... ] --Receive()--> writer
//                                   ^ dropped first on overflow
//
// WAKING THE CONSUMER:
// --------------------
// A suspended consumer is resumed through its Executor (Schedule() is the
// thread-safe entry into the loop), so publishers never run the writer's
// code on their own thread. Without an executor it is resumed inline, which
// is what single-threaded tests want.
//
// ============================================================================

#pragma once

#include "convq/engine/event.hpp"
#include "convq/io/executor.hpp"

#include <coroutine>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace convq {

class Outbox {
   public:
    enum class PushResult : uint8_t {
        Queued,
        DroppedOldest,
        Closed,
    };

    explicit Outbox(size_t capacity, Executor* executor = nullptr);
    ~Outbox();

    Outbox(const Outbox&) = delete;
    Outbox& operator=(const Outbox&) = delete;

    PushResult Push(EventPtr event);

    // Non-blocking pop for callers that poll
    std::optional<EventPtr> TryPop();

    // Pending events stay receivable; once they are drained Receive()
    // yields nullopt
    void Close();

    class ReceiveAwaitable {
       public:
        explicit ReceiveAwaitable(Outbox& outbox) : outbox_(outbox) {}

        bool await_ready();
        bool await_suspend(std::coroutine_handle<> h);
        std::optional<EventPtr> await_resume();

       private:
        Outbox& outbox_;
        std::optional<EventPtr> result_;
    };

    // Single consumer only
    ReceiveAwaitable Receive() { return ReceiveAwaitable(*this); }

    [[nodiscard]] bool IsClosed() const;
    [[nodiscard]] size_t Size() const;
    [[nodiscard]] size_t Capacity() const { return capacity_; }
    [[nodiscard]] uint64_t DroppedCount() const;

   private:
    void Wake(std::coroutine_handle<> h);

    const size_t capacity_;
    Executor* executor_;

    mutable std::mutex mutex_;
    std::deque<EventPtr> queue_;
    bool closed_ = false;
    uint64_t dropped_ = 0;
    std::coroutine_handle<> waiter_;
};

}  // namespace convq
