// ============================================================================
// convq/io/periodic_timer.hpp - Coroutine Periodic Timer
// ============================================================================
//
// PeriodicTimer wakes one waiting coroutine every interval. It drives the
// server heartbeat: each tick pings live connections and drops the ones
// whose last pong is too old.
//
// Wait() yields true on a tick and false once the timer has been cancelled,
// so a loop over it ends cleanly on shutdown:
//
//   PeriodicTimer timer(30s, loop);
//   while (co_await timer.Wait()) {
//       SendPings();
//   }
//
// Loop-thread only.
//
// ============================================================================

#pragma once

#include <chrono>
#include <coroutine>
#include <cstdint>
#include <uv.h>

namespace convq {

class PeriodicTimer {
   public:
    using Duration = std::chrono::milliseconds;

    PeriodicTimer(Duration interval, uv_loop_t* loop) : interval_(interval) {
        timer_ = new uv_timer_t;
        uv_timer_init(loop, timer_);
        timer_->data = this;
    }

    ~PeriodicTimer() {
        Cancel();
        // Heap-allocated so the close callback can free it after we are gone
        uv_close(reinterpret_cast<uv_handle_t*>(timer_), [](uv_handle_t* h) { delete reinterpret_cast<uv_timer_t*>(h); });
    }

    PeriodicTimer(const PeriodicTimer&) = delete;
    PeriodicTimer& operator=(const PeriodicTimer&) = delete;

    class WaitAwaitable {
       public:
        explicit WaitAwaitable(PeriodicTimer& timer) : timer_(timer) {}

        bool await_ready() const noexcept { return timer_.cancelled_; }

        void await_suspend(std::coroutine_handle<> h) {
            timer_.waiting_ = h;
            if (!timer_.running_) {
                auto period = static_cast<uint64_t>(timer_.interval_.count());
                uv_timer_start(timer_.timer_, OnTimer, period, period);
                timer_.running_ = true;
            }
        }

        bool await_resume() const noexcept { return !timer_.cancelled_; }

       private:
        PeriodicTimer& timer_;
    };

    WaitAwaitable Wait() { return WaitAwaitable(*this); }

    // Stop ticking and release the waiter (its Wait() yields false)
    void Cancel() {
        cancelled_ = true;
        if (running_) {
            uv_timer_stop(timer_);
            running_ = false;
        }
        if (waiting_) {
            auto h = waiting_;
            waiting_ = nullptr;
            h.resume();
        }
    }

    // A running timer restarts, so the next tick is one new interval away
    void SetInterval(Duration interval) {
        interval_ = interval;
        if (running_) {
            auto period = static_cast<uint64_t>(interval_.count());
            uv_timer_start(timer_, OnTimer, period, period);
        }
    }

    [[nodiscard]] bool IsCancelled() const { return cancelled_; }

   private:
    static void OnTimer(uv_timer_t* handle) {
        auto* self = static_cast<PeriodicTimer*>(handle->data);
        if (self->waiting_) {
            auto h = self->waiting_;
            self->waiting_ = nullptr;
            h.resume();
        }
    }

    uv_timer_t* timer_;
    Duration interval_;
    bool running_ = false;
    bool cancelled_ = false;
    std::coroutine_handle<> waiting_;
};

}  // namespace convq
