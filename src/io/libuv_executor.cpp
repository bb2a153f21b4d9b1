// ============================================================================
// convq/io/libuv_executor.cpp - libuv-based Event Loop Implementation
// ============================================================================

#include "convq/io/libuv_executor.hpp"

#include "convq/core/logging.hpp"

#include <utility>

namespace convq {

// ============================================================================
// Construction / Destruction
// ============================================================================

Result<std::unique_ptr<LibuvExecutor>, std::error_code> LibuvExecutor::Create() {
    auto executor = std::unique_ptr<LibuvExecutor>(new LibuvExecutor());

    if (uv_loop_init(&executor->loop_) != 0) {
        return Err(make_error_code(Errc::IoError));
    }

    if (uv_async_init(&executor->loop_, &executor->async_, OnAsync) != 0) {
        uv_loop_close(&executor->loop_);
        return Err(make_error_code(Errc::IoError));
    }
    executor->async_.data = executor.get();

    if (uv_idle_init(&executor->loop_, &executor->idle_) != 0) {
        uv_close(reinterpret_cast<uv_handle_t*>(&executor->async_), nullptr);
        uv_run(&executor->loop_, UV_RUN_ONCE);
        uv_loop_close(&executor->loop_);
        return Err(make_error_code(Errc::IoError));
    }
    executor->idle_.data = executor.get();

    return Ok(std::move(executor));
}

LibuvExecutor::~LibuvExecutor() {
    if (running_) {
        Stop();
    }

    uv_close(reinterpret_cast<uv_handle_t*>(&async_), nullptr);
    uv_close(reinterpret_cast<uv_handle_t*>(&idle_), nullptr);

    // Let close callbacks (ours and any stream/timer handles) run
    while (uv_loop_alive(&loop_)) {
        uv_run(&loop_, UV_RUN_ONCE);
    }

    uv_loop_close(&loop_);
}

// ============================================================================
// Event Loop Control
// ============================================================================

void LibuvExecutor::Run() {
    running_ = true;
    ExecutorGuard guard(this);
    uv_run(&loop_, UV_RUN_DEFAULT);
    running_ = false;
}

void LibuvExecutor::RunOnce() {
    ExecutorGuard guard(this);
    uv_run(&loop_, UV_RUN_NOWAIT);
}

void LibuvExecutor::Stop() {
    uv_stop(&loop_);
    running_ = false;
}

bool LibuvExecutor::IsRunning() const {
    return running_;
}

// ============================================================================
// Scheduling (any thread)
// ============================================================================

void LibuvExecutor::Schedule(std::coroutine_handle<> handle) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        ready_.emplace_back([handle] {
            if (handle) handle.resume();
        });
    }
    Wake();
}

void LibuvExecutor::ScheduleAfter(std::chrono::milliseconds delay, std::coroutine_handle<> handle) {
    // uv_timer_* is loop-thread only; the timer is created in Drain()
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        delayed_.push_back({delay, handle});
    }
    Wake();
}

void LibuvExecutor::Post(std::function<void()> callback) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        ready_.push_back(std::move(callback));
    }
    Wake();
}

void LibuvExecutor::Wake() {
    uv_async_send(&async_);
}

// ============================================================================
// Loop-thread Callbacks
// ============================================================================

void LibuvExecutor::OnAsync(uv_async_t* handle) {
    auto* self = static_cast<LibuvExecutor*>(handle->data);
    if (!self->idle_active_) {
        uv_idle_start(&self->idle_, OnIdle);
        self->idle_active_ = true;
    }
}

void LibuvExecutor::OnIdle(uv_idle_t* handle) {
    auto* self = static_cast<LibuvExecutor*>(handle->data);
    self->Drain();

    std::lock_guard<std::mutex> lock(self->queue_mutex_);
    if (self->ready_.empty() && self->delayed_.empty()) {
        uv_idle_stop(handle);
        self->idle_active_ = false;
    }
}

void LibuvExecutor::OnTimer(uv_timer_t* handle) {
    auto resume = std::coroutine_handle<>::from_address(handle->data);
    uv_close(reinterpret_cast<uv_handle_t*>(handle), [](uv_handle_t* h) { delete reinterpret_cast<uv_timer_t*>(h); });
    if (resume) {
        resume.resume();
    }
}

void LibuvExecutor::Drain() {
    std::deque<std::function<void()>> ready;
    std::deque<DelayedResume> delayed;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        std::swap(ready, ready_);
        std::swap(delayed, delayed_);
    }

    for (auto& work : ready) {
        work();
    }
    for (const auto& request : delayed) {
        StartTimer(request);
    }
}

void LibuvExecutor::StartTimer(const DelayedResume& request) {
    auto* timer = new uv_timer_t;
    if (uv_timer_init(&loop_, timer) != 0) {
        delete timer;
        CONVQ_LOG_WARN("executor", "timer init failed, resuming immediately");
        if (request.handle) request.handle.resume();
        return;
    }

    timer->data = request.handle.address();
    uv_timer_start(timer, OnTimer, static_cast<uint64_t>(request.delay.count()), 0);
}

}  // namespace convq
