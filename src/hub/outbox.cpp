// ============================================================================
// convq/hub/outbox.cpp - Bounded Per-Connection Event Queue
// ============================================================================

#include "convq/hub/outbox.hpp"

#include <algorithm>
#include <utility>

namespace convq {

Outbox::Outbox(size_t capacity, Executor* executor) : capacity_(std::max<size_t>(capacity, 1)), executor_(executor) {}

Outbox::~Outbox() {
    // Do not resume a waiter from here: it may touch this outbox again while
    // it is being destroyed. Its frame belongs to the connection's coroutine.
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    waiter_ = nullptr;
}

Outbox::PushResult Outbox::Push(EventPtr event) {
    std::coroutine_handle<> to_wake;
    PushResult result = PushResult::Queued;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return PushResult::Closed;
        if (queue_.size() >= capacity_) {
            queue_.pop_front();
            ++dropped_;
            result = PushResult::DroppedOldest;
        }
        queue_.push_back(std::move(event));
        to_wake = std::exchange(waiter_, nullptr);
    }
    if (to_wake) {
        Wake(to_wake);
    }
    return result;
}

std::optional<EventPtr> Outbox::TryPop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) return std::nullopt;
    EventPtr event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

void Outbox::Close() {
    std::coroutine_handle<> to_wake;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        closed_ = true;
        to_wake = std::exchange(waiter_, nullptr);
    }
    if (to_wake) {
        Wake(to_wake);
    }
}

bool Outbox::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t Outbox::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

uint64_t Outbox::DroppedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

void Outbox::Wake(std::coroutine_handle<> h) {
    if (executor_) {
        executor_->Schedule(h);
    } else {
        h.resume();
    }
}

// ============================================================================
// ReceiveAwaitable
// ============================================================================

bool Outbox::ReceiveAwaitable::await_ready() {
    std::lock_guard<std::mutex> lock(outbox_.mutex_);
    if (!outbox_.queue_.empty()) {
        result_ = std::move(outbox_.queue_.front());
        outbox_.queue_.pop_front();
        return true;
    }
    return outbox_.closed_;
}

bool Outbox::ReceiveAwaitable::await_suspend(std::coroutine_handle<> h) {
    std::lock_guard<std::mutex> lock(outbox_.mutex_);
    // A push or close may have landed since await_ready()
    if (!outbox_.queue_.empty()) {
        result_ = std::move(outbox_.queue_.front());
        outbox_.queue_.pop_front();
        return false;
    }
    if (outbox_.closed_) return false;
    outbox_.waiter_ = h;
    return true;
}

std::optional<EventPtr> Outbox::ReceiveAwaitable::await_resume() {
    if (result_) return std::move(result_);
    // Woken by Push() or Close(); the event, if any, is still queued
    std::lock_guard<std::mutex> lock(outbox_.mutex_);
    if (outbox_.queue_.empty()) return std::nullopt;
    EventPtr event = std::move(outbox_.queue_.front());
    outbox_.queue_.pop_front();
    return event;
}

}  // namespace convq
