// ============================================================================
// convq/core/backoff.hpp - Exponential Backoff Schedule
// ============================================================================
//
// BackoffPolicy describes a bounded retry schedule; Backoff walks it one
// attempt at a time. The reconnecting client asks for the next delay after
// every failed or lost connection and gives up once NextDelay() returns
// nullopt.
//
// With the defaults the delays are 3s, 6s, 12s, 24s, 48s, then exhaustion:
//
//   delay(n) = min(initial_delay * multiplier^(n-1), max_delay)
//
// ============================================================================

#pragma once

#include <chrono>
#include <cmath>
#include <cstddef>
#include <optional>
#include <random>

namespace convq {

struct BackoffPolicy {
    size_t max_attempts = 5;
    std::chrono::milliseconds initial_delay = std::chrono::milliseconds(3000);
    double multiplier = 2.0;
    std::chrono::milliseconds max_delay = std::chrono::milliseconds(60000);
    bool add_jitter = false;

    // Delay before the given 1-based attempt, without jitter
    [[nodiscard]] std::chrono::milliseconds DelayFor(size_t attempt) const {
        if (attempt == 0) return std::chrono::milliseconds(0);
        double factor = std::pow(multiplier, static_cast<double>(attempt - 1));
        double delay_ms = static_cast<double>(initial_delay.count()) * factor;
        if (delay_ms > static_cast<double>(max_delay.count())) {
            return max_delay;
        }
        return std::chrono::milliseconds(static_cast<long long>(delay_ms));
    }
};

class Backoff {
   public:
    explicit Backoff(BackoffPolicy policy = {}) : policy_(policy) {}

    // Consume one attempt. Returns the delay to wait before it, or nullopt
    // once max_attempts have been used.
    std::optional<std::chrono::milliseconds> NextDelay() {
        if (attempts_ >= policy_.max_attempts) {
            return std::nullopt;
        }
        ++attempts_;
        auto delay = policy_.DelayFor(attempts_);
        if (policy_.add_jitter) {
            static thread_local std::mt19937 rng{std::random_device{}()};
            std::uniform_real_distribution<> dist(0.5, 1.5);
            delay = std::chrono::milliseconds(static_cast<long long>(static_cast<double>(delay.count()) * dist(rng)));
            if (delay > policy_.max_delay) {
                delay = policy_.max_delay;
            }
        }
        return delay;
    }

    void Reset() { attempts_ = 0; }

    [[nodiscard]] size_t Attempts() const { return attempts_; }
    [[nodiscard]] bool Exhausted() const { return attempts_ >= policy_.max_attempts; }
    [[nodiscard]] const BackoffPolicy& Policy() const { return policy_; }

   private:
    BackoffPolicy policy_;
    size_t attempts_ = 0;
};

}  // namespace convq
