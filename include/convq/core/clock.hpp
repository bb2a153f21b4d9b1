// ============================================================================
// convq/core/clock.hpp - Time Source and Identifier Generation
// ============================================================================
//
// The engine never reads the wall clock or generates ids directly. It is
// handed a Clock and an IdGenerator, so tests can pin time and ids.
//
// ============================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace convq {

using SystemTime = std::chrono::system_clock::time_point;

int64_t ToUnixMillis(SystemTime t);
SystemTime FromUnixMillis(int64_t ms);

// ============================================================================
// Clock
// ============================================================================
class Clock {
   public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual SystemTime Now() const = 0;
};

class SystemClock : public Clock {
   public:
    [[nodiscard]] SystemTime Now() const override { return std::chrono::system_clock::now(); }
};

// Test clock: time moves only when told to
class ManualClock : public Clock {
   public:
    explicit ManualClock(SystemTime start = FromUnixMillis(1'700'000'000'000)) : now_ms_(ToUnixMillis(start)) {}

    [[nodiscard]] SystemTime Now() const override { return FromUnixMillis(now_ms_.load()); }

    void Set(SystemTime t) { now_ms_.store(ToUnixMillis(t)); }

    void Advance(std::chrono::milliseconds delta) { now_ms_.fetch_add(delta.count()); }

   private:
    std::atomic<int64_t> now_ms_;
};

// ============================================================================
// IdGenerator
// ============================================================================
class IdGenerator {
   public:
    virtual ~IdGenerator() = default;

    virtual std::string Next() = 0;
};

// Random RFC 4122 version-4 identifiers ("3f2b...-4...-a...")
class UuidGenerator : public IdGenerator {
   public:
    UuidGenerator();

    std::string Next() override;

   private:
    std::mutex mutex_;
    std::mt19937_64 rng_;
};

// "<prefix>-1", "<prefix>-2", ... for tests and diagnostics
class SequentialIdGenerator : public IdGenerator {
   public:
    explicit SequentialIdGenerator(std::string prefix) : prefix_(std::move(prefix)) {}

    std::string Next() override { return prefix_ + "-" + std::to_string(++counter_); }

   private:
    std::string prefix_;
    std::atomic<uint64_t> counter_{0};
};

}  // namespace convq
