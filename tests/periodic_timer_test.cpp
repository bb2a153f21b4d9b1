// ============================================================================
// PeriodicTimer Tests
// ============================================================================

#include "convq/io/periodic_timer.hpp"

#include "convq/core/detached_task.hpp"
#include "convq/core/task.hpp"
#include "convq/io/libuv_executor.hpp"
#include "convq/io/timer.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>

using namespace convq;
using namespace std::chrono_literals;

class PeriodicTimerTest : public ::testing::Test {
   protected:
    PeriodicTimerTest() : loop_(LibuvExecutor::Create().Value()) {}

    void Run(Task<void>& first) {
        loop_->Schedule(first.GetHandle());
        loop_->Run();
    }

    void Run(Task<void>& first, Task<void>& second) {
        loop_->Schedule(first.GetHandle());
        loop_->Schedule(second.GetHandle());
        loop_->Run();
    }

    std::unique_ptr<LibuvExecutor> loop_;
};

TEST_F(PeriodicTimerTest, IntervalCanChangeBeforeFirstWait) {
    PeriodicTimer heartbeat(30s, loop_->GetLoop());
    heartbeat.SetInterval(5s);
    EXPECT_FALSE(heartbeat.IsCancelled());
}

TEST_F(PeriodicTimerTest, HeartbeatTicksUntilCallerStops) {
    int pings = 0;
    auto heartbeat = [&]() -> Task<void> {
        PeriodicTimer timer(10ms, loop_->GetLoop());
        while (co_await timer.Wait()) {
            if (++pings == 4) break;
        }
        loop_->Stop();
    };

    auto task = heartbeat();
    Run(task);
    EXPECT_EQ(pings, 4);
}

TEST_F(PeriodicTimerTest, ShorterIntervalAppliesWhileRunning) {
    PeriodicTimer timer(10s, loop_->GetLoop());
    int ticks = 0;
    auto waiter = [&]() -> Task<void> {
        while (co_await timer.Wait()) {
            if (++ticks == 2) break;
        }
        loop_->Stop();
    };
    auto shorten = [&]() -> Task<void> {
        co_await AsyncSleep(5ms);
        timer.SetInterval(10ms);
    };

    auto w = waiter();
    auto s = shorten();
    auto started = std::chrono::steady_clock::now();
    Run(w, s);

    EXPECT_EQ(ticks, 2);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 9s);
}

TEST_F(PeriodicTimerTest, CancelWakesWaiterWithFalse) {
    PeriodicTimer timer(10s, loop_->GetLoop());
    bool tick = true;
    bool resumed = false;

    auto waiter = [&]() -> Task<void> {
        tick = co_await timer.Wait();
        resumed = true;
    };
    auto shutdown = [&]() -> Task<void> {
        co_await AsyncSleep(15ms);
        timer.Cancel();
        loop_->Stop();
    };

    auto w = waiter();
    auto s = shutdown();
    Run(w, s);

    EXPECT_TRUE(resumed);
    EXPECT_FALSE(tick);
    EXPECT_TRUE(timer.IsCancelled());
}

TEST_F(PeriodicTimerTest, CancelledTimerNeverSuspends) {
    PeriodicTimer timer(10s, loop_->GetLoop());
    timer.Cancel();

    bool tick = true;
    auto waiter = [&]() -> Task<void> {
        tick = co_await timer.Wait();
        loop_->Stop();
    };

    auto task = waiter();
    Run(task);
    EXPECT_FALSE(tick);
}

// Connection teardown destroys the timer under its detached heartbeat
TEST_F(PeriodicTimerTest, DestroyingTimerEndsDetachedLoop) {
    auto timer = std::make_unique<PeriodicTimer>(10s, loop_->GetLoop());
    bool finished = false;

    auto heartbeat = [&]() -> Task<void> {
        while (co_await timer->Wait()) {
        }
        finished = true;
    };

    loop_->Post([&]() { MakeDetached(heartbeat()).Start(); });
    loop_->Post([&]() {
        timer.reset();
        loop_->Stop();
    });
    loop_->Run();

    EXPECT_TRUE(finished);
}
