// ============================================================================
// SpaceMonitor Tests
// ============================================================================

#include "convq/service/space_monitor.hpp"

#include "convq/engine/storage_probe.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace convq;
using namespace std::chrono_literals;

namespace {

class SpaceEventSink : public EventSink {
   public:
    void OnEvent(const EventPtr& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    std::vector<EventPtr> Events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

   private:
    mutable std::mutex mutex_;
    std::vector<EventPtr> events_;
};

SpaceBudget TenGiB() {
    SpaceBudget budget;
    budget.max_total_bytes = 10 * kGiB;
    budget.reserved_bytes = 1 * kGiB;
    return budget;
}

template <typename Predicate>
bool WaitFor(Predicate done, std::chrono::milliseconds timeout = 2s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!done()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(2ms);
    }
    return true;
}

}  // namespace

class SpaceMonitorTest : public ::testing::Test {
   protected:
    SpaceMonitorTest() : probe_(UsageBreakdown{1 * kGiB, 1 * kGiB, 0}), accountant_(probe_, clock_, TenGiB()) {}

    ManualClock clock_;
    StaticStorageProbe probe_;
    SpaceAccountant accountant_;
    SpaceEventSink sink_;
};

TEST_F(SpaceMonitorTest, RefreshNowPublishesSnapshot) {
    SpaceMonitor monitor(accountant_, sink_, clock_);

    EXPECT_FALSE(monitor.RefreshNow("startup"));

    auto events = sink_.Events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0]->kind, EventKind::SpaceStatusChanged);
    ASSERT_NE(events[0]->Space(), nullptr);
    EXPECT_EQ(events[0]->Space()->reason, "startup");
    EXPECT_EQ(events[0]->Space()->snapshot.used_bytes, 2 * kGiB);
    EXPECT_EQ(events[0]->timestamp, clock_.Now());
    EXPECT_EQ(monitor.RefreshCount(), 1u);
}

TEST_F(SpaceMonitorTest, FailedRefreshStillPublishesStaleSnapshot) {
    SpaceMonitor monitor(accountant_, sink_, clock_);
    ASSERT_FALSE(monitor.RefreshNow("first"));

    probe_.SetFailure(true);
    auto ec = monitor.RefreshNow("second");

    EXPECT_EQ(ec, Errc::StorageUnavailable);
    EXPECT_EQ(monitor.LastError(), Errc::StorageUnavailable);
    auto events = sink_.Events();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_TRUE(events[1]->Space()->snapshot.stale);
    EXPECT_EQ(events[1]->Space()->snapshot.used_bytes, 2 * kGiB);

    probe_.SetFailure(false);
    EXPECT_FALSE(monitor.RefreshNow("third"));
    EXPECT_FALSE(monitor.LastError());
}

TEST_F(SpaceMonitorTest, TracksUsageBand) {
    SpaceMonitor monitor(accountant_, sink_, clock_);
    ASSERT_FALSE(monitor.RefreshNow("normal"));
    EXPECT_EQ(monitor.LastLevel(), SpaceLevel::Normal);

    probe_.Set(UsageBreakdown{4 * kGiB, 4 * kGiB, static_cast<int64_t>(0.5 * kGiB)});
    ASSERT_FALSE(monitor.RefreshNow("warning"));
    EXPECT_EQ(monitor.LastLevel(), SpaceLevel::Warning);

    probe_.Set(UsageBreakdown{5 * kGiB, 4 * kGiB, static_cast<int64_t>(0.5 * kGiB)});
    ASSERT_FALSE(monitor.RefreshNow("critical"));
    EXPECT_EQ(monitor.LastLevel(), SpaceLevel::Critical);

    probe_.Set(UsageBreakdown{});
    ASSERT_FALSE(monitor.RefreshNow("cleanup"));
    EXPECT_EQ(monitor.LastLevel(), SpaceLevel::Normal);
}

TEST_F(SpaceMonitorTest, BackgroundThreadRefreshesPeriodically) {
    SpaceMonitor monitor(accountant_, sink_, clock_, SpaceMonitorOptions{10ms});

    monitor.Start();
    EXPECT_TRUE(monitor.IsRunning());
    EXPECT_TRUE(WaitFor([&] { return monitor.RefreshCount() >= 3; }));
    EXPECT_FALSE(monitor.Stop());
    EXPECT_FALSE(monitor.IsRunning());

    auto events = sink_.Events();
    ASSERT_GE(events.size(), 3u);
    EXPECT_EQ(events[0]->Space()->reason, "periodic");
}

TEST_F(SpaceMonitorTest, StopReportsLastRefreshError) {
    SpaceMonitor monitor(accountant_, sink_, clock_, SpaceMonitorOptions{10ms});
    probe_.SetFailure(true);

    monitor.Start();
    ASSERT_TRUE(WaitFor([&] { return monitor.RefreshCount() >= 2; }));

    // Failures do not end the loop
    EXPECT_TRUE(monitor.IsRunning());
    EXPECT_EQ(monitor.Stop(), Errc::StorageUnavailable);
}

TEST_F(SpaceMonitorTest, StopWithoutStartAndTwice) {
    SpaceMonitor monitor(accountant_, sink_, clock_);
    EXPECT_FALSE(monitor.Stop());

    monitor.Start();
    EXPECT_FALSE(monitor.Stop());
    EXPECT_FALSE(monitor.Stop());
    EXPECT_EQ(monitor.RefreshCount(), 0u);
}

TEST_F(SpaceMonitorTest, StopDoesNotWaitForLongInterval) {
    SpaceMonitor monitor(accountant_, sink_, clock_, SpaceMonitorOptions{std::chrono::hours(1)});
    monitor.Start();

    auto started = std::chrono::steady_clock::now();
    monitor.Stop();
    EXPECT_LT(std::chrono::steady_clock::now() - started, 1s);
}
