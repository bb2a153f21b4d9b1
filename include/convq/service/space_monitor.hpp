// ============================================================================
// convq/service/space_monitor.hpp - Background Space Refresh
// ============================================================================
//
// SpaceMonitor owns one background thread that re-measures disk usage every
// interval and publishes a SpaceStatusChanged event with the new snapshot.
// Entering the warning (> 80%) or critical (> 90%) band is logged once per
// change of band.
//
// The thread is supervised: a failed refresh does not stop it (the snapshot
// is marked stale and the next tick tries again), and Stop() hands back the
// error of the most recent refresh so the owner sees how the monitor ended.
//
// USAGE:
// ------
//   SpaceMonitor monitor(accountant, router, clock, {std::chrono::seconds(30)});
//   monitor.Start();
//   ...
//   if (auto ec = monitor.Stop()) { log the last failure }
//
// ============================================================================

#pragma once

#include "convq/core/clock.hpp"
#include "convq/engine/event.hpp"
#include "convq/engine/space_accountant.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>

namespace convq {

struct SpaceMonitorOptions {
    std::chrono::milliseconds interval{30000};
};

class SpaceMonitor {
   public:
    using Options = SpaceMonitorOptions;

    SpaceMonitor(SpaceAccountant& accountant, EventSink& sink, const Clock& clock, Options options = {});
    ~SpaceMonitor();

    SpaceMonitor(const SpaceMonitor&) = delete;
    SpaceMonitor& operator=(const SpaceMonitor&) = delete;

    // Starts the refresh thread; the first refresh happens one interval in
    void Start();

    // Joins the thread. Returns the error of the last refresh, if it failed.
    std::error_code Stop();

    // Refresh and publish right now, on the calling thread
    std::error_code RefreshNow(std::string reason);

    [[nodiscard]] bool IsRunning() const { return running_.load(); }
    [[nodiscard]] uint64_t RefreshCount() const { return refreshes_.load(); }
    [[nodiscard]] std::error_code LastError() const;
    [[nodiscard]] SpaceLevel LastLevel() const;

    void SetInterval(std::chrono::milliseconds interval);

   private:
    void Loop();
    void ReportLevel(const SpaceUsageSnapshot& snapshot);

    SpaceAccountant& accountant_;
    EventSink& sink_;
    const Clock& clock_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> refreshes_{0};

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    bool stop_requested_ = false;
    std::chrono::milliseconds interval_;
    std::error_code last_error_;
    SpaceLevel last_level_ = SpaceLevel::Normal;
};

}  // namespace convq
