// ============================================================================
// convq/service/space_monitor.cpp - Background Space Refresh
// ============================================================================

#include "convq/service/space_monitor.hpp"

#include "convq/core/logging.hpp"

#include <utility>

namespace convq {

namespace {

constexpr const char* kComponent = "space";

}  // namespace

SpaceMonitor::SpaceMonitor(SpaceAccountant& accountant, EventSink& sink, const Clock& clock, Options options)
    : accountant_(accountant), sink_(sink), clock_(clock), interval_(options.interval) {
    if (interval_.count() <= 0) {
        interval_ = SpaceMonitorOptions{}.interval;
    }
}

SpaceMonitor::~SpaceMonitor() {
    Stop();
}

void SpaceMonitor::Start() {
    if (running_.exchange(true)) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    thread_ = std::thread([this] { Loop(); });
    CONVQ_LOG_DEBUG(kComponent, "monitor started, interval " << interval_.count() << "ms");
}

std::error_code SpaceMonitor::Stop() {
    if (running_.exchange(false)) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_requested_ = true;
        }
        wake_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
        CONVQ_LOG_DEBUG(kComponent, "monitor stopped after " << refreshes_.load() << " refreshes");
    }
    return LastError();
}

void SpaceMonitor::SetInterval(std::chrono::milliseconds interval) {
    if (interval.count() <= 0) return;
    std::lock_guard<std::mutex> lock(mutex_);
    interval_ = interval;
}

std::error_code SpaceMonitor::LastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

SpaceLevel SpaceMonitor::LastLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_level_;
}

std::error_code SpaceMonitor::RefreshNow(std::string reason) {
    std::error_code ec = accountant_.Refresh();
    refreshes_.fetch_add(1);

    SpaceUsageSnapshot snapshot = accountant_.Snapshot();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_error_ = ec;
    }
    if (ec) {
        CONVQ_LOG_WARN(kComponent, "refresh failed (" << ec.message() << "), keeping previous snapshot");
    }

    ReportLevel(snapshot);
    sink_.OnEvent(MakeSpaceEvent(snapshot, std::move(reason), clock_.Now()));
    return ec;
}

void SpaceMonitor::ReportLevel(const SpaceUsageSnapshot& snapshot) {
    SpaceLevel previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = std::exchange(last_level_, snapshot.level);
    }
    if (previous == snapshot.level) return;

    switch (snapshot.level) {
        case SpaceLevel::Critical:
            CONVQ_LOG_ERROR(kComponent, "space usage critical: " << snapshot.usage_percent << "% of "
                                                                 << snapshot.total_bytes / kMiB << " MiB used");
            break;
        case SpaceLevel::Warning:
            CONVQ_LOG_WARN(kComponent, "space usage high: " << snapshot.usage_percent << "% of "
                                                            << snapshot.total_bytes / kMiB << " MiB used");
            break;
        case SpaceLevel::Normal:
            CONVQ_LOG_INFO(kComponent, "space usage back to normal: " << snapshot.usage_percent << "%");
            break;
    }
}

void SpaceMonitor::Loop() {
    Logger::SetThreadName("space-monitor");
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        auto deadline = std::chrono::steady_clock::now() + interval_;
        // A new interval applies from the next tick
        if (wake_.wait_until(lock, deadline, [this] { return stop_requested_; })) {
            break;
        }
        lock.unlock();
        RefreshNow("periodic");
        lock.lock();
    }
}

}  // namespace convq
