// ============================================================================
// convq/engine/space_accountant.hpp - Storage Budget and Admission Ledger
// ============================================================================
//
// SpaceAccountant answers "is there room for this?" against a configured
// budget, the last disk measurement and the reservations held by admitted
// but unfinished tasks:
//
//   available = budget.max_total - budget.reserved - used - pending
//
// The disk measurement comes from a StorageProbe and is replaced wholesale
// by Refresh(); the probe runs outside the lock. If it fails, the previous
// measurement is kept and snapshots report `stale`.
//
// RESERVATIONS:
// -------------
// TryReserve() is the only way to take space: it checks and records the
// reservation under one lock, so two admissions that each fit alone but not
// together cannot both succeed. Release() is idempotent; a reservation is
// keyed by task id.
//
// ============================================================================

#pragma once

#include "convq/core/clock.hpp"
#include "convq/engine/conversion_task.hpp"
#include "convq/engine/engine_error.hpp"
#include "convq/engine/space_types.hpp"
#include "convq/engine/storage_probe.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <system_error>
#include <unordered_map>

namespace convq {

inline constexpr const char* kSpaceLimitDisabledMessage = "space limit disabled";

class SpaceAccountant {
   public:
    SpaceAccountant(StorageProbe& probe, const Clock& clock, SpaceBudget budget = {});

    SpaceAccountant(const SpaceAccountant&) = delete;
    SpaceAccountant& operator=(const SpaceAccountant&) = delete;

    // Re-measure disk usage. On failure the previous measurement is kept,
    // marked stale, and the error returned.
    std::error_code Refresh();

    [[nodiscard]] SpaceUsageSnapshot Snapshot() const;

    // Pure queries against the current snapshot and ledger
    [[nodiscard]] SpaceCheckResult CheckBytes(int64_t required_bytes) const;
    [[nodiscard]] SpaceCheckResult Check(const SpaceRequirement& requirement) const;

    // Atomic check-and-reserve of requirement.Total() under `key`.
    // InsufficientSpace (carrying the failed check) if it does not fit,
    // Conflict if `key` already holds a reservation.
    EngineResult<SpaceCheckResult> TryReserve(const TaskId& key, const SpaceRequirement& requirement);

    // Returns false if `key` held nothing
    bool Release(const TaskId& key);

    // Re-creates a reservation without checking, for tasks recovered at
    // startup that were admitted before the restart
    void Restore(const TaskId& key, int64_t bytes);

    [[nodiscard]] int64_t ReservedTotal() const;
    [[nodiscard]] size_t ReservationCount() const;
    [[nodiscard]] std::optional<int64_t> ReservationFor(const TaskId& key) const;

    [[nodiscard]] SpaceBudget Budget() const;
    void SetBudget(SpaceBudget budget);

   private:
    struct Measurement {
        UsageBreakdown usage;
        SystemTime measured_at{};
        bool stale = false;
    };

    // Callers hold mutex_
    SpaceUsageSnapshot SnapshotLocked() const;
    SpaceCheckResult CheckLocked(const SpaceRequirement& requirement) const;
    int64_t AvailableLocked() const;

    StorageProbe& probe_;
    const Clock& clock_;

    mutable std::mutex mutex_;
    SpaceBudget budget_;
    Measurement measurement_;
    std::unordered_map<TaskId, int64_t> reservations_;
    int64_t reserved_total_ = 0;
};

}  // namespace convq
