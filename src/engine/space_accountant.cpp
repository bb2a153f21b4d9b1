// ============================================================================
// convq/engine/space_accountant.cpp - Storage Budget and Admission Ledger
// ============================================================================

#include "convq/engine/space_accountant.hpp"

#include "convq/core/logging.hpp"

#include <algorithm>
#include <limits>
#include <sstream>

namespace convq {

namespace {

constexpr const char* kComponent = "space";

std::string FormatMiB(int64_t bytes) {
    std::ostringstream out;
    out << (bytes / kMiB) << " MiB";
    return out.str();
}

// Negative parts, or a total that would not fit, would credit the ledger
bool IsReservable(const SpaceRequirement& requirement) {
    if (requirement.source_bytes < 0 || requirement.estimated_output_bytes < 0 || requirement.temp_bytes < 0) {
        return false;
    }
    return requirement.estimated_output_bytes <= std::numeric_limits<int64_t>::max() - requirement.temp_bytes;
}

}  // namespace

SpaceAccountant::SpaceAccountant(StorageProbe& probe, const Clock& clock, SpaceBudget budget)
    : probe_(probe), clock_(clock), budget_(std::move(budget)) {
    measurement_.measured_at = clock_.Now();
}

std::error_code SpaceAccountant::Refresh() {
    auto measured = probe_.Measure();

    std::lock_guard<std::mutex> lock(mutex_);
    if (measured.IsErr()) {
        measurement_.stale = true;
        CONVQ_LOG_WARN(kComponent, "usage refresh failed, keeping previous snapshot: " << measured.Error().message());
        return measured.Error();
    }
    measurement_ = Measurement{measured.Value(), clock_.Now(), false};
    CONVQ_LOG_DEBUG(kComponent, "usage refreshed: " << FormatMiB(measurement_.usage.Total()) << " used");
    return {};
}

SpaceUsageSnapshot SpaceAccountant::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return SnapshotLocked();
}

SpaceCheckResult SpaceAccountant::CheckBytes(int64_t required_bytes) const {
    SpaceRequirement requirement;
    requirement.estimated_output_bytes = std::max<int64_t>(required_bytes, 0);
    return Check(requirement);
}

SpaceCheckResult SpaceAccountant::Check(const SpaceRequirement& requirement) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return CheckLocked(requirement);
}

EngineResult<SpaceCheckResult> SpaceAccountant::TryReserve(const TaskId& key, const SpaceRequirement& requirement) {
    if (!IsReservable(requirement)) {
        return Err(EngineError::Validation("invalid space requirement for '" + key + "'"));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (reservations_.count(key) != 0) {
        return Err(EngineError::Conflict("space already reserved for '" + key + "'"));
    }

    SpaceCheckResult check = CheckLocked(requirement);
    if (!check.has_enough_space) {
        CONVQ_LOG_INFO(kComponent, "admission of " << key << " rejected: need " << FormatMiB(check.required_bytes)
                                                   << ", available " << FormatMiB(check.available_bytes));
        return Err(EngineError::InsufficientSpace(std::move(check)));
    }

    int64_t bytes = requirement.Total();
    reservations_.emplace(key, bytes);
    reserved_total_ += bytes;
    CONVQ_LOG_DEBUG(kComponent, "reserved " << FormatMiB(bytes) << " for " << key << " (pending "
                                            << FormatMiB(reserved_total_) << ")");
    return Ok(std::move(check));
}

bool SpaceAccountant::Release(const TaskId& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = reservations_.find(key);
    if (it == reservations_.end()) return false;
    reserved_total_ -= it->second;
    CONVQ_LOG_DEBUG(kComponent, "released " << FormatMiB(it->second) << " for " << key);
    reservations_.erase(it);
    return true;
}

void SpaceAccountant::Restore(const TaskId& key, int64_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    bytes = std::max<int64_t>(bytes, 0);
    auto [it, inserted] = reservations_.try_emplace(key, bytes);
    if (!inserted) {
        reserved_total_ -= it->second;
        it->second = bytes;
    }
    reserved_total_ += bytes;
}

int64_t SpaceAccountant::ReservedTotal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reserved_total_;
}

size_t SpaceAccountant::ReservationCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reservations_.size();
}

std::optional<int64_t> SpaceAccountant::ReservationFor(const TaskId& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = reservations_.find(key);
    if (it == reservations_.end()) return std::nullopt;
    return it->second;
}

SpaceBudget SpaceAccountant::Budget() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return budget_;
}

void SpaceAccountant::SetBudget(SpaceBudget budget) {
    std::lock_guard<std::mutex> lock(mutex_);
    budget_ = std::move(budget);
    CONVQ_LOG_INFO(kComponent, "budget set: max " << FormatMiB(budget_.max_total_bytes) << ", reserved "
                                                  << FormatMiB(budget_.reserved_bytes)
                                                  << (budget_.enabled ? "" : " (disabled)"));
}

// ============================================================================
// Internals
// ============================================================================

int64_t SpaceAccountant::AvailableLocked() const {
    return budget_.max_total_bytes - budget_.reserved_bytes - measurement_.usage.Total() - reserved_total_;
}

SpaceUsageSnapshot SpaceAccountant::SnapshotLocked() const {
    SpaceUsageSnapshot snapshot;
    int64_t available = AvailableLocked();

    snapshot.total_bytes = budget_.max_total_bytes;
    snapshot.reserved_bytes = budget_.reserved_bytes;
    snapshot.used_bytes = measurement_.usage.Total();
    snapshot.pending_reservations = reserved_total_;
    snapshot.available_bytes = std::max<int64_t>(available, 0);
    snapshot.has_sufficient_space = !budget_.enabled || available >= 0;
    snapshot.enabled = budget_.enabled;
    snapshot.stale = measurement_.stale;
    snapshot.breakdown = measurement_.usage;
    snapshot.computed_at = measurement_.measured_at;

    if (budget_.max_total_bytes > 0) {
        snapshot.usage_percent =
            static_cast<double>(snapshot.used_bytes) * 100.0 / static_cast<double>(budget_.max_total_bytes);
    }
    snapshot.level = LevelForUsage(snapshot.usage_percent);
    return snapshot;
}

SpaceCheckResult SpaceAccountant::CheckLocked(const SpaceRequirement& requirement) const {
    SpaceCheckResult result;
    result.required_bytes = requirement.Total();

    SpaceCheckDetails& details = result.details;
    details.original_file_bytes = requirement.source_bytes;
    details.estimated_output_bytes = requirement.estimated_output_bytes;
    details.temp_file_bytes = requirement.temp_bytes;
    details.reserved_bytes = budget_.reserved_bytes;
    details.pending_reservations = reserved_total_;
    details.current_used_bytes = measurement_.usage.Total();
    details.total_configured_bytes = budget_.max_total_bytes;

    if (!budget_.enabled) {
        result.has_enough_space = true;
        result.available_bytes = std::numeric_limits<int64_t>::max();
        result.message = kSpaceLimitDisabledMessage;
        return result;
    }

    int64_t available = AvailableLocked();
    result.has_enough_space = available >= result.required_bytes;
    result.available_bytes = std::max<int64_t>(available, 0);
    if (result.has_enough_space) {
        result.message = "sufficient space";
    } else {
        result.message = "insufficient space: need " + FormatMiB(result.required_bytes) + ", available " +
                         FormatMiB(result.available_bytes);
    }
    return result;
}

}  // namespace convq
