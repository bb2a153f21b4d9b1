// ============================================================================
// convq/core/defer.hpp - Deferred Cleanup
// ============================================================================
//
// Defer runs a function when it goes out of scope unless Cancel() was
// called first. Admission uses it as the compensating action for a space
// reservation: the reservation is released on every early return and the
// guard is cancelled once the task exists.
//
// USAGE:
// ------
//   accountant.TryReserve(id, requirement);
//   Defer release([&] { accountant.Release(id); });
//   auto created = registry.Create(...);
//   if (created.IsErr()) return Err(...);   // reservation released
//   release.Cancel();                       // reservation kept
//
// ============================================================================

#pragma once

#include <functional>
#include <utility>

namespace convq {

class Defer {
   public:
    template <typename F>
    explicit Defer(F&& func) : cleanup_(std::forward<F>(func)) {}

    ~Defer() {
        if (cleanup_) {
            cleanup_();
        }
    }

    Defer(const Defer&) = delete;
    Defer& operator=(const Defer&) = delete;

    Defer(Defer&& other) noexcept : cleanup_(std::exchange(other.cleanup_, nullptr)) {}

    void Cancel() { cleanup_ = nullptr; }

   private:
    std::function<void()> cleanup_;
};

#define CONVQ_DEFER_CONCAT_IMPL(a, b) a##b
#define CONVQ_DEFER_CONCAT(a, b) CONVQ_DEFER_CONCAT_IMPL(a, b)
#define CONVQ_DEFER(lambda) ::convq::Defer CONVQ_DEFER_CONCAT(convq_defer_, __LINE__){lambda}

}  // namespace convq
