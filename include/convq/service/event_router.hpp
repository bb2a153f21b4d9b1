// ============================================================================
// convq/service/event_router.hpp - Registry Events to Hub Groups
// ============================================================================
//
// EventRouter is the registry's EventSink. It decides which groups see an
// event and hands it to the hub in one multi-group publish:
//
//   Created, StatusChanged, Completed, Deleted   task:<id>, user:<owner>, all
//   ProgressUpdated                              task:<id>, user:<owner>
//   SpaceStatusChanged                           space-monitor, all
//
// It also closes the admission loop: once a task is terminal or deleted its
// space reservation is released (the accountant ignores repeats).
//
// ============================================================================

#pragma once

#include "convq/engine/event.hpp"
#include "convq/engine/space_accountant.hpp"
#include "convq/hub/broadcast_hub.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace convq {

class EventRouter : public EventSink {
   public:
    // `accountant` may be null when there is no admission ledger to release
    explicit EventRouter(BroadcastHub& hub, SpaceAccountant* accountant = nullptr)
        : hub_(hub), accountant_(accountant) {}

    void OnEvent(const EventPtr& event) override;

    static std::vector<std::string> GroupsFor(const Event& event);

    [[nodiscard]] uint64_t RoutedCount() const { return routed_.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t ReleasedCount() const { return released_.load(std::memory_order_relaxed); }

   private:
    BroadcastHub& hub_;
    SpaceAccountant* accountant_;
    std::atomic<uint64_t> routed_{0};
    std::atomic<uint64_t> released_{0};
};

}  // namespace convq
