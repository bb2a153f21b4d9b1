// ============================================================================
// convq/engine/task_registry.hpp - Authoritative Task State
// ============================================================================
//
// TaskRegistry owns every ConversionTask and is the only place their state
// changes. Each mutating operation:
//
//   1. validates the request against the lifecycle table (task_status.hpp),
//   2. applies it to the task,
//   3. writes the new record through to the TaskStore (if any),
//   4. emits exactly one Event to the EventSink,
//
// all while holding that task's lock. A failed operation changes nothing
// and emits nothing.
//
// CONCURRENCY:
// ------------
// - index_mutex_ (shared) guards only the id -> entry map.
// - each Entry has its own mutex; operations on different tasks run in
//   parallel, operations on the same task are serialized, and so are its
//   events.
// - lock order is entry -> index (Delete); the index lock is never held
//   while acquiring an entry lock.
//
// USAGE:
// ------
//   TaskRegistry registry(clock, ids, &router, &store);
//   auto task = registry.Create({.name = "clip", .source = {"/in/a.mkv", size}});
//   registry.Start(task.Value().id);
//   registry.UpdateProgress(id, 40, 1.5, std::chrono::seconds(90));
//   registry.Complete(id);
//
// ============================================================================

#pragma once

#include "convq/core/clock.hpp"
#include "convq/engine/conversion_task.hpp"
#include "convq/engine/engine_error.hpp"
#include "convq/engine/event.hpp"
#include "convq/engine/task_store.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace convq {

struct RegistryStats {
    size_t total = 0;
    size_t pending = 0;
    size_t converting = 0;
    size_t completed = 0;
    size_t failed = 0;
    size_t cancelled = 0;
    uint64_t store_failures = 0;
};

inline constexpr int kMaxPageSize = 100;
inline constexpr const char* kInterruptedMessage = "interrupted by restart";

class TaskRegistry {
   public:
    // `sink` and `store` are optional and must outlive the registry
    TaskRegistry(const Clock& clock, IdGenerator& ids, EventSink* sink = nullptr, TaskStore* store = nullptr);

    TaskRegistry(const TaskRegistry&) = delete;
    TaskRegistry& operator=(const TaskRegistry&) = delete;

    // ========================================================================
    // Transitions
    // ========================================================================

    // New task in Pending. ValidationError for an empty/oversized name or a
    // non-positive source size; Conflict if a pre-assigned id is taken.
    EngineResult<ConversionTask> Create(NewTask request);

    // Pending -> Converting; resets progress and stamps started_at
    EngineResult<ConversionTask> Start(const TaskId& id);

    // Converting only; progress must be within [0, 100]. Values may go down.
    EngineResult<ConversionTask> UpdateProgress(const TaskId& id, int progress, std::optional<double> speed = std::nullopt,
                                                std::optional<std::chrono::seconds> eta = std::nullopt);

    // Converting -> Completed; progress becomes 100
    EngineResult<ConversionTask> Complete(const TaskId& id);

    // Any non-terminal -> Failed, recording the message
    EngineResult<ConversionTask> Fail(const TaskId& id, std::string message);

    // Pending | Converting -> Cancelled
    EngineResult<ConversionTask> Cancel(const TaskId& id);

    // Removes the task in any status
    Result<void, EngineError> Delete(const TaskId& id);

    // ========================================================================
    // Queries
    // ========================================================================

    [[nodiscard]] EngineResult<ConversionTask> Get(const TaskId& id) const;

    // All tasks, oldest first
    [[nodiscard]] std::vector<ConversionTask> List() const;

    // Pending and Converting tasks, oldest first
    [[nodiscard]] std::vector<ConversionTask> ListActive() const;

    // Terminal tasks, most recently finished first; `page` is 1-based and
    // `page_size` within [1, kMaxPageSize]
    [[nodiscard]] EngineResult<std::vector<ConversionTask>> ListCompleted(int page, int page_size) const;

    [[nodiscard]] RegistryStats Statistics() const;

    [[nodiscard]] size_t Size() const;

    // ========================================================================
    // Startup
    // ========================================================================

    // Loads every record from the store. Tasks found Converting were cut off
    // by a restart and are failed with kInterruptedMessage. Returns the
    // loaded tasks after that fix-up.
    Result<std::vector<ConversionTask>, std::error_code> Recover();

   private:
    struct Entry {
        std::mutex mutex;
        ConversionTask task;
        bool erased = false;
    };

    // Outcome of a mutation step: which event to emit, or why not
    using MutationOutcome = Result<EventKind, EngineError>;

    template <typename Mutator>
    EngineResult<ConversionTask> Mutate(const TaskId& id, Mutator&& mutate);

    std::shared_ptr<Entry> Find(const TaskId& id) const;
    std::vector<std::shared_ptr<Entry>> Entries() const;

    void Persist(const ConversionTask& task);
    void Emit(EventKind kind, const ConversionTask& task, std::optional<TaskStatus> previous);

    const Clock& clock_;
    IdGenerator& ids_;
    EventSink* sink_;
    TaskStore* store_;

    mutable std::shared_mutex index_mutex_;
    std::unordered_map<TaskId, std::shared_ptr<Entry>> index_;

    std::atomic<uint64_t> store_failures_{0};
};

}  // namespace convq
