// ============================================================================
// convq/engine/task_store.hpp - Task Record Persistence Boundary
// ============================================================================
//
// TaskStore is where TaskRegistry writes through every successful mutation
// and what it reloads from on startup. Storage drivers live outside the
// engine; MemoryTaskStore is the in-process implementation used by tests,
// examples and deployments that do not need durability.
//
// ============================================================================

#pragma once

#include "convq/core/result.hpp"
#include "convq/engine/conversion_task.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <system_error>
#include <vector>

namespace convq {

class TaskStore {
   public:
    virtual ~TaskStore() = default;

    virtual Result<void, std::error_code> Put(const ConversionTask& task) = 0;
    virtual Result<void, std::error_code> Erase(const TaskId& id) = 0;
    virtual Result<std::vector<ConversionTask>, std::error_code> LoadAll() = 0;
};

class MemoryTaskStore : public TaskStore {
   public:
    Result<void, std::error_code> Put(const ConversionTask& task) override;
    Result<void, std::error_code> Erase(const TaskId& id) override;
    Result<std::vector<ConversionTask>, std::error_code> LoadAll() override;

    [[nodiscard]] std::optional<ConversionTask> Find(const TaskId& id) const;
    [[nodiscard]] size_t Size() const;

    // While set, every write fails with Errc::StorageUnavailable
    void SetFailWrites(bool fail) { fail_writes_.store(fail); }

   private:
    mutable std::mutex mutex_;
    std::map<TaskId, ConversionTask> records_;
    std::atomic<bool> fail_writes_{false};
};

}  // namespace convq
