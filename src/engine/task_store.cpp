// ============================================================================
// convq/engine/task_store.cpp - In-Memory Task Store
// ============================================================================

#include "convq/engine/task_store.hpp"

#include "convq/core/error.hpp"

namespace convq {

Result<void, std::error_code> MemoryTaskStore::Put(const ConversionTask& task) {
    if (fail_writes_.load()) return Err(make_error_code(Errc::StorageUnavailable));
    std::lock_guard<std::mutex> lock(mutex_);
    records_.insert_or_assign(task.id, task);
    return Ok();
}

Result<void, std::error_code> MemoryTaskStore::Erase(const TaskId& id) {
    if (fail_writes_.load()) return Err(make_error_code(Errc::StorageUnavailable));
    std::lock_guard<std::mutex> lock(mutex_);
    records_.erase(id);
    return Ok();
}

Result<std::vector<ConversionTask>, std::error_code> MemoryTaskStore::LoadAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ConversionTask> tasks;
    tasks.reserve(records_.size());
    for (const auto& [id, task] : records_) {
        tasks.push_back(task);
    }
    return Ok(std::move(tasks));
}

std::optional<ConversionTask> MemoryTaskStore::Find(const TaskId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

size_t MemoryTaskStore::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

}  // namespace convq
