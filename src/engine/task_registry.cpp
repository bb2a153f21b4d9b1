// ============================================================================
// convq/engine/task_registry.cpp - Authoritative Task State
// ============================================================================

#include "convq/engine/task_registry.hpp"

#include "convq/core/logging.hpp"

#include <algorithm>
#include <string_view>
#include <utility>

namespace convq {

namespace {

constexpr const char* kComponent = "registry";

std::string Trim(std::string_view text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) return {};
    auto end = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(begin, end - begin + 1));
}

// Oldest first; ids break ties so equal timestamps still list stably
bool CreatedBefore(const ConversionTask& a, const ConversionTask& b) {
    if (a.created_at != b.created_at) return a.created_at < b.created_at;
    return a.id < b.id;
}

bool FinishedAfter(const ConversionTask& a, const ConversionTask& b) {
    auto a_done = a.completed_at.value_or(SystemTime{});
    auto b_done = b.completed_at.value_or(SystemTime{});
    if (a_done != b_done) return a_done > b_done;
    return a.id < b.id;
}

}  // namespace

TaskRegistry::TaskRegistry(const Clock& clock, IdGenerator& ids, EventSink* sink, TaskStore* store)
    : clock_(clock), ids_(ids), sink_(sink), store_(store) {}

// ============================================================================
// Transitions
// ============================================================================

EngineResult<ConversionTask> TaskRegistry::Create(NewTask request) {
    std::string name = Trim(request.name);
    if (name.empty()) {
        return Err(EngineError::Validation("task name must not be empty"));
    }
    if (name.size() > kMaxTaskNameLength) {
        return Err(EngineError::Validation("task name exceeds " + std::to_string(kMaxTaskNameLength) + " characters"));
    }
    if (request.source.size_bytes <= 0) {
        return Err(EngineError::Validation("source size must be positive"));
    }
    if (request.max_retries < 0) {
        return Err(EngineError::Validation("max retries must not be negative"));
    }
    if (request.id && request.id->empty()) {
        return Err(EngineError::Validation("task id must not be empty"));
    }

    auto entry = std::make_shared<Entry>();
    ConversionTask& task = entry->task;
    task.id = request.id ? std::move(*request.id) : ids_.Next();
    task.name = std::move(name);
    task.owner = std::move(request.owner);
    task.source = std::move(request.source);
    task.parameters = std::move(request.parameters);
    task.status = TaskStatus::Pending;
    task.progress = kMinProgress;
    task.created_at = clock_.Now();
    task.max_retries = request.max_retries;
    task.estimated_output_bytes = request.estimated_output_bytes;
    task.reserved_bytes = request.reserved_bytes;

    // Hold the entry before it becomes visible so no other operation on this
    // id can run, or emit, ahead of Created.
    std::lock_guard<std::mutex> entry_lock(entry->mutex);
    {
        std::unique_lock<std::shared_mutex> index_lock(index_mutex_);
        if (!index_.try_emplace(task.id, entry).second) {
            return Err(EngineError::Conflict("task '" + task.id + "' already exists"));
        }
    }

    Persist(task);
    Emit(EventKind::Created, task, std::nullopt);
    CONVQ_LOG_INFO(kComponent, "task " << task.id << " created (" << task.name << ")");
    return Ok(task);
}

EngineResult<ConversionTask> TaskRegistry::Start(const TaskId& id) {
    return Mutate(id, [this](ConversionTask& task) -> MutationOutcome {
        if (!CanTransition(task.status, TaskStatus::Converting)) {
            return Err(EngineError::InvalidTransition(task.status, TaskStatus::Converting));
        }
        task.status = TaskStatus::Converting;
        task.progress = kMinProgress;
        task.started_at = clock_.Now();
        task.speed.reset();
        task.eta.reset();
        task.error_message.reset();
        return Ok(EventKind::StatusChanged);
    });
}

EngineResult<ConversionTask> TaskRegistry::UpdateProgress(const TaskId& id, int progress, std::optional<double> speed,
                                                          std::optional<std::chrono::seconds> eta) {
    return Mutate(id, [&](ConversionTask& task) -> MutationOutcome {
        if (task.status != TaskStatus::Converting) {
            return Err(EngineError::InvalidTransition(task.status, TaskStatus::Converting));
        }
        if (progress < kMinProgress || progress > kMaxProgress) {
            return Err(EngineError::OutOfRange("progress " + std::to_string(progress) + " outside [0, 100]"));
        }
        task.progress = progress;
        task.speed = speed;
        task.eta = eta;
        return Ok(EventKind::ProgressUpdated);
    });
}

EngineResult<ConversionTask> TaskRegistry::Complete(const TaskId& id) {
    return Mutate(id, [this](ConversionTask& task) -> MutationOutcome {
        if (!CanTransition(task.status, TaskStatus::Completed)) {
            return Err(EngineError::InvalidTransition(task.status, TaskStatus::Completed));
        }
        task.status = TaskStatus::Completed;
        task.progress = kMaxProgress;
        task.completed_at = clock_.Now();
        task.eta.reset();
        return Ok(EventKind::Completed);
    });
}

EngineResult<ConversionTask> TaskRegistry::Fail(const TaskId& id, std::string message) {
    return Mutate(id, [&](ConversionTask& task) -> MutationOutcome {
        if (!CanTransition(task.status, TaskStatus::Failed)) {
            return Err(EngineError::InvalidTransition(task.status, TaskStatus::Failed));
        }
        task.status = TaskStatus::Failed;
        task.completed_at = clock_.Now();
        task.error_message = std::move(message);
        task.eta.reset();
        ++task.retry_count;
        return Ok(EventKind::StatusChanged);
    });
}

EngineResult<ConversionTask> TaskRegistry::Cancel(const TaskId& id) {
    return Mutate(id, [this](ConversionTask& task) -> MutationOutcome {
        if (!CanTransition(task.status, TaskStatus::Cancelled)) {
            return Err(EngineError::InvalidTransition(task.status, TaskStatus::Cancelled));
        }
        task.status = TaskStatus::Cancelled;
        task.completed_at = clock_.Now();
        task.eta.reset();
        return Ok(EventKind::StatusChanged);
    });
}

Result<void, EngineError> TaskRegistry::Delete(const TaskId& id) {
    auto entry = Find(id);
    if (!entry) {
        return Err(EngineError::NotFound("task", id));
    }

    std::lock_guard<std::mutex> entry_lock(entry->mutex);
    if (entry->erased) {
        return Err(EngineError::NotFound("task", id));
    }
    entry->erased = true;
    {
        std::unique_lock<std::shared_mutex> index_lock(index_mutex_);
        index_.erase(id);
    }

    if (store_) {
        auto erased = store_->Erase(id);
        if (erased.IsErr()) {
            store_failures_.fetch_add(1);
            CONVQ_LOG_ERROR(kComponent, "failed to erase task " << id << ": " << erased.Error().message());
        }
    }

    Emit(EventKind::Deleted, entry->task, std::nullopt);
    CONVQ_LOG_INFO(kComponent, "task " << id << " deleted");
    return Ok();
}

template <typename Mutator>
EngineResult<ConversionTask> TaskRegistry::Mutate(const TaskId& id, Mutator&& mutate) {
    auto entry = Find(id);
    if (!entry) {
        return Err(EngineError::NotFound("task", id));
    }

    std::lock_guard<std::mutex> entry_lock(entry->mutex);
    if (entry->erased) {
        return Err(EngineError::NotFound("task", id));
    }

    // Work on a copy so a rejected request leaves the task untouched
    ConversionTask updated = entry->task;
    MutationOutcome outcome = mutate(updated);
    if (outcome.IsErr()) {
        CONVQ_LOG_DEBUG(kComponent, "task " << id << ": " << outcome.Error().message);
        return Err(std::move(outcome).Error());
    }

    TaskStatus previous = entry->task.status;
    entry->task = updated;
    Persist(updated);

    EventKind kind = outcome.Value();
    if (kind == EventKind::ProgressUpdated) {
        Emit(kind, updated, std::nullopt);
        CONVQ_LOG_TRACE(kComponent, "task " << id << " progress " << updated.progress);
    } else {
        Emit(kind, updated, previous);
        CONVQ_LOG_INFO(kComponent, "task " << id << " " << ToString(previous) << " -> " << ToString(updated.status));
    }
    return Ok(std::move(updated));
}

// ============================================================================
// Queries
// ============================================================================

EngineResult<ConversionTask> TaskRegistry::Get(const TaskId& id) const {
    auto entry = Find(id);
    if (!entry) {
        return Err(EngineError::NotFound("task", id));
    }
    std::lock_guard<std::mutex> entry_lock(entry->mutex);
    if (entry->erased) {
        return Err(EngineError::NotFound("task", id));
    }
    return Ok(entry->task);
}

std::vector<ConversionTask> TaskRegistry::List() const {
    std::vector<ConversionTask> tasks;
    for (const auto& entry : Entries()) {
        std::lock_guard<std::mutex> entry_lock(entry->mutex);
        if (!entry->erased) {
            tasks.push_back(entry->task);
        }
    }
    std::sort(tasks.begin(), tasks.end(), CreatedBefore);
    return tasks;
}

std::vector<ConversionTask> TaskRegistry::ListActive() const {
    auto tasks = List();
    tasks.erase(std::remove_if(tasks.begin(), tasks.end(),
                               [](const ConversionTask& task) { return !IsActive(task.status); }),
                tasks.end());
    return tasks;
}

EngineResult<std::vector<ConversionTask>> TaskRegistry::ListCompleted(int page, int page_size) const {
    if (page < 1) {
        return Err(EngineError::Validation("page must be at least 1"));
    }
    if (page_size < 1 || page_size > kMaxPageSize) {
        return Err(EngineError::Validation("page size must be between 1 and " + std::to_string(kMaxPageSize)));
    }

    auto tasks = List();
    tasks.erase(std::remove_if(tasks.begin(), tasks.end(),
                               [](const ConversionTask& task) { return !IsTerminal(task.status); }),
                tasks.end());
    std::sort(tasks.begin(), tasks.end(), FinishedAfter);

    size_t offset = static_cast<size_t>(page - 1) * static_cast<size_t>(page_size);
    if (offset >= tasks.size()) {
        return Ok(std::vector<ConversionTask>{});
    }
    size_t end = std::min(tasks.size(), offset + static_cast<size_t>(page_size));
    return Ok(std::vector<ConversionTask>(std::make_move_iterator(tasks.begin() + static_cast<std::ptrdiff_t>(offset)),
                                          std::make_move_iterator(tasks.begin() + static_cast<std::ptrdiff_t>(end))));
}

RegistryStats TaskRegistry::Statistics() const {
    RegistryStats stats;
    for (const auto& entry : Entries()) {
        std::lock_guard<std::mutex> entry_lock(entry->mutex);
        if (entry->erased) continue;
        ++stats.total;
        switch (entry->task.status) {
            case TaskStatus::Pending:
                ++stats.pending;
                break;
            case TaskStatus::Converting:
                ++stats.converting;
                break;
            case TaskStatus::Completed:
                ++stats.completed;
                break;
            case TaskStatus::Failed:
                ++stats.failed;
                break;
            case TaskStatus::Cancelled:
                ++stats.cancelled;
                break;
        }
    }
    stats.store_failures = store_failures_.load();
    return stats;
}

size_t TaskRegistry::Size() const {
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    return index_.size();
}

// ============================================================================
// Startup
// ============================================================================

Result<std::vector<ConversionTask>, std::error_code> TaskRegistry::Recover() {
    if (!store_) {
        return Ok(std::vector<ConversionTask>{});
    }

    auto loaded = store_->LoadAll();
    if (loaded.IsErr()) {
        CONVQ_LOG_ERROR(kComponent, "failed to load task records: " << loaded.Error().message());
        return Err(loaded.Error());
    }

    std::vector<ConversionTask> recovered;
    size_t interrupted = 0;
    for (auto& record : loaded.Value()) {
        auto entry = std::make_shared<Entry>();
        std::optional<TaskStatus> previous;
        if (record.status == TaskStatus::Converting) {
            previous = record.status;
            record.status = TaskStatus::Failed;
            record.error_message = kInterruptedMessage;
            record.completed_at = clock_.Now();
            record.eta.reset();
            ++record.retry_count;
        }
        entry->task = record;

        std::lock_guard<std::mutex> entry_lock(entry->mutex);
        {
            std::unique_lock<std::shared_mutex> index_lock(index_mutex_);
            if (!index_.try_emplace(record.id, entry).second) {
                CONVQ_LOG_WARN(kComponent, "skipping stored task " << record.id << ": id already registered");
                continue;
            }
        }

        if (previous) {
            ++interrupted;
            Persist(record);
            Emit(EventKind::StatusChanged, record, previous);
        }
        recovered.push_back(std::move(record));
    }

    std::sort(recovered.begin(), recovered.end(), CreatedBefore);
    CONVQ_LOG_INFO(kComponent, "recovered " << recovered.size() << " tasks, " << interrupted << " interrupted");
    return Ok(std::move(recovered));
}

// ============================================================================
// Internals
// ============================================================================

std::shared_ptr<TaskRegistry::Entry> TaskRegistry::Find(const TaskId& id) const {
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    auto it = index_.find(id);
    if (it == index_.end()) return nullptr;
    return it->second;
}

std::vector<std::shared_ptr<TaskRegistry::Entry>> TaskRegistry::Entries() const {
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    std::vector<std::shared_ptr<Entry>> entries;
    entries.reserve(index_.size());
    for (const auto& [id, entry] : index_) {
        entries.push_back(entry);
    }
    return entries;
}

void TaskRegistry::Persist(const ConversionTask& task) {
    if (!store_) return;
    auto written = store_->Put(task);
    if (written.IsErr()) {
        store_failures_.fetch_add(1);
        CONVQ_LOG_ERROR(kComponent, "failed to persist task " << task.id << ": " << written.Error().message());
    }
}

void TaskRegistry::Emit(EventKind kind, const ConversionTask& task, std::optional<TaskStatus> previous) {
    if (!sink_) return;
    sink_->OnEvent(MakeTaskEvent(kind, task, clock_.Now(), previous));
}

}  // namespace convq
