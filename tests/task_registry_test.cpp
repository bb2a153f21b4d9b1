// ============================================================================
// TaskRegistry Tests
// ============================================================================

#include "convq/engine/task_registry.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace convq;
using namespace std::chrono_literals;

namespace {

class RecordingSink : public EventSink {
   public:
    void OnEvent(const EventPtr& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    std::vector<EventPtr> Events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    std::vector<EventKind> Kinds() const {
        std::vector<EventKind> kinds;
        for (const auto& event : Events()) kinds.push_back(event->kind);
        return kinds;
    }

    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.clear();
    }

   private:
    mutable std::mutex mutex_;
    std::vector<EventPtr> events_;
};

NewTask Request(std::string name, int64_t size = 1000) {
    NewTask request;
    request.name = std::move(name);
    request.source = SourceDescriptor{"/media/in/" + request.name + ".mkv", size};
    request.parameters.output_format = "mp4";
    request.parameters.video_codec = "libx265";
    return request;
}

}  // namespace

class TaskRegistryTest : public ::testing::Test {
   protected:
    TaskRegistryTest() : ids_("task"), registry_(clock_, ids_, &sink_, &store_) {}

    TaskId CreateTask(std::string name = "clip") {
        auto created = registry_.Create(Request(std::move(name)));
        EXPECT_TRUE(created.IsOk());
        return created.Value().id;
    }

    TaskId ConvertingTask(std::string name = "clip") {
        auto id = CreateTask(std::move(name));
        EXPECT_TRUE(registry_.Start(id).IsOk());
        return id;
    }

    ManualClock clock_;
    SequentialIdGenerator ids_;
    RecordingSink sink_;
    MemoryTaskStore store_;
    TaskRegistry registry_;
};

// ============================================================================
// Create
// ============================================================================

TEST_F(TaskRegistryTest, CreateStartsPending) {
    auto created = registry_.Create(Request("  holiday  "));

    ASSERT_TRUE(created.IsOk());
    const auto& task = created.Value();
    EXPECT_EQ(task.id, "task-1");
    EXPECT_EQ(task.name, "holiday");
    EXPECT_EQ(task.status, TaskStatus::Pending);
    EXPECT_EQ(task.progress, 0);
    EXPECT_EQ(task.created_at, clock_.Now());
    EXPECT_FALSE(task.started_at.has_value());

    ASSERT_EQ(sink_.Kinds(), std::vector<EventKind>{EventKind::Created});
    EXPECT_TRUE(store_.Find("task-1").has_value());
}

TEST_F(TaskRegistryTest, CreateValidatesInput) {
    auto empty = registry_.Create(Request("   "));
    ASSERT_TRUE(empty.IsErr());
    EXPECT_EQ(empty.Error().code, Errc::ValidationError);

    auto long_name = registry_.Create(Request(std::string(kMaxTaskNameLength + 1, 'n')));
    ASSERT_TRUE(long_name.IsErr());
    EXPECT_EQ(long_name.Error().code, Errc::ValidationError);

    auto no_source = registry_.Create(Request("clip", 0));
    ASSERT_TRUE(no_source.IsErr());
    EXPECT_EQ(no_source.Error().code, Errc::ValidationError);

    EXPECT_EQ(registry_.Size(), 0u);
    EXPECT_TRUE(sink_.Events().empty());
}

TEST_F(TaskRegistryTest, NameAtMaximumLengthAccepted) {
    EXPECT_TRUE(registry_.Create(Request(std::string(kMaxTaskNameLength, 'n'))).IsOk());
}

TEST_F(TaskRegistryTest, PreassignedIdConflict) {
    auto request = Request("clip");
    request.id = "fixed";
    ASSERT_TRUE(registry_.Create(request).IsOk());

    auto again = registry_.Create(request);
    ASSERT_TRUE(again.IsErr());
    EXPECT_EQ(again.Error().code, Errc::Conflict);
    EXPECT_EQ(sink_.Events().size(), 1u);
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(TaskRegistryTest, HappyPath) {
    auto id = CreateTask();
    clock_.Advance(1s);

    auto started = registry_.Start(id);
    ASSERT_TRUE(started.IsOk());
    EXPECT_EQ(started.Value().status, TaskStatus::Converting);
    EXPECT_EQ(started.Value().started_at, clock_.Now());

    auto progressed = registry_.UpdateProgress(id, 40, 1.5, 90s);
    ASSERT_TRUE(progressed.IsOk());
    EXPECT_EQ(progressed.Value().progress, 40);
    EXPECT_EQ(progressed.Value().speed, 1.5);
    EXPECT_EQ(progressed.Value().eta, 90s);

    clock_.Advance(1s);
    auto completed = registry_.Complete(id);
    ASSERT_TRUE(completed.IsOk());
    EXPECT_EQ(completed.Value().status, TaskStatus::Completed);
    EXPECT_EQ(completed.Value().progress, 100);
    EXPECT_EQ(completed.Value().completed_at, clock_.Now());
    EXPECT_FALSE(completed.Value().eta.has_value());

    EXPECT_EQ(sink_.Kinds(), (std::vector<EventKind>{EventKind::Created, EventKind::StatusChanged,
                                                     EventKind::ProgressUpdated, EventKind::Completed}));
}

TEST_F(TaskRegistryTest, StatusChangedCarriesPreviousStatus) {
    auto id = CreateTask();
    sink_.Clear();
    ASSERT_TRUE(registry_.Start(id).IsOk());

    auto events = sink_.Events();
    ASSERT_EQ(events.size(), 1u);
    const auto& payload = std::get<TaskEvent>(events[0]->payload);
    EXPECT_EQ(payload.previous_status, TaskStatus::Pending);
    EXPECT_EQ(payload.task.status, TaskStatus::Converting);
}

TEST_F(TaskRegistryTest, CompleteFromPendingIsInvalid) {
    auto id = CreateTask();
    sink_.Clear();

    auto result = registry_.Complete(id);
    ASSERT_TRUE(result.IsErr());
    EXPECT_EQ(result.Error().code, Errc::InvalidTransition);
    ASSERT_TRUE(result.Error().transition.has_value());
    EXPECT_EQ(result.Error().transition->current, TaskStatus::Pending);
    EXPECT_EQ(result.Error().transition->requested, TaskStatus::Completed);

    EXPECT_EQ(registry_.Get(id).Value().status, TaskStatus::Pending);
    EXPECT_TRUE(sink_.Events().empty());
}

TEST_F(TaskRegistryTest, ProgressRequiresConverting) {
    auto id = CreateTask();

    auto result = registry_.UpdateProgress(id, 10);
    ASSERT_TRUE(result.IsErr());
    EXPECT_EQ(result.Error().code, Errc::InvalidTransition);
}

TEST_F(TaskRegistryTest, ProgressOutOfRangeChangesNothing) {
    auto id = ConvertingTask();
    ASSERT_TRUE(registry_.UpdateProgress(id, 30).IsOk());
    sink_.Clear();

    auto over = registry_.UpdateProgress(id, 101);
    ASSERT_TRUE(over.IsErr());
    EXPECT_EQ(over.Error().code, Errc::OutOfRange);

    auto under = registry_.UpdateProgress(id, -1);
    ASSERT_TRUE(under.IsErr());
    EXPECT_EQ(under.Error().code, Errc::OutOfRange);

    EXPECT_EQ(registry_.Get(id).Value().progress, 30);
    EXPECT_TRUE(sink_.Events().empty());
}

TEST_F(TaskRegistryTest, ProgressMayGoBackwards) {
    auto id = ConvertingTask();
    ASSERT_TRUE(registry_.UpdateProgress(id, 60).IsOk());

    auto result = registry_.UpdateProgress(id, 20);
    ASSERT_TRUE(result.IsOk());
    EXPECT_EQ(result.Value().progress, 20);
}

TEST_F(TaskRegistryTest, FailRecordsMessage) {
    auto id = ConvertingTask();

    auto failed = registry_.Fail(id, "encoder crashed");
    ASSERT_TRUE(failed.IsOk());
    EXPECT_EQ(failed.Value().status, TaskStatus::Failed);
    EXPECT_EQ(failed.Value().error_message, "encoder crashed");
    EXPECT_EQ(failed.Value().retry_count, 1);
    EXPECT_TRUE(failed.Value().completed_at.has_value());
}

TEST_F(TaskRegistryTest, PendingTaskCanFailOrCancel) {
    auto a = CreateTask("a");
    auto b = CreateTask("b");

    EXPECT_TRUE(registry_.Fail(a, "source missing").IsOk());
    EXPECT_TRUE(registry_.Cancel(b).IsOk());
}

TEST_F(TaskRegistryTest, TerminalTasksRejectEverything) {
    auto id = ConvertingTask();
    ASSERT_TRUE(registry_.Cancel(id).IsOk());
    sink_.Clear();

    EXPECT_EQ(registry_.Start(id).Error().code, Errc::InvalidTransition);
    EXPECT_EQ(registry_.UpdateProgress(id, 50).Error().code, Errc::InvalidTransition);
    EXPECT_EQ(registry_.Complete(id).Error().code, Errc::InvalidTransition);
    EXPECT_EQ(registry_.Fail(id, "late").Error().code, Errc::InvalidTransition);
    EXPECT_EQ(registry_.Cancel(id).Error().code, Errc::InvalidTransition);

    EXPECT_EQ(registry_.Get(id).Value().status, TaskStatus::Cancelled);
    EXPECT_TRUE(sink_.Events().empty());
}

TEST_F(TaskRegistryTest, UnknownIdIsNotFound) {
    EXPECT_EQ(registry_.Get("missing").Error().code, Errc::NotFound);
    EXPECT_EQ(registry_.Start("missing").Error().code, Errc::NotFound);
    EXPECT_EQ(registry_.Cancel("missing").Error().code, Errc::NotFound);
    EXPECT_EQ(registry_.Delete("missing").Error().code, Errc::NotFound);
}

// ============================================================================
// Delete
// ============================================================================

TEST_F(TaskRegistryTest, DeleteInAnyStatus) {
    auto id = ConvertingTask();
    sink_.Clear();

    ASSERT_TRUE(registry_.Delete(id).IsOk());

    EXPECT_EQ(registry_.Get(id).Error().code, Errc::NotFound);
    EXPECT_FALSE(store_.Find(id).has_value());
    auto events = sink_.Events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0]->kind, EventKind::Deleted);
    EXPECT_EQ(events[0]->TaskSnapshot()->status, TaskStatus::Converting);

    EXPECT_EQ(registry_.Delete(id).Error().code, Errc::NotFound);
}

// ============================================================================
// Queries
// ============================================================================

TEST_F(TaskRegistryTest, ListActiveOldestFirst) {
    auto first = CreateTask("first");
    clock_.Advance(1s);
    auto second = ConvertingTask("second");
    clock_.Advance(1s);
    auto done = ConvertingTask("done");
    ASSERT_TRUE(registry_.Complete(done).IsOk());

    auto active = registry_.ListActive();
    ASSERT_EQ(active.size(), 2u);
    EXPECT_EQ(active[0].id, first);
    EXPECT_EQ(active[1].id, second);
}

TEST_F(TaskRegistryTest, ListCompletedNewestFirstWithPaging) {
    std::vector<TaskId> finished;
    for (int i = 0; i < 5; ++i) {
        auto id = ConvertingTask("t" + std::to_string(i));
        clock_.Advance(1s);
        ASSERT_TRUE(registry_.Complete(id).IsOk());
        finished.push_back(id);
    }
    CreateTask("still-pending");

    auto page1 = registry_.ListCompleted(1, 2);
    ASSERT_TRUE(page1.IsOk());
    ASSERT_EQ(page1.Value().size(), 2u);
    EXPECT_EQ(page1.Value()[0].id, finished[4]);
    EXPECT_EQ(page1.Value()[1].id, finished[3]);

    auto page3 = registry_.ListCompleted(3, 2);
    ASSERT_EQ(page3.Value().size(), 1u);
    EXPECT_EQ(page3.Value()[0].id, finished[0]);

    EXPECT_TRUE(registry_.ListCompleted(4, 2).Value().empty());
}

TEST_F(TaskRegistryTest, ListCompletedValidatesPaging) {
    EXPECT_EQ(registry_.ListCompleted(0, 10).Error().code, Errc::ValidationError);
    EXPECT_EQ(registry_.ListCompleted(1, 0).Error().code, Errc::ValidationError);
    EXPECT_EQ(registry_.ListCompleted(1, kMaxPageSize + 1).Error().code, Errc::ValidationError);
    EXPECT_TRUE(registry_.ListCompleted(1, kMaxPageSize).IsOk());
}

TEST_F(TaskRegistryTest, Statistics) {
    CreateTask("pending");
    ConvertingTask("converting");
    auto failed = ConvertingTask("failed");
    ASSERT_TRUE(registry_.Fail(failed, "boom").IsOk());

    auto stats = registry_.Statistics();
    EXPECT_EQ(stats.total, 3u);
    EXPECT_EQ(stats.pending, 1u);
    EXPECT_EQ(stats.converting, 1u);
    EXPECT_EQ(stats.failed, 1u);
    EXPECT_EQ(stats.completed, 0u);
}

// ============================================================================
// Persistence
// ============================================================================

TEST_F(TaskRegistryTest, StoreFailureDoesNotFailTheTransition) {
    auto id = ConvertingTask();
    store_.SetFailWrites(true);

    auto result = registry_.UpdateProgress(id, 70);
    ASSERT_TRUE(result.IsOk());
    EXPECT_EQ(registry_.Get(id).Value().progress, 70);
    EXPECT_EQ(store_.Find(id)->progress, 0);
    EXPECT_EQ(registry_.Statistics().store_failures, 1u);
}

TEST_F(TaskRegistryTest, RecoverFailsInterruptedConversions) {
    auto pending = CreateTask("pending");
    auto converting = ConvertingTask("converting");
    auto done = ConvertingTask("done");
    ASSERT_TRUE(registry_.Complete(done).IsOk());

    ManualClock clock;
    SequentialIdGenerator ids("restart");
    RecordingSink sink;
    TaskRegistry restarted(clock, ids, &sink, &store_);

    auto recovered = restarted.Recover();
    ASSERT_TRUE(recovered.IsOk());
    EXPECT_EQ(recovered.Value().size(), 3u);
    EXPECT_EQ(restarted.Size(), 3u);

    EXPECT_EQ(restarted.Get(pending).Value().status, TaskStatus::Pending);
    EXPECT_EQ(restarted.Get(done).Value().status, TaskStatus::Completed);

    auto interrupted = restarted.Get(converting).Value();
    EXPECT_EQ(interrupted.status, TaskStatus::Failed);
    EXPECT_EQ(interrupted.error_message, kInterruptedMessage);
    EXPECT_EQ(store_.Find(converting)->status, TaskStatus::Failed);

    ASSERT_EQ(sink.Kinds(), std::vector<EventKind>{EventKind::StatusChanged});
    EXPECT_EQ(std::get<TaskEvent>(sink.Events()[0]->payload).previous_status, TaskStatus::Converting);
}

TEST_F(TaskRegistryTest, RecoverWithoutStoreIsEmpty) {
    TaskRegistry bare(clock_, ids_);

    auto recovered = bare.Recover();
    ASSERT_TRUE(recovered.IsOk());
    EXPECT_TRUE(recovered.Value().empty());
}

// ============================================================================
// Concurrency
// ============================================================================

// Events for one task come out in the order its mutations were applied
TEST_F(TaskRegistryTest, ConcurrentProgressKeepsPerTaskEventOrder) {
    constexpr int kTasks = 4;
    constexpr int kUpdates = 100;
    std::vector<TaskId> ids;
    for (int i = 0; i < kTasks; ++i) ids.push_back(ConvertingTask("t" + std::to_string(i)));
    sink_.Clear();

    std::vector<std::thread> threads;
    for (int i = 0; i < kTasks; ++i) {
        threads.emplace_back([&, i]() {
            for (int p = 1; p <= kUpdates; ++p) {
                EXPECT_TRUE(registry_.UpdateProgress(ids[i], p % 101).IsOk());
            }
        });
    }
    for (auto& thread : threads) thread.join();

    std::vector<int> last(kTasks, 0);
    for (const auto& event : sink_.Events()) {
        const auto* task = event->TaskSnapshot();
        for (int i = 0; i < kTasks; ++i) {
            if (task->id != ids[i]) continue;
            EXPECT_EQ(task->progress, last[i] + 1);
            last[i] = task->progress;
        }
    }
    for (int i = 0; i < kTasks; ++i) EXPECT_EQ(last[i], kUpdates);
}

TEST_F(TaskRegistryTest, ConcurrentTerminalTransitionsHaveOneWinner) {
    auto id = ConvertingTask();
    sink_.Clear();
    std::atomic<int> winners{0};

    std::thread complete([&]() {
        if (registry_.Complete(id).IsOk()) winners.fetch_add(1);
    });
    std::thread cancel([&]() {
        if (registry_.Cancel(id).IsOk()) winners.fetch_add(1);
    });
    std::thread fail([&]() {
        if (registry_.Fail(id, "boom").IsOk()) winners.fetch_add(1);
    });
    complete.join();
    cancel.join();
    fail.join();

    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(sink_.Events().size(), 1u);
    EXPECT_TRUE(IsTerminal(registry_.Get(id).Value().status));
}
