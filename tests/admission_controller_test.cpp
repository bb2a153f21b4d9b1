// ============================================================================
// AdmissionController Tests
// ============================================================================

#include "convq/engine/admission_controller.hpp"

#include "convq/engine/output_estimator.hpp"
#include "convq/engine/storage_probe.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace convq;

namespace {

constexpr int64_t kGigabyte = 1'000'000'000;

StartTaskRequest Request(std::string name, int64_t size, std::string codec = "libx265") {
    StartTaskRequest request;
    request.name = std::move(name);
    request.source_path = "/media/in/source.mkv";
    request.source_size_bytes = size;
    request.parameters.output_format = "mp4";
    request.parameters.video_codec = std::move(codec);
    return request;
}

SpaceBudget Budget(int64_t max) {
    SpaceBudget budget;
    budget.max_total_bytes = max;
    budget.reserved_bytes = 0;
    return budget;
}

}  // namespace

class AdmissionControllerTest : public ::testing::Test {
   protected:
    AdmissionControllerTest()
        : ids_("task"),
          accountant_(probe_, clock_, Budget(2 * kGigabyte)),
          registry_(clock_, ids_),
          admission_(accountant_, registry_, ids_) {
        EXPECT_FALSE(accountant_.Refresh());
    }

    ManualClock clock_;
    SequentialIdGenerator ids_;
    StaticStorageProbe probe_;
    SpaceAccountant accountant_;
    TaskRegistry registry_;
    AdmissionController admission_;
};

TEST_F(AdmissionControllerTest, AdmitReservesAndCreates) {
    auto admitted = admission_.Admit(Request("holiday", kGigabyte));

    ASSERT_TRUE(admitted.IsOk());
    const auto& task = admitted.Value().task;
    EXPECT_EQ(task.status, TaskStatus::Pending);
    EXPECT_EQ(task.source.size_bytes, kGigabyte);
    EXPECT_EQ(task.estimated_output_bytes, 510'000'000);
    EXPECT_EQ(task.reserved_bytes, 610'000'000);
    EXPECT_EQ(task.max_retries, 3);

    EXPECT_TRUE(admitted.Value().check.has_enough_space);
    EXPECT_EQ(admitted.Value().check.required_bytes, 610'000'000);
    EXPECT_EQ(accountant_.ReservationFor(task.id), 610'000'000);
    EXPECT_TRUE(registry_.Get(task.id).IsOk());
}

TEST_F(AdmissionControllerTest, InsufficientSpaceCreatesNothing) {
    // 2 GB of libx264: 1.428 GB output + 0.2 GB temp against 2 GB total,
    // after the first admission took 0.61 GB
    ASSERT_TRUE(admission_.Admit(Request("first", kGigabyte)).IsOk());

    auto rejected = admission_.Admit(Request("second", 2 * kGigabyte, "libx264"));
    ASSERT_TRUE(rejected.IsErr());
    EXPECT_EQ(rejected.Error().code, Errc::InsufficientSpace);
    ASSERT_TRUE(rejected.Error().space_check.has_value());
    EXPECT_FALSE(rejected.Error().space_check->has_enough_space);
    EXPECT_EQ(rejected.Error().space_check->details.pending_reservations, 610'000'000);

    EXPECT_EQ(registry_.Size(), 1u);
    EXPECT_EQ(accountant_.ReservationCount(), 1u);
}

TEST_F(AdmissionControllerTest, ValidationFailsBeforeReserving) {
    auto unnamed = admission_.Admit(Request("  ", kGigabyte));
    ASSERT_TRUE(unnamed.IsErr());
    EXPECT_EQ(unnamed.Error().code, Errc::ValidationError);

    auto empty = admission_.Admit(Request("clip", 0));
    ASSERT_TRUE(empty.IsErr());
    EXPECT_EQ(empty.Error().code, Errc::ValidationError);

    EXPECT_EQ(accountant_.ReservationCount(), 0u);
    EXPECT_EQ(registry_.Size(), 0u);
}

TEST_F(AdmissionControllerTest, OversizedSourceIsRejectedAndBudgetHolds) {
    auto absurd = admission_.Admit(Request("absurd", 5'000'000'000'000'000'000));
    ASSERT_TRUE(absurd.IsErr());
    EXPECT_EQ(absurd.Error().code, Errc::ValidationError);

    auto just_over = admission_.Admit(Request("just-over", kMaxSourceBytes + 1));
    ASSERT_TRUE(just_over.IsErr());
    EXPECT_EQ(just_over.Error().code, Errc::ValidationError);

    EXPECT_EQ(accountant_.ReservationCount(), 0u);
    EXPECT_EQ(accountant_.ReservedTotal(), 0);

    // The largest accepted source still has to fit the 2 GB budget
    auto largest = admission_.Admit(Request("largest", kMaxSourceBytes));
    ASSERT_TRUE(largest.IsErr());
    EXPECT_EQ(largest.Error().code, Errc::InsufficientSpace);

    auto big = admission_.Admit(Request("big", 100 * kGigabyte));
    ASSERT_TRUE(big.IsErr());
    EXPECT_EQ(big.Error().code, Errc::InsufficientSpace);
    EXPECT_EQ(registry_.Size(), 0u);
}

TEST_F(AdmissionControllerTest, RegistryRejectionRollsBackReservation) {
    auto too_long = admission_.Admit(Request(std::string(kMaxTaskNameLength + 1, 'x'), kGigabyte));

    ASSERT_TRUE(too_long.IsErr());
    EXPECT_EQ(too_long.Error().code, Errc::ValidationError);
    EXPECT_EQ(accountant_.ReservationCount(), 0u);
    EXPECT_EQ(accountant_.ReservedTotal(), 0);
}

TEST_F(AdmissionControllerTest, DisabledBudgetAdmitsAnything) {
    auto budget = Budget(1);
    budget.enabled = false;
    accountant_.SetBudget(budget);

    auto admitted = admission_.Admit(Request("huge", 100 * kGigabyte));
    ASSERT_TRUE(admitted.IsOk());
    EXPECT_EQ(admitted.Value().check.message, kSpaceLimitDisabledMessage);
}

TEST_F(AdmissionControllerTest, MaxRetriesFollowsConfiguration) {
    admission_.SetMaxRetries(7);

    auto admitted = admission_.Admit(Request("clip", kGigabyte));
    ASSERT_TRUE(admitted.IsOk());
    EXPECT_EQ(admitted.Value().task.max_retries, 7);
}

// Three requests that each fit alone; only three of 0.61 GB fit in 2 GB
TEST_F(AdmissionControllerTest, ConcurrentAdmissionsNeverOvercommit) {
    constexpr int kThreads = 8;
    std::atomic<int> admitted{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i]() {
            auto result = admission_.Admit(Request("clip-" + std::to_string(i), kGigabyte));
            if (result.IsOk()) {
                admitted.fetch_add(1);
            } else if (result.Error().code == Errc::InsufficientSpace) {
                rejected.fetch_add(1);
            }
        });
    }
    for (auto& thread : threads) thread.join();

    EXPECT_EQ(admitted.load(), 3);
    EXPECT_EQ(rejected.load(), kThreads - 3);
    EXPECT_EQ(registry_.Size(), 3u);
    EXPECT_EQ(accountant_.ReservedTotal(), 3 * 610'000'000LL);
}
