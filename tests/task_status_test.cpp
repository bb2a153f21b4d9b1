// ============================================================================
// TaskStatus Tests
// ============================================================================

#include "convq/engine/task_status.hpp"

#include <gtest/gtest.h>

#include <array>

using namespace convq;

namespace {

constexpr std::array<TaskStatus, kTaskStatusCount> kAll{
    TaskStatus::Pending, TaskStatus::Converting, TaskStatus::Completed, TaskStatus::Failed, TaskStatus::Cancelled,
};

}  // namespace

TEST(TaskStatusTest, Names) {
    EXPECT_EQ(ToString(TaskStatus::Pending), "Pending");
    EXPECT_EQ(ToString(TaskStatus::Converting), "Converting");
    EXPECT_EQ(ToString(TaskStatus::Completed), "Completed");
    EXPECT_EQ(ToString(TaskStatus::Failed), "Failed");
    EXPECT_EQ(ToString(TaskStatus::Cancelled), "Cancelled");
}

TEST(TaskStatusTest, ParseRoundTrip) {
    for (auto status : kAll) {
        EXPECT_EQ(ParseTaskStatus(ToString(status)), status);
    }
    EXPECT_FALSE(ParseTaskStatus("pending").has_value());
    EXPECT_FALSE(ParseTaskStatus("Running").has_value());
}

TEST(TaskStatusTest, Terminality) {
    EXPECT_TRUE(IsActive(TaskStatus::Pending));
    EXPECT_TRUE(IsActive(TaskStatus::Converting));
    EXPECT_TRUE(IsTerminal(TaskStatus::Completed));
    EXPECT_TRUE(IsTerminal(TaskStatus::Failed));
    EXPECT_TRUE(IsTerminal(TaskStatus::Cancelled));
}

TEST(TaskStatusTest, AllowedTransitions) {
    EXPECT_TRUE(CanTransition(TaskStatus::Pending, TaskStatus::Converting));
    EXPECT_TRUE(CanTransition(TaskStatus::Pending, TaskStatus::Failed));
    EXPECT_TRUE(CanTransition(TaskStatus::Pending, TaskStatus::Cancelled));
    EXPECT_TRUE(CanTransition(TaskStatus::Converting, TaskStatus::Completed));
    EXPECT_TRUE(CanTransition(TaskStatus::Converting, TaskStatus::Failed));
    EXPECT_TRUE(CanTransition(TaskStatus::Converting, TaskStatus::Cancelled));
}

TEST(TaskStatusTest, RejectedTransitions) {
    EXPECT_FALSE(CanTransition(TaskStatus::Pending, TaskStatus::Completed));
    EXPECT_FALSE(CanTransition(TaskStatus::Converting, TaskStatus::Pending));

    for (auto status : kAll) {
        EXPECT_FALSE(CanTransition(status, status)) << ToString(status);
    }
}

TEST(TaskStatusTest, TerminalStatusesHaveNoExits) {
    for (auto from : kAll) {
        if (!IsTerminal(from)) continue;
        for (auto to : kAll) {
            EXPECT_FALSE(CanTransition(from, to)) << ToString(from) << " -> " << ToString(to);
        }
    }
}
