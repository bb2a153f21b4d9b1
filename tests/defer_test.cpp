// ============================================================================
// Defer Tests
// ============================================================================

#include "convq/core/defer.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace convq;

// ============================================================================
// Basic Defer Tests
// ============================================================================

TEST(DeferTest, RunsOnScopeExit) {
    bool executed = false;
    {
        Defer d([&] { executed = true; });
        EXPECT_FALSE(executed);
    }
    EXPECT_TRUE(executed);
}

TEST(DeferTest, RunsInReverseOrder) {
    std::string order;
    {
        Defer d1([&] { order += "1"; });
        Defer d2([&] { order += "2"; });
        Defer d3([&] { order += "3"; });
    }
    EXPECT_EQ(order, "321");
}

TEST(DeferTest, Cancel) {
    bool executed = false;
    {
        Defer d([&] { executed = true; });
        d.Cancel();
    }
    EXPECT_FALSE(executed);
}

TEST(DeferTest, MoveRunsOnce) {
    int count = 0;
    {
        Defer d1([&] { ++count; });
        Defer d2(std::move(d1));
    }
    EXPECT_EQ(count, 1);
}

TEST(DeferTest, Macro) {
    bool executed = false;
    {
        CONVQ_DEFER([&] { executed = true; });
        EXPECT_FALSE(executed);
    }
    EXPECT_TRUE(executed);
}

// ============================================================================
// Compensating Actions
// ============================================================================

namespace {

// Reserve, then undo the reservation unless every later step succeeds
bool ReserveThenCreate(int& reserved, bool create_succeeds) {
    reserved += 100;
    Defer release([&] { reserved -= 100; });
    if (!create_succeeds) {
        return false;
    }
    release.Cancel();
    return true;
}

}  // namespace

TEST(DeferTest, CompensatesOnEarlyReturn) {
    int reserved = 0;

    EXPECT_FALSE(ReserveThenCreate(reserved, false));
    EXPECT_EQ(reserved, 0);

    EXPECT_TRUE(ReserveThenCreate(reserved, true));
    EXPECT_EQ(reserved, 100);
}
