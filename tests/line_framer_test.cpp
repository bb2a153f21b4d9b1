// ============================================================================
// LineFramer Tests
// ============================================================================

#include "convq/net/line_framer.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace convq;

namespace {

std::vector<std::string> DrainFrames(LineFramer& framer) {
    std::vector<std::string> frames;
    while (true) {
        auto next = framer.NextFrame();
        EXPECT_TRUE(next.IsOk());
        if (next.IsErr() || !next.Value()) break;
        frames.push_back(*next.Value());
    }
    return frames;
}

}  // namespace

TEST(LineFramerTest, SplitsCompleteLines) {
    LineFramer framer;
    framer.Feed("{\"type\":\"Ping\"}\n{\"type\":\"Pong\"}\n");

    EXPECT_EQ(DrainFrames(framer), (std::vector<std::string>{"{\"type\":\"Ping\"}", "{\"type\":\"Pong\"}"}));
    EXPECT_EQ(framer.Buffered(), 0u);
}

TEST(LineFramerTest, ReassemblesChunks) {
    LineFramer framer;
    framer.Feed("hel");
    EXPECT_TRUE(DrainFrames(framer).empty());
    EXPECT_EQ(framer.Buffered(), 3u);

    framer.Feed("lo\nwor");
    EXPECT_EQ(DrainFrames(framer), std::vector<std::string>{"hello"});

    framer.Feed("ld\n");
    EXPECT_EQ(DrainFrames(framer), std::vector<std::string>{"world"});
}

TEST(LineFramerTest, StripsCarriageReturnAndSkipsBlankLines) {
    LineFramer framer;
    framer.Feed("one\r\n\n\r\ntwo\n");

    EXPECT_EQ(DrainFrames(framer), (std::vector<std::string>{"one", "two"}));
}

TEST(LineFramerTest, OversizedCompleteLineIsRejected) {
    LineFramer framer(8);
    framer.Feed("0123456789\n");

    auto next = framer.NextFrame();
    ASSERT_TRUE(next.IsErr());
    EXPECT_EQ(next.Error(), Errc::FrameTooLarge);
}

TEST(LineFramerTest, OversizedPartialLineIsRejected) {
    LineFramer framer(8);
    framer.Feed("0123");
    EXPECT_TRUE(framer.NextFrame().IsOk());

    framer.Feed("456789");
    auto next = framer.NextFrame();
    ASSERT_TRUE(next.IsErr());
    EXPECT_EQ(next.Error(), Errc::FrameTooLarge);
}

TEST(LineFramerTest, LineAtLimitIsAccepted) {
    LineFramer framer(4);
    framer.Feed("abcd\n");

    EXPECT_EQ(DrainFrames(framer), std::vector<std::string>{"abcd"});
}

TEST(LineFramerTest, ManySmallFeedsDoNotGrowBuffer) {
    LineFramer framer;
    for (int i = 0; i < 1000; ++i) {
        framer.Feed("frame-" + std::to_string(i) + "\n");
        auto frames = DrainFrames(framer);
        ASSERT_EQ(frames.size(), 1u);
        EXPECT_EQ(frames[0], "frame-" + std::to_string(i));
    }
    EXPECT_EQ(framer.Buffered(), 0u);
}
