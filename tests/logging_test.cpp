// ============================================================================
// Logging Tests
// ============================================================================

#include "convq/core/logging.hpp"

#include <gtest/gtest.h>

using namespace convq;

namespace {

class LevelGuard {
   public:
    LevelGuard() : saved_(Logger::Level()) {}
    ~LevelGuard() { Logger::SetLevel(saved_); }

   private:
    LogLevel saved_;
};

}  // namespace

TEST(LoggingTest, ParseLevel) {
    EXPECT_EQ(Logger::ParseLevel("error"), LogLevel::Error);
    EXPECT_EQ(Logger::ParseLevel("WARN"), LogLevel::Warn);
    EXPECT_EQ(Logger::ParseLevel("Warning"), LogLevel::Warn);
    EXPECT_EQ(Logger::ParseLevel("info"), LogLevel::Info);
    EXPECT_EQ(Logger::ParseLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(Logger::ParseLevel("trace"), LogLevel::Trace);
    EXPECT_FALSE(Logger::ParseLevel("verbose").has_value());
    EXPECT_FALSE(Logger::ParseLevel("").has_value());
}

TEST(LoggingTest, LevelName) {
    EXPECT_EQ(Logger::LevelName(LogLevel::Error), "ERROR");
    EXPECT_EQ(Logger::LevelName(LogLevel::Warn), "WARN");
    EXPECT_EQ(Logger::LevelName(LogLevel::Trace), "TRACE");
}

TEST(LoggingTest, EnabledFollowsLevel) {
    LevelGuard guard;
    Logger::SetLevel(LogLevel::Warn);

    EXPECT_TRUE(Logger::Enabled(LogLevel::Error));
    EXPECT_TRUE(Logger::Enabled(LogLevel::Warn));
    EXPECT_FALSE(Logger::Enabled(LogLevel::Info));
    EXPECT_FALSE(Logger::Enabled(LogLevel::Debug));
}

TEST(LoggingTest, DisabledMessagesAreNotFormatted) {
    LevelGuard guard;
    Logger::SetLevel(LogLevel::Error);

    int evaluated = 0;
    auto expensive = [&]() {
        ++evaluated;
        return "details";
    };

    CONVQ_LOG_DEBUG("test", "value " << expensive());
    EXPECT_EQ(evaluated, 0);

    CONVQ_LOG_ERROR("test", "value " << expensive());
    EXPECT_EQ(evaluated, 1);
}

TEST(LoggingTest, OutputGoesToStderr) {
    LevelGuard guard;
    Logger::SetLevel(LogLevel::Info);
    Logger::SetThreadName("tester");

    testing::internal::CaptureStderr();
    CONVQ_LOG_INFO("registry", "task " << 42 << " created");
    std::string output = testing::internal::GetCapturedStderr();
    Logger::SetThreadName("");

    EXPECT_NE(output.find("[INFO "), std::string::npos) << output;
    EXPECT_NE(output.find("[tester]"), std::string::npos) << output;
    EXPECT_NE(output.find("registry: task 42 created"), std::string::npos) << output;
}
