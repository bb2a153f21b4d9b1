// ============================================================================
// Storage Probe Tests
// ============================================================================

#include "convq/engine/storage_probe.hpp"

#include "convq/core/error.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace convq;
namespace fs = std::filesystem;

class DirectoryStorageProbeTest : public ::testing::Test {
   protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() / ("convq_probe_" + std::to_string(::getpid()) + "_" +
                                             ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(root_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void WriteFile(const fs::path& path, size_t bytes) {
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << std::string(bytes, 'x');
    }

    fs::path root_;
};

TEST_F(DirectoryStorageProbeTest, SumsRegularFilesRecursively) {
    WriteFile(root_ / "a.bin", 100);
    WriteFile(root_ / "nested" / "b.bin", 250);
    WriteFile(root_ / "nested" / "deeper" / "c.bin", 50);

    auto size = DirectoryStorageProbe::DirectorySize(root_);
    ASSERT_TRUE(size.IsOk());
    EXPECT_EQ(size.Value(), 400);
}

TEST_F(DirectoryStorageProbeTest, MissingRootCountsAsZero) {
    auto size = DirectoryStorageProbe::DirectorySize(root_ / "not-created-yet");
    ASSERT_TRUE(size.IsOk());
    EXPECT_EQ(size.Value(), 0);

    auto empty = DirectoryStorageProbe::DirectorySize(fs::path());
    ASSERT_TRUE(empty.IsOk());
    EXPECT_EQ(empty.Value(), 0);
}

TEST_F(DirectoryStorageProbeTest, SingleFileRoot) {
    WriteFile(root_ / "movie.mkv", 1234);

    auto size = DirectoryStorageProbe::DirectorySize(root_ / "movie.mkv");
    ASSERT_TRUE(size.IsOk());
    EXPECT_EQ(size.Value(), 1234);
}

TEST_F(DirectoryStorageProbeTest, MeasuresEachCategory) {
    WriteFile(root_ / "source" / "in.mov", 1000);
    WriteFile(root_ / "output" / "out.mp4", 300);
    WriteFile(root_ / "temp" / "part-1.tmp", 20);
    WriteFile(root_ / "temp" / "part-2.tmp", 30);

    DirectoryStorageProbe probe({root_ / "source", root_ / "output", root_ / "temp"});
    auto usage = probe.Measure();

    ASSERT_TRUE(usage.IsOk());
    EXPECT_EQ(usage.Value().source_bytes, 1000);
    EXPECT_EQ(usage.Value().output_bytes, 300);
    EXPECT_EQ(usage.Value().temp_bytes, 50);
    EXPECT_EQ(usage.Value().Total(), 1350);
}

TEST_F(DirectoryStorageProbeTest, RemeasuresFromScratch) {
    DirectoryStorageProbe probe({root_ / "source", root_ / "output", root_ / "temp"});
    WriteFile(root_ / "output" / "out.mp4", 500);
    ASSERT_EQ(probe.Measure().Value().output_bytes, 500);

    fs::remove(root_ / "output" / "out.mp4");
    EXPECT_EQ(probe.Measure().Value().output_bytes, 0);
}

// ============================================================================
// StaticStorageProbe
// ============================================================================

TEST(StaticStorageProbeTest, ReturnsWhatItWasGiven) {
    StaticStorageProbe probe({10, 20, 30});
    EXPECT_EQ(probe.Measure().Value().Total(), 60);

    probe.Set({1, 2, 3});
    EXPECT_EQ(probe.Measure().Value().temp_bytes, 3);
}

TEST(StaticStorageProbeTest, InjectedFailure) {
    StaticStorageProbe probe({10, 20, 30});
    probe.SetFailure(true);

    auto usage = probe.Measure();
    ASSERT_TRUE(usage.IsErr());
    EXPECT_EQ(usage.Error(), Errc::StorageUnavailable);

    probe.SetFailure(false);
    EXPECT_TRUE(probe.Measure().IsOk());
}
