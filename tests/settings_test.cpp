// ============================================================================
// Settings Tests
// ============================================================================

#include "convq/core/settings.hpp"

#include "convq/core/error.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace convq;

// ============================================================================
// MemorySettingsStore
// ============================================================================

TEST(SettingsTest, MissingKeyUsesDefault) {
    MemorySettingsStore store;
    Settings settings(store);

    EXPECT_EQ(settings.GetInt("space.max_total_bytes", 1024), 1024);
    EXPECT_TRUE(settings.GetBool("space.enabled", true));
    EXPECT_DOUBLE_EQ(settings.GetDouble("ratio", 0.5), 0.5);
    EXPECT_EQ(settings.GetString("space.updated_by", "system"), "system");
}

TEST(SettingsTest, TypedRoundTrip) {
    MemorySettingsStore store;
    Settings settings(store);

    ASSERT_TRUE(settings.SetInt("space.max_total_bytes", 1'000'000'000'000).IsOk());
    ASSERT_TRUE(settings.SetBool("space.enabled", false).IsOk());
    ASSERT_TRUE(settings.SetDouble("ratio", 0.85).IsOk());
    ASSERT_TRUE(settings.SetString("space.updated_by", "api").IsOk());

    EXPECT_EQ(settings.GetInt("space.max_total_bytes", 0), 1'000'000'000'000);
    EXPECT_FALSE(settings.GetBool("space.enabled", true));
    EXPECT_DOUBLE_EQ(settings.GetDouble("ratio", 0.0), 0.85);
    EXPECT_EQ(settings.GetString("space.updated_by", ""), "api");
}

TEST(SettingsTest, BooleanSpellings) {
    MemorySettingsStore store({{"a", "yes"}, {"b", "ON"}, {"c", "0"}, {"d", " off "}});
    Settings settings(store);

    EXPECT_TRUE(settings.GetBool("a", false));
    EXPECT_TRUE(settings.GetBool("b", false));
    EXPECT_FALSE(settings.GetBool("c", true));
    EXPECT_FALSE(settings.GetBool("d", true));
}

TEST(SettingsTest, UnparsableValueUsesDefault) {
    MemorySettingsStore store({{"net.port", "seventy"}, {"space.enabled", "maybe"}, {"ratio", "1.5x"}});
    Settings settings(store);

    EXPECT_EQ(settings.GetInt("net.port", 7300), 7300);
    EXPECT_TRUE(settings.GetBool("space.enabled", true));
    EXPECT_DOUBLE_EQ(settings.GetDouble("ratio", 2.0), 2.0);
}

TEST(SettingsTest, EmptyKeyRejected) {
    MemorySettingsStore store;

    auto result = store.Put("", "value");
    ASSERT_TRUE(result.IsErr());
    EXPECT_EQ(result.Error(), Errc::ValidationError);
}

TEST(SettingsTest, ListReturnsSortedEntries) {
    MemorySettingsStore store;
    ASSERT_TRUE(store.Put("b", "2").IsOk());
    ASSERT_TRUE(store.Put("a", "1").IsOk());

    auto entries = store.List();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].first, "a");
    EXPECT_EQ(entries[1].second, "2");
}

// ============================================================================
// FileSettingsStore
// ============================================================================

class FileSettingsStoreTest : public ::testing::Test {
   protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("convq_settings_" + std::to_string(::getpid()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(dir_);
        path_ = dir_ / "convq.conf";
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path dir_;
    std::filesystem::path path_;
};

TEST_F(FileSettingsStoreTest, MissingFileIsEmpty) {
    auto store = FileSettingsStore::Open(path_);
    ASSERT_TRUE(store.IsOk());

    EXPECT_TRUE(store.Value()->List().empty());
    EXPECT_FALSE(std::filesystem::exists(path_));
}

TEST_F(FileSettingsStoreTest, ParsesCommentsAndWhitespace) {
    {
        std::ofstream out(path_);
        out << "# space budget\n";
        out << "space.max_total_bytes = 2048\n";
        out << "\n";
        out << "not a setting\n";
        out << "  space.enabled=false  \n";
    }

    auto store = FileSettingsStore::Open(path_);
    ASSERT_TRUE(store.IsOk());
    Settings settings(*store.Value());

    EXPECT_EQ(settings.GetInt("space.max_total_bytes", 0), 2048);
    EXPECT_FALSE(settings.GetBool("space.enabled", true));
    EXPECT_EQ(store.Value()->List().size(), 2u);
}

TEST_F(FileSettingsStoreTest, PutPersistsAcrossReopen) {
    {
        auto store = FileSettingsStore::Open(path_).Value();
        Settings settings(*store);
        ASSERT_TRUE(settings.SetInt("space.reserved_bytes", 512).IsOk());
        ASSERT_TRUE(settings.SetString("space.updated_by", "operator").IsOk());
    }

    auto reopened = FileSettingsStore::Open(path_).Value();
    Settings settings(*reopened);
    EXPECT_EQ(settings.GetInt("space.reserved_bytes", 0), 512);
    EXPECT_EQ(settings.GetString("space.updated_by", ""), "operator");
    EXPECT_FALSE(std::filesystem::exists(path_.string() + ".tmp"));
}

TEST_F(FileSettingsStoreTest, RejectsValuesThatBreakTheFormat) {
    auto store = FileSettingsStore::Open(path_).Value();

    EXPECT_TRUE(store->Put("a=b", "1").IsErr());
    EXPECT_TRUE(store->Put("key", "two\nlines").IsErr());
    EXPECT_FALSE(store->Get("key").has_value());
}

TEST_F(FileSettingsStoreTest, FailedWriteKeepsPreviousValue) {
    auto store = FileSettingsStore::Open(path_).Value();
    ASSERT_TRUE(store->Put("space.enabled", "true").IsOk());

    // A directory in place of the temp file makes the write fail
    std::filesystem::create_directories(path_.string() + ".tmp");

    auto result = store->Put("space.enabled", "false");
    ASSERT_TRUE(result.IsErr());
    EXPECT_EQ(result.Error(), Errc::IoError);
    EXPECT_EQ(store->Get("space.enabled"), "true");
}
