// ============================================================================
// convq/core/settings.hpp - Key/Value Settings Store
// ============================================================================
//
// Settings persist as a flat string -> string mapping behind SettingsStore.
// The engine reads them through Settings, which adds typed accessors with
// defaults: a missing key or an unparsable value yields the default (the
// latter with a warning).
//
// Two stores ship with the library:
//   MemorySettingsStore  - process lifetime only
//   FileSettingsStore    - "key=value" lines, '#' comments, rewritten
//                          through a temporary file on every Put()
//
// USAGE:
// ------
//   auto store = FileSettingsStore::Open("convq.conf").Value();
//   Settings settings(*store);
//   int64_t max = settings.GetInt("space.max_total_bytes", kDefaultMax);
//   settings.SetBool("space.enabled", false);
//
// ============================================================================

#pragma once

#include "convq/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace convq {

class SettingsStore {
   public:
    virtual ~SettingsStore() = default;

    [[nodiscard]] virtual std::optional<std::string> Get(std::string_view key) const = 0;

    virtual Result<void, std::error_code> Put(std::string_view key, std::string value) = 0;

    [[nodiscard]] virtual std::vector<std::pair<std::string, std::string>> List() const = 0;
};

class MemorySettingsStore : public SettingsStore {
   public:
    MemorySettingsStore() = default;
    explicit MemorySettingsStore(std::map<std::string, std::string, std::less<>> initial)
        : values_(std::move(initial)) {}

    [[nodiscard]] std::optional<std::string> Get(std::string_view key) const override;
    Result<void, std::error_code> Put(std::string_view key, std::string value) override;
    [[nodiscard]] std::vector<std::pair<std::string, std::string>> List() const override;

   private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string, std::less<>> values_;
};

class FileSettingsStore : public SettingsStore {
   public:
    // Loads the file if it exists; a missing file is an empty store.
    static Result<std::unique_ptr<FileSettingsStore>, std::error_code> Open(std::filesystem::path path);

    [[nodiscard]] std::optional<std::string> Get(std::string_view key) const override;
    Result<void, std::error_code> Put(std::string_view key, std::string value) override;
    [[nodiscard]] std::vector<std::pair<std::string, std::string>> List() const override;

    [[nodiscard]] const std::filesystem::path& Path() const { return path_; }

   private:
    explicit FileSettingsStore(std::filesystem::path path) : path_(std::move(path)) {}

    std::error_code Load();
    std::error_code Flush() const;

    std::filesystem::path path_;
    mutable std::mutex mutex_;
    std::map<std::string, std::string, std::less<>> values_;
};

// ============================================================================
// Settings - Typed View
// ============================================================================
class Settings {
   public:
    explicit Settings(SettingsStore& store) : store_(store) {}

    [[nodiscard]] bool GetBool(std::string_view key, bool fallback) const;
    [[nodiscard]] int64_t GetInt(std::string_view key, int64_t fallback) const;
    [[nodiscard]] double GetDouble(std::string_view key, double fallback) const;
    [[nodiscard]] std::string GetString(std::string_view key, std::string fallback) const;

    Result<void, std::error_code> SetBool(std::string_view key, bool value);
    Result<void, std::error_code> SetInt(std::string_view key, int64_t value);
    Result<void, std::error_code> SetDouble(std::string_view key, double value);
    Result<void, std::error_code> SetString(std::string_view key, std::string value);

    [[nodiscard]] SettingsStore& Store() { return store_; }

   private:
    SettingsStore& store_;
};

}  // namespace convq
