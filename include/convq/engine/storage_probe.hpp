// ============================================================================
// convq/engine/storage_probe.hpp - Disk Usage Measurement
// ============================================================================
//
// A StorageProbe reports how many bytes the three storage categories take
// on disk. SpaceAccountant calls Measure() on every refresh; it never
// patches the previous result.
//
// - DirectoryStorageProbe walks a root directory per category. A root that
//   does not exist yet counts as zero bytes; any other filesystem error
//   fails the whole measurement.
// - StaticStorageProbe returns whatever it was last given.
//
// ============================================================================

#pragma once

#include "convq/core/result.hpp"
#include "convq/engine/space_types.hpp"

#include <filesystem>
#include <mutex>
#include <system_error>
#include <utility>

namespace convq {

class StorageProbe {
   public:
    virtual ~StorageProbe() = default;

    virtual Result<UsageBreakdown, std::error_code> Measure() = 0;
};

struct StorageRoots {
    std::filesystem::path source;
    std::filesystem::path output;
    std::filesystem::path temp;
};

class DirectoryStorageProbe : public StorageProbe {
   public:
    explicit DirectoryStorageProbe(StorageRoots roots) : roots_(std::move(roots)) {}

    Result<UsageBreakdown, std::error_code> Measure() override;

    [[nodiscard]] const StorageRoots& Roots() const { return roots_; }

    // Total size of regular files under `root`
    static Result<int64_t, std::error_code> DirectorySize(const std::filesystem::path& root);

   private:
    StorageRoots roots_;
};

class StaticStorageProbe : public StorageProbe {
   public:
    explicit StaticStorageProbe(UsageBreakdown usage = {}) : usage_(usage) {}

    Result<UsageBreakdown, std::error_code> Measure() override;

    void Set(UsageBreakdown usage);
    // While set, Measure() fails with Errc::StorageUnavailable
    void SetFailure(bool fail);

   private:
    std::mutex mutex_;
    UsageBreakdown usage_;
    bool fail_ = false;
};

}  // namespace convq
