// ============================================================================
// convq/engine/storage_probe.cpp - Disk Usage Measurement
// ============================================================================

#include "convq/engine/storage_probe.hpp"

#include "convq/core/error.hpp"
#include "convq/core/logging.hpp"

namespace convq {

namespace fs = std::filesystem;

Result<int64_t, std::error_code> DirectoryStorageProbe::DirectorySize(const fs::path& root) {
    if (root.empty()) return Ok(int64_t{0});

    std::error_code ec;
    if (!fs::exists(root, ec)) {
        if (ec) return Err(ec);
        return Ok(int64_t{0});
    }

    if (fs::is_regular_file(root, ec)) {
        auto size = fs::file_size(root, ec);
        if (ec) return Err(ec);
        return Ok(static_cast<int64_t>(size));
    }

    int64_t total = 0;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) return Err(ec);

    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) return Err(ec);
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec)) continue;
        auto size = it->file_size(entry_ec);
        if (entry_ec) {
            // The file vanished between listing and stat; a converter
            // cleaning up its temp files does this all the time.
            if (entry_ec == std::errc::no_such_file_or_directory) continue;
            return Err(entry_ec);
        }
        total += static_cast<int64_t>(size);
    }
    if (ec) return Err(ec);
    return Ok(total);
}

Result<UsageBreakdown, std::error_code> DirectoryStorageProbe::Measure() {
    UsageBreakdown usage;

    struct Category {
        const fs::path* root;
        int64_t* bytes;
    };
    const Category categories[] = {
        {&roots_.source, &usage.source_bytes},
        {&roots_.output, &usage.output_bytes},
        {&roots_.temp, &usage.temp_bytes},
    };

    for (const auto& category : categories) {
        auto size = DirectorySize(*category.root);
        if (size.IsErr()) {
            CONVQ_LOG_WARN("storage", "cannot measure " << category.root->string() << ": " << size.Error().message());
            return Err(make_error_code(Errc::StorageUnavailable));
        }
        *category.bytes = size.Value();
    }
    return Ok(usage);
}

Result<UsageBreakdown, std::error_code> StaticStorageProbe::Measure() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_) return Err(make_error_code(Errc::StorageUnavailable));
    return Ok(usage_);
}

void StaticStorageProbe::Set(UsageBreakdown usage) {
    std::lock_guard<std::mutex> lock(mutex_);
    usage_ = usage;
}

void StaticStorageProbe::SetFailure(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_ = fail;
}

}  // namespace convq
