// ============================================================================
// convq/engine/conversion_task.hpp - Conversion Task Record
// ============================================================================
//
// ConversionTask is the registry's record of one conversion job. Callers
// only ever see copies (snapshots); the authoritative instance lives inside
// TaskRegistry and changes only through its transition operations.
//
// ConversionParameters is opaque to the lifecycle. Only the output size
// estimator looks at it.
//
// ============================================================================

#pragma once

#include "convq/core/clock.hpp"
#include "convq/engine/task_status.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace convq {

using TaskId = std::string;

struct SourceDescriptor {
    std::string path;
    int64_t size_bytes = 0;
};

struct ConversionParameters {
    std::string output_format;
    std::string video_codec;
    std::string audio_codec;
    std::string quality;
    std::string resolution;
    std::optional<int> video_bitrate_kbps;
};

struct ConversionTask {
    TaskId id;
    std::string name;
    std::optional<std::string> owner;
    SourceDescriptor source;
    ConversionParameters parameters;

    TaskStatus status = TaskStatus::Pending;
    int progress = 0;
    std::optional<double> speed;
    std::optional<std::chrono::seconds> eta;
    std::optional<std::string> error_message;

    SystemTime created_at{};
    std::optional<SystemTime> started_at;
    std::optional<SystemTime> completed_at;

    int retry_count = 0;
    int max_retries = 3;

    // Admission bookkeeping
    int64_t estimated_output_bytes = 0;
    int64_t reserved_bytes = 0;
};

// Everything TaskRegistry::Create needs. `id` is normally assigned by the
// registry; admission pre-assigns it so the space reservation and the task
// share a key.
struct NewTask {
    std::optional<TaskId> id;
    std::string name;
    std::optional<std::string> owner;
    SourceDescriptor source;
    ConversionParameters parameters;
    int max_retries = 3;
    int64_t estimated_output_bytes = 0;
    int64_t reserved_bytes = 0;
};

inline constexpr size_t kMaxTaskNameLength = 255;
inline constexpr int kMinProgress = 0;
inline constexpr int kMaxProgress = 100;

}  // namespace convq
