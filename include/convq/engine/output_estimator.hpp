// ============================================================================
// convq/engine/output_estimator.hpp - Output Size Estimation
// ============================================================================
//
// Admission has to reserve space before a conversion runs, so it needs a
// guess at the output size up front:
//
//   estimate = source * codec_ratio * format * resolution * quality
//
// clamped to a sane range around the source size. The reservation for a
// task is that estimate plus the temp-file overhead (source / 10); the
// source file itself is already on disk.
//
// All lookups normalize names (trimmed, lower-case) and fall back to a
// neutral factor for anything unknown. Sources larger than kMaxSourceBytes
// are refused at admission; the estimator saturates rather than wraps.
//
// ============================================================================

#pragma once

#include "convq/engine/conversion_task.hpp"
#include "convq/engine/space_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace convq {

inline constexpr double kDefaultCompressionRatio = 0.8;
inline constexpr double kDefaultFormatMultiplier = 1.0;

// 1 PiB. Keeps every derived byte count (estimate, temp, totals) in range.
inline constexpr int64_t kMaxSourceBytes = int64_t{1} << 50;

std::string NormalizeName(std::string_view name);

// Codec ratio, scaled by the requested bitrate when one is given
double CompressionRatio(std::string_view codec, std::optional<int> video_bitrate_kbps = std::nullopt,
                        int64_t source_bytes = 0);

double FormatMultiplier(std::string_view format);

double ResolutionMultiplier(std::string_view resolution);

// 1.0 whenever an explicit bitrate is set
double QualityMultiplier(std::string_view quality, std::optional<int> video_bitrate_kbps = std::nullopt);

int64_t EstimateOutputBytes(int64_t source_bytes, const ConversionParameters& params);

inline int64_t TempOverheadBytes(int64_t source_bytes) {
    return source_bytes / 10;
}

SpaceRequirement EstimateRequirement(int64_t source_bytes, const ConversionParameters& params);

}  // namespace convq
