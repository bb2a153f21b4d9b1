// ============================================================================
// convq/engine/output_estimator.cpp - Output Size Estimation
// ============================================================================

#include "convq/engine/output_estimator.hpp"

#include "convq/core/logging.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace convq {

namespace {

struct Factor {
    std::string_view name;
    double value;
};

constexpr std::array<Factor, 12> kCodecRatios{{
    {"h264_nvenc", 0.65},
    {"h265_nvenc", 0.45},
    {"av1_nvenc", 0.35},
    {"libx264", 0.70},
    {"libx265", 0.50},
    {"libaom-av1", 0.40},
    {"libvpx-vp9", 0.55},
    {"h264", 0.68},
    {"h265", 0.48},
    {"hevc", 0.48},
    {"av1", 0.38},
    {"vp9", 0.58},
}};

constexpr std::array<Factor, 8> kFormatMultipliers{{
    {"mp4", 1.02},
    {"mkv", 1.05},
    {"avi", 1.08},
    {"mov", 1.03},
    {"webm", 1.01},
    {"flv", 1.06},
    {"wmv", 1.07},
    {"m4v", 1.02},
}};

constexpr std::array<Factor, 9> kResolutionMultipliers{{
    {"8k", 2.0},
    {"4k", 1.5},
    {"2160p", 1.5},
    {"1440p", 1.2},
    {"1080p", 1.0},
    {"720p", 0.7},
    {"480p", 0.5},
    {"360p", 0.3},
    {"240p", 0.2},
}};

constexpr std::array<Factor, 8> kQualityMultipliers{{
    {"low", 0.8},
    {"fast", 0.8},
    {"medium", 1.0},
    {"balanced", 1.0},
    {"high", 1.2},
    {"slow", 1.2},
    {"ultra", 1.4},
    {"veryslow", 1.4},
}};

template <size_t N>
double Lookup(const std::array<Factor, N>& table, std::string_view raw, double fallback) {
    std::string name = NormalizeName(raw);
    for (const auto& factor : table) {
        if (factor.name == name) return factor.value;
    }
    return fallback;
}

// A source of unknown duration is assumed to be a 30 minute clip with
// 128 kbps of audio; the rest of its bitrate is video.
constexpr int64_t kAssumedDurationSeconds = 30 * 60;
constexpr int64_t kAssumedAudioKbps = 128;
constexpr int64_t kMinSourceVideoKbps = 500;

// Upper bound for an estimate; exactly representable as a double.
constexpr double kMaxEstimatedBytes = static_cast<double>(int64_t{1} << 62);

int64_t EstimateSourceVideoKbps(int64_t source_bytes) {
    int64_t total_kbps = source_bytes / kAssumedDurationSeconds * 8 / 1000;
    return std::max(kMinSourceVideoKbps, total_kbps - kAssumedAudioKbps);
}

}  // namespace

std::string NormalizeName(std::string_view name) {
    auto begin = name.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) return {};
    auto end = name.find_last_not_of(" \t\r\n");
    std::string out(name.substr(begin, end - begin + 1));
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

double CompressionRatio(std::string_view codec, std::optional<int> video_bitrate_kbps, int64_t source_bytes) {
    double ratio = Lookup(kCodecRatios, codec, kDefaultCompressionRatio);
    if (video_bitrate_kbps && *video_bitrate_kbps > 0 && source_bytes > 0) {
        double bitrate_ratio = static_cast<double>(*video_bitrate_kbps) /
                               static_cast<double>(EstimateSourceVideoKbps(source_bytes));
        ratio *= std::clamp(bitrate_ratio, 0.2, 2.0);
    }
    return ratio;
}

double FormatMultiplier(std::string_view format) {
    return Lookup(kFormatMultipliers, format, kDefaultFormatMultiplier);
}

double ResolutionMultiplier(std::string_view resolution) {
    return Lookup(kResolutionMultipliers, resolution, 1.0);
}

double QualityMultiplier(std::string_view quality, std::optional<int> video_bitrate_kbps) {
    if (video_bitrate_kbps && *video_bitrate_kbps > 0) return 1.0;
    return Lookup(kQualityMultipliers, quality, 1.0);
}

int64_t EstimateOutputBytes(int64_t source_bytes, const ConversionParameters& params) {
    if (source_bytes <= 0) return 0;

    double estimate = static_cast<double>(source_bytes) *
                      CompressionRatio(params.video_codec, params.video_bitrate_kbps, source_bytes) *
                      FormatMultiplier(params.output_format) * ResolutionMultiplier(params.resolution) *
                      QualityMultiplier(params.quality, params.video_bitrate_kbps);

    double max_factor = 2.0;
    if (NormalizeName(params.video_codec).find("lossless") != std::string::npos) {
        max_factor = 3.0;
    }
    if (NormalizeName(params.output_format) == "gif") {
        max_factor = 5.0;
    }

    double min_bytes = static_cast<double>(source_bytes) * 0.1;
    double max_bytes = static_cast<double>(source_bytes) * max_factor;
    auto estimated = static_cast<int64_t>(std::min(std::clamp(estimate, min_bytes, max_bytes), kMaxEstimatedBytes));

    CONVQ_LOG_DEBUG("estimator", "source " << source_bytes << " bytes -> estimated output " << estimated << " bytes");
    return estimated;
}

SpaceRequirement EstimateRequirement(int64_t source_bytes, const ConversionParameters& params) {
    SpaceRequirement requirement;
    requirement.source_bytes = source_bytes;
    requirement.estimated_output_bytes = EstimateOutputBytes(source_bytes, params);
    requirement.temp_bytes = TempOverheadBytes(source_bytes);
    return requirement;
}

}  // namespace convq
