// ============================================================================
// convq/net/line_framer.hpp - Newline-Delimited Frame Splitter
// ============================================================================
//
// TCP delivers bytes in arbitrary chunks; LineFramer turns them back into
// frames. Feed() appends a chunk, then NextFrame() yields each complete
// line without its terminator ("\n" or "\r\n"). Blank lines are skipped.
//
// A line longer than the frame limit (complete or still accumulating) is a
// protocol violation: the framer reports Errc::FrameTooLarge and the
// connection is expected to be closed.
//
// ============================================================================

#pragma once

#include "convq/core/error.hpp"
#include "convq/core/result.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace convq {

inline constexpr size_t kDefaultMaxFrameBytes = 64 * 1024;

class LineFramer {
   public:
    explicit LineFramer(size_t max_frame_bytes = kDefaultMaxFrameBytes) : max_frame_bytes_(max_frame_bytes) {}

    void Feed(std::string_view chunk) { buffer_.append(chunk.data(), chunk.size()); }

    // nullopt when no complete frame is buffered yet
    Result<std::optional<std::string>, std::error_code> NextFrame();

    [[nodiscard]] size_t Buffered() const { return buffer_.size() - consumed_; }
    [[nodiscard]] size_t MaxFrameBytes() const { return max_frame_bytes_; }

   private:
    void Compact();

    size_t max_frame_bytes_;
    std::string buffer_;
    size_t consumed_ = 0;
};

}  // namespace convq
