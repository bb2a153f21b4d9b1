// ============================================================================
// convq/net/line_framer.cpp - Newline-Delimited Frame Splitter
// ============================================================================

#include "convq/net/line_framer.hpp"

namespace convq {

Result<std::optional<std::string>, std::error_code> LineFramer::NextFrame() {
    while (true) {
        size_t newline = buffer_.find('\n', consumed_);
        if (newline == std::string::npos) {
            Compact();
            if (buffer_.size() > max_frame_bytes_) {
                return Err(make_error_code(Errc::FrameTooLarge));
            }
            return Ok(std::optional<std::string>{});
        }

        size_t end = newline;
        if (end > consumed_ && buffer_[end - 1] == '\r') {
            --end;
        }
        size_t length = end - consumed_;
        size_t start = consumed_;
        consumed_ = newline + 1;

        if (length > max_frame_bytes_) {
            return Err(make_error_code(Errc::FrameTooLarge));
        }
        if (length == 0) {
            continue;
        }
        return Ok(std::optional<std::string>(buffer_.substr(start, length)));
    }
}

void LineFramer::Compact() {
    if (consumed_ == 0) return;
    buffer_.erase(0, consumed_);
    consumed_ = 0;
}

}  // namespace convq
