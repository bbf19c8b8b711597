
#pragma once
#include <string>
#include <system_error>

namespace blobstream {

enum class errc {
    invalid_range = 1,        // read range crosses the committed end offset
    frame_capacity_exceeded,  // payload larger than a frame can describe
    size_mismatch,            // declared and actual byte counts differ
    invalid_state,            // operation not allowed in the current state
    channel_closed,           // channel closed before completion
    index_out_of_range,
    offset_out_of_range,
    content_after_last,       // content received after the terminal chunk
    unsupported_content,      // content for a method that carries no body
    malformed_message
};

const std::error_category& blobstream_category() noexcept;

std::error_code make_error_code(errc e) noexcept;

// True for the non-blocking "try again" conditions reported by channels.
bool is_would_block(const std::error_code& ec) noexcept;

} // namespace blobstream

namespace std {
template <> struct is_error_code_enum<blobstream::errc> : true_type {};
} // namespace std
