
#include "errors.hpp"

namespace blobstream {

namespace {

class Category : public std::error_category {
public:
  const char *name() const noexcept override { return "blobstream"; }

  std::string message(int val) const override {
    switch (static_cast<errc>(val)) {
    case errc::invalid_range:
      return "read range extends past the committed end of the log";
    case errc::frame_capacity_exceeded:
      return "payload exceeds the maximum frame size";
    case errc::size_mismatch:
      return "content size does not match the declared size";
    case errc::invalid_state:
      return "operation not permitted in the current channel state";
    case errc::channel_closed:
      return "channel is closed";
    case errc::index_out_of_range:
      return "index out of range";
    case errc::offset_out_of_range:
      return "relative offset exceeds the range size";
    case errc::content_after_last:
      return "content received after the last chunk";
    case errc::unsupported_content:
      return "no content expected for this request method";
    case errc::malformed_message:
      return "malformed message";
    }
    return "unknown blobstream error";
  }
};

} // namespace

const std::error_category &blobstream_category() noexcept {
  static const Category cat;
  return cat;
}

std::error_code make_error_code(errc e) noexcept {
  return std::error_code(static_cast<int>(e), blobstream_category());
}

bool is_would_block(const std::error_code &ec) noexcept {
  return ec == std::errc::operation_would_block ||
         ec == std::errc::resource_unavailable_try_again;
}

} // namespace blobstream
