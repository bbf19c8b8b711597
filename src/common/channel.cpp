
#include "channel.hpp"
#include <algorithm>

namespace blobstream {

size_t SocketChannel::write_some(const uint8_t *data, size_t len,
                                 std::error_code &ec) {
  ec.clear();
  if (len == 0)
    return 0;
  return sock_.write_some(asio::buffer(data, len), ec);
}

int SocketChannel::native_handle() const {
  return sock_.native_handle();
}

size_t BufferChannel::write_some(const uint8_t *data, size_t len,
                                 std::error_code &ec) {
  ec.clear();
  calls_++;
  if (len > 0 && paused_) {
    ec = std::make_error_code(std::errc::operation_would_block);
    return 0;
  }
  size_t n = limit_ ? std::min(len, limit_) : len;
  data_.insert(data_.end(), data, data + n);
  return n;
}

} // namespace blobstream
