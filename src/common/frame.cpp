
#include "frame.hpp"

namespace blobstream {

void ByteWriter::put_u16(uint16_t v) {
  uint8_t b[2];
  put_u16_be(b, v);
  put_bytes(b, sizeof(b));
}

void ByteWriter::put_u64(uint64_t v) {
  uint8_t b[8];
  put_u64_be(b, v);
  put_bytes(b, sizeof(b));
}

void ByteWriter::put_string(const std::string &s) {
  if (s.size() > 0xFFFF)
    throw std::system_error(make_error_code(errc::malformed_message),
                            "string of " + std::to_string(s.size()) +
                                " bytes does not fit a u16 length");
  put_u16((uint16_t)s.size());
  put_bytes((const uint8_t *)s.data(), s.size());
}

void Frame::check_capacity(uint64_t payload_size) {
  if (payload_size > kMaxFramePayload)
    throw std::system_error(make_error_code(errc::frame_capacity_exceeded),
                            "maximum frame payload is " +
                                std::to_string(kMaxFramePayload) + " bytes");
}

size_t Frame::write_to(WritableChannel &ch, std::error_code &ec) {
  ec.clear();
  if (is_complete())
    return 0;
  size_t n = ch.write_some(buf_->data() + pos_, remaining(), ec);
  pos_ += n;
  return n;
}

} // namespace blobstream
