
#include "util.hpp"
#include <stdexcept>

namespace blobstream {

bool parse_host_port(const std::string &s, std::string &host, uint16_t &port) {
  auto pos = s.rfind(':');
  if (pos == std::string::npos || pos == 0)
    return false;
  host = s.substr(0, pos);
  try {
    size_t used = 0;
    int p = std::stoi(s.substr(pos + 1), &used);
    if (used != s.size() - pos - 1 || p < 0 || p > 65535)
      return false;
    port = (uint16_t)p;
    return true;
  } catch (const std::logic_error &) {
    return false;
  }
}

std::string bytes_to_hex(const uint8_t *data, size_t len) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (size_t i = 0; i < len; i++) {
    out.push_back(digits[data[i] >> 4]);
    out.push_back(digits[data[i] & 0x0F]);
  }
  return out;
}

} // namespace blobstream
