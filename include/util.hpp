
#pragma once
#include <string>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace blobstream {

bool parse_host_port(const std::string& s, std::string& host, uint16_t& port);
std::string bytes_to_hex(const uint8_t* data, size_t len);

// Big-endian integer codecs used by the wire format.
inline void put_u16_be(uint8_t* out, uint16_t v) {
    out[0] = (uint8_t)(v >> 8);
    out[1] = (uint8_t)v;
}
inline void put_u32_be(uint8_t* out, uint32_t v) {
    for (int i = 3; i >= 0; --i, v >>= 8) out[i] = (uint8_t)v;
}
inline void put_u64_be(uint8_t* out, uint64_t v) {
    for (int i = 7; i >= 0; --i, v >>= 8) out[i] = (uint8_t)v;
}
inline uint16_t get_u16_be(const uint8_t* in) {
    return (uint16_t)((in[0] << 8) | in[1]);
}
inline uint32_t get_u32_be(const uint8_t* in) {
    return ((uint32_t)in[0] << 24) | ((uint32_t)in[1] << 16) | ((uint32_t)in[2] << 8) | in[3];
}
inline uint64_t get_u64_be(const uint8_t* in) {
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) v = (v << 8) | in[i];
    return v;
}

} // namespace blobstream
