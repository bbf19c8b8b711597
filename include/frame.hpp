
#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <system_error>
#include <vector>
#include "channel.hpp"
#include "errors.hpp"
#include "util.hpp"

namespace blobstream {

constexpr size_t kLengthPrefixSize = 4;
// Largest payload whose framed size still fits a signed 32-bit length.
constexpr uint64_t kMaxFramePayload = 0x7FFFFFFFull - kLengthPrefixSize;

// Outbound unit driven by an event loop until is_complete().
class Send {
public:
    virtual ~Send() = default;
    virtual size_t write_to(WritableChannel& ch, std::error_code& ec) = 0;
    virtual bool is_complete() const = 0;
};

// Append-only big-endian serializer over a caller-owned buffer.
class ByteWriter {
public:
    explicit ByteWriter(std::vector<uint8_t>& out) : out_(out) {}
    void put_u8(uint8_t v) { out_.push_back(v); }
    void put_u16(uint16_t v);
    void put_u64(uint64_t v);
    void put_i64(int64_t v) { put_u64((uint64_t)v); }
    void put_bytes(const uint8_t* data, size_t len) { out_.insert(out_.end(), data, data + len); }
    // u16 length followed by the bytes; throws errc::malformed_message past 65535
    void put_string(const std::string& s);
private:
    std::vector<uint8_t>& out_;
};

// Unframed byte payload.
struct BytesPayload {
    const uint8_t* data;
    size_t size;
    uint64_t size_in_bytes() const { return size; }
    void serialize_into(ByteWriter& w) const { w.put_bytes(data, size); }
};

// [u32 big-endian payload length][payload], serialized once at creation.
// Each Frame owns a write cursor over shared immutable bytes.
class Frame : public Send {
public:
    // Payload must provide size_in_bytes() and serialize_into(ByteWriter&).
    // Throws std::system_error: frame_capacity_exceeded, or size_mismatch if
    // the payload writes a different number of bytes than it declares.
    template <typename Payload>
    static Frame create(const Payload& payload);

    static void check_capacity(uint64_t payload_size);

    size_t write_to(WritableChannel& ch, std::error_code& ec) override;
    bool is_complete() const override { return pos_ == buf_->size(); }

    // Independent cursor at position 0 over the same bytes.
    Frame duplicate() const { return Frame(buf_); }

    size_t size_in_bytes() const { return buf_->size(); }
    size_t payload_size() const { return buf_->size() - kLengthPrefixSize; }
    size_t remaining() const { return buf_->size() - pos_; }
    const std::vector<uint8_t>& bytes() const { return *buf_; }

private:
    explicit Frame(std::shared_ptr<const std::vector<uint8_t>> buf) : buf_(std::move(buf)) {}

    std::shared_ptr<const std::vector<uint8_t>> buf_;
    size_t pos_{0};
};

template <typename Payload>
Frame Frame::create(const Payload& payload) {
    const uint64_t size = payload.size_in_bytes();
    check_capacity(size);
    auto buf = std::make_shared<std::vector<uint8_t>>();
    buf->reserve(kLengthPrefixSize + size);
    buf->resize(kLengthPrefixSize);
    put_u32_be(buf->data(), (uint32_t)size);
    ByteWriter w(*buf);
    payload.serialize_into(w);
    if (buf->size() != kLengthPrefixSize + size)
        throw std::system_error(make_error_code(errc::size_mismatch),
                                "payload serialized " + std::to_string(buf->size() - kLengthPrefixSize) +
                                " bytes, declared " + std::to_string(size));
    return Frame(std::move(buf));
}

} // namespace blobstream
