
#pragma once
#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>

namespace blobstream {

// One piece of an inbound message body. Owned bytes move with the chunk;
// borrowed bytes belong to the caller and are only valid for the duration of
// the call that hands them over, so anything that keeps a chunk must retain()
// it first.
class ContentChunk {
public:
    static ContentChunk owned(std::vector<uint8_t> bytes, bool is_last = false);
    static ContentChunk borrowed(const uint8_t* data, size_t size, bool is_last = false);

    const uint8_t* data() const;
    size_t size() const;
    bool is_last() const { return last_; }
    bool is_owned() const { return std::holds_alternative<std::vector<uint8_t>>(bytes_); }

    // Owned chunk with the same content; borrowed bytes are copied.
    ContentChunk retain() &&;

private:
    struct Borrowed {
        const uint8_t* data;
        size_t size;
    };

    ContentChunk(std::variant<std::vector<uint8_t>, Borrowed> bytes, bool last)
        : bytes_(std::move(bytes)), last_(last) {}

    std::variant<std::vector<uint8_t>, Borrowed> bytes_;
    bool last_;
};

} // namespace blobstream
