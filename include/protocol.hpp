
#pragma once
#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "frame.hpp"

namespace blobstream {

constexpr size_t  kMaxKeyLength = 1024;
constexpr int64_t kNoExpiry = -1;
constexpr int64_t kUnknownSize = -1;

enum class MessageType : uint8_t {
    PUT_REQUEST   = 0x01,
    CONTENT_CHUNK = 0x02,
    GET_REQUEST   = 0x03,
    PUT_RESPONSE  = 0x81,
    GET_RESPONSE  = 0x82
};

enum class Status : uint16_t {
    OK = 0,
    BAD_REQUEST = 1,
    NOT_FOUND = 2,
    EXPIRED = 3,
    SIZE_MISMATCH = 4,
    CLOSED = 5,
    INTERNAL_ERROR = 6
};

const char* status_str(Status s);

struct PutRequest {
    std::string key;
    int64_t expiry_ms{kNoExpiry};
    int64_t declared_size{kUnknownSize};
};

// Views bytes owned elsewhere: the sender's blob or the receiver's input buffer.
struct ChunkMessage {
    bool is_last{false};
    const uint8_t* data{nullptr};
    size_t size{0};
};

struct GetRequest {
    std::vector<std::string> keys;
};

struct PutResponse {
    Status status{Status::OK};
    std::string key;
};

struct BlobInfo {
    std::string key;
    uint64_t size{0};
    int64_t expiry_ms{kNoExpiry};
};

// On OK, followed on the wire by one frame of raw bytes per listed blob.
struct GetResponse {
    Status status{Status::OK};
    std::vector<BlobInfo> blobs;
};

using MessageBody = std::variant<PutRequest, ChunkMessage, GetRequest, PutResponse, GetResponse>;

struct Message {
    MessageBody body;

    MessageType type() const;
    uint64_t size_in_bytes() const;
    void serialize_into(ByteWriter& w) const;
};

// Parses one frame payload. Returned chunk views point into `data`.
std::optional<Message> decode_message(const uint8_t* data, size_t len);

// Throws std::system_error(errc::malformed_message) for keys longer than
// kMaxKeyLength, an empty GetRequest, or more than 65535 keys or blobs.
inline Frame make_frame(MessageBody body) { return Frame::create(Message{std::move(body)}); }

} // namespace blobstream
