
#include "protocol.hpp"

namespace blobstream {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

constexpr size_t kMaxListLength = 0xFFFF;

uint64_t key_size(const std::string &k) {
  if (k.size() > kMaxKeyLength)
    throw std::system_error(make_error_code(errc::malformed_message),
                            "key of " + std::to_string(k.size()) +
                                " bytes exceeds " +
                                std::to_string(kMaxKeyLength));
  return 2 + k.size();
}

void check_list_length(size_t n) {
  if (n > kMaxListLength)
    throw std::system_error(make_error_code(errc::malformed_message),
                            "list of " + std::to_string(n) +
                                " entries does not fit a u16 count");
}

class Reader {
public:
  Reader(const uint8_t *data, size_t len) : p_(data), end_(data + len) {}

  bool u8(uint8_t &v) {
    if (left() < 1)
      return false;
    v = *p_++;
    return true;
  }
  bool u16(uint16_t &v) {
    if (left() < 2)
      return false;
    v = get_u16_be(p_);
    p_ += 2;
    return true;
  }
  bool u64(uint64_t &v) {
    if (left() < 8)
      return false;
    v = get_u64_be(p_);
    p_ += 8;
    return true;
  }
  bool i64(int64_t &v) {
    uint64_t u;
    if (!u64(u))
      return false;
    v = (int64_t)u;
    return true;
  }
  bool key(std::string &s) {
    uint16_t n;
    if (!u16(n) || n > kMaxKeyLength || left() < n)
      return false;
    s.assign((const char *)p_, n);
    p_ += n;
    return true;
  }
  const uint8_t *pos() const { return p_; }
  size_t left() const { return (size_t)(end_ - p_); }

private:
  const uint8_t *p_;
  const uint8_t *end_;
};

bool valid_status(uint16_t v) {
  return v <= static_cast<uint16_t>(Status::INTERNAL_ERROR);
}

} // namespace

const char *status_str(Status s) {
  switch (s) {
  case Status::OK:
    return "ok";
  case Status::BAD_REQUEST:
    return "bad request";
  case Status::NOT_FOUND:
    return "not found";
  case Status::EXPIRED:
    return "expired";
  case Status::SIZE_MISMATCH:
    return "size mismatch";
  case Status::CLOSED:
    return "closed";
  default:
    return "internal error";
  }
}

MessageType Message::type() const {
  return std::visit(
      overloaded{
          [](const PutRequest &) { return MessageType::PUT_REQUEST; },
          [](const ChunkMessage &) { return MessageType::CONTENT_CHUNK; },
          [](const GetRequest &) { return MessageType::GET_REQUEST; },
          [](const PutResponse &) { return MessageType::PUT_RESPONSE; },
          [](const GetResponse &) { return MessageType::GET_RESPONSE; }},
      body);
}

uint64_t Message::size_in_bytes() const {
  uint64_t n = 1;
  std::visit(overloaded{[&](const PutRequest &m) {
                          n += key_size(m.key) + 8 + 8;
                        },
                        [&](const ChunkMessage &m) { n += 1 + m.size; },
                        [&](const GetRequest &m) {
                          if (m.keys.empty())
                            throw std::system_error(
                                make_error_code(errc::malformed_message),
                                "GetRequest without keys");
                          check_list_length(m.keys.size());
                          n += 2;
                          for (auto &k : m.keys)
                            n += key_size(k);
                        },
                        [&](const PutResponse &m) {
                          n += 2 + key_size(m.key);
                        },
                        [&](const GetResponse &m) {
                          check_list_length(m.blobs.size());
                          n += 2 + 2;
                          for (auto &b : m.blobs)
                            n += key_size(b.key) + 8 + 8;
                        }},
             body);
  return n;
}

void Message::serialize_into(ByteWriter &w) const {
  w.put_u8(static_cast<uint8_t>(type()));
  std::visit(overloaded{[&](const PutRequest &m) {
                          w.put_string(m.key);
                          w.put_i64(m.expiry_ms);
                          w.put_i64(m.declared_size);
                        },
                        [&](const ChunkMessage &m) {
                          w.put_u8(m.is_last ? 1 : 0);
                          w.put_bytes(m.data, m.size);
                        },
                        [&](const GetRequest &m) {
                          w.put_u16((uint16_t)m.keys.size());
                          for (auto &k : m.keys)
                            w.put_string(k);
                        },
                        [&](const PutResponse &m) {
                          w.put_u16(static_cast<uint16_t>(m.status));
                          w.put_string(m.key);
                        },
                        [&](const GetResponse &m) {
                          w.put_u16(static_cast<uint16_t>(m.status));
                          w.put_u16((uint16_t)m.blobs.size());
                          for (auto &b : m.blobs) {
                            w.put_string(b.key);
                            w.put_u64(b.size);
                            w.put_i64(b.expiry_ms);
                          }
                        }},
             body);
}

std::optional<Message> decode_message(const uint8_t *data, size_t len) {
  Reader r(data, len);
  uint8_t type;
  if (!r.u8(type))
    return std::nullopt;

  switch (static_cast<MessageType>(type)) {
  case MessageType::PUT_REQUEST: {
    PutRequest m;
    if (!r.key(m.key) || !r.i64(m.expiry_ms) || !r.i64(m.declared_size))
      return std::nullopt;
    if (m.declared_size < kUnknownSize || r.left() != 0)
      return std::nullopt;
    return Message{std::move(m)};
  }
  case MessageType::CONTENT_CHUNK: {
    ChunkMessage m;
    uint8_t last;
    if (!r.u8(last) || last > 1)
      return std::nullopt;
    m.is_last = last == 1;
    m.data = r.pos();
    m.size = r.left();
    return Message{m};
  }
  case MessageType::GET_REQUEST: {
    GetRequest m;
    uint16_t count;
    if (!r.u16(count) || count == 0)
      return std::nullopt;
    m.keys.resize(count);
    for (auto &k : m.keys)
      if (!r.key(k))
        return std::nullopt;
    if (r.left() != 0)
      return std::nullopt;
    return Message{std::move(m)};
  }
  case MessageType::PUT_RESPONSE: {
    PutResponse m;
    uint16_t st;
    if (!r.u16(st) || !valid_status(st) || !r.key(m.key) || r.left() != 0)
      return std::nullopt;
    m.status = static_cast<Status>(st);
    return Message{std::move(m)};
  }
  case MessageType::GET_RESPONSE: {
    GetResponse m;
    uint16_t st, count;
    if (!r.u16(st) || !valid_status(st) || !r.u16(count))
      return std::nullopt;
    m.status = static_cast<Status>(st);
    m.blobs.resize(count);
    for (auto &b : m.blobs)
      if (!r.key(b.key) || !r.u64(b.size) || !r.i64(b.expiry_ms))
        return std::nullopt;
    if (r.left() != 0)
      return std::nullopt;
    return Message{std::move(m)};
  }
  }
  return std::nullopt;
}

} // namespace blobstream
