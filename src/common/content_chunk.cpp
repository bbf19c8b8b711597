
#include "content_chunk.hpp"

namespace blobstream {

ContentChunk ContentChunk::owned(std::vector<uint8_t> bytes, bool is_last) {
  return ContentChunk(std::move(bytes), is_last);
}

ContentChunk ContentChunk::borrowed(const uint8_t *data, size_t size,
                                    bool is_last) {
  return ContentChunk(Borrowed{data, size}, is_last);
}

const uint8_t *ContentChunk::data() const {
  if (auto *v = std::get_if<std::vector<uint8_t>>(&bytes_))
    return v->data();
  return std::get<Borrowed>(bytes_).data;
}

size_t ContentChunk::size() const {
  if (auto *v = std::get_if<std::vector<uint8_t>>(&bytes_))
    return v->size();
  return std::get<Borrowed>(bytes_).size;
}

ContentChunk ContentChunk::retain() && {
  if (is_owned())
    return std::move(*this);
  const Borrowed &b = std::get<Borrowed>(bytes_);
  std::vector<uint8_t> copy(b.data, b.data + b.size);
  return ContentChunk(std::move(copy), last_);
}

} // namespace blobstream
