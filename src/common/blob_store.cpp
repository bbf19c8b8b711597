
#include "blob_store.hpp"
#include "logging.hpp"

namespace blobstream {

void BlobStore::put(const BlobKey &key, std::optional<int64_t> expiry_ms,
                    const std::vector<uint8_t> &bytes) {
  uint64_t offset = log_->append(bytes.data(), bytes.size());
  std::lock_guard<std::mutex> lk(mtx_);
  index_[key] = IndexEntry{offset, bytes.size(), expiry_ms};
  Logger::instance().log(LogLevel::DEBUG, "stored %s at %llu (%zu bytes)",
                         key.c_str(), (unsigned long long)offset,
                         bytes.size());
}

Lookup BlobStore::lookup(const std::vector<BlobKey> &keys,
                         int64_t now_ms) const {
  Lookup out;
  std::vector<ReadRange> ranges;
  ranges.reserve(keys.size());
  {
    std::lock_guard<std::mutex> lk(mtx_);
    for (const auto &k : keys) {
      auto it = index_.find(k);
      if (it == index_.end()) {
        out.status = LookupStatus::NOT_FOUND;
        out.failed_key = k;
        return out;
      }
      const IndexEntry &e = it->second;
      if (e.expiry_ms && *e.expiry_ms <= now_ms) {
        out.status = LookupStatus::EXPIRED;
        out.failed_key = k;
        return out;
      }
      ranges.push_back(ReadRange{e.offset, e.size, e.expiry_ms, k});
    }
  }
  // Entries are indexed only after their bytes are below the watermark.
  out.read_set = std::make_shared<LogReadSet>(log_, log_->end_offset(),
                                              std::move(ranges));
  return out;
}

size_t BlobStore::blob_count() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return index_.size();
}

} // namespace blobstream
