
#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "log_file.hpp"
#include "log_read_set.hpp"

namespace blobstream {

enum class LookupStatus { OK, NOT_FOUND, EXPIRED };

struct Lookup {
    LookupStatus status{LookupStatus::OK};
    BlobKey failed_key;
    std::shared_ptr<const LogReadSet> read_set;
};

// Single log file plus an in-memory index of the blobs appended through it.
class BlobStore {
public:
    explicit BlobStore(std::shared_ptr<LogFile> log) : log_(std::move(log)) {}

    // Appends the blob and indexes it; a later put of the same key wins.
    void put(const BlobKey& key, std::optional<int64_t> expiry_ms, const std::vector<uint8_t>& bytes);

    // Read set over `keys` bounded by the current committed end of the log.
    Lookup lookup(const std::vector<BlobKey>& keys, int64_t now_ms) const;

    size_t blob_count() const;
    const std::shared_ptr<LogFile>& log() const { return log_; }

private:
    struct IndexEntry {
        uint64_t offset;
        uint64_t size;
        std::optional<int64_t> expiry_ms;
    };

    std::shared_ptr<LogFile> log_;
    mutable std::mutex mtx_;
    std::unordered_map<BlobKey, IndexEntry> index_;
};

} // namespace blobstream
