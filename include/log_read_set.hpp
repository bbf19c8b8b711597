
#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>
#include "channel.hpp"
#include "frame.hpp"
#include "log_file.hpp"

namespace blobstream {

using BlobKey = std::string;

struct ReadRange {
    uint64_t offset{0};
    uint64_t size{0};
    std::optional<int64_t> expiry_ms;  // absolute, milliseconds since epoch
    BlobKey key;
};

// Ordered, validated set of byte ranges inside one log file. Immutable after
// construction; transfer() is positional and may be called concurrently.
class LogReadSet {
public:
    // Sorts `ranges` by offset (ties by key). Throws std::system_error with
    // errc::invalid_range if a range ends past `file_end_offset`.
    LogReadSet(std::shared_ptr<LogFile> file, uint64_t file_end_offset, std::vector<ReadRange> ranges);

    size_t count() const { return ranges_.size(); }
    uint64_t size_at(size_t index) const { return range_at(index).size; }
    const BlobKey& key_at(size_t index) const { return range_at(index).key; }
    // Throws std::system_error with errc::index_out_of_range.
    const ReadRange& range_at(size_t index) const;

    // Moves up to `max_size` bytes of range `index`, starting `relative_offset`
    // bytes into it, to `dest` in one non-blocking step. Returns the bytes the
    // destination accepted. Throws for a bad index or an offset past the range;
    // I/O conditions (including would-block) are reported through `ec`.
    uint64_t transfer(size_t index, WritableChannel& dest, uint64_t relative_offset,
                      uint64_t max_size, std::error_code& ec) const;

private:
    std::shared_ptr<LogFile> file_;
    std::vector<ReadRange> ranges_;
};

// Writes every range of a read-set in order, each framed as
// [u32 big-endian size][range bytes]. The body bytes go through
// LogReadSet::transfer, so sockets receive them straight from the page cache.
class ReadSetSend : public Send {
public:
    explicit ReadSetSend(std::shared_ptr<const LogReadSet> set);

    size_t write_to(WritableChannel& ch, std::error_code& ec) override;
    bool is_complete() const override { return index_ == set_->count(); }

private:
    void start_range();

    std::shared_ptr<const LogReadSet> set_;
    size_t index_{0};
    uint8_t prefix_[kLengthPrefixSize];
    size_t prefix_pos_{0};
    uint64_t relative_offset_{0};
};

} // namespace blobstream
