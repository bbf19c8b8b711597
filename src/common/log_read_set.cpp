
#include "log_read_set.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cerrno>
#include <sys/sendfile.h>

namespace blobstream {

namespace {

// Linux caps a single sendfile(2) at this many bytes.
constexpr uint64_t kMaxSendfileChunk = 0x7ffff000;
constexpr size_t kBounceBufferSize = 64 * 1024;

} // namespace

LogReadSet::LogReadSet(std::shared_ptr<LogFile> file, uint64_t file_end_offset,
                       std::vector<ReadRange> ranges)
    : file_(std::move(file)), ranges_(std::move(ranges)) {
  if (!file_)
    throw std::system_error(make_error_code(errc::invalid_range),
                            "read set requires an open log file");
  std::sort(ranges_.begin(), ranges_.end(),
            [](const ReadRange &a, const ReadRange &b) {
              if (a.offset != b.offset)
                return a.offset < b.offset;
              return a.key < b.key;
            });
  for (const auto &r : ranges_) {
    // offset + size may wrap; compare without adding.
    if (r.offset > file_end_offset || r.size > file_end_offset - r.offset)
      throw std::system_error(
          make_error_code(errc::invalid_range),
          "range offset=" + std::to_string(r.offset) +
              " size=" + std::to_string(r.size) + " exceeds end " +
              std::to_string(file_end_offset) + " of " + file_->path());
    Logger::instance().log(LogLevel::TRACE, "read set %s: key=%s off=%llu size=%llu",
                           file_->path().c_str(), r.key.c_str(),
                           (unsigned long long)r.offset,
                           (unsigned long long)r.size);
  }
}

const ReadRange &LogReadSet::range_at(size_t index) const {
  if (index >= ranges_.size())
    throw std::system_error(make_error_code(errc::index_out_of_range),
                            "index " + std::to_string(index) +
                                " out of read set of size " +
                                std::to_string(ranges_.size()));
  return ranges_[index];
}

uint64_t LogReadSet::transfer(size_t index, WritableChannel &dest,
                              uint64_t relative_offset, uint64_t max_size,
                              std::error_code &ec) const {
  ec.clear();
  const ReadRange &r = range_at(index);
  if (relative_offset > r.size)
    throw std::system_error(make_error_code(errc::offset_out_of_range),
                            "relative offset " +
                                std::to_string(relative_offset) +
                                " past range of size " + std::to_string(r.size));
  uint64_t n = std::min(max_size, r.size - relative_offset);
  if (n == 0)
    return 0;
  uint64_t start = r.offset + relative_offset;

  int out_fd = dest.native_handle();
  if (out_fd >= 0) {
    off_t pos = (off_t)start;
    for (;;) {
      ssize_t sent = ::sendfile(out_fd, file_->fd(), &pos,
                                (size_t)std::min(n, kMaxSendfileChunk));
      if (sent > 0) {
        Logger::instance().log(LogLevel::TRACE,
                               "sendfile %s pos=%llu sent=%zd",
                               file_->path().c_str(),
                               (unsigned long long)start, sent);
        return (uint64_t)sent;
      }
      if (sent == 0) {
        ec = std::make_error_code(std::errc::io_error);
        return 0;
      }
      if (errno == EINTR)
        continue;
      ec.assign(errno, std::system_category());
      return 0;
    }
  }

  uint8_t buf[kBounceBufferSize];
  size_t want = (size_t)std::min<uint64_t>(n, sizeof(buf));
  size_t got = file_->read_at(start, buf, want, ec);
  if (ec)
    return 0;
  if (got == 0) {
    ec = std::make_error_code(std::errc::io_error);
    return 0;
  }
  return dest.write_some(buf, got, ec);
}

ReadSetSend::ReadSetSend(std::shared_ptr<const LogReadSet> set)
    : set_(std::move(set)) {
  for (size_t i = 0; i < set_->count(); i++)
    Frame::check_capacity(set_->size_at(i));
  if (!is_complete())
    start_range();
}

void ReadSetSend::start_range() {
  put_u32_be(prefix_, (uint32_t)set_->size_at(index_));
  prefix_pos_ = 0;
  relative_offset_ = 0;
}

size_t ReadSetSend::write_to(WritableChannel &ch, std::error_code &ec) {
  ec.clear();
  size_t total = 0;
  while (!is_complete()) {
    if (prefix_pos_ < kLengthPrefixSize) {
      size_t n = ch.write_some(prefix_ + prefix_pos_,
                               kLengthPrefixSize - prefix_pos_, ec);
      prefix_pos_ += n;
      total += n;
      if (ec || prefix_pos_ < kLengthPrefixSize)
        return total;
    }
    uint64_t size = set_->size_at(index_);
    if (relative_offset_ < size) {
      uint64_t n = set_->transfer(index_, ch, relative_offset_,
                                  size - relative_offset_, ec);
      relative_offset_ += n;
      total += n;
      if (ec || n == 0)
        return total;
      if (relative_offset_ < size)
        continue;
    }
    if (++index_ < set_->count())
      start_range();
  }
  return total;
}

} // namespace blobstream
