
#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>

namespace blobstream {

// Append-only log file accessed positionally. Readers may share one handle
// because no operation moves the descriptor's file offset. end_offset() is
// the committed watermark: bytes below it are fully written.
class LogFile {
public:
    // Opens or creates `path`; existing content counts as committed.
    // Throws std::system_error on failure.
    static std::shared_ptr<LogFile> open(const std::string& path);

    ~LogFile();
    LogFile(const LogFile&) = delete;
    LogFile& operator=(const LogFile&) = delete;

    // Writes `len` bytes after the current end, then advances the watermark.
    // Returns the offset the bytes were written at.
    uint64_t append(const uint8_t* data, size_t len);

    // One positional read of up to `len` bytes; returns 0 at end of file.
    size_t read_at(uint64_t offset, uint8_t* out, size_t len, std::error_code& ec) const;

    uint64_t end_offset() const { return end_.load(std::memory_order_acquire); }
    int fd() const { return fd_; }
    const std::string& path() const { return path_; }

private:
    LogFile(std::string path, int fd, uint64_t end);

    std::string path_;
    int fd_;
    std::mutex append_mtx_;
    std::atomic<uint64_t> end_;
};

} // namespace blobstream
