
#include "log_file.hpp"
#include "logging.hpp"
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

namespace blobstream {

namespace {

std::system_error errno_error(const std::string &what, const std::string &path) {
  return std::system_error(errno, std::system_category(),
                           what + "('" + path + "')");
}

} // namespace

std::shared_ptr<LogFile> LogFile::open(const std::string &path) {
  int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd == -1)
    throw errno_error("open", path);
  struct stat st;
  if (::fstat(fd, &st) != 0) {
    auto err = errno_error("fstat", path);
    ::close(fd);
    throw err;
  }
  Logger::instance().log(LogLevel::INFO, "opened log %s end=%llu",
                         path.c_str(), (unsigned long long)st.st_size);
  return std::shared_ptr<LogFile>(new LogFile(path, fd, (uint64_t)st.st_size));
}

LogFile::LogFile(std::string path, int fd, uint64_t end)
    : path_(std::move(path)), fd_(fd), end_(end) {}

LogFile::~LogFile() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

uint64_t LogFile::append(const uint8_t *data, size_t len) {
  std::lock_guard<std::mutex> lk(append_mtx_);
  uint64_t offset = end_.load(std::memory_order_relaxed);
  size_t written = 0;
  while (written < len) {
    ssize_t w = ::pwrite(fd_, data + written, len - written,
                         (off_t)(offset + written));
    if (w == -1) {
      if (errno == EINTR)
        continue;
      throw errno_error("pwrite", path_);
    }
    written += (size_t)w;
  }
  end_.store(offset + len, std::memory_order_release);
  return offset;
}

size_t LogFile::read_at(uint64_t offset, uint8_t *out, size_t len,
                       std::error_code &ec) const {
  ec.clear();
  for (;;) {
    ssize_t r = ::pread(fd_, out, len, (off_t)offset);
    if (r >= 0)
      return (size_t)r;
    if (errno != EINTR) {
      ec.assign(errno, std::system_category());
      return 0;
    }
  }
}

} // namespace blobstream
