
#include "content_channel.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <atomic>
#include <stdexcept>
#include <utility>

namespace blobstream {

namespace {

std::optional<int64_t> parse_size(const std::optional<std::string> &v) {
  if (!v || v->empty())
    return std::nullopt;
  try {
    size_t used = 0;
    long long n = std::stoll(*v, &used);
    if (used != v->size() || n < 0)
      return std::nullopt;
    return (int64_t)n;
  } catch (const std::logic_error &) {
    return std::nullopt;
  }
}

// Read callbacks raised while this thread holds a channel lock run once the
// thread has left its outermost locked section.
struct DeferredCallbacks {
  int depth = 0;
  std::vector<std::function<void()>> pending;
};

thread_local DeferredCallbacks t_deferred;

void run_or_defer(std::function<void()> fn) {
  if (t_deferred.depth > 0)
    t_deferred.pending.push_back(std::move(fn));
  else
    fn();
}

class LockedSection {
public:
  explicit LockedSection(std::recursive_mutex &m) : lk_(m) {
    t_deferred.depth++;
  }
  ~LockedSection() {
    lk_.unlock();
    if (--t_deferred.depth > 0)
      return;
    while (!t_deferred.pending.empty()) {
      std::vector<std::function<void()>> calls;
      calls.swap(t_deferred.pending);
      for (auto &fn : calls)
        fn();
    }
  }

private:
  std::unique_lock<std::recursive_mutex> lk_;
};

} // namespace

const char *method_str(RequestMethod m) {
  switch (m) {
  case RequestMethod::Get:
    return "GET";
  case RequestMethod::Head:
    return "HEAD";
  case RequestMethod::Post:
    return "POST";
  case RequestMethod::Put:
    return "PUT";
  default:
    return "DELETE";
  }
}

bool method_has_body(RequestMethod m) {
  return m == RequestMethod::Post || m == RequestMethod::Put;
}

int64_t resolve_declared_size(const std::optional<std::string> &blob_size,
                              const std::optional<std::string> &content_length) {
  if (auto n = parse_size(blob_size))
    return *n;
  if (auto n = parse_size(content_length))
    return *n;
  return -1;
}

const char *state_str(AsyncContentChannel::State s) {
  switch (s) {
  case AsyncContentChannel::State::NoReader:
    return "no-reader";
  case AsyncContentChannel::State::HasReader:
    return "has-reader";
  default:
    return "closed";
  }
}

void BufferingWritableChannel::write(ContentChunk chunk,
                                     WriteCallback callback) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    bytes_.insert(bytes_.end(), chunk.data(), chunk.data() + chunk.size());
    writes_++;
  }
  callback(chunk.size(), std::error_code());
}

std::vector<uint8_t> BufferingWritableChannel::take_bytes() {
  std::lock_guard<std::mutex> lk(mtx_);
  std::vector<uint8_t> out;
  out.swap(bytes_);
  return out;
}

size_t BufferingWritableChannel::size() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return bytes_.size();
}

size_t BufferingWritableChannel::write_count() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return writes_;
}

// One read_into() call: acknowledged byte count plus the single outcome.
class AsyncContentChannel::ReadOperation {
public:
  explicit ReadOperation(ReadCallback cb) : callback_(std::move(cb)) {}

  void on_written(uint64_t n) { bytes_.fetch_add(n, std::memory_order_acq_rel); }
  bool complete(std::error_code ec) {
    ReadResult r{bytes_.load(std::memory_order_acquire), ec};
    if (!cell_.try_set(r))
      return false;
    if (callback_)
      run_or_defer([cb = std::move(callback_), r]() { cb(r); });
    return true;
  }
  bool done() const { return cell_.is_set(); }
  std::future<ReadResult> future() { return cell_.take_future(); }

private:
  std::atomic<uint64_t> bytes_{0};
  ReadCallback callback_;
  CompletionCell<ReadResult> cell_;
};

AsyncContentChannel::AsyncContentChannel(RequestMethod method,
                                         int64_t declared_size)
    : method_(method), declared_size_(declared_size < 0 ? -1 : declared_size),
      close_error_(make_error_code(errc::channel_closed)) {}

AsyncContentChannel::~AsyncContentChannel() { close(); }

std::error_code AsyncContentChannel::add_content(ContentChunk chunk) {
  if (!method_has_body(method_) && (!chunk.is_last() || chunk.size() > 0)) {
    Logger::instance().log(LogLevel::WARN, "no content expected for %s",
                           method_str(method_));
    return make_error_code(errc::unsupported_content);
  }

  LockedSection lk(mtx_);
  if (state_ == State::Closed)
    return make_error_code(errc::invalid_state);
  if (last_seen_)
    return make_error_code(errc::content_after_last);
  if (op_ && op_->done())
    return make_error_code(errc::channel_closed);

  // Rejected chunks are not counted.
  uint64_t total = bytes_received_ + chunk.size();
  if (declared_size_ >= 0) {
    uint64_t declared = (uint64_t)declared_size_;
    if (total > declared) {
      Logger::instance().log(LogLevel::WARN,
                             "content exceeds declared size: %llu > %llu",
                             (unsigned long long)total,
                             (unsigned long long)declared);
      fail(make_error_code(errc::size_mismatch));
      return make_error_code(errc::size_mismatch);
    }
    if (chunk.is_last() && total < declared) {
      Logger::instance().log(LogLevel::WARN,
                             "content short of declared size: %llu < %llu",
                             (unsigned long long)total,
                             (unsigned long long)declared);
      fail(make_error_code(errc::size_mismatch));
      return make_error_code(errc::size_mismatch);
    }
  }
  bytes_received_ = total;
  if (chunk.is_last())
    last_seen_ = true;

  ContentChunk kept = std::move(chunk).retain();
  if (state_ == State::NoReader)
    queue_.push_back(std::move(kept));
  else
    forward(std::move(kept));
  return {};
}

std::future<ReadResult>
AsyncContentChannel::read_into(std::shared_ptr<AsyncWritableChannel> dest,
                               ReadCallback callback) {
  auto op = std::make_shared<ReadOperation>(std::move(callback));
  auto fut = op->future();

  LockedSection lk(mtx_);
  if (state_ == State::Closed) {
    op->complete(close_error_);
    return fut;
  }
  if (state_ == State::HasReader || !dest) {
    Logger::instance().log(LogLevel::WARN,
                           "content channel cannot be read more than once");
    op->complete(make_error_code(errc::invalid_state));
    return fut;
  }

  dest_ = std::move(dest);
  op_ = op;
  state_ = State::HasReader;
  Logger::instance().log(LogLevel::TRACE,
                         "reader attached, draining %zu queued chunks",
                         queue_.size());
  // Stop once the destination has failed the read.
  while (state_ == State::HasReader && !op->done() && !queue_.empty()) {
    ContentChunk chunk = std::move(queue_.front());
    queue_.pop_front();
    forward(std::move(chunk));
  }
  return fut;
}

void AsyncContentChannel::forward(ContentChunk chunk) {
  bool last = chunk.is_last();
  std::shared_ptr<ReadOperation> op = op_;
  // close() from inside the callback resets dest_; keep it alive for the call.
  std::shared_ptr<AsyncWritableChannel> dest = dest_;
  dest->write(std::move(chunk), [op, last](uint64_t n, std::error_code ec) {
    op->on_written(n);
    if (ec || last)
      op->complete(ec);
  });
}

void AsyncContentChannel::fail(std::error_code ec) {
  LockedSection lk(mtx_);
  close_error_ = ec;
  close();
}

void AsyncContentChannel::close() {
  LockedSection lk(mtx_);
  if (state_ == State::Closed)
    return;
  Logger::instance().log(LogLevel::TRACE,
                         "closing %s content channel (%s) with %zu chunks unread",
                         method_str(method_), state_str(state_),
                         queue_.size());
  state_ = State::Closed;
  queue_.clear();
  dest_.reset();
  std::shared_ptr<ReadOperation> op = std::move(op_);
  if (op)
    op->complete(close_error_);
}

bool AsyncContentChannel::is_open() const {
  std::lock_guard<std::recursive_mutex> lk(mtx_);
  return state_ != State::Closed;
}

AsyncContentChannel::State AsyncContentChannel::state() const {
  std::lock_guard<std::recursive_mutex> lk(mtx_);
  return state_;
}

uint64_t AsyncContentChannel::bytes_received() const {
  std::lock_guard<std::recursive_mutex> lk(mtx_);
  return bytes_received_;
}

} // namespace blobstream
