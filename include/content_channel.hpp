
#pragma once
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <vector>
#include "completion.hpp"
#include "content_chunk.hpp"

namespace blobstream {

enum class RequestMethod { Get, Head, Post, Put, Delete };

const char* method_str(RequestMethod m);
bool method_has_body(RequestMethod m);

// Declared body size: explicit blob size header, else content length, else
// unknown (-1). Values that do not parse as a non-negative integer are
// ignored.
int64_t resolve_declared_size(const std::optional<std::string>& blob_size,
                              const std::optional<std::string>& content_length);

using WriteCallback = std::function<void(uint64_t bytes_written, std::error_code ec)>;

// Consumer side of a content channel. write() takes the chunk and must call
// `callback` exactly once, possibly before returning.
class AsyncWritableChannel {
public:
    virtual ~AsyncWritableChannel() = default;
    virtual void write(ContentChunk chunk, WriteCallback callback) = 0;
};

// Collects everything written to it; acknowledges inline.
class BufferingWritableChannel : public AsyncWritableChannel {
public:
    void write(ContentChunk chunk, WriteCallback callback) override;

    std::vector<uint8_t> take_bytes();
    size_t size() const;
    size_t write_count() const;

private:
    mutable std::mutex mtx_;
    std::vector<uint8_t> bytes_;
    size_t writes_{0};
};

struct ReadResult {
    uint64_t bytes_forwarded{0};
    std::error_code error;
};

using ReadCallback = std::function<void(const ReadResult&)>;

// Inbound body channel between the transport (add_content) and the request
// handler (read_into). Chunks added before the reader attaches are queued
// and drained on attach; later chunks are forwarded as they arrive. Both
// paths run under one lock, so every chunk reaches the destination exactly
// once and in arrival order. The read resolves exactly once.
class AsyncContentChannel {
public:
    enum class State { NoReader, HasReader, Closed };

    AsyncContentChannel(RequestMethod method, int64_t declared_size);
    ~AsyncContentChannel();

    AsyncContentChannel(const AsyncContentChannel&) = delete;
    AsyncContentChannel& operator=(const AsyncContentChannel&) = delete;

    // Called by the transport for each inbound chunk. A size mismatch forces
    // completion with the same error and closes the channel.
    std::error_code add_content(ContentChunk chunk);

    // Attaches the single consumer. A second call, or a call after close,
    // yields a future that already holds the error.
    //
    // The future is set while the channel is locked. `callback` runs after
    // the lock is released, on the thread that completed the read (the one
    // calling add_content, read_into or close, or the one acknowledging the
    // last write). It may call back into the channel and may block on other
    // threads that use it.
    std::future<ReadResult> read_into(std::shared_ptr<AsyncWritableChannel> dest,
                                      ReadCallback callback = {});

    // Idempotent. Drops queued chunks and fails a pending read with
    // errc::channel_closed.
    void close();

    bool is_open() const;
    State state() const;
    RequestMethod method() const { return method_; }
    int64_t declared_size() const { return declared_size_; }
    // Bytes of accepted chunks; a rejected chunk is not counted.
    uint64_t bytes_received() const;

private:
    class ReadOperation;

    void forward(ContentChunk chunk);
    void fail(std::error_code ec);

    const RequestMethod method_;
    const int64_t declared_size_;

    // Recursive: destinations may acknowledge inside write(), and close()
    // runs inside add_content() on a size mismatch.
    mutable std::recursive_mutex mtx_;
    State state_{State::NoReader};
    std::deque<ContentChunk> queue_;
    std::shared_ptr<AsyncWritableChannel> dest_;
    std::shared_ptr<ReadOperation> op_;
    uint64_t bytes_received_{0};
    bool last_seen_{false};
    std::error_code close_error_;
};

const char* state_str(AsyncContentChannel::State s);

} // namespace blobstream
