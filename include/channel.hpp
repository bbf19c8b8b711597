
#pragma once
#include <asio.hpp>
#include <cstddef>
#include <cstdint>
#include <system_error>
#include <vector>

namespace blobstream {

// Destination for outbound bytes. write_some never blocks on a non-blocking
// transport: a full destination returns 0 with a would-block error code.
class WritableChannel {
public:
    virtual ~WritableChannel() = default;
    virtual size_t write_some(const uint8_t* data, size_t len, std::error_code& ec) = 0;
    // Descriptor usable for kernel-side transfers, or -1 when there is none.
    virtual int native_handle() const { return -1; }
};

class SocketChannel : public WritableChannel {
public:
    explicit SocketChannel(asio::ip::tcp::socket& sock) : sock_(sock) {}
    size_t write_some(const uint8_t* data, size_t len, std::error_code& ec) override;
    int native_handle() const override;
private:
    asio::ip::tcp::socket& sock_;
};

// In-memory sink. A non-zero per-call limit models a destination that accepts
// only part of each write; a paused sink accepts nothing.
class BufferChannel : public WritableChannel {
public:
    explicit BufferChannel(size_t per_call_limit = 0) : limit_(per_call_limit) {}
    size_t write_some(const uint8_t* data, size_t len, std::error_code& ec) override;

    void set_per_call_limit(size_t limit) { limit_ = limit; }
    void set_paused(bool paused) { paused_ = paused; }
    const std::vector<uint8_t>& data() const { return data_; }
    size_t write_calls() const { return calls_; }
private:
    std::vector<uint8_t> data_;
    size_t limit_;
    size_t calls_{0};
    bool paused_{false};
};

} // namespace blobstream
