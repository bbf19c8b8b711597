
#pragma once
#include <asio.hpp>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include "blob_store.hpp"
#include "channel.hpp"
#include "content_channel.hpp"
#include "frame.hpp"
#include "protocol.hpp"

namespace blobstream {

struct ServerConfig {
    std::string listen_host{"0.0.0.0"};
    uint16_t listen_port{};
    int threads{4};
    std::string log_path{"blobstream.log"};
    uint32_t put_timeout_ms{30000};
    uint64_t max_blob_size{64ull << 20};
    uint32_t max_frame_size{4u << 20};
};

class BlobServer {
public:
    using tcp = asio::ip::tcp;
    using strand = asio::strand<asio::io_context::executor_type>;

    // Body of the PUT currently streaming on a connection.
    struct PendingPut {
        std::string key;
        std::optional<int64_t> expiry_ms;
        std::shared_ptr<AsyncContentChannel> channel;
        std::shared_ptr<BufferingWritableChannel> sink;
    };

    // All handlers of one connection run on its strand.
    struct Conn : public std::enable_shared_from_this<Conn> {
        strand exec;
        tcp::socket sock;
        asio::steady_timer put_timer;
        SocketChannel out;
        std::vector<uint8_t> read_buf;
        std::vector<uint8_t> inbuf;
        std::deque<std::unique_ptr<Send>> write_q;
        std::shared_ptr<PendingPut> put;
        bool writing{false};
        bool closed{false};
        explicit Conn(asio::io_context& io)
            : exec(asio::make_strand(io)), sock(exec), put_timer(exec), out(sock), read_buf(64*1024) {}
    };

    BlobServer(asio::io_context& io, const ServerConfig& cfg, BlobStore& store);
    void start();
    void stop();
    uint16_t local_port() const;

private:
    asio::io_context& io_;
    ServerConfig cfg_;
    BlobStore& store_;
    tcp::acceptor acceptor_;

    void do_accept();
    void do_read(std::shared_ptr<Conn> c);
    void do_write(std::shared_ptr<Conn> c);
    void parse_and_handle(std::shared_ptr<Conn> c, const uint8_t* data, size_t n);
    void handle_message(std::shared_ptr<Conn> c, const Message& msg);
    void handle_put(std::shared_ptr<Conn> c, const PutRequest& req);
    void handle_chunk(std::shared_ptr<Conn> c, const ChunkMessage& chunk);
    void handle_get(std::shared_ptr<Conn> c, const GetRequest& req);
    void finish_put(std::shared_ptr<Conn> c, std::shared_ptr<PendingPut> put, const ReadResult& r);
    void send_via(std::shared_ptr<Conn> c, std::unique_ptr<Send> s);
    void close_conn(std::shared_ptr<Conn> c);
};

Status status_for(const std::error_code& ec);

} // namespace blobstream
