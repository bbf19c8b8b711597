
#pragma once
#include <asio.hpp>
#include <optional>
#include <string>
#include <vector>
#include "channel.hpp"
#include "protocol.hpp"

namespace blobstream {

struct ClientConfig {
    std::string server_host; uint16_t server_port{};
    int threads{4};
    int total_puts{64}; int gets_per_blob{4};
    size_t min_blob_size{0}; size_t max_blob_size{256*1024};
    size_t max_chunk_size{16*1024};
};

// Blocking request/response connection to a blob server. One request is in
// flight at a time. Transport failures, and keys or key lists too
// long to encode, throw std::system_error.
class BlobClient {
public:
    using tcp = asio::ip::tcp;

    explicit BlobClient(asio::io_context& io) : sock_(io), out_(sock_) {}
    void connect(const std::string& host, uint16_t port);
    void close();

    // Sends the request and the body split into chunks of at most
    // `chunk_size` bytes (0 sends one chunk); the last chunk is flagged.
    Status put(const PutRequest& req, const std::vector<uint8_t>& blob, size_t chunk_size);

    // On OK, `blobs` holds one entry per requested key, in server order
    // (ascending log offset), with `infos` describing each.
    Status get(const std::vector<std::string>& keys, std::vector<BlobInfo>& infos,
               std::vector<std::vector<uint8_t>>& blobs);

    // Low level access used by tests that exercise protocol violations.
    void send(Send& s);
    std::vector<uint8_t> read_frame();

private:
    tcp::socket sock_;
    SocketChannel out_;
};

} // namespace blobstream
