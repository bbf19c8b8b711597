
#include "blob_client.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <algorithm>

namespace blobstream {

namespace {

std::system_error malformed(const char *what) {
  return std::system_error(make_error_code(errc::malformed_message), what);
}

} // namespace

void BlobClient::connect(const std::string &host, uint16_t port) {
  tcp::resolver res(sock_.get_executor());
  auto eps = res.resolve(host, std::to_string(port));
  asio::connect(sock_, eps);
  sock_.set_option(tcp::no_delay(true));
  Logger::instance().log(LogLevel::DEBUG, "connected to %s:%u", host.c_str(),
                         (unsigned)port);
}

void BlobClient::close() {
  std::error_code ec;
  sock_.shutdown(tcp::socket::shutdown_both, ec);
  sock_.close(ec);
}

void BlobClient::send(Send &s) {
  while (!s.is_complete()) {
    std::error_code ec;
    s.write_to(out_, ec);
    if (ec)
      throw std::system_error(ec, "send");
  }
}

std::vector<uint8_t> BlobClient::read_frame() {
  uint8_t prefix[kLengthPrefixSize];
  asio::read(sock_, asio::buffer(prefix, sizeof(prefix)));
  std::vector<uint8_t> payload(get_u32_be(prefix));
  asio::read(sock_, asio::buffer(payload));
  return payload;
}

Status BlobClient::put(const PutRequest &req, const std::vector<uint8_t> &blob,
                       size_t chunk_size) {
  Frame head = make_frame(req);
  send(head);

  if (chunk_size == 0)
    chunk_size = std::max<size_t>(blob.size(), 1);
  size_t off = 0;
  do {
    size_t n = std::min(chunk_size, blob.size() - off);
    bool last = off + n == blob.size();
    Frame chunk = make_frame(ChunkMessage{last, blob.data() + off, n});
    send(chunk);
    off += n;
  } while (off < blob.size());

  auto payload = read_frame();
  auto msg = decode_message(payload.data(), payload.size());
  if (!msg)
    throw malformed("bad PUT response");
  auto *resp = std::get_if<PutResponse>(&msg->body);
  if (!resp || resp->key != req.key)
    throw malformed("unexpected PUT response");
  return resp->status;
}

Status BlobClient::get(const std::vector<std::string> &keys,
                       std::vector<BlobInfo> &infos,
                       std::vector<std::vector<uint8_t>> &blobs) {
  Frame req = make_frame(GetRequest{keys});
  send(req);

  auto payload = read_frame();
  auto msg = decode_message(payload.data(), payload.size());
  if (!msg)
    throw malformed("bad GET response");
  auto *resp = std::get_if<GetResponse>(&msg->body);
  if (!resp)
    throw malformed("unexpected GET response");
  infos.clear();
  blobs.clear();
  if (resp->status != Status::OK)
    return resp->status;

  infos = std::move(resp->blobs);
  blobs.reserve(infos.size());
  for (const auto &info : infos) {
    blobs.push_back(read_frame());
    if (blobs.back().size() != info.size)
      throw malformed("blob frame size differs from response");
  }
  return Status::OK;
}

} // namespace blobstream
