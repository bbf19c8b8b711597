
#include "blob_server.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <chrono>

namespace blobstream {

namespace {

int64_t now_ms() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch())
      .count();
}

std::unique_ptr<Send> frame_of(MessageBody body) {
  return std::make_unique<Frame>(make_frame(std::move(body)));
}

} // namespace

Status status_for(const std::error_code &ec) {
  if (!ec)
    return Status::OK;
  if (ec == errc::size_mismatch)
    return Status::SIZE_MISMATCH;
  if (ec == errc::channel_closed)
    return Status::CLOSED;
  if (ec == errc::unsupported_content || ec == errc::content_after_last ||
      ec == errc::malformed_message)
    return Status::BAD_REQUEST;
  return Status::INTERNAL_ERROR;
}

BlobServer::BlobServer(asio::io_context &io, const ServerConfig &cfg,
                       BlobStore &store)
    : io_(io), cfg_(cfg), store_(store), acceptor_(io) {}

void BlobServer::start() {
  tcp::endpoint ep(asio::ip::make_address(cfg_.listen_host), cfg_.listen_port);
  acceptor_.open(ep.protocol());
  acceptor_.set_option(asio::socket_base::reuse_address(true));
  acceptor_.bind(ep);
  acceptor_.listen();
  Logger::instance().log(LogLevel::INFO, "listening on %s:%u",
                         cfg_.listen_host.c_str(), (unsigned)local_port());
  do_accept();
}

void BlobServer::stop() {
  std::error_code ec;
  acceptor_.close(ec);
}

uint16_t BlobServer::local_port() const {
  std::error_code ec;
  return acceptor_.local_endpoint(ec).port();
}

void BlobServer::do_accept() {
  auto c = std::make_shared<Conn>(io_);
  acceptor_.async_accept(c->sock, [this, c](std::error_code ec) {
    if (ec == asio::error::operation_aborted)
      return;
    if (!ec) {
      c->sock.non_blocking(true, ec);
      if (ec) {
        Logger::instance().log(LogLevel::ERROR, "non_blocking failed: %s",
                               ec.message().c_str());
      } else {
        Logger::instance().log(LogLevel::DEBUG, "accepted connection");
        asio::dispatch(c->exec, [this, c]() { do_read(c); });
      }
    } else {
      Logger::instance().log(LogLevel::WARN, "accept failed: %s",
                             ec.message().c_str());
    }
    do_accept();
  });
}

void BlobServer::do_read(std::shared_ptr<Conn> c) {
  c->sock.async_read_some(asio::buffer(c->read_buf),
                          [this, c](std::error_code ec, std::size_t n) {
                            if (ec) {
                              if (ec != asio::error::eof)
                                Logger::instance().log(
                                    LogLevel::DEBUG, "read error: %s",
                                    ec.message().c_str());
                              close_conn(c);
                              return;
                            }
                            parse_and_handle(c, c->read_buf.data(), n);
                            if (!c->closed)
                              do_read(c);
                          });
}

void BlobServer::parse_and_handle(std::shared_ptr<Conn> c, const uint8_t *data,
                                  size_t n) {
  c->inbuf.insert(c->inbuf.end(), data, data + n);
  size_t off = 0;
  while (c->inbuf.size() - off >= kLengthPrefixSize) {
    uint32_t len = get_u32_be(c->inbuf.data() + off);
    if (len > cfg_.max_frame_size) {
      Logger::instance().log(LogLevel::WARN,
                             "frame of %u bytes exceeds limit %u, closing",
                             len, cfg_.max_frame_size);
      close_conn(c);
      return;
    }
    size_t need = kLengthPrefixSize + len;
    if (c->inbuf.size() - off < need)
      break;
    // Chunk views point into inbuf, which stays put until the erase below.
    auto msg = decode_message(c->inbuf.data() + off + kLengthPrefixSize, len);
    off += need;
    if (!msg) {
      Logger::instance().log(LogLevel::WARN, "malformed message, closing");
      close_conn(c);
      return;
    }
    handle_message(c, *msg);
    if (c->closed)
      return;
  }
  if (off > 0)
    c->inbuf.erase(c->inbuf.begin(), c->inbuf.begin() + off);
}

void BlobServer::handle_message(std::shared_ptr<Conn> c, const Message &msg) {
  if (auto *put = std::get_if<PutRequest>(&msg.body))
    handle_put(c, *put);
  else if (auto *chunk = std::get_if<ChunkMessage>(&msg.body))
    handle_chunk(c, *chunk);
  else if (auto *get = std::get_if<GetRequest>(&msg.body))
    handle_get(c, *get);
  else {
    Logger::instance().log(LogLevel::WARN, "unexpected message type 0x%02x",
                           (unsigned)msg.type());
    close_conn(c);
  }
}

void BlobServer::handle_put(std::shared_ptr<Conn> c, const PutRequest &req) {
  if (c->put && c->put->channel->is_open()) {
    Logger::instance().log(LogLevel::WARN, "PUT %s while another is streaming",
                           req.key.c_str());
    send_via(c, frame_of(PutResponse{Status::BAD_REQUEST, req.key}));
    return;
  }
  if (req.declared_size > 0 && (uint64_t)req.declared_size > cfg_.max_blob_size) {
    Logger::instance().log(LogLevel::WARN, "PUT %s declares %lld bytes",
                           req.key.c_str(), (long long)req.declared_size);
    send_via(c, frame_of(PutResponse{Status::BAD_REQUEST, req.key}));
    return;
  }

  auto put = std::make_shared<PendingPut>();
  put->key = req.key;
  if (req.expiry_ms != kNoExpiry)
    put->expiry_ms = req.expiry_ms;
  put->channel =
      std::make_shared<AsyncContentChannel>(RequestMethod::Put, req.declared_size);
  put->sink = std::make_shared<BufferingWritableChannel>();
  c->put = put;
  Logger::instance().log(LogLevel::DEBUG, "PUT %s declared=%lld",
                         req.key.c_str(), (long long)req.declared_size);

  // Completion may fire inside add_content() or close(); finish on the strand.
  // The cycle through the callback is broken when finish_put closes the channel.
  std::weak_ptr<Conn> weak = c;
  std::weak_ptr<PendingPut> weak_put = put;
  put->channel->read_into(put->sink, [this, weak, put](const ReadResult &r) {
    auto c = weak.lock();
    if (!c)
      return;
    asio::post(c->exec, [this, c, put, r]() { finish_put(c, put, r); });
  });

  c->put_timer.expires_after(std::chrono::milliseconds(cfg_.put_timeout_ms));
  c->put_timer.async_wait([c, weak_put](std::error_code ec) {
    if (ec)
      return;
    auto put = weak_put.lock();
    if (put && c->put == put && put->channel->is_open()) {
      Logger::instance().log(LogLevel::WARN, "PUT %s timed out",
                             put->key.c_str());
      put->channel->close();
    }
  });
}

void BlobServer::handle_chunk(std::shared_ptr<Conn> c, const ChunkMessage &m) {
  if (!c->put) {
    Logger::instance().log(LogLevel::DEBUG, "dropping chunk outside a PUT");
    return;
  }
  auto &channel = c->put->channel;
  if (channel->bytes_received() + m.size > cfg_.max_blob_size) {
    Logger::instance().log(LogLevel::WARN, "PUT %s exceeds %llu bytes",
                           c->put->key.c_str(),
                           (unsigned long long)cfg_.max_blob_size);
    channel->close();
    return;
  }
  std::error_code ec =
      channel->add_content(ContentChunk::borrowed(m.data, m.size, m.is_last));
  if (ec) {
    Logger::instance().log(LogLevel::DEBUG, "chunk for %s rejected: %s",
                           c->put->key.c_str(), ec.message().c_str());
    return;
  }
  // The body is complete; the connection may start its next request while
  // finish_put is still queued.
  if (m.is_last) {
    c->put_timer.cancel();
    c->put.reset();
  }
}

void BlobServer::finish_put(std::shared_ptr<Conn> c,
                            std::shared_ptr<PendingPut> put,
                            const ReadResult &r) {
  if (c->put == put) {
    c->put_timer.cancel();
    c->put.reset();
  }
  put->channel->close();
  if (c->closed)
    return;

  Status st = status_for(r.error);
  if (st == Status::OK) {
    try {
      store_.put(put->key, put->expiry_ms, put->sink->take_bytes());
    } catch (const std::system_error &e) {
      Logger::instance().log(LogLevel::ERROR, "store %s failed: %s",
                             put->key.c_str(), e.what());
      st = Status::INTERNAL_ERROR;
    }
  } else {
    Logger::instance().log(LogLevel::WARN, "PUT %s failed after %llu bytes: %s",
                           put->key.c_str(),
                           (unsigned long long)r.bytes_forwarded,
                           r.error.message().c_str());
  }
  send_via(c, frame_of(PutResponse{st, put->key}));
}

void BlobServer::handle_get(std::shared_ptr<Conn> c, const GetRequest &req) {
  Lookup found = store_.lookup(req.keys, now_ms());
  GetResponse resp;
  if (found.status != LookupStatus::OK) {
    resp.status = found.status == LookupStatus::NOT_FOUND ? Status::NOT_FOUND
                                                          : Status::EXPIRED;
    Logger::instance().log(LogLevel::DEBUG, "GET %s: %s",
                           found.failed_key.c_str(), status_str(resp.status));
    send_via(c, frame_of(std::move(resp)));
    return;
  }

  const LogReadSet &set = *found.read_set;
  for (size_t i = 0; i < set.count(); i++) {
    const ReadRange &r = set.range_at(i);
    resp.blobs.push_back(BlobInfo{r.key, r.size, r.expiry_ms.value_or(kNoExpiry)});
  }
  std::unique_ptr<Send> body;
  try {
    body = std::make_unique<ReadSetSend>(found.read_set);
  } catch (const std::system_error &e) {
    Logger::instance().log(LogLevel::ERROR, "GET cannot be framed: %s",
                           e.what());
    send_via(c, frame_of(GetResponse{Status::INTERNAL_ERROR, {}}));
    return;
  }
  send_via(c, frame_of(std::move(resp)));
  send_via(c, std::move(body));
}

void BlobServer::send_via(std::shared_ptr<Conn> c, std::unique_ptr<Send> s) {
  if (c->closed)
    return;
  c->write_q.push_back(std::move(s));
  if (!c->writing)
    do_write(c);
}

void BlobServer::do_write(std::shared_ptr<Conn> c) {
  while (!c->write_q.empty()) {
    Send &front = *c->write_q.front();
    std::error_code ec;
    front.write_to(c->out, ec);
    if (ec && !is_would_block(ec)) {
      Logger::instance().log(LogLevel::WARN, "write error: %s",
                             ec.message().c_str());
      close_conn(c);
      return;
    }
    if (!front.is_complete()) {
      c->writing = true;
      c->sock.async_wait(tcp::socket::wait_write,
                         [this, c](std::error_code ec) {
                           c->writing = false;
                           if (ec) {
                             close_conn(c);
                             return;
                           }
                           do_write(c);
                         });
      return;
    }
    c->write_q.pop_front();
  }
}

void BlobServer::close_conn(std::shared_ptr<Conn> c) {
  if (c->closed)
    return;
  c->closed = true;
  c->put_timer.cancel();
  if (auto put = std::move(c->put))
    put->channel->close();
  c->write_q.clear();
  std::error_code ec;
  c->sock.shutdown(tcp::socket::shutdown_both, ec);
  c->sock.close(ec);
  Logger::instance().log(LogLevel::DEBUG, "connection closed");
}

} // namespace blobstream
