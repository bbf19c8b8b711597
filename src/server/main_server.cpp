
#include "blob_server.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <asio.hpp>
#include <csignal>
#include <iostream>
#include <thread>

using namespace blobstream;

int main(int argc, char **argv) {
  std::string listen = "0.0.0.0:46180";
  int threads = std::max(2u, std::thread::hardware_concurrency());
  ServerConfig cfg;
  std::string level = "info";

  try {
    for (int i = 1; i < argc; i++) {
      std::string a = argv[i];
      auto next = [&](int &i) -> std::string {
        if (i + 1 < argc)
          return std::string(argv[++i]);
        std::cerr << "missing value for " << a << "\n";
        std::exit(1);
      };
      if (a == "--listen")
        listen = next(i);
      else if (a == "--threads")
        threads = std::stoi(next(i));
      else if (a == "--log")
        cfg.log_path = next(i);
      else if (a == "--put-timeout-ms")
        cfg.put_timeout_ms = (uint32_t)std::stoul(next(i));
      else if (a == "--max-blob-size")
        cfg.max_blob_size = std::stoull(next(i));
      else if (a == "--max-frame-size")
        cfg.max_frame_size = (uint32_t)std::stoul(next(i));
      else if (a == "--log-level")
        level = next(i);
      else {
        std::cerr << "unknown option " << a << "\n";
        return 1;
      }
    }
  } catch (const std::logic_error &) {
    std::cerr << "bad numeric option" << std::endl;
    return 1;
  }

  auto lvl = parse_log_level(level);
  if (!lvl) {
    std::cerr << "bad log level " << level << std::endl;
    return 1;
  }
  Logger::instance().set_level(*lvl);

  if (!parse_host_port(listen, cfg.listen_host, cfg.listen_port)) {
    std::cerr << "bad listen" << std::endl;
    return 1;
  }
  cfg.threads = std::max(1, threads);

  std::shared_ptr<LogFile> log;
  try {
    log = LogFile::open(cfg.log_path);
  } catch (const std::system_error &e) {
    Logger::instance().log(LogLevel::ERROR, "cannot open %s: %s",
                           cfg.log_path.c_str(), e.what());
    return 1;
  }
  BlobStore store(log);
  Logger::instance().log(LogLevel::INFO, "log %s opened at offset %llu",
                         cfg.log_path.c_str(),
                         (unsigned long long)log->end_offset());

  asio::io_context io;
  BlobServer server(io, cfg, store);
  try {
    server.start();
  } catch (const std::system_error &e) {
    Logger::instance().log(LogLevel::ERROR, "cannot listen on %s: %s",
                           listen.c_str(), e.what());
    return 1;
  }

  asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([&](std::error_code ec, int) {
    if (ec)
      return;
    Logger::instance().log(LogLevel::INFO, "shutting down, %zu blobs stored",
                           store.blob_count());
    server.stop();
    io.stop();
  });

  std::vector<std::thread> th;
  th.reserve(cfg.threads);
  for (int i = 0; i < cfg.threads; i++)
    th.emplace_back([&]() { io.run(); });
  for (auto &t : th)
    t.join();
  return 0;
}
