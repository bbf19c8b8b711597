
#include "blob_client.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <asio.hpp>
#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <iostream>
#include <sodium.h>
#include <thread>

using namespace blobstream;

namespace {

using Digest = std::array<uint8_t, crypto_generichash_BYTES>;

Digest digest_of(const std::vector<uint8_t> &data) {
  Digest d;
  crypto_generichash(d.data(), d.size(), data.data(), data.size(), nullptr, 0);
  return d;
}

size_t random_between(size_t lo, size_t hi) {
  if (hi <= lo)
    return lo;
  uint64_t span = (uint64_t)(hi - lo) + 1;
  if (span > 0xFFFFFFFFull)
    span = 0xFFFFFFFFull;
  return lo + randombytes_uniform((uint32_t)span);
}

struct Totals {
  std::atomic<uint64_t> puts{0};
  std::atomic<uint64_t> gets{0};
  std::atomic<uint64_t> bytes_put{0};
  std::atomic<uint64_t> bytes_got{0};
  std::atomic<uint64_t> failures{0};
};

// PUTs this worker's share of blobs, then reads each back and compares
// digests against what was uploaded.
void run_worker(const ClientConfig &cfg, int worker, int puts, Totals &t) {
  asio::io_context io;
  BlobClient client(io);
  try {
    client.connect(cfg.server_host, cfg.server_port);
  } catch (const std::system_error &e) {
    Logger::instance().log(LogLevel::ERROR, "worker %d cannot connect: %s",
                           worker, e.what());
    t.failures += puts;
    return;
  }

  std::vector<std::pair<std::string, Digest>> stored;
  for (int i = 0; i < puts; i++) {
    uint8_t tag[8];
    randombytes_buf(tag, sizeof(tag));
    PutRequest req;
    req.key = "w" + std::to_string(worker) + "-" + std::to_string(i) + "-" +
              bytes_to_hex(tag, sizeof(tag));
    std::vector<uint8_t> blob(random_between(cfg.min_blob_size, cfg.max_blob_size));
    randombytes_buf(blob.data(), blob.size());
    // Every other blob streams without a declared size.
    req.declared_size = (i % 2 == 0) ? (int64_t)blob.size() : kUnknownSize;
    size_t chunk = random_between(1, std::max<size_t>(cfg.max_chunk_size, 1));

    try {
      Status st = client.put(req, blob, chunk);
      if (st != Status::OK) {
        Logger::instance().log(LogLevel::ERROR, "PUT %s: %s", req.key.c_str(),
                               status_str(st));
        t.failures++;
        continue;
      }
    } catch (const std::system_error &e) {
      Logger::instance().log(LogLevel::ERROR, "PUT %s: %s", req.key.c_str(),
                             e.what());
      t.failures++;
      return;
    }
    t.puts++;
    t.bytes_put += blob.size();
    stored.emplace_back(req.key, digest_of(blob));
  }

  for (const auto &entry : stored) {
    for (int g = 0; g < cfg.gets_per_blob; g++) {
      std::vector<BlobInfo> infos;
      std::vector<std::vector<uint8_t>> blobs;
      try {
        Status st = client.get({entry.first}, infos, blobs);
        if (st != Status::OK || blobs.size() != 1) {
          Logger::instance().log(LogLevel::ERROR, "GET %s: %s",
                                 entry.first.c_str(), status_str(st));
          t.failures++;
          continue;
        }
      } catch (const std::system_error &e) {
        Logger::instance().log(LogLevel::ERROR, "GET %s: %s",
                               entry.first.c_str(), e.what());
        t.failures++;
        return;
      }
      if (digest_of(blobs[0]) != entry.second) {
        Logger::instance().log(LogLevel::ERROR, "GET %s: digest mismatch",
                               entry.first.c_str());
        t.failures++;
        continue;
      }
      t.gets++;
      t.bytes_got += blobs[0].size();
    }
  }

  // One multi-key read over everything this worker stored.
  if (stored.size() > 1) {
    std::vector<std::string> keys;
    for (const auto &entry : stored)
      keys.push_back(entry.first);
    std::vector<BlobInfo> infos;
    std::vector<std::vector<uint8_t>> blobs;
    try {
      Status st = client.get(keys, infos, blobs);
      if (st != Status::OK || blobs.size() != keys.size()) {
        Logger::instance().log(LogLevel::ERROR, "multi GET of %zu: %s",
                               keys.size(), status_str(st));
        t.failures++;
      } else {
        for (size_t i = 0; i < infos.size(); i++) {
          auto it = std::find_if(stored.begin(), stored.end(),
                                 [&](const auto &e) {
                                   return e.first == infos[i].key;
                                 });
          if (it == stored.end() || digest_of(blobs[i]) != it->second) {
            Logger::instance().log(LogLevel::ERROR,
                                   "multi GET: %s digest mismatch",
                                   infos[i].key.c_str());
            t.failures++;
          }
        }
      }
    } catch (const std::system_error &e) {
      Logger::instance().log(LogLevel::ERROR, "multi GET: %s", e.what());
      t.failures++;
    }
  }
  client.close();
}

} // namespace

int main(int argc, char **argv) {
  std::string server = "127.0.0.1:46180";
  std::string level = "info";
  ClientConfig cfg;
  cfg.threads = std::max(2u, std::thread::hardware_concurrency());

  try {
    for (int i = 1; i < argc; i++) {
      std::string a = argv[i];
      auto next = [&](int &i) -> std::string {
        if (i + 1 < argc)
          return std::string(argv[++i]);
        std::cerr << "missing value for " << a << "\n";
        std::exit(1);
      };
      if (a == "--server")
        server = next(i);
      else if (a == "--threads")
        cfg.threads = std::stoi(next(i));
      else if (a == "--puts")
        cfg.total_puts = std::stoi(next(i));
      else if (a == "--gets-per-blob")
        cfg.gets_per_blob = std::stoi(next(i));
      else if (a == "--min-size")
        cfg.min_blob_size = std::stoull(next(i));
      else if (a == "--max-size")
        cfg.max_blob_size = std::stoull(next(i));
      else if (a == "--chunk-size")
        cfg.max_chunk_size = std::stoull(next(i));
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

  if (!parse_host_port(server, cfg.server_host, cfg.server_port)) {
    std::cerr << "bad server" << std::endl;
    return 1;
  }
  if (cfg.threads < 1 || cfg.total_puts < 0 || cfg.gets_per_blob < 0 ||
      cfg.min_blob_size > cfg.max_blob_size) {
    std::cerr << "bad load parameters" << std::endl;
    return 1;
  }
  if (sodium_init() < 0) {
    std::cerr << "libsodium initialization failed" << std::endl;
    return 1;
  }

  Totals totals;
  auto start = std::chrono::steady_clock::now();
  std::vector<std::thread> th;
  th.reserve(cfg.threads);
  for (int i = 0; i < cfg.threads; i++) {
    int share = cfg.total_puts / cfg.threads + (i < cfg.total_puts % cfg.threads);
    th.emplace_back([&, i, share]() { run_worker(cfg, i, share, totals); });
  }
  for (auto &t : th)
    t.join();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start)
                .count();

  Logger::instance().log(
      LogLevel::INFO,
      "%llu puts (%llu bytes), %llu verified gets (%llu bytes), %llu failures "
      "in %lld ms",
      (unsigned long long)totals.puts.load(),
      (unsigned long long)totals.bytes_put.load(),
      (unsigned long long)totals.gets.load(),
      (unsigned long long)totals.bytes_got.load(),
      (unsigned long long)totals.failures.load(), (long long)ms);
  return totals.failures.load() == 0 ? 0 : 2;
}
