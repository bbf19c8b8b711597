
#include <algorithm>
#include <cerrno>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

#include "common/test_check.hpp"
#include "log_read_set.hpp"
#include "logging.hpp"

using namespace blobstream;

namespace {

struct TempLog {
    std::string path;
    std::shared_ptr<LogFile> file;

    explicit TempLog(const char* name)
        : path("/tmp/blobstream_" + std::string(name) + "_" + std::to_string(::getpid()) + ".log") {
        ::unlink(path.c_str());
        file = LogFile::open(path);
    }
    ~TempLog() {
        file.reset();
        ::unlink(path.c_str());
    }
};

std::vector<uint8_t> pattern(size_t n, uint8_t seed) {
    std::vector<uint8_t> v(n);
    for (size_t i = 0; i < n; i++) v[i] = (uint8_t)(i * 13 + seed);
    return v;
}

// Pipe whose write end is offered for kernel transfers.
class PipeChannel : public WritableChannel {
public:
    PipeChannel() { TEST_CHECK(::pipe(fds_) == 0); }
    ~PipeChannel() override { ::close(fds_[0]); ::close(fds_[1]); }

    size_t write_some(const uint8_t* data, size_t len, std::error_code& ec) override {
        ec.clear();
        ssize_t n = ::write(fds_[1], data, len);
        if (n < 0) {
            ec.assign(errno, std::system_category());
            return 0;
        }
        return (size_t)n;
    }
    int native_handle() const override { return fds_[1]; }

    std::vector<uint8_t> read_exact(size_t n) {
        std::vector<uint8_t> out(n);
        size_t got = 0;
        while (got < n) {
            ssize_t r = ::read(fds_[0], out.data() + got, n - got);
            TEST_CHECK(r > 0);
            got += (size_t)r;
        }
        return out;
    }

private:
    int fds_[2];
};

} // namespace

void test_ranges_are_sorted() {
    std::cout << "[TEST] Read set ordering..." << std::endl;

    TempLog log("order");
    auto a = pattern(100, 1);
    log.file->append(a.data(), a.size());

    LogReadSet set(log.file, 100, {
        ReadRange{60, 40, std::nullopt, "c"},
        ReadRange{0, 10, std::nullopt, "a"},
        ReadRange{20, 5, 77, "b"},
        ReadRange{20, 5, std::nullopt, "a2"},
    });
    TEST_CHECK(set.count() == 4);
    TEST_CHECK(set.key_at(0) == "a");
    TEST_CHECK(set.key_at(1) == "a2");
    TEST_CHECK(set.key_at(2) == "b");
    TEST_CHECK(set.key_at(3) == "c");
    TEST_CHECK(set.size_at(3) == 40);
    TEST_CHECK(set.range_at(2).expiry_ms == 77);
    for (size_t i = 1; i < set.count(); i++)
        TEST_CHECK(set.range_at(i - 1).offset <= set.range_at(i).offset);

    std::cout << "[TEST] OK\n";
}

void test_validation() {
    std::cout << "[TEST] Read set validation..." << std::endl;

    TempLog log("validate");
    auto a = pattern(64, 2);
    log.file->append(a.data(), a.size());

    // Exactly at the end is fine, including an empty range there.
    LogReadSet ok(log.file, 64, {ReadRange{0, 64, std::nullopt, "all"},
                                 ReadRange{64, 0, std::nullopt, "empty"}});
    TEST_CHECK(ok.count() == 2);

    TEST_CHECK_THROWS(LogReadSet(log.file, 64, {ReadRange{0, 10, std::nullopt, "a"},
                                                ReadRange{60, 5, std::nullopt, "b"}}),
                      errc::invalid_range);
    TEST_CHECK_THROWS(LogReadSet(log.file, 64, {ReadRange{65, 0, std::nullopt, "a"}}),
                      errc::invalid_range);
    // offset + size wraps around.
    TEST_CHECK_THROWS(LogReadSet(log.file, 64, {ReadRange{8, UINT64_MAX, std::nullopt, "a"}}),
                      errc::invalid_range);
    TEST_CHECK_THROWS(LogReadSet(nullptr, 64, {}), errc::invalid_range);

    std::cout << "[TEST] OK\n";
}

void test_index_and_offset_errors() {
    std::cout << "[TEST] Read set index/offset errors..." << std::endl;

    TempLog log("errors");
    auto a = pattern(32, 3);
    log.file->append(a.data(), a.size());
    LogReadSet set(log.file, 32, {ReadRange{0, 32, std::nullopt, "a"}});

    BufferChannel ch;
    std::error_code ec;
    TEST_CHECK_THROWS(set.range_at(1), errc::index_out_of_range);
    TEST_CHECK_THROWS(set.key_at(5), errc::index_out_of_range);
    TEST_CHECK_THROWS(set.transfer(1, ch, 0, 10, ec), errc::index_out_of_range);
    TEST_CHECK_THROWS(set.transfer(0, ch, 33, 10, ec), errc::offset_out_of_range);

    // At the end of the range nothing moves.
    TEST_CHECK(set.transfer(0, ch, 32, 10, ec) == 0);
    TEST_CHECK(!ec);
    TEST_CHECK(ch.write_calls() == 0);

    std::cout << "[TEST] OK\n";
}

void test_transfer_sums_to_size() {
    std::cout << "[TEST] Read set transfer..." << std::endl;

    TempLog log("transfer");
    auto head = pattern(10, 4);
    auto body = pattern(200000, 5);
    log.file->append(head.data(), head.size());
    uint64_t off = log.file->append(body.data(), body.size());
    TEST_CHECK(off == 10);

    LogReadSet set(log.file, log.file->end_offset(), {ReadRange{off, body.size(), std::nullopt, "b"}});

    // Bounded steps move exactly min(max, size - rel).
    BufferChannel ch;
    std::error_code ec;
    uint64_t rel = 0;
    while (rel < body.size()) {
        uint64_t n = set.transfer(0, ch, rel, 7777, ec);
        TEST_CHECK(!ec);
        TEST_CHECK(n == std::min<uint64_t>(7777, body.size() - rel));
        rel += n;
    }
    TEST_CHECK(rel == body.size());
    TEST_CHECK(ch.data() == body);

    // A destination that takes little per call still sums to the range size.
    BufferChannel slow(1000);
    rel = 0;
    while (rel < body.size()) {
        uint64_t n = set.transfer(0, slow, rel, UINT64_MAX, ec);
        TEST_CHECK(!ec);
        TEST_CHECK(n > 0 && n <= 1000);
        rel += n;
    }
    TEST_CHECK(slow.data() == body);

    std::cout << "[TEST] OK\n";
}

void test_transfer_would_block() {
    std::cout << "[TEST] Read set transfer to a full destination..." << std::endl;

    TempLog log("block");
    auto a = pattern(50, 6);
    log.file->append(a.data(), a.size());
    LogReadSet set(log.file, 50, {ReadRange{0, 50, std::nullopt, "a"}});

    BufferChannel ch;
    ch.set_paused(true);
    std::error_code ec;
    TEST_CHECK(set.transfer(0, ch, 0, 50, ec) == 0);
    TEST_CHECK(is_would_block(ec));

    std::cout << "[TEST] OK\n";
}

void test_transfer_through_descriptor() {
    std::cout << "[TEST] Read set kernel transfer..." << std::endl;

    TempLog log("sendfile");
    auto a = pattern(3000, 7);
    log.file->append(a.data(), a.size());
    LogReadSet set(log.file, 3000, {ReadRange{1000, 1500, std::nullopt, "mid"}});

    PipeChannel pipe;
    std::error_code ec;
    uint64_t rel = 0;
    while (rel < 1500) {
        uint64_t n = set.transfer(0, pipe, rel, 400, ec);
        TEST_CHECK(!ec);
        TEST_CHECK(n > 0 && n <= 400);
        rel += n;
    }
    auto got = pipe.read_exact(1500);
    TEST_CHECK(std::equal(got.begin(), got.end(), a.begin() + 1000));

    std::cout << "[TEST] OK\n";
}

void test_concurrent_transfer() {
    std::cout << "[TEST] Read set concurrent transfer..." << std::endl;

    constexpr int kThreads = 8;
    constexpr size_t kRangeSize = 128 * 1024;
    constexpr size_t kPipeSpan = 48 * 1024;  // stays under the pipe buffer

    TempLog log("concurrent");
    std::vector<std::vector<uint8_t>> blobs;
    std::vector<ReadRange> ranges;
    for (int i = 0; i < kThreads; i++) {
        // Position-dependent bytes so a read at the wrong offset shows up.
        std::vector<uint8_t> v(kRangeSize);
        for (size_t j = 0; j < v.size(); j++) v[j] = (uint8_t)((j * 13) ^ (j >> 8) ^ (i * 31));
        uint64_t off = log.file->append(v.data(), v.size());
        ranges.push_back(ReadRange{off, v.size(), std::nullopt, "r" + std::to_string(i)});
        blobs.push_back(std::move(v));
    }
    LogReadSet set(log.file, log.file->end_offset(), ranges);

    std::vector<BufferChannel> sinks(kThreads);
    std::vector<std::thread> th;
    for (int i = 0; i < kThreads; i++) {
        th.emplace_back([&, i]() {
            std::error_code ec;
            uint64_t rel = 0;
            while (rel < kRangeSize) {
                uint64_t n = set.transfer(i, sinks[i], rel, 3000, ec);
                TEST_CHECK(!ec);
                TEST_CHECK(n > 0 && n <= 3000);
                rel += n;
            }
            TEST_CHECK(rel == kRangeSize);
        });
    }
    for (auto& t : th) t.join();
    for (int i = 0; i < kThreads; i++) TEST_CHECK(sinks[i].data() == blobs[i]);

    // Same again through descriptors, so the kernel path runs concurrently.
    std::vector<PipeChannel> pipes(kThreads);
    th.clear();
    for (int i = 0; i < kThreads; i++) {
        th.emplace_back([&, i]() {
            std::error_code ec;
            uint64_t rel = 0;
            while (rel < kPipeSpan) {
                uint64_t n = set.transfer(i, pipes[i], rel, std::min<uint64_t>(3000, kPipeSpan - rel), ec);
                TEST_CHECK(!ec);
                TEST_CHECK(n > 0);
                rel += n;
            }
        });
    }
    for (auto& t : th) t.join();
    for (int i = 0; i < kThreads; i++) {
        auto got = pipes[i].read_exact(kPipeSpan);
        TEST_CHECK(std::equal(got.begin(), got.end(), blobs[i].begin()));
    }

    std::cout << "[TEST] OK\n";
}

void test_read_set_send() {
    std::cout << "[TEST] ReadSetSend framing..." << std::endl;

    TempLog log("send");
    auto a = pattern(300, 8);
    auto b = pattern(70000, 9);
    uint64_t oa = log.file->append(a.data(), a.size());
    uint64_t ob = log.file->append(b.data(), b.size());
    auto set = std::make_shared<LogReadSet>(log.file, log.file->end_offset(), std::vector<ReadRange>{
        ReadRange{ob, b.size(), std::nullopt, "b"},
        ReadRange{oa, 0, std::nullopt, "empty"},
        ReadRange{oa, a.size(), std::nullopt, "a"},
    });

    ReadSetSend send(set);
    TEST_CHECK(!send.is_complete());
    BufferChannel ch(4099);
    std::error_code ec;

    ch.set_paused(true);
    TEST_CHECK(send.write_to(ch, ec) == 0);
    TEST_CHECK(is_would_block(ec));
    ch.set_paused(false);

    size_t total = 0;
    while (!send.is_complete()) {
        total += send.write_to(ch, ec);
        TEST_CHECK(!ec);
    }
    TEST_CHECK(total == 4 + 4 + a.size() + 4 + b.size());

    // Ordered by offset: "a" and "empty" share offset 0, then "b".
    const auto& out = ch.data();
    size_t pos = 0;
    TEST_CHECK(get_u32_be(out.data() + pos) == a.size());
    TEST_CHECK(std::equal(a.begin(), a.end(), out.begin() + pos + 4));
    pos += 4 + a.size();
    TEST_CHECK(get_u32_be(out.data() + pos) == 0);
    pos += 4;
    TEST_CHECK(get_u32_be(out.data() + pos) == b.size());
    TEST_CHECK(std::equal(b.begin(), b.end(), out.begin() + pos + 4));

    TEST_CHECK(send.write_to(ch, ec) == 0);

    ReadSetSend none(std::make_shared<LogReadSet>(log.file, 0, std::vector<ReadRange>{}));
    TEST_CHECK(none.is_complete());

    std::cout << "[TEST] OK\n";
}

int main() {
    Logger::instance().set_level(LogLevel::WARN);

    test_ranges_are_sorted();
    test_validation();
    test_index_and_offset_errors();
    test_transfer_sums_to_size();
    test_transfer_would_block();
    test_transfer_through_descriptor();
    test_concurrent_transfer();
    test_read_set_send();

    std::cout << "[TEST] ALL LOG READ SET TESTS PASSED!\n";
    return 0;
}
