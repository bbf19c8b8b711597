
#pragma once
#include <atomic>
#include <functional>
#include <future>
#include <utility>

namespace blobstream {

// Result slot written at most once. Several completion paths may race to
// set it; the first wins and every later attempt is a no-op. The value is
// published through a future and, optionally, a callback run by the winner.
template <typename T>
class CompletionCell {
public:
    using Callback = std::function<void(const T&)>;

    explicit CompletionCell(Callback cb = {}) : cb_(std::move(cb)), future_(promise_.get_future()) {}

    CompletionCell(const CompletionCell&) = delete;
    CompletionCell& operator=(const CompletionCell&) = delete;

    // Returns false if the cell was already set.
    bool try_set(T value) {
        bool expected = false;
        if (!done_.compare_exchange_strong(expected, true, std::memory_order_acq_rel))
            return false;
        promise_.set_value(value);
        if (cb_)
            cb_(value);
        return true;
    }

    bool is_set() const { return done_.load(std::memory_order_acquire); }

    // May be taken once.
    std::future<T> take_future() { return std::move(future_); }

private:
    std::atomic<bool> done_{false};
    Callback cb_;
    std::promise<T> promise_;
    std::future<T> future_;
};

} // namespace blobstream
