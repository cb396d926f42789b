#include "core/results_store.h"

#include <chrono>
#include <utility>

namespace core {

void ResultsStore::publish(LatestResults&& r) {
    {
        std::lock_guard<std::mutex> lk(m_);
        if (stop_) return;
        r.seq = ++seq_;
        last_ = std::move(r);
    }
    cv_.notify_all();
}

bool ResultsStore::snapshot(LatestResults& out) const {
    std::lock_guard<std::mutex> lk(m_);
    if (last_.seq == 0) return false;

    // Mats are shallow copies; publishers never write into published buffers.
    out = last_;
    return true;
}

bool ResultsStore::wait_next(LatestResults& out, std::uint64_t after_seq, int timeout_ms) {
    std::unique_lock<std::mutex> lk(m_);

    const auto pred = [&]() {
        return stop_ || last_.seq > after_seq;
    };

    if (!cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms), pred)) {
        return false; // timeout
    }
    if (stop_) return false;

    out = last_;
    return true;
}

void ResultsStore::clear() {
    std::lock_guard<std::mutex> lk(m_);
    // seq_ keeps counting so waiters never see an older number again.
    last_ = LatestResults{};
}

void ResultsStore::stop() {
    {
        std::lock_guard<std::mutex> lk(m_);
        stop_ = true;
    }
    cv_.notify_all();
}

bool ResultsStore::stopped() const {
    std::lock_guard<std::mutex> lk(m_);
    return stop_;
}

} // namespace core
