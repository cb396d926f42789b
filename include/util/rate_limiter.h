#pragma once
#include <chrono>
#include <thread>

namespace util {

// RateLimiter: caps how often a loop runs.
//  - tick() at the end of an iteration sleeps until the next slot
//  - due()  is the non-blocking form, for work on a slower cadence
class RateLimiter {
public:
    using clock = std::chrono::steady_clock;

    explicit RateLimiter(int target_hz)
            : period_(target_hz > 0 ? std::chrono::microseconds(1000000 / target_hz)
                                    : std::chrono::microseconds(0)),
              next_(clock::now()) {}

    static RateLimiter every_ms(int period_ms) {
        RateLimiter r(0);
        r.period_ = std::chrono::microseconds(period_ms > 0 ? period_ms * 1000LL : 0);
        return r;
    }

    void tick() {
        if (period_.count() <= 0) return;
        next_ += period_;

        // Far behind (debugger, suspend): resync instead of bursting.
        const auto now = clock::now();
        if (now > next_ + period_ * 3) next_ = now;

        std::this_thread::sleep_until(next_);
    }

    bool due() {
        const auto now = clock::now();
        if (now < next_) return false;
        next_ = now + period_;
        return true;
    }

    void reset() {
        next_ = clock::now();
    }

private:
    std::chrono::microseconds period_;
    clock::time_point next_;
};

} // namespace util
