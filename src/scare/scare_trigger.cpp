#include "scare/scare_trigger.h"

#include <exception>
#include <iostream>
#include <thread>
#include <utility>

namespace scare {

std::optional<double> cooldown_remaining(const std::optional<Clock::time_point>& last_trigger,
                                         Clock::time_point now,
                                         int cooldown_seconds) {
    if (!last_trigger) return std::nullopt;

    const std::chrono::duration<double> elapsed = now - *last_trigger;
    const double cooldown = static_cast<double>(cooldown_seconds);
    if (elapsed.count() >= cooldown) return std::nullopt;

    return cooldown - elapsed.count();
}

ScareTrigger::ScareTrigger(std::shared_ptr<audio::AudioDispatcher> dispatcher, const LoggingConfig& log)
    : dispatcher_(std::move(dispatcher)), log_(log) {}

bool ScareTrigger::evaluate(const detect::MotionEvent& ev, int cooldown_seconds, Clock::time_point now) {
    if (paused()) return false;
    if (!ev.motion_detected) return false;

    if (last_trigger_) {
        const auto elapsed = now - *last_trigger_;
        if (elapsed < std::chrono::seconds(cooldown_seconds)) return false;
    }

    dispatch_async();

    // last_trigger only moves forward
    if (!last_trigger_ || now > *last_trigger_) last_trigger_ = now;
    stats_.record(WallClock::now());

    if (log_.trigger_logger) {
        std::cout << "[TRG] scare #" << stats_.detection_count()
                  << " blobs=" << ev.blobs.size()
                  << " area=" << ev.total_area << std::endl;
    }
    return true;
}

void ScareTrigger::dispatch_async() {
    if (!dispatcher_) return;

    auto dispatcher = dispatcher_;
    const bool verbose = log_.audio_logger;

    // Fire-and-forget: nobody joins this thread.
    std::thread([dispatcher, verbose]() {
        try {
            if (!dispatcher->play(audio::PlayReason::motion) && verbose) {
                std::cerr << "[AUD] scare playback failed" << std::endl;
            }
        } catch (const std::exception& e) {
            if (verbose) std::cerr << "[AUD] scare playback error: " << e.what() << std::endl;
        }
    }).detach();
}

bool ScareTrigger::test_trigger() {
    if (!dispatcher_) return false;

    try {
        return dispatcher_->play(audio::PlayReason::test);
    } catch (const std::exception& e) {
        if (log_.audio_logger) std::cerr << "[AUD] test playback error: " << e.what() << std::endl;
        return false;
    }
}

void ScareTrigger::pause() {
    if (mode_.exchange(Mode::paused, std::memory_order_acq_rel) != Mode::paused && log_.trigger_logger) {
        std::cout << "[TRG] detection paused" << std::endl;
    }
}

void ScareTrigger::resume() {
    if (mode_.exchange(Mode::monitoring, std::memory_order_acq_rel) != Mode::monitoring && log_.trigger_logger) {
        std::cout << "[TRG] detection resumed" << std::endl;
    }
}

bool ScareTrigger::toggle_pause() {
    Mode cur = mode_.load(std::memory_order_acquire);
    Mode next;
    do {
        next = (cur == Mode::paused) ? Mode::monitoring : Mode::paused;
    } while (!mode_.compare_exchange_weak(cur, next, std::memory_order_acq_rel));

    if (log_.trigger_logger) {
        std::cout << "[TRG] detection " << (next == Mode::paused ? "paused" : "resumed") << std::endl;
    }
    return next == Mode::paused;
}

TriggerSnapshot ScareTrigger::snapshot() const {
    TriggerSnapshot s;
    s.paused = paused();
    s.detection_count = stats_.detection_count();
    s.last_detection = stats_.last_detection();
    s.last_trigger = last_trigger_;
    return s;
}

} // namespace scare
