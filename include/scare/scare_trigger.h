#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

#include "audio/audio_dispatcher.h"
#include "config.h"
#include "detect/motion_event.h"
#include "scare/stats_tracker.h"

namespace scare {

using Clock = std::chrono::steady_clock;

enum class Mode {
    monitoring,
    paused
};

// Copy of the trigger bookkeeping for display.
struct TriggerSnapshot {
    bool paused = false;
    std::uint64_t detection_count = 0;
    std::optional<WallClock::time_point> last_detection;
    std::optional<Clock::time_point> last_trigger;
};

// Seconds left in the cooldown, or nothing once it has elapsed
// (or when nothing has fired yet).
std::optional<double> cooldown_remaining(const std::optional<Clock::time_point>& last_trigger,
                                         Clock::time_point now,
                                         int cooldown_seconds);

//------------------------------------------------------------------------------
// ScareTrigger
//
// Cooldown-gated decision turning a MotionEvent into a scare.
// The cooldown is not a state: it is derived from now - last_trigger.
// evaluate()/snapshot() belong to the processing thread; pause/resume and
// test_trigger() may be called from any thread.
//------------------------------------------------------------------------------
class ScareTrigger {
public:
    ScareTrigger(std::shared_ptr<audio::AudioDispatcher> dispatcher, const LoggingConfig& log);

    // true when the scare fired. The audio is dispatched on a detached
    // thread; its outcome never affects the decision.
    bool evaluate(const detect::MotionEvent& ev, int cooldown_seconds, Clock::time_point now);

    // Plays a cue right away, ignoring mode and cooldown. No bookkeeping.
    bool test_trigger();

    void pause();
    void resume();
    bool toggle_pause();   // returns the new paused state

    Mode mode() const { return mode_.load(std::memory_order_acquire); }
    bool paused() const { return mode() == Mode::paused; }

    const StatsTracker& stats() const { return stats_; }
    const std::optional<Clock::time_point>& last_trigger_time() const { return last_trigger_; }

    TriggerSnapshot snapshot() const;

private:
    void dispatch_async();

    std::shared_ptr<audio::AudioDispatcher> dispatcher_;
    LoggingConfig log_;

    std::atomic<Mode> mode_{Mode::monitoring};
    std::optional<Clock::time_point> last_trigger_;
    StatsTracker stats_;
};

} // namespace scare
