#pragma once
#include <opencv2/core.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include "config.h"
#include "core/results_store.h"
#include "detect/detection_config.h"
#include "scare/scare_trigger.h"
#include "util/rate_limiter.h"

namespace ui {

// DisplayLoop: operator window, runs on the main thread (HighGUI).
// 1) waits for the next published results (the thread sleeps)
// 2) shows the annotated feed and the motion mask, pollKey() for events
// 3) sliders write straight into the live DetectionConfig
// 4) stats are polled on their own, slower cadence
// FPS is capped so the UI never spins.
class DisplayLoop {
public:
    struct Config {
        int target_fps = 60;
        int wait_frame_ms = 16;
        int stats_period_ms = 1000;
        int display_width = 640;
        int display_height = 360;
        std::string feed_window = "Live Feed";
        std::string mask_window = "Motion Detection";
    };

    // Operator commands; each may be left empty.
    struct Actions {
        std::function<bool()> toggle_pause;          // -> now paused
        std::function<bool()> test_sound;            // -> playback started
        std::function<std::size_t()> reload_sounds;  // -> clips available
        std::function<bool()> toggle_monitoring;     // -> now monitoring
        std::function<scare::TriggerSnapshot()> poll_stats;
    };

    DisplayLoop(core::ResultsStore& results,
                detect::DetectionConfig& tunables,
                Actions actions,
                const Config& cfg,
                const LoggingConfig& log);

    // Returns when keep_running turns false or the operator quits.
    void run(std::atomic<bool>& keep_running);

    // false = quit requested.
    bool handle_key(int key);

    static std::string format_stats(const scare::TriggerSnapshot& s);

private:
    void create_windows();
    void show(const core::LatestResults& r);
    void poll_stats();

    static void on_sensitivity(int pos, void* userdata);
    static void on_cooldown(int pos, void* userdata);
    static void on_min_area(int pos, void* userdata);

    core::ResultsStore& results_;
    detect::DetectionConfig& tunables_;
    Actions actions_;
    Config cfg_;
    LoggingConfig log_;

    util::RateLimiter limiter_;
    util::RateLimiter stats_timer_;
    std::uint64_t last_seq_ = 0;
    std::uint64_t last_logged_count_ = 0;
};

} // namespace ui
