#include "ui/display_loop.h"

#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>

#include <iostream>
#include <utility>

namespace ui {

namespace {
    const char* kSensitivityBar = "Sensitivity";
    const char* kCooldownBar = "Cooldown (s)";
    const char* kMinAreaBar = "Min Motion Area";

    constexpr int kKeyEsc = 27;
}

DisplayLoop::DisplayLoop(core::ResultsStore& results,
                         detect::DetectionConfig& tunables,
                         Actions actions,
                         const Config& cfg,
                         const LoggingConfig& log)
    : results_(results),
      tunables_(tunables),
      actions_(std::move(actions)),
      cfg_(cfg),
      log_(log),
      limiter_(cfg.target_fps),
      stats_timer_(util::RateLimiter::every_ms(cfg.stats_period_ms)) {}

std::string DisplayLoop::format_stats(const scare::TriggerSnapshot& s) {
    std::string out = "Total Detections: " + std::to_string(s.detection_count);
    out += " | Last Detection: ";
    out += s.last_detection ? scare::format_clock_time(*s.last_detection) : "None";
    if (s.paused) out += " | PAUSED";
    return out;
}

void DisplayLoop::on_sensitivity(int pos, void* userdata) {
    auto* self = static_cast<DisplayLoop*>(userdata);
    if (self) self->tunables_.set_sensitivity(pos);
}

void DisplayLoop::on_cooldown(int pos, void* userdata) {
    auto* self = static_cast<DisplayLoop*>(userdata);
    if (self) self->tunables_.set_cooldown_seconds(pos);
}

void DisplayLoop::on_min_area(int pos, void* userdata) {
    auto* self = static_cast<DisplayLoop*>(userdata);
    if (self) self->tunables_.set_min_motion_area(pos);
}

void DisplayLoop::create_windows() {
    cv::namedWindow(cfg_.feed_window, cv::WINDOW_NORMAL);
    cv::namedWindow(cfg_.mask_window, cv::WINDOW_NORMAL);
    cv::resizeWindow(cfg_.feed_window, cfg_.display_width, cfg_.display_height);
    cv::resizeWindow(cfg_.mask_window, cfg_.display_width, cfg_.display_height);

    const detect::DetectionTunables t = tunables_.snapshot();

    // Sliders start at the configured values, bounded like the tunables.
    cv::createTrackbar(kSensitivityBar, cfg_.feed_window, nullptr,
                       detect::DetectionConfig::kMaxSensitivity, &DisplayLoop::on_sensitivity, this);
    cv::setTrackbarMin(kSensitivityBar, cfg_.feed_window, detect::DetectionConfig::kMinSensitivity);
    cv::setTrackbarPos(kSensitivityBar, cfg_.feed_window, t.sensitivity);

    cv::createTrackbar(kCooldownBar, cfg_.feed_window, nullptr,
                       detect::DetectionConfig::kMaxCooldown, &DisplayLoop::on_cooldown, this);
    cv::setTrackbarMin(kCooldownBar, cfg_.feed_window, detect::DetectionConfig::kMinCooldown);
    cv::setTrackbarPos(kCooldownBar, cfg_.feed_window, t.cooldown_seconds);

    cv::createTrackbar(kMinAreaBar, cfg_.feed_window, nullptr,
                       detect::DetectionConfig::kMaxMotionArea, &DisplayLoop::on_min_area, this);
    cv::setTrackbarMin(kMinAreaBar, cfg_.feed_window, detect::DetectionConfig::kMinMotionArea);
    cv::setTrackbarPos(kMinAreaBar, cfg_.feed_window, t.min_motion_area);
}

bool DisplayLoop::handle_key(int key) {
    if (key < 0) return true;

    switch (key) {
        case kKeyEsc:
        case 'q':
        case 'Q':
            if (log_.ui_logger) std::cout << "[UI] quit" << std::endl;
            return false;

        case 'p':
        case 'P':
            if (actions_.toggle_pause) {
                const bool paused = actions_.toggle_pause();
                if (log_.ui_logger) {
                    std::cout << "[UI] " << (paused ? "detection paused" : "monitoring for motion...") << std::endl;
                }
            }
            break;

        case 't':
        case 'T':
            if (actions_.test_sound) {
                const bool ok = actions_.test_sound();
                if (log_.ui_logger) {
                    if (ok) std::cout << "[UI] playing test sound..." << std::endl;
                    else std::cerr << "[UI] failed to play sound" << std::endl;
                }
            }
            break;

        case 'r':
        case 'R':
            if (actions_.reload_sounds) {
                const std::size_t n = actions_.reload_sounds();
                if (log_.ui_logger) std::cout << "[UI] audio reloaded: " << n << " sound(s)" << std::endl;
            }
            break;

        case 's':
        case 'S':
            if (actions_.toggle_monitoring) {
                const bool on = actions_.toggle_monitoring();
                if (log_.ui_logger) {
                    std::cout << "[UI] " << (on ? "monitoring started" : "monitoring stopped") << std::endl;
                }
            }
            break;

        default:
            break;
    }
    return true;
}

void DisplayLoop::show(const core::LatestResults& r) {
    const cv::Size size(cfg_.display_width, cfg_.display_height);

    if (!r.display.empty()) {
        cv::Mat view;
        cv::resize(r.display, view, size, 0, 0, cv::INTER_NEAREST);
        cv::imshow(cfg_.feed_window, view);
    }

    if (!r.mask.empty()) {
        cv::Mat view;
        cv::resize(r.mask, view, size, 0, 0, cv::INTER_NEAREST);
        cv::imshow(cfg_.mask_window, view);
    }
}

void DisplayLoop::poll_stats() {
    if (!actions_.poll_stats) return;

    const scare::TriggerSnapshot s = actions_.poll_stats();
    const std::string text = format_stats(s);
    cv::setWindowTitle(cfg_.feed_window, cfg_.feed_window + " | " + text);

    if (log_.ui_logger && s.detection_count != last_logged_count_) {
        std::cout << "[UI] " << text << std::endl;
        last_logged_count_ = s.detection_count;
    }
}

void DisplayLoop::run(std::atomic<bool>& keep_running) {
    create_windows();
    limiter_.reset();

    core::LatestResults r;
    while (keep_running.load(std::memory_order_relaxed)) {
        if (results_.wait_next(r, last_seq_, cfg_.wait_frame_ms)) {
            last_seq_ = r.seq;
            show(r);
        }

        if (stats_timer_.due()) poll_stats();

        // No waitKey: pollKey() only pumps HighGUI events.
        if (!handle_key(cv::pollKey())) {
            keep_running.store(false, std::memory_order_relaxed);
            break;
        }

        limiter_.tick();
    }

    cv::destroyAllWindows();
}

} // namespace ui
