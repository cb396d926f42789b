#pragma once

#include <algorithm>
#include <atomic>

namespace detect {

// Plain copy of the tunables, taken once at the start of a frame.
struct DetectionTunables {
    int sensitivity = 25;
    int min_motion_area = 500;
    int cooldown_seconds = 5;
};

// Live tunables. Written by the operator sliders at any time,
// read by the processing loop at the start of each frame.
struct DetectionConfig {
    static constexpr int kMinSensitivity = 10;
    static constexpr int kMaxSensitivity = 100;
    static constexpr int kMinMotionArea = 100;
    static constexpr int kMaxMotionArea = 2000;
    static constexpr int kMinCooldown = 1;
    static constexpr int kMaxCooldown = 30;

    std::atomic<int> sensitivity{25};
    std::atomic<int> min_motion_area{500};
    std::atomic<int> cooldown_seconds{5};

    void set_sensitivity(int v) {
        sensitivity.store(std::clamp(v, kMinSensitivity, kMaxSensitivity), std::memory_order_relaxed);
    }

    void set_min_motion_area(int v) {
        min_motion_area.store(std::clamp(v, kMinMotionArea, kMaxMotionArea), std::memory_order_relaxed);
    }

    void set_cooldown_seconds(int v) {
        cooldown_seconds.store(std::clamp(v, kMinCooldown, kMaxCooldown), std::memory_order_relaxed);
    }

    DetectionTunables snapshot() const {
        DetectionTunables t;
        t.sensitivity = sensitivity.load(std::memory_order_relaxed);
        t.min_motion_area = min_motion_area.load(std::memory_order_relaxed);
        t.cooldown_seconds = cooldown_seconds.load(std::memory_order_relaxed);
        return t;
    }
};

} // namespace detect
