#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace scare {

using WallClock = std::chrono::system_clock;

// Detection count and time of the last fired scare.
// Written only from the trigger's fire path.
class StatsTracker {
public:
    void record(WallClock::time_point when) {
        ++detection_count_;
        last_detection_ = when;
    }

    std::uint64_t detection_count() const { return detection_count_; }
    const std::optional<WallClock::time_point>& last_detection() const { return last_detection_; }

private:
    std::uint64_t detection_count_ = 0;
    std::optional<WallClock::time_point> last_detection_;
};

// Local time as HH:MM:SS.
std::string format_clock_time(WallClock::time_point tp);

} // namespace scare
