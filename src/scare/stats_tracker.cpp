#include "scare/stats_tracker.h"

#include <ctime>

namespace scare {

std::string format_clock_time(WallClock::time_point tp) {
    const std::time_t t = WallClock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm); // thread-safe
    char buf[16];
    if (std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm) == 0)
        return std::string();
    return std::string(buf);
}

} // namespace scare
