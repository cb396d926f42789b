#pragma once
#include <opencv2/core.hpp>

#include <condition_variable>
#include <cstdint>
#include <mutex>

#include "scare/scare_trigger.h"

namespace core {

// Everything the display needs from one processed frame.
struct LatestResults {
    std::uint64_t seq = 0;        // 0 = nothing published yet
    cv::Mat frame;                // raw capture
    cv::Mat display;              // annotated
    cv::Mat mask;                 // empty while no background is available
    bool motion_detected = false;
    int cooldown_seconds = 0;
    scare::TriggerSnapshot state;
};

// Single-slot hand-off between the processing loop and the display.
// The bundle is replaced and copied as one unit under one mutex, so a
// reader never sees the mask of one frame with the image of another.
// Published Mats must not be written to afterwards.
class ResultsStore {
public:
    ResultsStore() = default;

    void publish(LatestResults&& r);   // assigns the next seq

    // Copy of the latest bundle; false if nothing was published yet.
    bool snapshot(LatestResults& out) const;

    // Waits for a bundle newer than after_seq. false on timeout or stop().
    bool wait_next(LatestResults& out, std::uint64_t after_seq, int timeout_ms);

    void clear();
    void stop();
    bool stopped() const;

private:
    mutable std::mutex m_;
    std::condition_variable cv_;
    LatestResults last_;
    std::uint64_t seq_ = 0;
    bool stop_ = false;
};

} // namespace core
