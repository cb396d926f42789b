#pragma once
#include <opencv2/core.hpp>

#include <vector>

namespace detect {

// One foreground region that survived area filtering.
struct MotionBlob {
    cv::Rect bbox;
    double area = 0.0;
};

// Per-frame detection result. Never outlives the frame it came from.
struct MotionEvent {
    bool motion_detected = false;
    std::vector<MotionBlob> blobs;   // contour scan order
    double total_area = 0.0;
};

} // namespace detect
