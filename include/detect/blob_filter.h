#pragma once
#include <opencv2/core.hpp>

#include "detect/motion_event.h"

namespace detect {

// External contours of a binary mask, filtered by polygon area.
// A blob survives when its area is strictly greater than min_area.
class BlobFilter {
public:
    MotionEvent filter(const cv::Mat& mask, double min_area) const;
};

} // namespace detect
