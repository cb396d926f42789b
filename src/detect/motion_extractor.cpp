#include "detect/motion_extractor.h"

#include <opencv2/imgproc.hpp>

#include <algorithm>

namespace detect {

MotionExtractor::MotionExtractor(const Config& cfg) : cfg_(cfg) {
    const int k = std::max(1, cfg_.kernel_size);
    kernel_ = cv::getStructuringElement(cv::MORPH_ELLIPSE, cv::Size(k, k));
}

cv::Mat MotionExtractor::extract(const cv::Mat& fg) const {
    cv::Mat mask;
    if (fg.empty()) return mask;

    cv::threshold(fg, mask, cfg_.fg_threshold, 255, cv::THRESH_BINARY);

    // One iteration only: this runs on every frame.
    cv::morphologyEx(mask, mask, cv::MORPH_OPEN, kernel_, cv::Point(-1, -1), 1);
    return mask;
}

} // namespace detect
