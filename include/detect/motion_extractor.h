#pragma once
#include <opencv2/core.hpp>

namespace detect {

// Foreground map -> clean binary mask.
// Hard threshold, then a single opening with a small elliptical kernel.
class MotionExtractor {
public:
    struct Config {
        int fg_threshold = 250;   // keep only values above this
        int kernel_size = 3;
    };

    explicit MotionExtractor(const Config& cfg);

    cv::Mat extract(const cv::Mat& fg) const;

private:
    Config cfg_;
    cv::Mat kernel_;
};

} // namespace detect
