#include "detect/blob_filter.h"

#include <opencv2/imgproc.hpp>

#include <vector>

namespace detect {

MotionEvent BlobFilter::filter(const cv::Mat& mask, double min_area) const {
    MotionEvent ev;
    if (mask.empty()) return ev;

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(mask, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

    ev.blobs.reserve(contours.size());
    for (const auto& c : contours) {
        const double area = cv::contourArea(c);
        if (area <= min_area) continue;

        MotionBlob b;
        b.bbox = cv::boundingRect(c);
        b.area = area;
        ev.blobs.push_back(b);
        ev.total_area += area;
    }

    ev.motion_detected = !ev.blobs.empty();
    return ev;
}

} // namespace detect
