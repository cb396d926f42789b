#include "detect/motion_detector.h"

#include <stdexcept>

namespace detect {

MotionDetector::MotionDetector(const BackgroundModel::Config& bg_cfg,
                               const MotionExtractor::Config& ex_cfg)
    : bg_(bg_cfg), extractor_(ex_cfg) {}

void MotionDetector::reset() {
    bg_.reset();
    applied_sensitivity_ = -1;
}

void MotionDetector::release() {
    bg_.release();
    applied_sensitivity_ = -1;
}

void MotionDetector::apply_sensitivity(int sensitivity) {
    if (sensitivity == applied_sensitivity_) return;
    bg_.set_var_threshold(BackgroundModel::var_threshold_for(sensitivity, bg_.config().var_threshold));
    applied_sensitivity_ = sensitivity;
}

MotionEvent MotionDetector::detect(const cv::Mat& frame_bgr,
                                   const DetectionTunables& tunables,
                                   cv::Mat& mask_out) {
    mask_out.release();
    if (frame_bgr.empty() || !bg_.initialized()) return MotionEvent{};
    if (frame_bgr.type() != CV_8UC3) {
        throw std::invalid_argument("expected an 8-bit BGR frame");
    }

    apply_sensitivity(tunables.sensitivity);

    cv::Mat fg;
    if (!bg_.apply(frame_bgr, fg)) {
        // Unformed background: never judge motion against it.
        return MotionEvent{};
    }

    mask_out = extractor_.extract(fg);
    return blobs_.filter(mask_out, tunables.min_motion_area);
}

} // namespace detect
