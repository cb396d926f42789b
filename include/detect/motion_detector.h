#pragma once
#include <opencv2/core.hpp>

#include "detect/background_model.h"
#include "detect/blob_filter.h"
#include "detect/detection_config.h"
#include "detect/motion_extractor.h"
#include "detect/motion_event.h"

namespace detect {

// Per-frame chain: BackgroundModel -> MotionExtractor -> BlobFilter.
class MotionDetector {
public:
    MotionDetector(const BackgroundModel::Config& bg_cfg,
                   const MotionExtractor::Config& ex_cfg);

    // (Re)creates the background model; warm-up starts over.
    void reset();
    void release();

    void warm_up(const cv::Mat& frame) { bg_.warm_up(frame); }
    bool ready() const { return bg_.ready(); }

    // Returns a motion-free event and an empty mask while the background
    // is not available. Throws std::invalid_argument for non-BGR frames.
    MotionEvent detect(const cv::Mat& frame_bgr,
                       const DetectionTunables& tunables,
                       cv::Mat& mask_out);

    const BackgroundModel& background() const { return bg_; }

private:
    void apply_sensitivity(int sensitivity);

    BackgroundModel bg_;
    MotionExtractor extractor_;
    BlobFilter blobs_;
    int applied_sensitivity_ = -1;
};

} // namespace detect
