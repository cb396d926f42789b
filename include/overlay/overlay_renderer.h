#pragma once

#include <opencv2/core.hpp>
#include <string>
#include <vector>

#include "detect/motion_event.h"
#include "scare/scare_trigger.h"

namespace overlay {

struct StatusLine {
    std::string text;
    cv::Scalar color;
    double scale = 0.6;
    int thickness = 2;
};

//------------------------------------------------------------------------------
// OverlayRenderer
//
// Builds the operator view of one processed frame:
//  - motion mask as a translucent red layer
//  - a red box per surviving blob
//  - status text (state, count, last detection, cooldown countdown)
//
// Pure: inputs are never modified, a new image is returned every call.
//------------------------------------------------------------------------------
class OverlayRenderer {
public:
    struct Config {
        float mask_alpha = 0.3f;   // weight of the mask layer
        float hud_alpha = 0.25f;   // dark strip behind the status text
        int box_thickness = 2;
    };

    explicit OverlayRenderer(const Config& cfg);

    cv::Mat render(const cv::Mat& frame,
                   const cv::Mat& mask,
                   const std::vector<detect::MotionBlob>& blobs,
                   bool motion_detected,
                   const scare::TriggerSnapshot& state,
                   int cooldown_seconds,
                   scare::Clock::time_point now) const;

    static std::vector<StatusLine> status_lines(bool motion_detected,
                                                const scare::TriggerSnapshot& state,
                                                int cooldown_seconds,
                                                scare::Clock::time_point now);

private:
    Config cfg_;

    static cv::Rect clip_rect(const cv::Rect& r, int w, int h);

    static void draw_rect_alpha(
            cv::Mat& frame,
            const cv::Rect& r,
            const cv::Scalar& color,
            float alpha
    );

    void blend_mask(cv::Mat& frame, const cv::Mat& mask) const;
};

} // namespace overlay
