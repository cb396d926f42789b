#include "overlay/overlay_renderer.h"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cstdio>

namespace overlay {

namespace {
    const cv::Scalar kRed(0, 0, 255);
    const cv::Scalar kGreen(0, 255, 0);
    const cv::Scalar kYellow(0, 255, 255);
    const cv::Scalar kWhite(255, 255, 255);

    constexpr int kTextX = 10;
    constexpr int kFirstLineY = 30;
    constexpr int kLineStep = 30;
}

//------------------------------------------------------------------------------
// ctor
//------------------------------------------------------------------------------
OverlayRenderer::OverlayRenderer(const Config& cfg)
        : cfg_(cfg) {}

//------------------------------------------------------------------------------
// Utility helpers
//------------------------------------------------------------------------------
cv::Rect OverlayRenderer::clip_rect(const cv::Rect& r, int w, int h) {
    int x1 = std::max(0, r.x);
    int y1 = std::max(0, r.y);
    int x2 = std::min(w, r.x + r.width);
    int y2 = std::min(h, r.y + r.height);

    if (x2 <= x1 || y2 <= y1)
        return cv::Rect(0, 0, 0, 0);

    return cv::Rect(x1, y1, x2 - x1, y2 - y1);
}

void OverlayRenderer::draw_rect_alpha(
        cv::Mat& frame,
        const cv::Rect& r,
        const cv::Scalar& color,
        float alpha
) {
    if (alpha <= 0.0f)
        return;

    alpha = std::min(1.0f, alpha);

    cv::Rect rr = clip_rect(r, frame.cols, frame.rows);
    if (rr.width <= 0 || rr.height <= 0)
        return;

    cv::Mat roi = frame(rr);
    cv::Mat layer(roi.size(), roi.type(), color);
    cv::addWeighted(layer, alpha, roi, 1.0f - alpha, 0.0, roi);
}

// Mask goes into the red channel only, then the whole layer is blended.
void OverlayRenderer::blend_mask(cv::Mat& frame, const cv::Mat& mask) const {
    if (mask.empty() || frame.type() != CV_8UC3 || mask.size() != frame.size() || mask.type() != CV_8UC1)
        return;

    const cv::Mat zeros = cv::Mat::zeros(mask.size(), CV_8UC1);
    const std::vector<cv::Mat> planes{zeros, zeros, mask};
    cv::Mat layer;
    cv::merge(planes, layer);

    const float a = std::clamp(cfg_.mask_alpha, 0.0f, 1.0f);
    cv::addWeighted(frame, 1.0f - a, layer, a, 0.0, frame);
}

//------------------------------------------------------------------------------
// Status text
//------------------------------------------------------------------------------
std::vector<StatusLine> OverlayRenderer::status_lines(bool motion_detected,
                                                      const scare::TriggerSnapshot& state,
                                                      int cooldown_seconds,
                                                      scare::Clock::time_point now) {
    std::vector<StatusLine> lines;

    if (state.paused) {
        lines.push_back({"PAUSED", kYellow, 0.7, 2});
    } else if (motion_detected) {
        lines.push_back({"MOTION DETECTED!", kRed, 0.7, 2});
    } else {
        lines.push_back({"Monitoring...", kGreen, 0.7, 2});
    }

    lines.push_back({"Detections: " + std::to_string(state.detection_count), kWhite, 0.6, 2});

    if (state.last_detection) {
        lines.push_back({"Last: " + scare::format_clock_time(*state.last_detection), kWhite, 0.5, 1});
    }

    const auto remaining = scare::cooldown_remaining(state.last_trigger, now, cooldown_seconds);
    if (remaining) {
        char buf[48];
        std::snprintf(buf, sizeof(buf), "Cooldown: %.1fs", *remaining);
        lines.push_back({buf, kYellow, 0.6, 2});
    }

    return lines;
}

//------------------------------------------------------------------------------
// Render
//------------------------------------------------------------------------------
cv::Mat OverlayRenderer::render(const cv::Mat& frame,
                                const cv::Mat& mask,
                                const std::vector<detect::MotionBlob>& blobs,
                                bool motion_detected,
                                const scare::TriggerSnapshot& state,
                                int cooldown_seconds,
                                scare::Clock::time_point now) const {
    cv::Mat out = frame.clone();
    if (out.empty())
        return out;

    blend_mask(out, mask);

    for (const auto& b : blobs) {
        const cv::Rect r = clip_rect(b.bbox, out.cols, out.rows);
        if (r.width > 0 && r.height > 0)
            cv::rectangle(out, r, kRed, cfg_.box_thickness);
    }

    const auto lines = status_lines(motion_detected, state, cooldown_seconds, now);

    if (cfg_.hud_alpha > 0.0f) {
        const int hud_h = kFirstLineY + kLineStep * static_cast<int>(lines.size() - 1) + 12;
        draw_rect_alpha(out, cv::Rect(0, 0, std::min(out.cols, 260), hud_h), cv::Scalar(0, 0, 0), cfg_.hud_alpha);
    }

    int y = kFirstLineY;
    for (const auto& l : lines) {
        cv::putText(out, l.text, cv::Point(kTextX, y),
                    cv::FONT_HERSHEY_SIMPLEX, l.scale, l.color, l.thickness, cv::LINE_AA);
        y += kLineStep;
    }

    return out;
}

} // namespace overlay
