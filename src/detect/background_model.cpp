#include "detect/background_model.h"

#include <algorithm>

namespace detect {

BackgroundModel::BackgroundModel(const Config& cfg)
    : cfg_(cfg), var_threshold_(cfg.var_threshold) {}

void BackgroundModel::reset() {
    mog2_ = cv::createBackgroundSubtractorMOG2(cfg_.history, var_threshold_, false);
    warmed_ = 0;
}

void BackgroundModel::release() {
    mog2_.release();
    warmed_ = 0;
}

int BackgroundModel::warmup_remaining() const {
    if (!initialized()) return cfg_.warmup_frames;
    return std::max(0, cfg_.warmup_frames - warmed_);
}

void BackgroundModel::warm_up(const cv::Mat& frame) {
    if (!initialized() || frame.empty()) return;

    cv::Mat unused;
    mog2_->apply(frame, unused);
    ++warmed_;
}

bool BackgroundModel::apply(const cv::Mat& frame, cv::Mat& fg_out) {
    fg_out.release();
    if (!initialized() || frame.empty()) return false;

    if (warmed_ < cfg_.warmup_frames) {
        warm_up(frame);
        return false;
    }

    mog2_->apply(frame, fg_out, cfg_.learning_rate);
    return !fg_out.empty();
}

void BackgroundModel::set_var_threshold(double v) {
    var_threshold_ = v;
    if (initialized()) mog2_->setVarThreshold(v);
}

// Higher sensitivity -> smaller squared-distance threshold -> more foreground.
double BackgroundModel::var_threshold_for(int sensitivity, double base_var_threshold) {
    const int s = std::max(1, sensitivity);
    return base_var_threshold * static_cast<double>(kReferenceSensitivity) / static_cast<double>(s);
}

} // namespace detect
