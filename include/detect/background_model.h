#pragma once
#include <opencv2/core.hpp>
#include <opencv2/video/background_segm.hpp>

namespace detect {

//------------------------------------------------------------------------------
// BackgroundModel
//
// Adaptive per-pixel background (OpenCV MOG2, shadows off).
//  - reset()   creates a fresh model and restarts warm-up
//  - release() discards it ("not initialized" again)
//  - apply()   returns a foreground map only once warm-up is complete
//------------------------------------------------------------------------------
class BackgroundModel {
public:
    struct Config {
        int history = 100;            // frames contributing to the model
        double var_threshold = 16.0;  // at the reference sensitivity
        double learning_rate = 0.01;  // used after warm-up
        int warmup_frames = 10;
    };

    // Sensitivity at which var_threshold applies unchanged.
    static constexpr int kReferenceSensitivity = 25;

    explicit BackgroundModel(const Config& cfg);

    void reset();
    void release();

    bool initialized() const { return !mog2_.empty(); }
    bool ready() const { return initialized() && warmed_ >= cfg_.warmup_frames; }
    int warmup_remaining() const;

    // Feed one frame with the automatic learning rate. Counts towards warm-up.
    void warm_up(const cv::Mat& frame);

    // false = no background available (uninitialized or still warming up).
    // A warming-up frame is consumed by the model.
    bool apply(const cv::Mat& frame, cv::Mat& fg_out);

    void set_var_threshold(double v);
    double var_threshold() const { return var_threshold_; }

    static double var_threshold_for(int sensitivity, double base_var_threshold);

    const Config& config() const { return cfg_; }

private:
    Config cfg_;
    cv::Ptr<cv::BackgroundSubtractorMOG2> mog2_;
    int warmed_ = 0;
    double var_threshold_;
};

} // namespace detect
