#include "core/scare_system.h"

#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

namespace core {

ScareSystem::ScareSystem(video::FrameSource& source,
                         detect::DetectionConfig& tunables,
                         std::shared_ptr<audio::AudioDispatcher> audio,
                         const Config& cfg,
                         const LoggingConfig& log)
    : source_(source),
      tunables_(tunables),
      cfg_(cfg),
      log_(log),
      detector_(cfg.background, cfg.extractor),
      trigger_(std::move(audio), log),
      overlay_(cfg.overlay) {}

ScareSystem::~ScareSystem() {
    stop();
}

bool ScareSystem::connect() {
    if (running()) return true;

    if (!source_.connect()) {
        if (log_.capture_logger) {
            std::cerr << "[CAP] connect failed, staying idle" << std::endl;
        }
        return false;
    }

    std::lock_guard<std::mutex> lk(processing_mu_);
    detector_.reset();

    // Short warm-up so the first decision is not made against an empty model.
    // Missing frames are skipped; the model finishes warming in detect().
    const int warmup = cfg_.background.warmup_frames;
    for (int i = 0; i < warmup; ++i) {
        auto f = source_.read();
        if (f) detector_.warm_up(f->image);
    }

    results_.clear();
    connected_.store(true, std::memory_order_release);
    return true;
}

bool ScareSystem::process_frame() {
    if (!connected()) return false;

    auto frame = source_.read();
    if (!frame || frame->image.empty()) return false;

    try {
        process(*frame);
    } catch (const std::exception& e) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        if (log_.frame_error_logger) {
            std::cerr << "[DET] frame dropped: " << e.what() << std::endl;
        }
        return false;
    }

    processed_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

void ScareSystem::process(const video::Frame& frame) {
    // Tunables are read once per frame; slider changes land on the next one.
    const detect::DetectionTunables t = tunables_.snapshot();

    std::lock_guard<std::mutex> lk(processing_mu_);
    if (!connected()) return;

    cv::Mat mask;
    const detect::MotionEvent ev = detector_.detect(frame.image, t, mask);

    // Paused: the event is still shown, but never drives a trigger.
    if (!trigger_.paused()) {
        trigger_.evaluate(ev, t.cooldown_seconds, frame.captured_at);
    }

    LatestResults r;
    r.frame = frame.image;
    r.mask = mask;
    r.motion_detected = ev.motion_detected;
    r.cooldown_seconds = t.cooldown_seconds;
    r.state = trigger_.snapshot();
    r.display = overlay_.render(frame.image, mask, ev.blobs, ev.motion_detected,
                                r.state, t.cooldown_seconds, frame.captured_at);

    results_.publish(std::move(r));
}

bool ScareSystem::start() {
    if (!connected()) return false;
    if (running_.exchange(true, std::memory_order_acq_rel)) return true;

    th_ = std::thread(&ScareSystem::threadMain, this);
    return true;
}

void ScareSystem::stop() {
    running_.store(false, std::memory_order_release);
    if (th_.joinable()) th_.join();

    // Loop is gone: release the source before returning.
    std::lock_guard<std::mutex> lk(processing_mu_);
    const bool was_connected = connected_.exchange(false, std::memory_order_acq_rel);
    if (was_connected) {
        source_.release();
        detector_.release();
        if (log_.capture_logger) {
            std::cout << "[CAP] monitoring stopped" << std::endl;
        }
    }
}

scare::TriggerSnapshot ScareSystem::stats() const {
    std::lock_guard<std::mutex> lk(processing_mu_);
    return trigger_.snapshot();
}

void ScareSystem::threadMain() {
    if (log_.capture_logger) {
        std::cout << "[DET] processing loop started" << std::endl;
    }

    const auto backoff = std::chrono::milliseconds(cfg_.idle_backoff_ms);

    while (running_.load(std::memory_order_acquire)) {
        bool got = false;
        try {
            got = process_frame();
        } catch (const std::exception& e) {
            // read() failure: no frame this cycle, no retry.
            if (log_.frame_error_logger) {
                std::cerr << "[CAP] read failed: " << e.what() << std::endl;
            }
        }

        if (!got && running_.load(std::memory_order_acquire)) {
            std::this_thread::sleep_for(backoff);
        }
    }

    if (log_.capture_logger) {
        std::cout << "[DET] processing loop exit" << std::endl;
    }
}

} // namespace core
