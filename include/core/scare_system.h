#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "audio/audio_dispatcher.h"
#include "config.h"
#include "core/results_store.h"
#include "detect/detection_config.h"
#include "detect/motion_detector.h"
#include "overlay/overlay_renderer.h"
#include "scare/scare_trigger.h"
#include "video/frame_source.h"

namespace core {

//------------------------------------------------------------------------------
// ScareSystem
//
// Owns the per-session state (background model, trigger bookkeeping, latest
// results) and runs the sequential processing loop:
//
//   read -> detect -> trigger (unless paused) -> overlay -> publish
//
// One frame at a time, no pipelining. The display side only touches
// results(), stats(), the pause toggle and test_trigger().
//------------------------------------------------------------------------------
class ScareSystem {
public:
    struct Config {
        detect::BackgroundModel::Config background;
        detect::MotionExtractor::Config extractor;
        overlay::OverlayRenderer::Config overlay;
        int idle_backoff_ms = 5;   // sleep after a cycle without a frame
    };

    ScareSystem(video::FrameSource& source,
                detect::DetectionConfig& tunables,
                std::shared_ptr<audio::AudioDispatcher> audio,
                const Config& cfg,
                const LoggingConfig& log);
    ~ScareSystem();

    ScareSystem(const ScareSystem&) = delete;
    ScareSystem& operator=(const ScareSystem&) = delete;

    // Opens the source, creates the background model and warms it up.
    // On failure nothing is initialized.
    bool connect();
    bool connected() const { return connected_.load(std::memory_order_acquire); }

    // One processing cycle. false when not connected, no frame arrived,
    // or the frame was dropped because processing failed.
    bool process_frame();

    // Processing loop on its own thread. Requires connect().
    bool start();
    // Stops the loop, releases the source, discards the model. Idempotent.
    void stop();
    bool running() const { return running_.load(std::memory_order_acquire); }

    void pause() { trigger_.pause(); }
    bool toggle_pause() { return trigger_.toggle_pause(); }
    bool paused() const { return trigger_.paused(); }

    bool test_trigger() { return trigger_.test_trigger(); }

    scare::TriggerSnapshot stats() const;

    ResultsStore& results() { return results_; }
    const ResultsStore& results() const { return results_; }

    std::uint64_t frames_processed() const { return processed_.load(std::memory_order_relaxed); }
    std::uint64_t frames_dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
    void threadMain();
    void process(const video::Frame& frame);

    video::FrameSource& source_;
    detect::DetectionConfig& tunables_;
    Config cfg_;
    LoggingConfig log_;

    // Guards detector_, trigger_ bookkeeping and the connect/stop transition.
    mutable std::mutex processing_mu_;
    detect::MotionDetector detector_;
    scare::ScareTrigger trigger_;
    overlay::OverlayRenderer overlay_;
    ResultsStore results_;

    std::atomic<bool> connected_{false};
    std::atomic<bool> running_{false};
    std::thread th_;

    std::atomic<std::uint64_t> processed_{0};
    std::atomic<std::uint64_t> dropped_{0};
};

} // namespace core
