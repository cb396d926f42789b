#pragma once
#include <gst/gst.h>
#include <gst/app/gstappsrc.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "audio/audio_dispatcher.h"
#include "audio/clip_library.h"
#include "config.h"

namespace audio {

//------------------------------------------------------------------------------
// GstAudioPlayer
//
// AudioDispatcher over GStreamer.
//  - files:        playbin uri=file://...
//  - default tone: appsrc ! audioconvert ! audioresample ! volume ! <sink>
//
// play() returns once the pipeline is PLAYING; a detached watcher waits for
// EOS/ERROR on the bus and tears the pipeline down.
// gst_init() must have been called.
//------------------------------------------------------------------------------
class GstAudioPlayer : public AudioDispatcher {
public:
    struct Config {
        double volume = 1.0;
        int start_timeout_ms = 2000;
        int max_play_ms = 60000;   // watcher gives up after this
        std::string sink = "autoaudiosink";
    };

    // The player shares ownership of the library: detached playback
    // threads may keep the player alive past its creator.
    GstAudioPlayer(std::shared_ptr<ClipLibrary> clips, const Config& cfg, const LoggingConfig& log);

    bool play(PlayReason reason) override;

    std::size_t reload() { return clips_->load(); }
    std::size_t clip_count() const { return clips_->size(); }

    int active_playbacks() const { return active_->load(std::memory_order_acquire); }

private:
    GstElement* build_file_pipeline(const Clip& clip) const;
    GstElement* build_pcm_pipeline(const Clip& clip) const;
    GstElement* make_sink(const char* name) const;
    bool start(GstElement* pipeline, const Clip& clip);
    void watch(GstElement* pipeline, std::string name);

    std::shared_ptr<ClipLibrary> clips_;
    Config cfg_;
    LoggingConfig log_;
    // Shared with detached watchers, which may outlive the player.
    std::shared_ptr<std::atomic<int>> active_;
};

} // namespace audio
