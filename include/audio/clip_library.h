#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

#include <gst/pbutils/pbutils.h>

#include "audio/tone_synth.h"
#include "config.h"

namespace audio {

// Either a sound file on disk or an in-memory PCM cue.
struct Clip {
    std::string name;
    std::string path;                                        // empty for synthesized cues
    std::shared_ptr<const std::vector<std::int16_t>> pcm;    // S16LE, interleaved
    int sample_rate = 0;
    int channels = 0;

    bool synthesized() const { return pcm != nullptr; }
};

// Set of scare sounds loaded from a directory.
// Every file is inspected with GstDiscoverer; files without a decodable
// audio stream are skipped. With no usable files it holds a single
// synthesized cue, so pick() always returns something playable.
// load() needs gst_init().
class ClipLibrary {
public:
    struct Config {
        std::string directory = "scary_sounds";
        int discover_timeout_ms = 3000;   // per file
        ToneConfig tone;
    };

    ClipLibrary(Config cfg, const LoggingConfig& log);

    // (Re)scans the directory. Returns the number of clips available.
    std::size_t load();

    std::size_t size() const;
    bool using_fallback() const;

    // Uniformly random clip.
    Clip pick();

    static bool is_supported_extension(const std::string& path);

private:
    Clip make_fallback() const;
    bool inspect(GstDiscoverer* discoverer, const std::string& path, std::string& why) const;

    Config cfg_;
    LoggingConfig log_;

    mutable std::mutex m_;
    std::vector<Clip> clips_;
    bool fallback_ = false;
    std::mt19937 rng_;
};

} // namespace audio
