#pragma once
#include <cstdint>
#include <vector>

namespace audio {

// Default cue used when no sound files are available:
// a sine tone amplitude-modulated by a slow tremolo.
struct ToneConfig {
    int sample_rate = 22050;
    double duration_s = 1.0;
    double frequency_hz = 200.0;
    double tremolo_hz = 6.0;
    int channels = 2;
};

// Interleaved signed 16-bit PCM, duration_s * sample_rate frames.
std::vector<std::int16_t> synthesize_tone(const ToneConfig& cfg);

} // namespace audio
