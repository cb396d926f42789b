#include "audio/tone_synth.h"

#include <algorithm>
#include <cmath>

namespace audio {

namespace {
    constexpr double kPi = 3.14159265358979323846;
}

std::vector<std::int16_t> synthesize_tone(const ToneConfig& cfg) {
    const int channels = std::max(1, cfg.channels);
    const auto frames = static_cast<std::size_t>(std::max(0.0, cfg.sample_rate * cfg.duration_s));

    std::vector<std::int16_t> pcm(frames * channels, 0);
    if (frames == 0) return pcm;

    // Time axis spans [0, duration] inclusive.
    const double step = frames > 1 ? cfg.duration_s / static_cast<double>(frames - 1) : 0.0;
    const double two_pi = 2.0 * kPi;

    for (std::size_t i = 0; i < frames; ++i) {
        const double t = step * static_cast<double>(i);
        const double tone = std::sin(two_pi * cfg.frequency_hz * t);
        const double tremolo = std::sin(two_pi * cfg.tremolo_hz * t);
        const double v = tone * (0.5 + 0.5 * tremolo);

        const auto s = static_cast<std::int16_t>(v * 32767.0);
        for (int c = 0; c < channels; ++c) {
            pcm[i * channels + c] = s;
        }
    }
    return pcm;
}

} // namespace audio
