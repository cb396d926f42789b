#pragma once

namespace audio {

enum class PlayReason {
    motion,   // fired by the trigger
    test      // operator "test sound"
};

inline const char *to_string(PlayReason r) {
    return r == PlayReason::motion ? "motion" : "test";
}

// Plays one scare cue without blocking the caller.
// Returns false when playback could not be started.
class AudioDispatcher {
public:
    virtual ~AudioDispatcher() = default;
    virtual bool play(PlayReason reason) = 0;
};

} // namespace audio
