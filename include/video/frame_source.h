#pragma once
#include <opencv2/core.hpp>

#include <chrono>
#include <optional>

namespace video {

struct Frame {
    cv::Mat image;                                      // BGR
    std::chrono::steady_clock::time_point captured_at;
};

// Where frames come from. At most one frame is expected to be buffered.
// read() must return nothing rather than hang when no frame is available.
class FrameSource {
public:
    virtual ~FrameSource() = default;

    virtual bool connect() = 0;
    virtual std::optional<Frame> read() = 0;
    virtual void release() = 0;
};

} // namespace video
