#pragma once
#include <gst/gst.h>
#include <gst/app/gstappsink.h>

#include <mutex>
#include <optional>
#include <string>

#include "config.h"
#include "video/frame_source.h"

namespace video {

//------------------------------------------------------------------------------
// GstFrameSource
//
// Pull-mode FrameSource over GStreamer:
//   uridecodebin ! videoconvert ! videoscale ! video/x-raw,format=BGR,... ! appsink
//
// uridecodebin covers MJPEG over http (ESP32-CAM style), rtsp:// and file://.
// appsink keeps only the newest frame (max-buffers=1, drop=true).
// No reconnect: after EOS or an error read() keeps returning nothing.
// gst_init() must have been called.
//------------------------------------------------------------------------------
class GstFrameSource : public FrameSource {
public:
    struct Config {
        std::string url = "http://192.168.29.215:81/stream";
        int width = 640;
        int height = 480;
        int start_timeout_ms = 5000;
        int read_timeout_ms = 500;
    };

    GstFrameSource(const Config& cfg, const LoggingConfig& log);
    ~GstFrameSource() override;

    GstFrameSource(const GstFrameSource&) = delete;
    GstFrameSource& operator=(const GstFrameSource&) = delete;

    bool connect() override;
    std::optional<Frame> read() override;
    void release() override;

private:
    bool buildPipeline();
    void teardownPipeline();
    bool drainBus();   // false once the stream is finished or failed

    static void onPadAdded(GstElement* src, GstPad* new_pad, gpointer user_data);

    static std::string to_uri(const std::string& url);

private:
    Config cfg_;
    LoggingConfig log_;

    std::mutex mu_;
    bool finished_ = false;
    bool first_sample_logged_ = false;

    GstElement* pipeline_{nullptr};
    GstElement* src_{nullptr};
    GstElement* convert_{nullptr};
    GstElement* scale_{nullptr};
    GstElement* force_caps_{nullptr};
    GstElement* sink_{nullptr};
    GstBus* bus_{nullptr};
};

} // namespace video
