#include "video/gst_frame_source.h"

#include <chrono>
#include <cstring>
#include <iostream>
#include <string>

namespace video {

GstFrameSource::GstFrameSource(const Config& cfg, const LoggingConfig& log)
    : cfg_(cfg), log_(log) {}

GstFrameSource::~GstFrameSource() {
    release();
}

std::string GstFrameSource::to_uri(const std::string& url) {
    if (url.find("://") != std::string::npos) return url;

    // Plain path -> file:// uri
    GError* err = nullptr;
    gchar* uri = gst_filename_to_uri(url.c_str(), &err);
    if (err) g_error_free(err);
    if (!uri) return url;

    std::string out(uri);
    g_free(uri);
    return out;
}

bool GstFrameSource::connect() {
    std::lock_guard<std::mutex> lk(mu_);

    teardownPipeline(); // reconnect starts from scratch
    finished_ = false;
    first_sample_logged_ = false;

    if (log_.capture_logger) {
        std::cout << "[CAP] connecting to " << cfg_.url << std::endl;
    }

    if (!buildPipeline()) {
        if (log_.capture_logger) {
            std::cerr << "[CAP] buildPipeline() failed" << std::endl;
        }
        teardownPipeline();
        return false;
    }

    gst_element_set_state(pipeline_, GST_STATE_PLAYING);

    // Wait for PLAYING for a bounded time.
    GstState cur = GST_STATE_NULL, pending = GST_STATE_NULL;
    GstStateChangeReturn ret = gst_element_get_state(
        pipeline_, &cur, &pending,
        (GstClockTime)cfg_.start_timeout_ms * GST_MSECOND
    );

    if (ret == GST_STATE_CHANGE_FAILURE || !drainBus()) {
        if (log_.capture_logger) {
            std::cerr << "[CAP] failed to open stream " << cfg_.url << std::endl;
        }
        teardownPipeline();
        return false;
    }
    // ASYNC after the timeout is tolerated: live sources may preroll late.

    if (log_.capture_logger) {
        std::cout << "[CAP] stream opened" << std::endl;
    }
    return true;
}

std::optional<Frame> GstFrameSource::read() {
    std::lock_guard<std::mutex> lk(mu_);
    if (!sink_ || finished_) return std::nullopt;

    GstSample* sample = gst_app_sink_try_pull_sample(
        GST_APP_SINK(sink_), (GstClockTime)cfg_.read_timeout_ms * GST_MSECOND);

    if (!sample) {
        if (gst_app_sink_is_eos(GST_APP_SINK(sink_))) {
            if (log_.capture_logger) std::cerr << "[CAP] EOS" << std::endl;
            finished_ = true;
        }
        drainBus();
        return std::nullopt;
    }

    const auto captured_at = std::chrono::steady_clock::now();

    GstBuffer* buffer = gst_sample_get_buffer(sample);
    GstCaps* caps = gst_sample_get_caps(sample);
    if (!buffer || !caps) {
        gst_sample_unref(sample);
        return std::nullopt;
    }

    GstStructure* s = gst_caps_get_structure(caps, 0);
    int width = 0, height = 0;
    gst_structure_get_int(s, "width", &width);
    gst_structure_get_int(s, "height", &height);
    if (width <= 0 || height <= 0) {
        gst_sample_unref(sample);
        return std::nullopt;
    }

    GstMapInfo map{};
    if (!gst_buffer_map(buffer, &map, GST_MAP_READ)) {
        gst_sample_unref(sample);
        return std::nullopt;
    }

    // Packed BGR rows are padded to 4 bytes by GStreamer.
    const std::size_t stride = GST_ROUND_UP_4(static_cast<std::size_t>(width) * 3);
    std::optional<Frame> out;
    if (map.size >= stride * static_cast<std::size_t>(height)) {
        cv::Mat view(height, width, CV_8UC3, (void*)map.data, stride);
        out = Frame{view.clone(), captured_at};
    }

    gst_buffer_unmap(buffer, &map);
    gst_sample_unref(sample);

    if (out && !first_sample_logged_) {
        first_sample_logged_ = true;
        if (log_.capture_logger) {
            std::cout << "[CAP] first frame " << width << "x" << height << std::endl;
        }
    }
    return out;
}

void GstFrameSource::release() {
    std::lock_guard<std::mutex> lk(mu_);
    if (pipeline_ && log_.capture_logger) {
        std::cout << "[CAP] releasing stream" << std::endl;
    }
    teardownPipeline();
    finished_ = true;
}

bool GstFrameSource::drainBus() {
    if (!bus_) return false;

    bool ok = true;
    while (GstMessage* msg = gst_bus_pop_filtered(
            bus_, (GstMessageType)(GST_MESSAGE_ERROR | GST_MESSAGE_EOS))) {
        if (GST_MESSAGE_TYPE(msg) == GST_MESSAGE_ERROR) {
            GError* err = nullptr;
            gchar* dbg = nullptr;
            gst_message_parse_error(msg, &err, &dbg);

            if (log_.capture_logger) {
                std::cerr << "[CAP] GST_MESSAGE_ERROR: "
                          << (err ? err->message : "(null)") << std::endl;
                if (dbg) std::cerr << "[CAP] debug: " << dbg << std::endl;
            }

            if (err) g_error_free(err);
            if (dbg) g_free(dbg);
        } else if (log_.capture_logger) {
            std::cerr << "[CAP] EOS" << std::endl;
        }

        gst_message_unref(msg);
        ok = false;
    }

    if (!ok) finished_ = true;
    return ok;
}

bool GstFrameSource::buildPipeline() {
    // uridecodebin exposes its pads dynamically -> linked in onPadAdded().
    pipeline_   = gst_pipeline_new("capture-pipeline");
    src_        = gst_element_factory_make("uridecodebin", "src");
    convert_    = gst_element_factory_make("videoconvert", "convert");
    scale_      = gst_element_factory_make("videoscale", "scale");
    force_caps_ = gst_element_factory_make("capsfilter", "force_caps");
    sink_       = gst_element_factory_make("appsink", "sink");

    if (!pipeline_ || !src_ || !convert_ || !scale_ || !force_caps_ || !sink_) {
        if (log_.capture_logger) {
            std::cerr << "[CAP] failed to create one or more GStreamer elements" << std::endl;
        }
        for (GstElement* e : {src_, convert_, scale_, force_caps_, sink_}) {
            if (e) gst_object_unref(gst_object_ref_sink(e));
        }
        src_ = convert_ = scale_ = force_caps_ = sink_ = nullptr;
        return false;
    }

    const std::string uri = to_uri(cfg_.url);
    g_object_set(G_OBJECT(src_), "uri", uri.c_str(), nullptr);

    GstCaps* caps = gst_caps_new_simple(
        "video/x-raw",
        "format", G_TYPE_STRING, "BGR",
        "width", G_TYPE_INT, cfg_.width,
        "height", G_TYPE_INT, cfg_.height,
        nullptr);
    g_object_set(G_OBJECT(force_caps_), "caps", caps, nullptr);
    gst_caps_unref(caps);

    // appsink: minimal latency, only the newest frame is kept.
    g_object_set(G_OBJECT(sink_), "emit-signals", FALSE, nullptr);
    g_object_set(G_OBJECT(sink_), "sync", FALSE, nullptr);
    g_object_set(G_OBJECT(sink_), "max-buffers", 1, nullptr);
    g_object_set(G_OBJECT(sink_), "drop", TRUE, nullptr);

    g_signal_connect(src_, "pad-added", G_CALLBACK(&GstFrameSource::onPadAdded), this);

    gst_bin_add_many(GST_BIN(pipeline_), src_, convert_, scale_, force_caps_, sink_, nullptr);

    if (!gst_element_link_many(convert_, scale_, force_caps_, sink_, nullptr)) {
        if (log_.capture_logger) {
            std::cerr << "[CAP] failed to link convert->scale->caps->sink" << std::endl;
        }
        return false;
    }

    bus_ = gst_element_get_bus(pipeline_);
    return true;
}

void GstFrameSource::teardownPipeline() {
    if (bus_) {
        gst_object_unref(bus_);
        bus_ = nullptr;
    }

    if (!pipeline_) return;

    // NULL state closes the network session.
    gst_element_set_state(pipeline_, GST_STATE_NULL);

    // Unref of the pipeline releases the whole element tree.
    gst_object_unref(pipeline_);
    pipeline_ = nullptr;

    src_ = convert_ = scale_ = force_caps_ = sink_ = nullptr;
}

void GstFrameSource::onPadAdded(GstElement* /*src*/, GstPad* new_pad, gpointer user_data) {
    auto* self = static_cast<GstFrameSource*>(user_data);
    if (!self || !self->convert_) return;

    GstCaps* caps = gst_pad_get_current_caps(new_pad);
    if (!caps) caps = gst_pad_query_caps(new_pad, nullptr);
    if (!caps) return;

    // Only raw video; audio pads of the same stream are left unlinked.
    GstStructure* str = gst_caps_get_structure(caps, 0);
    const char* name = gst_structure_get_name(str);

    if (!name || std::strncmp(name, "video/", 6) != 0) {
        gst_caps_unref(caps);
        return;
    }

    GstPad* sinkpad = gst_element_get_static_pad(self->convert_, "sink");
    if (!sinkpad) {
        gst_caps_unref(caps);
        return;
    }

    if (!gst_pad_is_linked(sinkpad)) {
        GstPadLinkReturn ret = gst_pad_link(new_pad, sinkpad);
        if (ret != GST_PAD_LINK_OK && self->log_.capture_logger) {
            std::cerr << "[CAP] [pad-added] link result = " << ret << std::endl;
        }
    }

    gst_object_unref(sinkpad);
    gst_caps_unref(caps);
}

} // namespace video
