#include "audio/gst_audio_player.h"

#include <iostream>
#include <thread>
#include <utility>

namespace audio {

GstAudioPlayer::GstAudioPlayer(std::shared_ptr<ClipLibrary> clips, const Config& cfg, const LoggingConfig& log)
    : clips_(std::move(clips)), cfg_(cfg), log_(log), active_(std::make_shared<std::atomic<int>>(0)) {}

bool GstAudioPlayer::play(PlayReason reason) {
    if (!clips_) return false;
    const Clip clip = clips_->pick();

    GstElement* pipeline = clip.synthesized() ? build_pcm_pipeline(clip)
                                              : build_file_pipeline(clip);
    if (!pipeline) {
        if (log_.audio_logger) {
            std::cerr << "[AUD] failed to build pipeline for " << clip.name << std::endl;
        }
        return false;
    }

    if (!start(pipeline, clip)) return false;

    if (log_.audio_logger) {
        std::cout << "[AUD] playing " << clip.name << " (" << to_string(reason) << ")" << std::endl;
    }
    return true;
}

GstElement* GstAudioPlayer::make_sink(const char* name) const {
    GstElement* sink = gst_element_factory_make(cfg_.sink.c_str(), name);
    if (!sink && log_.audio_logger) {
        std::cerr << "[AUD] no audio sink element '" << cfg_.sink << "'" << std::endl;
    }
    return sink;
}

GstElement* GstAudioPlayer::build_file_pipeline(const Clip& clip) const {
    GError* err = nullptr;
    gchar* uri = gst_filename_to_uri(clip.path.c_str(), &err);
    if (!uri) {
        if (log_.audio_logger) {
            std::cerr << "[AUD] bad path " << clip.path << ": "
                      << (err ? err->message : "(null)") << std::endl;
        }
        if (err) g_error_free(err);
        return nullptr;
    }

    GstElement* playbin = gst_element_factory_make("playbin", nullptr);
    GstElement* sink = make_sink(nullptr);
    if (!playbin || !sink) {
        if (sink) gst_object_unref(gst_object_ref_sink(sink));
        if (playbin) gst_object_unref(playbin);
        g_free(uri);
        return nullptr;
    }

    g_object_set(G_OBJECT(playbin), "uri", uri, nullptr);
    g_object_set(G_OBJECT(playbin), "audio-sink", sink, nullptr);   // playbin sinks the floating ref
    g_object_set(G_OBJECT(playbin), "volume", cfg_.volume, nullptr);
    g_free(uri);
    return playbin;
}

GstElement* GstAudioPlayer::build_pcm_pipeline(const Clip& clip) const {
    GstElement* pipeline = gst_pipeline_new("scare-tone");
    GstElement* src      = gst_element_factory_make("appsrc", "src");
    GstElement* convert  = gst_element_factory_make("audioconvert", "convert");
    GstElement* resample = gst_element_factory_make("audioresample", "resample");
    GstElement* volume   = gst_element_factory_make("volume", "volume");
    GstElement* sink     = make_sink("sink");

    if (!pipeline || !src || !convert || !resample || !volume || !sink) {
        // Elements not yet in a bin are floating; sink the refs before dropping them.
        for (GstElement* e : {src, convert, resample, volume, sink}) {
            if (e) gst_object_unref(gst_object_ref_sink(e));
        }
        if (pipeline) gst_object_unref(pipeline);
        return nullptr;
    }

    GstCaps* caps = gst_caps_new_simple(
            "audio/x-raw",
            "format", G_TYPE_STRING, "S16LE",
            "layout", G_TYPE_STRING, "interleaved",
            "rate", G_TYPE_INT, clip.sample_rate,
            "channels", G_TYPE_INT, clip.channels,
            nullptr);
    g_object_set(G_OBJECT(src), "caps", caps, nullptr);
    g_object_set(G_OBJECT(src), "format", GST_FORMAT_TIME, nullptr);
    gst_caps_unref(caps);

    g_object_set(G_OBJECT(volume), "volume", cfg_.volume, nullptr);

    gst_bin_add_many(GST_BIN(pipeline), src, convert, resample, volume, sink, nullptr);
    if (!gst_element_link_many(src, convert, resample, volume, sink, nullptr)) {
        gst_object_unref(pipeline);
        return nullptr;
    }

    // The whole cue fits in one buffer; appsrc queues it until PLAYING.
    const gsize bytes = clip.pcm->size() * sizeof(std::int16_t);
    GstBuffer* buf = gst_buffer_new_allocate(nullptr, bytes, nullptr);
    gst_buffer_fill(buf, 0, clip.pcm->data(), bytes);

    const guint64 frames = clip.channels > 0 ? clip.pcm->size() / clip.channels : 0;
    GST_BUFFER_PTS(buf) = 0;
    GST_BUFFER_DURATION(buf) = gst_util_uint64_scale(frames, GST_SECOND, clip.sample_rate);

    gst_app_src_push_buffer(GST_APP_SRC(src), buf);   // takes ownership
    gst_app_src_end_of_stream(GST_APP_SRC(src));
    return pipeline;
}

bool GstAudioPlayer::start(GstElement* pipeline, const Clip& clip) {
    GstStateChangeReturn ret = gst_element_set_state(pipeline, GST_STATE_PLAYING);
    if (ret != GST_STATE_CHANGE_FAILURE) {
        GstState cur = GST_STATE_NULL, pending = GST_STATE_NULL;
        ret = gst_element_get_state(pipeline, &cur, &pending,
                                    (GstClockTime)cfg_.start_timeout_ms * GST_MSECOND);
    }

    if (ret == GST_STATE_CHANGE_FAILURE) {
        if (log_.audio_logger) {
            std::cerr << "[AUD] cannot start playback of " << clip.name << std::endl;
        }
        gst_element_set_state(pipeline, GST_STATE_NULL);
        gst_object_unref(pipeline);
        return false;
    }

    watch(pipeline, clip.name);
    return true;
}

void GstAudioPlayer::watch(GstElement* pipeline, std::string name) {
    auto active = active_;
    active->fetch_add(1, std::memory_order_acq_rel);

    const LoggingConfig log = log_;
    const int max_ms = cfg_.max_play_ms;

    std::thread([pipeline, name = std::move(name), active, log, max_ms]() {
        GstBus* bus = gst_element_get_bus(pipeline);
        GstMessage* msg = gst_bus_timed_pop_filtered(
                bus, (GstClockTime)max_ms * GST_MSECOND,
                (GstMessageType)(GST_MESSAGE_EOS | GST_MESSAGE_ERROR));

        if (!msg) {
            if (log.audio_logger) {
                std::cerr << "[AUD] " << name << " still playing after " << max_ms
                          << " ms, stopping" << std::endl;
            }
        } else if (GST_MESSAGE_TYPE(msg) == GST_MESSAGE_ERROR) {
            GError* err = nullptr;
            gchar* dbg = nullptr;
            gst_message_parse_error(msg, &err, &dbg);
            if (log.audio_logger) {
                std::cerr << "[AUD] playback error (" << name << "): "
                          << (err ? err->message : "(null)") << std::endl;
            }
            if (err) g_error_free(err);
            if (dbg) g_free(dbg);
        }

        if (msg) gst_message_unref(msg);
        gst_object_unref(bus);

        gst_element_set_state(pipeline, GST_STATE_NULL);
        gst_object_unref(pipeline);
        active->fetch_sub(1, std::memory_order_acq_rel);
    }).detach();
}

} // namespace audio
