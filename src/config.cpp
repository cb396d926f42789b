#include <toml++/toml.h>   // must come first
#include "config.h"
#include "app_config.h"
#include <iostream>
#include <stdexcept>
#include <string_view>


// ============================================================================
// config.toml loading
//
//  - A parse or key error must never take the application down.
//  - On error the affected table keeps its defaults and the loader returns false.
//  - Key names match config.toml one to one.
// ============================================================================


bool load_stream_config(const toml::table &tbl, video::GstFrameSource::Config &cfg) {
    // ----------------------------- [stream] -----------------------------
    try {
        const auto &stream = require_table(tbl, "stream");
        video::GstFrameSource::Config c = cfg;
        c.url = read_required<std::string>(stream, "url");
        c.width = read_required<int>(stream, "width");
        c.height = read_required<int>(stream, "height");
        c.start_timeout_ms = read_required<int>(stream, "start_timeout_ms");
        c.read_timeout_ms = read_required<int>(stream, "read_timeout_ms");
        if (c.width <= 0 || c.height <= 0) {
            throw std::runtime_error("width/height must be positive");
        }
        cfg = c;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "[CFG] stream config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_background_config(const toml::table &tbl, core::ScareSystem::Config &cfg) {
    // --------------------------- [background] ---------------------------
    // MOG2 parameters. var_threshold applies at sensitivity 25.
    try {
        const auto &bg = require_table(tbl, "background");
        detect::BackgroundModel::Config c = cfg.background;
        c.history = read_required<int>(bg, "history");
        c.var_threshold = read_required<double>(bg, "var_threshold");
        c.learning_rate = read_required<double>(bg, "learning_rate");
        c.warmup_frames = read_required<int>(bg, "warmup_frames");
        if (c.history <= 0 || c.var_threshold <= 0.0 || c.warmup_frames < 0) {
            throw std::runtime_error("history/var_threshold must be positive, warmup_frames >= 0");
        }
        cfg.background = c;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "[CFG] background config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_detection_config(const toml::table &tbl, detect::DetectionConfig &tunables,
                           detect::MotionExtractor::Config &extractor) {
    // ---------------------------- [detection] ---------------------------
    // Initial slider positions; out-of-range values are clamped.
    try {
        const auto &det = require_table(tbl, "detection");
        const int sensitivity = read_required<int>(det, "sensitivity");
        const int min_area = read_required<int>(det, "min_motion_area");
        const int cooldown = read_required<int>(det, "cooldown_seconds");

        detect::MotionExtractor::Config ex = extractor;
        ex.fg_threshold = read_required<int>(det, "fg_threshold");
        ex.kernel_size = read_required<int>(det, "kernel_size");
        if (ex.kernel_size <= 0) {
            throw std::runtime_error("kernel_size must be positive");
        }

        tunables.set_sensitivity(sensitivity);
        tunables.set_min_motion_area(min_area);
        tunables.set_cooldown_seconds(cooldown);
        extractor = ex;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "[CFG] detection config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_audio_config(const toml::table &tbl, audio::ClipLibrary::Config &clips,
                       audio::GstAudioPlayer::Config &player) {
    // ----------------------------- [audio] ------------------------------
    try {
        const auto &au = require_table(tbl, "audio");
        audio::ClipLibrary::Config c = clips;
        audio::GstAudioPlayer::Config p = player;
        c.directory = read_required<std::string>(au, "sounds_dir");
        p.volume = read_required<double>(au, "volume");
        p.start_timeout_ms = read_required<int>(au, "start_timeout_ms");
        p.max_play_ms = read_required<int>(au, "max_play_ms");
        p.sink = read_required<std::string>(au, "sink");
        if (p.volume < 0.0) {
            throw std::runtime_error("volume must be >= 0");
        }
        if (p.sink.empty()) {
            throw std::runtime_error("sink must name a GStreamer element");
        }
        clips = c;
        player = p;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "[CFG] audio config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_overlay_config(const toml::table &tbl, overlay::OverlayRenderer::Config &cfg) {
    // ---------------------------- [overlay] -----------------------------
    try {
        const auto &ov = require_table(tbl, "overlay");
        overlay::OverlayRenderer::Config c = cfg;
        c.mask_alpha = read_required<float>(ov, "mask_alpha");
        c.hud_alpha = read_required<float>(ov, "hud_alpha");
        c.box_thickness = read_required<int>(ov, "box_thickness");
        if (c.mask_alpha < 0.f || c.mask_alpha > 1.f || c.hud_alpha < 0.f || c.hud_alpha > 1.f) {
            throw std::runtime_error("alpha values must be in [0, 1]");
        }
        cfg = c;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "[CFG] overlay config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_display_config(const toml::table &tbl, ui::DisplayLoop::Config &cfg) {
    // ---------------------------- [display] -----------------------------
    try {
        const auto &d = require_table(tbl, "display");
        ui::DisplayLoop::Config c = cfg;
        c.target_fps = read_required<int>(d, "target_fps");
        c.wait_frame_ms = read_required<int>(d, "wait_frame_ms");
        c.stats_period_ms = read_required<int>(d, "stats_period_ms");
        c.display_width = read_required<int>(d, "width");
        c.display_height = read_required<int>(d, "height");
        if (c.display_width <= 0 || c.display_height <= 0) {
            throw std::runtime_error("width/height must be positive");
        }
        cfg = c;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "[CFG] display config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_logging_config(const toml::table &tbl, LoggingConfig &cfg) {
    // ---------------------------- [logging] -----------------------------
    try {
        const auto &lg = require_table(tbl, "logging");
        LoggingConfig c;
        c.capture_logger = read_required<bool>(lg, "capture_logger");
        c.trigger_logger = read_required<bool>(lg, "trigger_logger");
        c.audio_logger = read_required<bool>(lg, "audio_logger");
        c.ui_logger = read_required<bool>(lg, "ui_logger");
        c.frame_error_logger = read_required<bool>(lg, "frame_error_logger");
        cfg = c;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "[CFG] logging config load failed  " << e.what() << std::endl;
        return false;
    }
}

int load_app_config(const toml::table &tbl, AppConfig &app, detect::DetectionConfig &tunables) {
    int failed = 0;
    if (!load_logging_config(tbl, app.logging)) ++failed;
    if (!load_stream_config(tbl, app.stream)) ++failed;
    if (!load_background_config(tbl, app.system)) ++failed;
    if (!load_detection_config(tbl, tunables, app.system.extractor)) ++failed;
    if (!load_audio_config(tbl, app.clips, app.player)) ++failed;
    if (!load_overlay_config(tbl, app.system.overlay)) ++failed;
    if (!load_display_config(tbl, app.display)) ++failed;
    return failed;
}

bool load_app_config_file(const std::string &path, AppConfig &app, detect::DetectionConfig &tunables) {
    try {
        const toml::table tbl = toml::parse_file(path);
        const int failed = load_app_config(tbl, app, tunables);
        if (failed > 0) {
            std::cerr << "[CFG] " << failed << " table(s) kept their defaults" << std::endl;
        }
        return failed == 0;

    } catch (const toml::parse_error &e) {
        std::cerr << "[CFG] cannot parse " << path << ": " << e.description()
                  << " (line " << e.source().begin.line << "), using defaults" << std::endl;
        return false;
    }
}
