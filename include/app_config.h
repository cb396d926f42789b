#pragma once

#include <string>
#include <toml++/toml.h>

#include "config.h"
#include "audio/clip_library.h"
#include "audio/gst_audio_player.h"
#include "core/scare_system.h"
#include "detect/detection_config.h"
#include "ui/display_loop.h"
#include "video/gst_frame_source.h"

// Everything config.toml can set. Defaults are the built-in values;
// a table that fails to load leaves its part untouched.
struct AppConfig {
    video::GstFrameSource::Config stream;
    core::ScareSystem::Config system;
    audio::ClipLibrary::Config clips;
    audio::GstAudioPlayer::Config player;
    ui::DisplayLoop::Config display;
    LoggingConfig logging;
};

// ----------------------------- loaders ------------------------------
// Each returns false (and logs) on a missing/invalid table or key.
bool load_stream_config(const toml::table &tbl, video::GstFrameSource::Config &cfg);
bool load_background_config(const toml::table &tbl, core::ScareSystem::Config &cfg);
bool load_detection_config(const toml::table &tbl, detect::DetectionConfig &tunables,
                           detect::MotionExtractor::Config &extractor);
bool load_audio_config(const toml::table &tbl, audio::ClipLibrary::Config &clips,
                       audio::GstAudioPlayer::Config &player);
bool load_overlay_config(const toml::table &tbl, overlay::OverlayRenderer::Config &cfg);
bool load_display_config(const toml::table &tbl, ui::DisplayLoop::Config &cfg);

// Runs every loader above. Returns the number of tables that failed.
int load_app_config(const toml::table &tbl, AppConfig &app, detect::DetectionConfig &tunables);

// Parses the file and loads it. A parse failure leaves all defaults.
bool load_app_config_file(const std::string &path, AppConfig &app, detect::DetectionConfig &tunables);
