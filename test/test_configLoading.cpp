#include <gtest/gtest.h>

#include <string_view>

#include "app_config.h"

using namespace std::string_view_literals;

class ConfigLoadingTests : public ::testing::Test {
protected:
    AppConfig app;
    detect::DetectionConfig tunables;
};

TEST_F(ConfigLoadingTests, FullFileLoads) {
    const auto tbl = toml::parse(R"(
        [stream]
        url = "file:///tmp/porch.mp4"
        width = 320
        height = 240
        start_timeout_ms = 1000
        read_timeout_ms = 100

        [background]
        history = 200
        var_threshold = 20.0
        learning_rate = 0.005
        warmup_frames = 15

        [detection]
        sensitivity = 40
        min_motion_area = 800
        cooldown_seconds = 8
        fg_threshold = 240
        kernel_size = 5

        [audio]
        sounds_dir = "sounds"
        volume = 0.5
        start_timeout_ms = 1500
        max_play_ms = 30000
        sink = "fakesink"

        [overlay]
        mask_alpha = 0.4
        hud_alpha = 0.0
        box_thickness = 3

        [display]
        target_fps = 30
        wait_frame_ms = 20
        stats_period_ms = 500
        width = 800
        height = 600

        [logging]
        capture_logger = false
        trigger_logger = true
        audio_logger = false
        ui_logger = true
        frame_error_logger = false
    )"sv);

    EXPECT_EQ(load_app_config(tbl, app, tunables), 0);

    EXPECT_EQ(app.stream.url, "file:///tmp/porch.mp4");
    EXPECT_EQ(app.stream.width, 320);
    EXPECT_EQ(app.stream.read_timeout_ms, 100);

    EXPECT_EQ(app.system.background.history, 200);
    EXPECT_DOUBLE_EQ(app.system.background.var_threshold, 20.0);
    EXPECT_DOUBLE_EQ(app.system.background.learning_rate, 0.005);
    EXPECT_EQ(app.system.background.warmup_frames, 15);

    const auto t = tunables.snapshot();
    EXPECT_EQ(t.sensitivity, 40);
    EXPECT_EQ(t.min_motion_area, 800);
    EXPECT_EQ(t.cooldown_seconds, 8);
    EXPECT_EQ(app.system.extractor.fg_threshold, 240);
    EXPECT_EQ(app.system.extractor.kernel_size, 5);

    EXPECT_EQ(app.clips.directory, "sounds");
    EXPECT_DOUBLE_EQ(app.player.volume, 0.5);
    EXPECT_EQ(app.player.max_play_ms, 30000);
    EXPECT_EQ(app.player.sink, "fakesink");

    EXPECT_FLOAT_EQ(app.system.overlay.mask_alpha, 0.4f);
    EXPECT_EQ(app.system.overlay.box_thickness, 3);

    EXPECT_EQ(app.display.target_fps, 30);
    EXPECT_EQ(app.display.display_width, 800);
    EXPECT_EQ(app.display.stats_period_ms, 500);

    EXPECT_FALSE(app.logging.capture_logger);
    EXPECT_TRUE(app.logging.trigger_logger);
    EXPECT_FALSE(app.logging.frame_error_logger);
}

TEST_F(ConfigLoadingTests, MissingTablesKeepDefaults) {
    const auto tbl = toml::parse(R"(
        [detection]
        sensitivity = 50
        min_motion_area = 300
        cooldown_seconds = 2
        fg_threshold = 250
        kernel_size = 3
    )"sv);

    EXPECT_EQ(load_app_config(tbl, app, tunables), 6);

    EXPECT_EQ(tunables.snapshot().sensitivity, 50);
    EXPECT_EQ(app.stream.url, video::GstFrameSource::Config{}.url);
    EXPECT_EQ(app.system.background.history, 100);
    EXPECT_EQ(app.clips.directory, "scary_sounds");
    EXPECT_TRUE(app.logging.ui_logger);
}

TEST_F(ConfigLoadingTests, InvalidKeyLeavesWholeTableUntouched) {
    const auto tbl = toml::parse(R"(
        [stream]
        url = "rtsp://cam/porch"
        width = "wide"
        height = 240
        start_timeout_ms = 1000
        read_timeout_ms = 100
    )"sv);

    EXPECT_FALSE(load_stream_config(tbl, app.stream));
    EXPECT_EQ(app.stream.url, video::GstFrameSource::Config{}.url);
    EXPECT_EQ(app.stream.width, 640);
}

TEST_F(ConfigLoadingTests, DetectionValuesAreClamped) {
    const auto tbl = toml::parse(R"(
        [detection]
        sensitivity = 500
        min_motion_area = 10
        cooldown_seconds = 60
        fg_threshold = 250
        kernel_size = 3
    )"sv);

    EXPECT_TRUE(load_detection_config(tbl, tunables, app.system.extractor));
    const auto t = tunables.snapshot();
    EXPECT_EQ(t.sensitivity, 100);
    EXPECT_EQ(t.min_motion_area, 100);
    EXPECT_EQ(t.cooldown_seconds, 30);
}

TEST_F(ConfigLoadingTests, OutOfRangeAlphaIsRejected) {
    const auto tbl = toml::parse(R"(
        [overlay]
        mask_alpha = 1.5
        hud_alpha = 0.2
        box_thickness = 2
    )"sv);

    EXPECT_FALSE(load_overlay_config(tbl, app.system.overlay));
    EXPECT_FLOAT_EQ(app.system.overlay.mask_alpha, 0.3f);
}

TEST_F(ConfigLoadingTests, UnreadableFileKeepsDefaults) {
    EXPECT_FALSE(load_app_config_file("/nonexistent/scarecam.toml", app, tunables));
    EXPECT_EQ(tunables.snapshot().sensitivity, 25);
    EXPECT_EQ(app.display.target_fps, 60);
}
