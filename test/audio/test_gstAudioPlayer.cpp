#include <gtest/gtest.h>
#include <gst/gst.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>

#include "audio/clip_library.h"
#include "audio/gst_audio_player.h"
#include "support/wav_file.h"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

// Headless playback: every pipeline ends in a fakesink.
class GstAudioPlayerTests : public ::testing::Test {
protected:
    void SetUp() override {
        gst_init(nullptr, nullptr);

        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        dir = fs::temp_directory_path() / ("scarecam_player_" + std::to_string(stamp));
        fs::create_directories(dir);

        clip_cfg.directory = dir.string();
        player_cfg.sink = "fakesink";
        log.audio_logger = false;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    static bool wait_idle(const audio::GstAudioPlayer& player, std::chrono::milliseconds timeout = 5000ms) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (player.active_playbacks() > 0) {
            if (std::chrono::steady_clock::now() > deadline) return false;
            std::this_thread::sleep_for(10ms);
        }
        return true;
    }

    fs::path dir;
    audio::ClipLibrary::Config clip_cfg;
    audio::GstAudioPlayer::Config player_cfg;
    LoggingConfig log;
};

TEST_F(GstAudioPlayerTests, PlaysDefaultToneWithoutClips) {
    auto clips = std::make_shared<audio::ClipLibrary>(clip_cfg, log);
    ASSERT_EQ(clips->load(), 1u);
    ASSERT_TRUE(clips->using_fallback());

    audio::GstAudioPlayer player(clips, player_cfg, log);
    EXPECT_TRUE(player.play(audio::PlayReason::motion));
    EXPECT_TRUE(wait_idle(player));
}

TEST_F(GstAudioPlayerTests, PlaysSoundFile) {
    write_wav((dir / "creak.wav").string());
    auto clips = std::make_shared<audio::ClipLibrary>(clip_cfg, log);
    ASSERT_EQ(clips->load(), 1u);
    ASSERT_FALSE(clips->using_fallback());

    audio::GstAudioPlayer player(clips, player_cfg, log);
    EXPECT_TRUE(player.play(audio::PlayReason::test));
    EXPECT_TRUE(wait_idle(player));
}

TEST_F(GstAudioPlayerTests, UnknownSinkFailsToStart) {
    player_cfg.sink = "scarecam_no_such_sink";
    auto clips = std::make_shared<audio::ClipLibrary>(clip_cfg, log);

    audio::GstAudioPlayer player(clips, player_cfg, log);
    EXPECT_FALSE(player.play(audio::PlayReason::test));
    EXPECT_EQ(player.active_playbacks(), 0);
}

TEST_F(GstAudioPlayerTests, PlayerKeepsLibraryAlive) {
    auto clips = std::make_shared<audio::ClipLibrary>(clip_cfg, log);
    std::weak_ptr<audio::ClipLibrary> watch = clips;

    auto player = std::make_shared<audio::GstAudioPlayer>(clips, player_cfg, log);
    clips.reset();

    ASSERT_FALSE(watch.expired());
    EXPECT_EQ(player->clip_count(), 1u);
    EXPECT_TRUE(player->play(audio::PlayReason::motion));
    EXPECT_TRUE(wait_idle(*player));

    player.reset();
    EXPECT_TRUE(watch.expired());
}

TEST_F(GstAudioPlayerTests, ReloadGoesThroughTheLibrary) {
    auto clips = std::make_shared<audio::ClipLibrary>(clip_cfg, log);
    audio::GstAudioPlayer player(clips, player_cfg, log);
    EXPECT_EQ(player.reload(), 1u);
    EXPECT_TRUE(clips->using_fallback());

    write_wav((dir / "howl.wav").string());
    EXPECT_EQ(player.reload(), 1u);
    EXPECT_FALSE(clips->using_fallback());
}
