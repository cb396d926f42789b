#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <set>
#include <string>

#include <gst/gst.h>

#include "audio/clip_library.h"
#include "support/wav_file.h"

namespace fs = std::filesystem;

class ClipLibraryTests : public ::testing::Test {
protected:
    void SetUp() override {
        gst_init(nullptr, nullptr);
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        dir = fs::temp_directory_path() / ("scarecam_clips_" + std::to_string(stamp));
        cfg.directory = dir.string();
        log.audio_logger = false;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    void touch(const std::string& name) {
        fs::create_directories(dir);
        std::ofstream(dir / name) << "data";
    }

    void add_wav(const std::string& name) {
        fs::create_directories(dir);
        write_wav((dir / name).string());
    }

    fs::path dir;
    audio::ClipLibrary::Config cfg;
    LoggingConfig log;
};

TEST_F(ClipLibraryTests, FallbackBeforeLoad) {
    audio::ClipLibrary lib(cfg, log);
    EXPECT_EQ(lib.size(), 1u);
    EXPECT_TRUE(lib.using_fallback());
    EXPECT_TRUE(lib.pick().synthesized());
}

TEST_F(ClipLibraryTests, MissingDirectoryIsCreatedAndFallsBack) {
    audio::ClipLibrary lib(cfg, log);

    EXPECT_EQ(lib.load(), 1u);
    EXPECT_TRUE(lib.using_fallback());
    EXPECT_TRUE(fs::is_directory(dir));

    const audio::Clip c = lib.pick();
    ASSERT_TRUE(c.synthesized());
    EXPECT_EQ(c.pcm->size(), static_cast<std::size_t>(22050 * 2));
    EXPECT_EQ(c.sample_rate, 22050);
    EXPECT_EQ(c.channels, 2);
}

TEST_F(ClipLibraryTests, EmptyDirectoryFallsBack) {
    fs::create_directories(dir);
    audio::ClipLibrary lib(cfg, log);

    EXPECT_EQ(lib.load(), 1u);
    EXPECT_TRUE(lib.using_fallback());
}

TEST_F(ClipLibraryTests, LoadsOnlySupportedFiles) {
    add_wav("scream.wav");
    add_wav("ghost.WAV");
    add_wav("notes.txt");     // decodable, wrong extension
    touch("cover.jpg");

    audio::ClipLibrary lib(cfg, log);
    EXPECT_EQ(lib.load(), 2u);
    EXPECT_FALSE(lib.using_fallback());

    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        const audio::Clip c = lib.pick();
        EXPECT_FALSE(c.synthesized());
        EXPECT_FALSE(c.path.empty());
        seen.insert(c.name);
    }
    EXPECT_EQ(seen, (std::set<std::string>{"ghost.WAV", "scream.wav"}));
}

TEST_F(ClipLibraryTests, UndecodableFilesAreSkipped) {
    add_wav("scream.wav");
    touch("broken.mp3");
    touch("broken.ogg");

    audio::ClipLibrary lib(cfg, log);
    EXPECT_EQ(lib.load(), 1u);
    EXPECT_FALSE(lib.using_fallback());
    EXPECT_EQ(lib.pick().name, "scream.wav");
}

TEST_F(ClipLibraryTests, OnlyUndecodableFilesFallBack) {
    touch("broken.wav");

    audio::ClipLibrary lib(cfg, log);
    EXPECT_EQ(lib.load(), 1u);
    EXPECT_TRUE(lib.using_fallback());
    EXPECT_TRUE(lib.pick().synthesized());
}

TEST_F(ClipLibraryTests, ReloadPicksUpNewFiles) {
    fs::create_directories(dir);
    audio::ClipLibrary lib(cfg, log);
    EXPECT_EQ(lib.load(), 1u);
    EXPECT_TRUE(lib.using_fallback());

    add_wav("boo.wav");
    EXPECT_EQ(lib.load(), 1u);
    EXPECT_FALSE(lib.using_fallback());
    EXPECT_EQ(lib.pick().name, "boo.wav");
}

TEST(ClipExtensionTests, CaseInsensitive) {
    EXPECT_TRUE(audio::ClipLibrary::is_supported_extension("a.wav"));
    EXPECT_TRUE(audio::ClipLibrary::is_supported_extension("dir/b.OGG"));
    EXPECT_TRUE(audio::ClipLibrary::is_supported_extension("c.Mp3"));
    EXPECT_FALSE(audio::ClipLibrary::is_supported_extension("d.flac"));
    EXPECT_FALSE(audio::ClipLibrary::is_supported_extension("wav"));
}
