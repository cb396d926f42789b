#include <gtest/gtest.h>
#include <gst/gst.h>

#include "video/gst_frame_source.h"

class GstFrameSourceTests : public ::testing::Test {
protected:
    void SetUp() override {
        gst_init(nullptr, nullptr);
        cfg.start_timeout_ms = 2000;
        cfg.read_timeout_ms = 100;
        log.capture_logger = false;
    }

    video::GstFrameSource::Config cfg;
    LoggingConfig log;
};

TEST_F(GstFrameSourceTests, ReadBeforeConnectGivesNothing) {
    video::GstFrameSource source(cfg, log);
    EXPECT_FALSE(source.read().has_value());
}

TEST_F(GstFrameSourceTests, MissingFileUriFailsToConnect) {
    cfg.url = "file:///nonexistent/scarecam/porch.mp4";
    video::GstFrameSource source(cfg, log);

    EXPECT_FALSE(source.connect());
    EXPECT_FALSE(source.read().has_value());
}

TEST_F(GstFrameSourceTests, MissingPlainPathFailsToConnect) {
    cfg.url = "/nonexistent/scarecam/porch.mp4";
    video::GstFrameSource source(cfg, log);

    EXPECT_FALSE(source.connect());
    EXPECT_FALSE(source.read().has_value());
}

TEST_F(GstFrameSourceTests, ReleaseIsIdempotent) {
    cfg.url = "file:///nonexistent/scarecam/porch.mp4";
    video::GstFrameSource source(cfg, log);
    source.connect();

    source.release();
    source.release();
    EXPECT_FALSE(source.read().has_value());
}
