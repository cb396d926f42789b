#include <gtest/gtest.h>

#include <chrono>
#include <memory>

#include "scare/scare_trigger.h"
#include "support/fakes.h"

using namespace std::chrono_literals;

class ScareTriggerTests : public ::testing::Test {
protected:
    void SetUp() override {
        dispatcher = std::make_shared<CountingDispatcher>();
        trigger = std::make_unique<scare::ScareTrigger>(dispatcher, LoggingConfig{});

        motion.motion_detected = true;
        motion.blobs.push_back({cv::Rect(10, 10, 40, 40), 1521.0});
        motion.total_area = 1521.0;

        t0 = scare::Clock::now();
    }

    std::shared_ptr<CountingDispatcher> dispatcher;
    std::unique_ptr<scare::ScareTrigger> trigger;
    detect::MotionEvent motion;
    detect::MotionEvent still;
    scare::Clock::time_point t0;
};

TEST_F(ScareTriggerTests, NoMotionNeverFires) {
    EXPECT_FALSE(trigger->evaluate(still, 5, t0));
    EXPECT_EQ(trigger->stats().detection_count(), 0u);
    EXPECT_FALSE(trigger->last_trigger_time().has_value());
}

TEST_F(ScareTriggerTests, FirstMotionFires) {
    EXPECT_TRUE(trigger->evaluate(motion, 5, t0));
    EXPECT_EQ(trigger->stats().detection_count(), 1u);
    ASSERT_TRUE(trigger->last_trigger_time().has_value());
    EXPECT_EQ(*trigger->last_trigger_time(), t0);
    EXPECT_TRUE(trigger->stats().last_detection().has_value());
}

TEST_F(ScareTriggerTests, CooldownSuppressesRepeat) {
    EXPECT_TRUE(trigger->evaluate(motion, 5, t0));
    EXPECT_FALSE(trigger->evaluate(motion, 5, t0 + 3s));
    EXPECT_TRUE(trigger->evaluate(motion, 5, t0 + 6s));

    EXPECT_EQ(trigger->stats().detection_count(), 2u);
    EXPECT_EQ(*trigger->last_trigger_time(), t0 + 6s);
}

TEST_F(ScareTriggerTests, CooldownBoundaryFires) {
    EXPECT_TRUE(trigger->evaluate(motion, 5, t0));
    EXPECT_FALSE(trigger->evaluate(motion, 5, t0 + 4999ms));
    EXPECT_TRUE(trigger->evaluate(motion, 5, t0 + 5s));
}

TEST_F(ScareTriggerTests, PausedNeverFires) {
    trigger->pause();
    EXPECT_TRUE(trigger->paused());

    for (int i = 0; i < 5; ++i) {
        EXPECT_FALSE(trigger->evaluate(motion, 1, t0 + std::chrono::seconds(i * 10)));
    }
    EXPECT_EQ(trigger->stats().detection_count(), 0u);
    EXPECT_EQ(dispatcher->motion_calls(), 0);
}

TEST_F(ScareTriggerTests, ResumeRestoresFiring) {
    trigger->pause();
    EXPECT_FALSE(trigger->evaluate(motion, 5, t0));
    trigger->resume();
    EXPECT_TRUE(trigger->evaluate(motion, 5, t0));
}

TEST_F(ScareTriggerTests, TogglePauseReturnsNewState) {
    EXPECT_TRUE(trigger->toggle_pause());
    EXPECT_EQ(trigger->mode(), scare::Mode::paused);
    EXPECT_FALSE(trigger->toggle_pause());
    EXPECT_EQ(trigger->mode(), scare::Mode::monitoring);
}

TEST_F(ScareTriggerTests, PauseIsIdempotentAndKeepsCounters) {
    EXPECT_TRUE(trigger->evaluate(motion, 5, t0));
    trigger->pause();
    trigger->pause();
    EXPECT_TRUE(trigger->paused());
    EXPECT_EQ(trigger->stats().detection_count(), 1u);
}

TEST_F(ScareTriggerTests, TestTriggerPlaysWithoutBookkeeping) {
    trigger->pause();
    EXPECT_TRUE(trigger->test_trigger());

    EXPECT_EQ(dispatcher->test_calls(), 1);
    EXPECT_EQ(dispatcher->motion_calls(), 0);
    EXPECT_EQ(trigger->stats().detection_count(), 0u);
    EXPECT_FALSE(trigger->last_trigger_time().has_value());
    EXPECT_TRUE(trigger->paused());
}

TEST_F(ScareTriggerTests, TestTriggerReportsFailure) {
    auto failing = std::make_shared<CountingDispatcher>(false);
    scare::ScareTrigger t(failing, LoggingConfig{});
    EXPECT_FALSE(t.test_trigger());
}

TEST_F(ScareTriggerTests, FireDispatchesAsynchronously) {
    EXPECT_TRUE(trigger->evaluate(motion, 5, t0));
    EXPECT_TRUE(dispatcher->wait_for_motion(1, 2000));
}

TEST_F(ScareTriggerTests, FailedPlaybackStillCounts) {
    auto failing = std::make_shared<CountingDispatcher>(false);
    scare::ScareTrigger t(failing, LoggingConfig{});

    EXPECT_TRUE(t.evaluate(motion, 5, t0));
    EXPECT_TRUE(failing->wait_for_motion(1, 2000));
    EXPECT_EQ(t.stats().detection_count(), 1u);
}

TEST_F(ScareTriggerTests, SnapshotMirrorsState) {
    trigger->evaluate(motion, 5, t0);
    trigger->pause();

    const auto s = trigger->snapshot();
    EXPECT_TRUE(s.paused);
    EXPECT_EQ(s.detection_count, 1u);
    EXPECT_TRUE(s.last_detection.has_value());
    ASSERT_TRUE(s.last_trigger.has_value());
    EXPECT_EQ(*s.last_trigger, t0);
}

TEST(CooldownRemainingTests, NothingBeforeFirstTrigger) {
    EXPECT_FALSE(scare::cooldown_remaining(std::nullopt, scare::Clock::now(), 5).has_value());
}

TEST(CooldownRemainingTests, CountsDownThenExpires) {
    const auto t0 = scare::Clock::now();

    const auto r = scare::cooldown_remaining(t0, t0 + 2s, 5);
    ASSERT_TRUE(r.has_value());
    EXPECT_NEAR(*r, 3.0, 1e-9);

    EXPECT_FALSE(scare::cooldown_remaining(t0, t0 + 5s, 5).has_value());
    EXPECT_FALSE(scare::cooldown_remaining(t0, t0 + 9s, 5).has_value());
}
