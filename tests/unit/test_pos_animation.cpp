#include <gtest/gtest.h>
#include "slippy_map/core/pos_animation.h"
#include "slippy_map/platform/frame_scheduler.h"
#include "slippy_map/constants.h"
#include <chrono>

using namespace slippy_map;

class PosAnimationTest : public ::testing::Test {
protected:
    void AdvanceSeconds(double seconds) {
        scheduler_.AdvanceBy(std::chrono::duration<double>(seconds));
    }

    void RunToCompletion(PosAnimation& animation) {
        int guard = 0;
        while (animation.IsRunning() && guard++ < 1000) {
            AdvanceSeconds(constants::view::FRAME_INTERVAL);
        }
    }

    ManualFrameScheduler scheduler_;
    Pane pane_;
};

TEST(EaseOutQuadTest, Curve) {
    EXPECT_DOUBLE_EQ(EaseOutQuad(0.0), 0.0);
    EXPECT_DOUBLE_EQ(EaseOutQuad(0.5), 0.75);
    EXPECT_DOUBLE_EQ(EaseOutQuad(1.0), 1.0);

    // Clamped outside [0, 1]
    EXPECT_DOUBLE_EQ(EaseOutQuad(-1.0), 0.0);
    EXPECT_DOUBLE_EQ(EaseOutQuad(2.0), 1.0);
}

TEST_F(PosAnimationTest, InterpolatesWithEaseOut) {
    PosAnimation animation(scheduler_);
    animation.Run(pane_, Point(-100.0, 40.0), 0.25);

    // First tick runs at t = 0
    EXPECT_TRUE(animation.IsRunning());
    EXPECT_EQ(pane_.position, Point(0.0, 0.0));

    AdvanceSeconds(0.125);
    EXPECT_NEAR(pane_.position.x, -75.0, 1e-6);
    EXPECT_NEAR(pane_.position.y, 30.0, 1e-6);
    EXPECT_TRUE(animation.IsRunning());

    AdvanceSeconds(0.125);
    EXPECT_EQ(pane_.position, Point(-100.0, 40.0));
    EXPECT_FALSE(animation.IsRunning());
    EXPECT_EQ(scheduler_.GetPendingCount(), 0u);
}

TEST_F(PosAnimationTest, FiresEndOnce) {
    PosAnimation animation(scheduler_);
    int ends = 0;
    animation.On(constants::events::END, [&](const Event&) { ++ends; });

    animation.Run(pane_, Point(10.0, 10.0), 0.25);
    RunToCompletion(animation);
    AdvanceSeconds(1.0);

    EXPECT_EQ(ends, 1);
}

TEST_F(PosAnimationTest, ZeroDurationJumps) {
    PosAnimation animation(scheduler_);
    int ends = 0;
    animation.On(constants::events::END, [&](const Event&) { ++ends; });

    animation.Run(pane_, Point(5.0, -5.0), 0.0);

    EXPECT_EQ(pane_.position, Point(5.0, -5.0));
    EXPECT_FALSE(animation.IsRunning());
    EXPECT_EQ(ends, 1);
}

TEST_F(PosAnimationTest, StopFreezesPosition) {
    PosAnimation animation(scheduler_);
    int ends = 0;
    animation.On(constants::events::END, [&](const Event&) { ++ends; });

    animation.Run(pane_, Point(100.0, 0.0), 0.25);
    AdvanceSeconds(0.1);
    const Point frozen = pane_.position;

    animation.Stop();
    EXPECT_FALSE(animation.IsRunning());
    EXPECT_EQ(scheduler_.GetPendingCount(), 0u);

    AdvanceSeconds(0.5);
    EXPECT_EQ(pane_.position, frozen);
    EXPECT_EQ(ends, 0);
}

TEST_F(PosAnimationTest, SecondRunCancelsFirst) {
    PosAnimation animation(scheduler_);
    int ends = 0;
    animation.On(constants::events::END, [&](const Event&) { ++ends; });

    animation.Run(pane_, Point(100.0, 0.0), 0.25);
    AdvanceSeconds(0.125);
    const Point mid = pane_.position;
    ASSERT_NEAR(mid.x, 75.0, 1e-6);

    // Restart from the rendered position, not from the first start
    animation.Run(pane_, Point(0.0, 50.0), 0.25);
    EXPECT_EQ(pane_.position, mid);
    EXPECT_EQ(scheduler_.GetPendingCount(), 1u);

    RunToCompletion(animation);
    EXPECT_EQ(pane_.position, Point(0.0, 50.0));
    EXPECT_EQ(animation.GetTarget(), Point(0.0, 50.0));
    EXPECT_EQ(ends, 1);
}

TEST_F(PosAnimationTest, DestructionCancelsPendingFrame) {
    {
        PosAnimation animation(scheduler_);
        animation.Run(pane_, Point(100.0, 0.0), 0.25);
        EXPECT_EQ(scheduler_.GetPendingCount(), 1u);
    }
    EXPECT_EQ(scheduler_.GetPendingCount(), 0u);
    EXPECT_NO_THROW(AdvanceSeconds(0.1));
}

TEST(ManualFrameSchedulerTest, FramesRequestedDuringAFrameRunNext) {
    ManualFrameScheduler scheduler;
    int outer = 0;
    int inner = 0;

    scheduler.RequestFrame([&](FrameTime) {
        ++outer;
        scheduler.RequestFrame([&](FrameTime) { ++inner; });
    });

    EXPECT_EQ(scheduler.RunFrame(), 1u);
    EXPECT_EQ(outer, 1);
    EXPECT_EQ(inner, 0);
    EXPECT_EQ(scheduler.GetPendingCount(), 1u);

    EXPECT_EQ(scheduler.RunFrame(), 1u);
    EXPECT_EQ(inner, 1);
}

TEST(ManualFrameSchedulerTest, CancelDuringFrameSkipsCallback) {
    ManualFrameScheduler scheduler;
    int second_calls = 0;
    FrameHandle second = 0;

    scheduler.RequestFrame([&](FrameTime) { scheduler.CancelFrame(second); });
    second = scheduler.RequestFrame([&](FrameTime) { ++second_calls; });

    EXPECT_EQ(scheduler.RunFrame(), 1u);
    EXPECT_EQ(second_calls, 0);
}

TEST(ManualFrameSchedulerTest, AdvanceMovesClock) {
    ManualFrameScheduler scheduler;
    const FrameTime start = scheduler.Now();
    FrameTime seen{};

    scheduler.RequestFrame([&](FrameTime now) { seen = now; });
    scheduler.AdvanceBy(std::chrono::milliseconds(16));

    EXPECT_EQ(scheduler.Now() - start, std::chrono::milliseconds(16));
    EXPECT_EQ(seen, scheduler.Now());
}
