#include <animation/point_animator.hpp>
#include <animation/timers.hpp>
#include <gtest/gtest.h>

using animation::Countdown;
using animation::IntervalTimer;
using animation::PointAnimator;

TEST(Countdown, FiresOnceAtExpiry) {
    Countdown c;
    c.start(1.0f);
    EXPECT_TRUE(c.active());
    EXPECT_FALSE(c.tick(0.4f));
    EXPECT_NEAR(c.fraction_remaining(), 0.6f, 1e-6f);
    EXPECT_TRUE(c.tick(0.7f));
    EXPECT_FALSE(c.active());
    EXPECT_FALSE(c.tick(1.0f));
}

TEST(Countdown, CancelStopsWithoutFiring) {
    Countdown c;
    c.start(0.5f);
    c.cancel();
    EXPECT_FALSE(c.tick(1.0f));
    EXPECT_FLOAT_EQ(c.fraction_remaining(), 0.0f);
}

TEST(IntervalTimer, FiresEveryInterval) {
    IntervalTimer timer(1.2f);
    EXPECT_FALSE(timer.tick(5.0f));
    timer.start();
    int fired = 0;
    for (int i = 0; i < 40; ++i) {
        if (timer.tick(0.1f)) ++fired;
    }
    EXPECT_EQ(fired, 3);
}

TEST(IntervalTimer, StalledFrameFiresOnce) {
    IntervalTimer timer(1.0f);
    timer.start();
    EXPECT_TRUE(timer.tick(10.0f));
    EXPECT_FALSE(timer.tick(0.4f));
    EXPECT_TRUE(timer.tick(0.2f));
}

TEST(IntervalTimer, StopResetsElapsed) {
    IntervalTimer timer(1.0f);
    timer.start();
    timer.tick(0.9f);
    timer.stop();
    EXPECT_FALSE(timer.running());
    timer.start();
    EXPECT_FALSE(timer.tick(0.5f));
}

TEST(PointAnimator, NewIdsAppearAtTarget) {
    PointAnimator anim;
    anim.set_targets({{"a", {10.0, 20.0}}});
    EXPECT_DOUBLE_EQ(anim.get_current("a").x, 10.0);
    EXPECT_DOUBLE_EQ(anim.get_current("a").y, 20.0);
}

TEST(PointAnimator, MovesTowardTargetAndSettles) {
    PointAnimator anim;
    anim.set_targets({{"a", {0.0, 0.0}}});
    anim.set_targets({{"a", {100.0, 0.0}}, {"b", {5.0, 5.0}}});
    EXPECT_FALSE(anim.settled());
    anim.tick(0.05f);
    const double x = anim.get_current("a").x;
    EXPECT_GT(x, 0.0);
    EXPECT_LT(x, 100.0);
    anim.tick(1.0f);
    EXPECT_TRUE(anim.settled());
    EXPECT_DOUBLE_EQ(anim.get_current("a").x, 100.0);
}

TEST(PointAnimator, DropsIdsMissingFromTargets) {
    PointAnimator anim;
    anim.set_targets({{"a", {1.0, 1.0}}, {"b", {2.0, 2.0}}});
    anim.set_targets({{"b", {3.0, 3.0}}});
    EXPECT_EQ(anim.current().count("a"), 0u);
    anim.snap_to_targets();
    EXPECT_DOUBLE_EQ(anim.get_current("b").x, 3.0);
}
