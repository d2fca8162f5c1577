#include <gtest/gtest.h>
#include "engine/Time.hpp"

using namespace emberfall;

TEST(TimeTest, InitialState) {
    Time time;
    EXPECT_DOUBLE_EQ(time.deltaTime(), 0.0);
    EXPECT_DOUBLE_EQ(time.elapsedTime(), 0.0);
    EXPECT_EQ(time.tickCount(), 0u);
    EXPECT_DOUBLE_EQ(time.getMaxDelta(), Time::DEFAULT_MAX_DELTA);
}

TEST(TimeTest, SingleUpdate) {
    Time time;
    time.update(1.0 / 60.0);
    EXPECT_DOUBLE_EQ(time.deltaTime(), 1.0 / 60.0);
    EXPECT_DOUBLE_EQ(time.elapsedTime(), 1.0 / 60.0);
    EXPECT_EQ(time.tickCount(), 1u);
}

TEST(TimeTest, ElapsedTimeAccumulates) {
    Time time;
    for (int i = 0; i < 10; ++i) {
        time.update(0.1);
    }
    EXPECT_NEAR(time.elapsedTime(), 1.0, 1e-9);
    EXPECT_EQ(time.tickCount(), 10u);
}

TEST(TimeTest, DeltaTimeClamped) {
    Time time;
    time.update(2.0);
    EXPECT_DOUBLE_EQ(time.deltaTime(), Time::DEFAULT_MAX_DELTA);
    EXPECT_DOUBLE_EQ(time.rawDeltaTime(), 2.0);
}

TEST(TimeTest, NegativeDeltaClampedToZero) {
    Time time;
    time.update(-0.5);
    EXPECT_DOUBLE_EQ(time.deltaTime(), 0.0);
    EXPECT_DOUBLE_EQ(time.elapsedTime(), 0.0);
}

TEST(TimeTest, CustomMaxDelta) {
    Time time;
    time.setMaxDelta(0.05);
    time.update(0.1);
    EXPECT_DOUBLE_EQ(time.deltaTime(), 0.05);
}

TEST(TimeTest, NonPositiveMaxDeltaRestoresDefault) {
    Time time;
    time.setMaxDelta(0.0);
    EXPECT_DOUBLE_EQ(time.getMaxDelta(), Time::DEFAULT_MAX_DELTA);
}

TEST(TimeTest, ClampNextDeltaOneShotOnly) {
    Time time;
    time.clampNextDelta(0.01);
    time.update(0.1);
    EXPECT_DOUBLE_EQ(time.deltaTime(), 0.01);
    EXPECT_DOUBLE_EQ(time.rawDeltaTime(), 0.1);

    time.update(0.1);
    EXPECT_DOUBLE_EQ(time.deltaTime(), 0.1);
}

TEST(TimeTest, ExactlyAtMaxDelta) {
    Time time;
    time.update(Time::DEFAULT_MAX_DELTA);
    EXPECT_DOUBLE_EQ(time.deltaTime(), Time::DEFAULT_MAX_DELTA);
}
