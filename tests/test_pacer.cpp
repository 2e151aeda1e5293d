#include <gtest/gtest.h>
#include "session/tick_pacer.hpp"
#include <limits>

using namespace phenom;

TEST(TickPacerTest, ConvertsElapsedTimeToTicks) {
    TickPacer pacer(4.0);
    EXPECT_EQ(pacer.advance(0.5), 2);
    EXPECT_EQ(pacer.advance(0.125), 0);
    EXPECT_EQ(pacer.advance(0.125), 1);  // 0.25 accumulated
    EXPECT_EQ(pacer.totalTicks(), 3);
}

TEST(TickPacerTest, CarriesRemainderAcrossFrames) {
    TickPacer pacer(10.0);
    int ticks = 0;
    for (int frame = 0; frame < 60; frame++) {
        ticks += pacer.advance(1.0 / 60.0);
    }
    // One second at 10 ticks/s, give or take float rounding at the boundary.
    EXPECT_GE(ticks, 9);
    EXPECT_LE(ticks, 10);
    EXPECT_LT(pacer.backlogSeconds(), 0.1);
}

TEST(TickPacerTest, CapsTicksPerFrameAndDropsBacklog) {
    TickPacer pacer(100.0, 5);
    EXPECT_EQ(pacer.advance(10.0), 5);
    EXPECT_DOUBLE_EQ(pacer.backlogSeconds(), 0.0);
    EXPECT_EQ(pacer.advance(0.02), 2);
}

TEST(TickPacerTest, PauseStopsTicks) {
    TickPacer pacer(10.0);
    pacer.advance(0.05);
    pacer.pause();
    EXPECT_TRUE(pacer.paused());
    EXPECT_DOUBLE_EQ(pacer.backlogSeconds(), 0.0);
    EXPECT_EQ(pacer.advance(5.0), 0);

    pacer.resume();
    EXPECT_FALSE(pacer.paused());
    EXPECT_EQ(pacer.advance(0.1), 1);
}

TEST(TickPacerTest, SpeedChanges) {
    TickPacer pacer(1.0);
    EXPECT_EQ(pacer.advance(0.5), 0);
    pacer.setSpeed(4.0);
    EXPECT_DOUBLE_EQ(pacer.speed(), 4.0);
    EXPECT_EQ(pacer.advance(0.0), 0);
    EXPECT_EQ(pacer.advance(0.25), 3);  // 0.75 s at 4 ticks/s

    pacer.setSpeed(0.0);
    pacer.setSpeed(-3.0);
    pacer.setSpeed(std::numeric_limits<double>::infinity());
    EXPECT_DOUBLE_EQ(pacer.speed(), 4.0);
}

TEST(TickPacerTest, IgnoresBadElapsedTimes) {
    TickPacer pacer(10.0);
    EXPECT_EQ(pacer.advance(-1.0), 0);
    EXPECT_EQ(pacer.advance(std::numeric_limits<double>::quiet_NaN()), 0);
    EXPECT_EQ(pacer.advance(std::numeric_limits<double>::infinity()), 0);
    EXPECT_DOUBLE_EQ(pacer.backlogSeconds(), 0.0);
}

TEST(TickPacerTest, ResetClearsCounters) {
    TickPacer pacer(10.0);
    pacer.advance(0.35);
    EXPECT_EQ(pacer.totalTicks(), 3);
    pacer.reset();
    EXPECT_EQ(pacer.totalTicks(), 0);
    EXPECT_DOUBLE_EQ(pacer.backlogSeconds(), 0.0);
}

TEST(TickPacerTest, RejectsBadConstruction) {
    EXPECT_THROW(TickPacer(0.0), std::invalid_argument);
    EXPECT_THROW(TickPacer(-2.0), std::invalid_argument);
    EXPECT_THROW(TickPacer(10.0, 0), std::invalid_argument);
}
