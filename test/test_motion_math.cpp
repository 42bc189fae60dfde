/**
 * @file test_motion_math.cpp
 * @brief Angle arithmetic and commutation table, no RTOS required
 */

#include <algorithm>
#include <cmath>
#include <limits>
#include "gtest/gtest.h"
#include "motion_controller.h"
#include "step_sequence.h"

namespace {

// Distance on the circle, so 359.999... and 0 compare equal
double circularDistance(double a, double b) {
    double d = std::fabs(motion_normalize_deg(a) - motion_normalize_deg(b));
    return std::min(d, 360.0 - d);
}

}  // namespace

TEST(MotionMath, DefaultConfig) {
    motion_controller_config_t config = motion_controller_get_default_config();
    EXPECT_EQ(config.step_delay_us, static_cast<uint32_t>(MOTION_DEFAULT_STEP_DELAY_US));
}

TEST(MotionMath, AngleValidity) {
    EXPECT_TRUE(motion_angle_is_valid(0.0));
    EXPECT_TRUE(motion_angle_is_valid(-12345.6));
    EXPECT_FALSE(motion_angle_is_valid(std::numeric_limits<double>::quiet_NaN()));
    EXPECT_FALSE(motion_angle_is_valid(std::numeric_limits<double>::infinity()));
    EXPECT_FALSE(motion_angle_is_valid(-std::numeric_limits<double>::infinity()));
}

TEST(MotionMath, NormalizeFoldsIntoHalfOpenRange) {
    EXPECT_DOUBLE_EQ(motion_normalize_deg(0.0), 0.0);
    EXPECT_DOUBLE_EQ(motion_normalize_deg(359.5), 359.5);
    EXPECT_DOUBLE_EQ(motion_normalize_deg(360.0), 0.0);
    EXPECT_DOUBLE_EQ(motion_normalize_deg(720.0), 0.0);
    EXPECT_DOUBLE_EQ(motion_normalize_deg(-90.0), 270.0);
    EXPECT_DOUBLE_EQ(motion_normalize_deg(-360.0), 0.0);
    EXPECT_DOUBLE_EQ(motion_normalize_deg(450.0), 90.0);

    double tiny = motion_normalize_deg(-1e-15);
    EXPECT_GE(tiny, 0.0);
    EXPECT_LT(tiny, 360.0);
}

TEST(MotionMath, ShortestDeltaKnownCases) {
    EXPECT_DOUBLE_EQ(motion_shortest_delta_deg(0.0, 90.0), 90.0);
    EXPECT_DOUBLE_EQ(motion_shortest_delta_deg(0.0, 270.0), -90.0);
    EXPECT_DOUBLE_EQ(motion_shortest_delta_deg(0.0, -90.0), -90.0);
    EXPECT_DOUBLE_EQ(motion_shortest_delta_deg(350.0, 10.0), 20.0);
    EXPECT_DOUBLE_EQ(motion_shortest_delta_deg(10.0, 350.0), -20.0);
    EXPECT_DOUBLE_EQ(motion_shortest_delta_deg(90.0, 90.0), 0.0);
    EXPECT_DOUBLE_EQ(motion_shortest_delta_deg(45.0, 405.0), 0.0);
}

TEST(MotionMath, HalfTurnResolvesPositive) {
    EXPECT_DOUBLE_EQ(motion_shortest_delta_deg(0.0, 180.0), 180.0);
    EXPECT_DOUBLE_EQ(motion_shortest_delta_deg(180.0, 0.0), 180.0);
    EXPECT_DOUBLE_EQ(motion_shortest_delta_deg(270.0, 90.0), 180.0);
}

TEST(MotionMath, ShortestDeltaSweep) {
    for (double current = 0.0; current < 360.0; current += 7.5) {
        for (double target = 0.0; target < 360.0; target += 7.5) {
            double delta = motion_shortest_delta_deg(current, target);
            EXPECT_LE(delta, 180.0) << current << " -> " << target;
            EXPECT_GT(delta, -180.0) << current << " -> " << target;
            EXPECT_LT(circularDistance(current + delta, target), 1e-9)
                << current << " -> " << target;
        }
    }
}

TEST(MotionMath, StepsRoundToNearest) {
    const double spd = 4096.0 / 360.0;
    EXPECT_EQ(motion_steps_for_delta(90.0, spd), 1024u);
    EXPECT_EQ(motion_steps_for_delta(-45.0, spd), 512u);
    EXPECT_EQ(motion_steps_for_delta(360.0, spd), 4096u);
    EXPECT_EQ(motion_steps_for_delta(1.0, 2.4), 2u);
    EXPECT_EQ(motion_steps_for_delta(1.0, 2.6), 3u);
    EXPECT_EQ(motion_steps_for_delta(0.0, spd), 0u);
}

TEST(MotionMath, StepsRejectUnusableInput) {
    EXPECT_EQ(motion_steps_for_delta(std::numeric_limits<double>::quiet_NaN(), 10.0), 0u);
    EXPECT_EQ(motion_steps_for_delta(std::numeric_limits<double>::infinity(), 10.0), 0u);
    EXPECT_EQ(motion_steps_for_delta(10.0, 0.0), 0u);
    EXPECT_EQ(motion_steps_for_delta(1e300, 1e10), UINT32_MAX);
}

TEST(MotionMath, DelayRoundsUpToWholeTicks) {
    // Default 100 Hz tick: 1200 us still blocks for a full tick
    EXPECT_EQ(motion_delay_ticks(1200, 100), 1u);
    EXPECT_EQ(motion_delay_ticks(1, 100), 1u);
    EXPECT_EQ(motion_delay_ticks(10000, 100), 1u);
    EXPECT_EQ(motion_delay_ticks(10001, 100), 2u);

    EXPECT_EQ(motion_delay_ticks(1200, 1000), 2u);
    EXPECT_EQ(motion_delay_ticks(1000, 1000), 1u);
    EXPECT_EQ(motion_delay_ticks(500, 1000), 1u);
}

TEST(MotionMath, ZeroDelayNeverBlocks) {
    EXPECT_EQ(motion_delay_ticks(0, 1000), 0u);
    EXPECT_EQ(motion_delay_ticks(1200, 0), 0u);
}

TEST(MotionMath, Direction) {
    EXPECT_EQ(motion_direction_for_delta(12.0), 1);
    EXPECT_EQ(motion_direction_for_delta(-0.1), -1);
    EXPECT_EQ(motion_direction_for_delta(0.0), 0);
}

TEST(StepSequence, PatternsAreFourBitAndNonZero) {
    for (uint8_t i = 0; i < STEP_SEQUENCE_LENGTH; i++) {
        uint8_t nibble = step_sequence_nibble(i);
        EXPECT_NE(nibble, 0u);
        EXPECT_EQ(nibble & ~0xFu, 0u);
    }
    EXPECT_EQ(step_sequence_nibble(0), 0b0001);
    EXPECT_EQ(step_sequence_nibble(7), 0b1001);
}

TEST(StepSequence, AdvanceWrapsBothWays) {
    EXPECT_EQ(step_sequence_advance(7, 1), 0);
    EXPECT_EQ(step_sequence_advance(0, -1), 7);
    EXPECT_EQ(step_sequence_advance(3, 1), 4);
    EXPECT_EQ(step_sequence_advance(3, -1), 2);
}

TEST(StepSequence, EightStepsReturnToStart) {
    for (uint8_t start = 0; start < STEP_SEQUENCE_LENGTH; start++) {
        uint8_t forward = start;
        uint8_t backward = start;
        for (int i = 0; i < 8; i++) {
            forward = step_sequence_advance(forward, 1);
            backward = step_sequence_advance(backward, -1);
        }
        EXPECT_EQ(forward, start);
        EXPECT_EQ(backward, start);
    }
}
