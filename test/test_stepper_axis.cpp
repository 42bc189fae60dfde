/**
 * @file test_stepper_axis.cpp
 * @brief Step arithmetic, zeroing and slice ownership of StepperAxis
 */

#include <algorithm>
#include "gtest/gtest.h"
#include "SharedBus.hpp"
#include "StepperAxis.hpp"
#include "step_sequence.h"
#include "fake_bus.h"

namespace {

class StepperAxisTest : public ::testing::Test {
protected:
    StepperAxisTest() :
        bus_(SharedBus::defaultConfig(2, FakeBus::transmit, &fake_))
    {
    }

    stepper_axis_config_t config(uint8_t id, uint32_t steps_per_revolution = 1024) {
        stepper_axis_config_t cfg = StepperAxis::defaultConfig(id, id == 0 ? "a" : "b");
        cfg.steps_per_revolution = steps_per_revolution;
        return cfg;
    }

    FakeBus fake_;
    SharedBus bus_;
};

}  // namespace

TEST_F(StepperAxisTest, StartsAtZero) {
    StepperAxis axis(bus_, config(0));
    ASSERT_TRUE(axis.isInitialized());
    EXPECT_DOUBLE_EQ(axis.currentAngle(), 0.0);
    EXPECT_EQ(axis.stepIndex(), 0);
    EXPECT_EQ(axis.getState(), AXIS_STATE_IDLE);
    EXPECT_EQ(axis.bitOffset(), 0);
    EXPECT_DOUBLE_EQ(axis.stepsPerDegree(), 1024.0 / 360.0);
}

TEST_F(StepperAxisTest, ConstructionFailures) {
    StepperAxis no_steps(bus_, config(0, 0));
    EXPECT_FALSE(no_steps.isInitialized());

    StepperAxis off_bus(bus_, config(2));
    EXPECT_FALSE(off_bus.isInitialized());

    StepperAxis first(bus_, config(1));
    StepperAxis duplicate(bus_, config(1));
    EXPECT_TRUE(first.isInitialized());
    EXPECT_FALSE(duplicate.isInitialized());
}

TEST_F(StepperAxisTest, SlotIsFreedOnDestruction) {
    {
        StepperAxis axis(bus_, config(0));
        ASSERT_TRUE(axis.isInitialized());
    }
    StepperAxis again(bus_, config(0));
    EXPECT_TRUE(again.isInitialized());
}

TEST_F(StepperAxisTest, StepMovesAngleAndWritesNibble) {
    StepperAxis axis(bus_, config(1));

    ASSERT_EQ(axis.step(1), ESP_OK);
    EXPECT_EQ(axis.stepIndex(), 1);
    EXPECT_NEAR(axis.currentAngle(), 360.0 / 1024.0, 1e-12);
    EXPECT_EQ(bus_.word(), static_cast<uint32_t>(step_sequence_nibble(1)) << 4);

    ASSERT_EQ(axis.step(-1), ESP_OK);
    ASSERT_EQ(axis.step(-1), ESP_OK);
    EXPECT_EQ(axis.stepIndex(), 7);
    EXPECT_NEAR(axis.currentAngle(), 360.0 - 360.0 / 1024.0, 1e-9);
    EXPECT_EQ(bus_.word(), static_cast<uint32_t>(step_sequence_nibble(7)) << 4);
}

TEST_F(StepperAxisTest, StepsAccumulate) {
    StepperAxis axis(bus_, config(0));
    const double spd = axis.stepsPerDegree();

    for (int i = 0; i < 300; i++) {
        ASSERT_EQ(axis.step(1), ESP_OK);
    }
    EXPECT_NEAR(axis.currentAngle(), 300.0 / spd, 1e-9);
    EXPECT_EQ(axis.stepIndex(), 300 % 8);

    stepper_axis_statistics_t stats;
    ASSERT_TRUE(axis.getStatistics(&stats));
    EXPECT_EQ(stats.steps_taken, 300u);
}

TEST_F(StepperAxisTest, FullTurnWrapsToZero) {
    StepperAxis axis(bus_, config(0, 64));
    for (int i = 0; i < 64; i++) {
        axis.step(-1);
    }
    double angle = axis.currentAngle();
    EXPECT_GE(angle, 0.0);
    EXPECT_LT(angle, 360.0);
    EXPECT_LT(std::min(angle, 360.0 - angle), 1e-9);
    EXPECT_EQ(axis.stepIndex(), 0);
}

TEST_F(StepperAxisTest, InvalidDirectionIsRejected) {
    StepperAxis axis(bus_, config(0));
    const size_t writes = fake_.words.size();

    EXPECT_EQ(axis.step(0), ESP_ERR_INVALID_ARG);
    EXPECT_EQ(axis.step(2), ESP_ERR_INVALID_ARG);
    EXPECT_EQ(axis.stepIndex(), 0);
    EXPECT_DOUBLE_EQ(axis.currentAngle(), 0.0);
    EXPECT_EQ(fake_.words.size(), writes);
}

TEST_F(StepperAxisTest, ZeroIsIdempotent) {
    StepperAxis axis(bus_, config(0));
    for (int i = 0; i < 5; i++) {
        axis.step(1);
    }

    axis.zero();
    EXPECT_DOUBLE_EQ(axis.currentAngle(), 0.0);
    EXPECT_EQ(axis.stepIndex(), 0);

    axis.zero();
    EXPECT_DOUBLE_EQ(axis.currentAngle(), 0.0);
    EXPECT_EQ(axis.stepIndex(), 0);
}

TEST_F(StepperAxisTest, AxesKeepTheirOwnBits) {
    StepperAxis a(bus_, config(0));
    StepperAxis b(bus_, config(1));

    for (int i = 0; i < 13; i++) {
        ASSERT_EQ(a.step(1), ESP_OK);
        uint32_t before = bus_.word();
        ASSERT_EQ(b.step(-1), ESP_OK);
        uint32_t after = bus_.word();
        // b's step never disturbs a's slice
        EXPECT_EQ(before & 0x0Fu, after & 0x0Fu);
        EXPECT_EQ(after & 0x0Fu, step_sequence_nibble(a.stepIndex()));
        EXPECT_EQ((after >> 4) & 0x0Fu, step_sequence_nibble(b.stepIndex()));
    }
}

TEST_F(StepperAxisTest, ReleaseClearsOnlyOwnSlice) {
    StepperAxis a(bus_, config(0));
    StepperAxis b(bus_, config(1));
    a.step(1);
    b.step(1);

    a.release();
    EXPECT_EQ(bus_.word() & 0x0Fu, 0u);
    EXPECT_EQ((bus_.word() >> 4) & 0x0Fu, step_sequence_nibble(1));
    EXPECT_EQ(a.stepIndex(), 1);
}

TEST_F(StepperAxisTest, StateNames) {
    EXPECT_STREQ(StepperAxis::getStateName(AXIS_STATE_IDLE), "IDLE");
    EXPECT_STREQ(StepperAxis::getStateName(AXIS_STATE_MOVING), "MOVING");
    EXPECT_STREQ(StepperAxis::getStateName(AXIS_STATE_COUNT), "UNKNOWN");
}
