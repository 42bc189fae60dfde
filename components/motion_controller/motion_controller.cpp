/**
 * @file motion_controller.cpp
 * @brief Angle arithmetic for axis motion
 */

#include "motion_controller.h"
#include <cmath>

motion_controller_config_t motion_controller_get_default_config(void) {
    motion_controller_config_t config = {
        .step_delay_us = MOTION_DEFAULT_STEP_DELAY_US
    };
    return config;
}

bool motion_angle_is_valid(double angle_deg) {
    return std::isfinite(angle_deg);
}

double motion_normalize_deg(double angle_deg) {
    double folded = std::fmod(angle_deg, 360.0);
    if (folded < 0.0) {
        folded += 360.0;
    }
    // -1e-15 + 360.0 rounds to 360.0
    if (folded >= 360.0) {
        folded = 0.0;
    }
    return folded;
}

double motion_shortest_delta_deg(double current_deg, double target_deg) {
    double current = motion_normalize_deg(current_deg);
    double target = motion_normalize_deg(target_deg);

    // target - current is in (-360, 360), so the dividend stays positive
    double delta = std::fmod(target - current + 540.0, 360.0) - 180.0;
    if (delta <= -180.0) {
        delta += 360.0;
    }
    return delta;
}

uint32_t motion_steps_for_delta(double delta_deg, double steps_per_degree) {
    if (!std::isfinite(delta_deg) || !std::isfinite(steps_per_degree) || steps_per_degree <= 0.0) {
        return 0;
    }
    double steps = std::round(steps_per_degree * std::fabs(delta_deg));
    if (steps >= static_cast<double>(UINT32_MAX)) {
        return UINT32_MAX;
    }
    return static_cast<uint32_t>(steps);
}

uint32_t motion_delay_ticks(uint32_t delay_us, uint32_t tick_rate_hz) {
    if (delay_us == 0 || tick_rate_hz == 0) {
        return 0;
    }
    uint64_t ticks = (static_cast<uint64_t>(delay_us) * tick_rate_hz + 999999ULL) / 1000000ULL;
    if (ticks > UINT32_MAX) {
        return UINT32_MAX;
    }
    return static_cast<uint32_t>(ticks);
}

int8_t motion_direction_for_delta(double delta_deg) {
    if (delta_deg > 0.0) {
        return 1;
    }
    if (delta_deg < 0.0) {
        return -1;
    }
    return 0;
}
