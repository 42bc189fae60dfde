/**
 * @file motion_controller.h
 * @brief Angle arithmetic and timing configuration for axis motion
 *
 * Pure helpers shared by the motion controller and its callers:
 * angle normalization, shortest-path resolution and step counting.
 * No RTOS or hardware dependencies.
 */

#ifndef MOTION_CONTROLLER_H
#define MOTION_CONTROLLER_H

#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

#define MOTION_DEFAULT_STEPS_PER_REVOLUTION 4096    // 28BYJ-48, half stepping
#define MOTION_DEFAULT_STEP_DELAY_US        1200

/**
 * @brief Motion controller configuration
 */
typedef struct {
    uint32_t step_delay_us;     // Pause between consecutive steps of one axis
} motion_controller_config_t;

/**
 * @brief Get default motion controller configuration
 */
motion_controller_config_t motion_controller_get_default_config(void);

/**
 * @brief Check that an angle can be acted on (finite, not NaN)
 */
bool motion_angle_is_valid(double angle_deg);

/**
 * @brief Fold any finite angle into [0, 360)
 */
double motion_normalize_deg(double angle_deg);

/**
 * @brief Signed shortest rotation from current to target
 *
 * Computed as ((target - current + 540) mod 360) - 180 on normalized
 * inputs, then folded so the result lies in (-180, 180]. A half-turn
 * resolves to +180.
 */
double motion_shortest_delta_deg(double current_deg, double target_deg);

/**
 * @brief Number of whole steps for a rotation, round(steps_per_degree * |delta|)
 *
 * @return 0 for a zero or non-finite delta
 */
uint32_t motion_steps_for_delta(double delta_deg, double steps_per_degree);

/**
 * @brief RTOS ticks to block for a step delay, rounded up
 *
 * Any non-zero delay blocks for at least one tick, so a moving axis always
 * hands the CPU to lower priority tasks between steps.
 *
 * @return 0 only for a zero delay or tick rate
 */
uint32_t motion_delay_ticks(uint32_t delay_us, uint32_t tick_rate_hz);

/**
 * @brief Step direction for a rotation: +1, -1, or 0 for no motion
 */
int8_t motion_direction_for_delta(double delta_deg);

#ifdef __cplusplus
}
#endif

#endif // MOTION_CONTROLLER_H
