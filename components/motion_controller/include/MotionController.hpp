/**
 * @file MotionController.hpp
 * @brief Blocking step loops for single-axis moves
 *
 * The only place physical motion happens. Owns per-step timing and the
 * IDLE -> MOVING -> IDLE transition of the axis being moved. Holds no
 * per-axis state, so one instance can serve every axis task.
 */

#ifndef MOTION_CONTROLLER_HPP
#define MOTION_CONTROLLER_HPP

#include <atomic>
#include <cstdint>
#include "esp_err.h"
#include "motion_controller.h"
#include "StepperAxis.hpp"

class MotionController {
public:
    explicit MotionController(const motion_controller_config_t& config);

    /**
     * @brief Rotate by a signed number of degrees, blocking until done
     *
     * steps = round(steps_per_degree * |delta|) half steps in the sign of
     * delta. After each step the task blocks for step_delay_us rounded up
     * to whole ticks; a zero delay only yields.
     *
     * @param axis Axis to move
     * @param delta_deg Relative rotation, positive = counterclockwise
     * @param abort Optional flag polled between steps
     * @return ESP_OK when all steps were taken,
     *         ESP_ERR_NOT_FINISHED if abort was raised mid-move,
     *         ESP_ERR_INVALID_ARG for a non-finite delta,
     *         ESP_ERR_INVALID_STATE for an uninitialized axis
     */
    esp_err_t rotateRelative(StepperAxis& axis, double delta_deg,
                             const std::atomic<bool>* abort = nullptr) const;

    /**
     * @brief Rotate to an absolute angle along the shorter arc
     *
     * Reads the axis angle once; the move is not retargeted afterwards.
     */
    esp_err_t goToAngle(StepperAxis& axis, double target_deg,
                        const std::atomic<bool>* abort = nullptr) const;

    uint32_t stepDelayUs() const { return config_.step_delay_us; }

private:
    void delayBetweenSteps() const;

    motion_controller_config_t config_;
};

#endif // MOTION_CONTROLLER_HPP
