/**
 * @file MotionController.cpp
 * @brief Implementation of blocking axis moves
 */

#include "MotionController.hpp"
#include "esp_log.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

static const char *TAG = "MotionController";

MotionController::MotionController(const motion_controller_config_t& config) :
    config_(config)
{
    ESP_LOGI(TAG, "Motion controller ready, %lu us per step (%lu ticks)",
             static_cast<unsigned long>(config_.step_delay_us),
             static_cast<unsigned long>(motion_delay_ticks(config_.step_delay_us, configTICK_RATE_HZ)));
}

void MotionController::delayBetweenSteps() const {
    const TickType_t ticks = motion_delay_ticks(config_.step_delay_us, configTICK_RATE_HZ);
    if (ticks == 0) {
        // Let other axis tasks at the same priority interleave
        taskYIELD();
        return;
    }
    vTaskDelay(ticks);
}

esp_err_t MotionController::rotateRelative(StepperAxis& axis, double delta_deg,
                                           const std::atomic<bool>* abort) const {
    if (!axis.isInitialized()) {
        ESP_LOGW(TAG, "Axis not initialized");
        return ESP_ERR_INVALID_STATE;
    }
    if (!motion_angle_is_valid(delta_deg)) {
        ESP_LOGE(TAG, "[%s] rejected non-finite rotation", axis.name());
        return ESP_ERR_INVALID_ARG;
    }

    const uint32_t num_steps = motion_steps_for_delta(delta_deg, axis.stepsPerDegree());
    const int8_t direction = motion_direction_for_delta(delta_deg);
    const double start_angle = axis.currentAngle();

    ESP_LOGI(TAG, "[%s] START rotate: delta=%.2f, start=%.2f, target=%.2f, steps=%lu",
             axis.name(), delta_deg, start_angle,
             motion_normalize_deg(start_angle + delta_deg),
             static_cast<unsigned long>(num_steps));

    axis.setState(AXIS_STATE_MOVING);

    esp_err_t result = ESP_OK;
    for (uint32_t i = 0; i < num_steps; i++) {
        if (abort != nullptr && abort->load()) {
            result = ESP_ERR_NOT_FINISHED;
            break;
        }
        result = axis.step(direction);
        if (result != ESP_OK) {
            break;
        }
        ESP_LOGD(TAG, "[%s] step %lu/%lu -> angle=%.2f", axis.name(),
                 static_cast<unsigned long>(i + 1), static_cast<unsigned long>(num_steps),
                 axis.currentAngle());
        delayBetweenSteps();
    }

    axis.setState(AXIS_STATE_IDLE);
    axis.recordMove(result == ESP_OK);

    if (result != ESP_OK) {
        ESP_LOGW(TAG, "[%s] ABORTED rotate at angle=%.2f: %s",
                 axis.name(), axis.currentAngle(), esp_err_to_name(result));
        return result;
    }

    ESP_LOGI(TAG, "[%s] DONE rotate: angle=%.2f", axis.name(), axis.currentAngle());
    return ESP_OK;
}

esp_err_t MotionController::goToAngle(StepperAxis& axis, double target_deg,
                                      const std::atomic<bool>* abort) const {
    if (!axis.isInitialized()) {
        ESP_LOGW(TAG, "Axis not initialized");
        return ESP_ERR_INVALID_STATE;
    }
    if (!motion_angle_is_valid(target_deg)) {
        ESP_LOGE(TAG, "[%s] rejected non-finite target", axis.name());
        return ESP_ERR_INVALID_ARG;
    }

    // Snapshot, not re-evaluated during the move
    const double current = axis.currentAngle();
    const double delta = motion_shortest_delta_deg(current, target_deg);

    ESP_LOGI(TAG, "[%s] goAngle: target=%.2f, current=%.2f, delta=%.2f",
             axis.name(), target_deg, current, delta);

    return rotateRelative(axis, delta, abort);
}
