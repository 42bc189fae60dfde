/**
 * @file StepperAxis.cpp
 * @brief Implementation of per-axis angular state
 */

#include "StepperAxis.hpp"
#include <string.h>
#include "esp_log.h"
#include "step_sequence.h"
#include "motion_controller.h"

static const char *TAG = "StepperAxis";

static const char* state_names[] = {
    "IDLE",
    "MOVING"
};

StepperAxis::StepperAxis(SharedBus& bus, const stepper_axis_config_t& config) :
    bus_(bus),
    config_(config),
    bit_offset_(static_cast<uint8_t>(config.id * SHARED_BUS_BITS_PER_AXIS)),
    steps_per_degree_(0.0),
    angle_(0.0),
    step_index_(0),
    state_(AXIS_STATE_IDLE),
    guard_(nullptr)
{
    memset(&statistics_, 0, sizeof(statistics_));
    if (config_.name == nullptr) {
        config_.name = "axis";
    }

    if (config.steps_per_revolution == 0) {
        ESP_LOGE(TAG, "[%s] steps per revolution must be positive", config_.name);
        return;
    }

    if (bus_.claimSlot(config.id) != ESP_OK) {
        ESP_LOGE(TAG, "[%s] cannot claim bus slot %u", config_.name, config.id);
        return;
    }

    guard_ = xSemaphoreCreateMutex();
    if (guard_ == nullptr) {
        ESP_LOGE(TAG, "[%s] failed to create angle guard", config_.name);
        bus_.releaseSlot(config.id);
        return;
    }

    steps_per_degree_ = static_cast<double>(config.steps_per_revolution) / 360.0;

    ESP_LOGI(TAG, "[%s] axis %u on bits %u..%u, %.3f steps/deg",
             config_.name, config_.id, bit_offset_, bit_offset_ + 3, steps_per_degree_);
}

StepperAxis::~StepperAxis() {
    if (guard_ != nullptr) {
        bus_.releaseSlot(config_.id);
        vSemaphoreDelete(guard_);
        guard_ = nullptr;
    }
}

stepper_axis_config_t StepperAxis::defaultConfig(uint8_t id, const char* name) {
    stepper_axis_config_t config = {
        .id = id,
        .name = name,
        .steps_per_revolution = MOTION_DEFAULT_STEPS_PER_REVOLUTION
    };
    return config;
}

esp_err_t StepperAxis::step(int8_t direction) {
    if (guard_ == nullptr) {
        ESP_LOGW(TAG, "Axis not initialized");
        return ESP_ERR_INVALID_STATE;
    }
    if (direction != 1 && direction != -1) {
        ESP_LOGE(TAG, "[%s] invalid step direction %d", config_.name, direction);
        return ESP_ERR_INVALID_ARG;
    }

    xSemaphoreTake(guard_, portMAX_DELAY);
    step_index_ = step_sequence_advance(step_index_, direction);
    uint8_t nibble = step_sequence_nibble(step_index_);
    xSemaphoreGive(guard_);

    // Serialization point across axes
    bus_.applyAxisNibble(bit_offset_, nibble);

    xSemaphoreTake(guard_, portMAX_DELAY);
    angle_ = motion_normalize_deg(angle_ + direction / steps_per_degree_);
    statistics_.steps_taken++;
    xSemaphoreGive(guard_);

    return ESP_OK;
}

void StepperAxis::zero() {
    if (guard_ == nullptr) {
        ESP_LOGW(TAG, "Axis not initialized");
        return;
    }
    xSemaphoreTake(guard_, portMAX_DELAY);
    angle_ = 0.0;
    step_index_ = 0;
    xSemaphoreGive(guard_);
    ESP_LOGI(TAG, "[%s] zeroed", config_.name);
}

void StepperAxis::release() {
    if (guard_ == nullptr) {
        return;
    }
    bus_.applyAxisNibble(bit_offset_, 0);
    ESP_LOGD(TAG, "[%s] coils released", config_.name);
}

double StepperAxis::currentAngle() const {
    if (guard_ == nullptr) {
        return 0.0;
    }
    xSemaphoreTake(guard_, portMAX_DELAY);
    double snapshot = angle_;
    xSemaphoreGive(guard_);
    return snapshot;
}

uint8_t StepperAxis::stepIndex() const {
    if (guard_ == nullptr) {
        return 0;
    }
    xSemaphoreTake(guard_, portMAX_DELAY);
    uint8_t snapshot = step_index_;
    xSemaphoreGive(guard_);
    return snapshot;
}

axis_state_t StepperAxis::getState() const {
    if (guard_ == nullptr) {
        return AXIS_STATE_IDLE;
    }
    xSemaphoreTake(guard_, portMAX_DELAY);
    axis_state_t snapshot = state_;
    xSemaphoreGive(guard_);
    return snapshot;
}

void StepperAxis::setState(axis_state_t state) {
    if (guard_ == nullptr || state >= AXIS_STATE_COUNT) {
        return;
    }
    xSemaphoreTake(guard_, portMAX_DELAY);
    axis_state_t old_state = state_;
    state_ = state;
    xSemaphoreGive(guard_);

    if (old_state != state) {
        ESP_LOGD(TAG, "[%s] Transition: %s -> %s",
                 config_.name, state_names[old_state], state_names[state]);
    }
}

void StepperAxis::recordMove(bool completed) {
    if (guard_ == nullptr) {
        return;
    }
    xSemaphoreTake(guard_, portMAX_DELAY);
    if (completed) {
        statistics_.moves_completed++;
    } else {
        statistics_.moves_cancelled++;
    }
    xSemaphoreGive(guard_);
}

bool StepperAxis::getStatistics(stepper_axis_statistics_t* stats) const {
    if (guard_ == nullptr || stats == nullptr) {
        return false;
    }
    xSemaphoreTake(guard_, portMAX_DELAY);
    memcpy(stats, &statistics_, sizeof(stepper_axis_statistics_t));
    xSemaphoreGive(guard_);
    return true;
}

const char* StepperAxis::getStateName(axis_state_t state) {
    if (state < AXIS_STATE_COUNT) {
        return state_names[state];
    }
    return "UNKNOWN";
}
