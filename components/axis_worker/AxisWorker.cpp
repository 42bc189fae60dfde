/**
 * @file AxisWorker.cpp
 * @brief Implementation of the per-axis command task
 */

#include "AxisWorker.hpp"
#include <stdio.h>
#include "esp_log.h"
#include "motion_controller.h"

static const char *TAG = "AxisWorker";

#define AXIS_WORKER_DEFAULT_QUEUE_DEPTH 16
#define AXIS_WORKER_DEFAULT_STACK_SIZE  4096
#define AXIS_WORKER_DEFAULT_PRIORITY    5

AxisWorker::AxisWorker(StepperAxis& axis, const MotionController& motion, const axis_worker_config_t& config) :
    axis_(axis),
    motion_(motion),
    config_(config),
    queue_(nullptr),
    task_(nullptr),
    exited_(nullptr),
    control_mutex_(nullptr),
    abort_(false),
    outstanding_(0)
{
    if (!axis_.isInitialized()) {
        ESP_LOGE(TAG, "Cannot start worker for an uninitialized axis");
        return;
    }
    if (config_.queue_depth == 0) {
        ESP_LOGE(TAG, "[%s] queue depth must be positive", axis_.name());
        return;
    }

    queue_ = xQueueCreate(config_.queue_depth, sizeof(command_t));
    exited_ = xSemaphoreCreateBinary();
    control_mutex_ = xSemaphoreCreateMutex();
    if (!queue_ || !exited_ || !control_mutex_) {
        ESP_LOGE(TAG, "[%s] failed to allocate worker queue/semaphores", axis_.name());
        return;
    }

    char task_name[configMAX_TASK_NAME_LEN];
    snprintf(task_name, sizeof(task_name), "axis_%s", axis_.name());

    if (xTaskCreate(taskEntry, task_name, config_.task_stack_size, this,
                    config_.task_priority, &task_) != pdPASS) {
        ESP_LOGE(TAG, "[%s] failed to create worker task", axis_.name());
        task_ = nullptr;
        return;
    }

    ESP_LOGI(TAG, "[%s] worker started (queue depth %lu, priority %u)",
             axis_.name(), static_cast<unsigned long>(config_.queue_depth),
             static_cast<unsigned>(config_.task_priority));
}

AxisWorker::~AxisWorker() {
    if (task_ != nullptr) {
        xSemaphoreTake(control_mutex_, portMAX_DELAY);
        flushPending();
        abort_.store(true);

        command_t cmd = {CMD_SHUTDOWN, 0.0, nullptr};
        if (xQueueSendToFront(queue_, &cmd, portMAX_DELAY) == pdTRUE) {
            xSemaphoreTake(exited_, portMAX_DELAY);
        } else {
            ESP_LOGE(TAG, "[%s] failed to post shutdown", axis_.name());
        }
        task_ = nullptr;

        // Commands that raced in behind the shutdown
        flushPending();
        xSemaphoreGive(control_mutex_);
        ESP_LOGI(TAG, "[%s] worker stopped", axis_.name());
    }

    if (queue_ != nullptr) {
        vQueueDelete(queue_);
        queue_ = nullptr;
    }
    if (exited_ != nullptr) {
        vSemaphoreDelete(exited_);
        exited_ = nullptr;
    }
    if (control_mutex_ != nullptr) {
        vSemaphoreDelete(control_mutex_);
        control_mutex_ = nullptr;
    }
}

axis_worker_config_t AxisWorker::defaultConfig() {
    axis_worker_config_t config = {
        .queue_depth = AXIS_WORKER_DEFAULT_QUEUE_DEPTH,
        .task_stack_size = AXIS_WORKER_DEFAULT_STACK_SIZE,
        .task_priority = AXIS_WORKER_DEFAULT_PRIORITY
    };
    return config;
}

esp_err_t AxisWorker::goAngle(double target_deg, MotionTicket* ticket, TickType_t ticks_to_wait) {
    return submit(CMD_GO_ANGLE, target_deg, ticket, ticks_to_wait);
}

esp_err_t AxisWorker::rotate(double delta_deg, MotionTicket* ticket, TickType_t ticks_to_wait) {
    return submit(CMD_ROTATE, delta_deg, ticket, ticks_to_wait);
}

esp_err_t AxisWorker::zero() {
    return runPrivileged(CMD_ZERO);
}

esp_err_t AxisWorker::stop() {
    return runPrivileged(CMD_STOP);
}

uint32_t AxisWorker::pendingCount() const {
    if (queue_ == nullptr) {
        return 0;
    }
    return static_cast<uint32_t>(uxQueueMessagesWaiting(queue_));
}

esp_err_t AxisWorker::submit(command_type_t type, double value, MotionTicket* ticket, TickType_t ticks_to_wait) {
    if (task_ == nullptr) {
        ESP_LOGW(TAG, "Worker not running");
        return ESP_ERR_INVALID_STATE;
    }
    if (!motion_angle_is_valid(value)) {
        ESP_LOGE(TAG, "[%s] rejected non-finite %s", axis_.name(),
                 type == CMD_GO_ANGLE ? "target" : "rotation");
        return ESP_ERR_INVALID_ARG;
    }

    if (ticket != nullptr) {
        esp_err_t ret = ticket->arm();
        if (ret != ESP_OK) {
            ESP_LOGW(TAG, "[%s] ticket not usable: %s", axis_.name(), esp_err_to_name(ret));
            return ret;
        }
    }

    command_t cmd = {type, value, ticket};
    outstanding_.fetch_add(1);
    if (xQueueSend(queue_, &cmd, ticks_to_wait) != pdTRUE) {
        outstanding_.fetch_sub(1);
        if (ticket != nullptr) {
            ticket->disarm();
        }
        ESP_LOGW(TAG, "[%s] command queue full, %s %.2f not queued", axis_.name(),
                 type == CMD_GO_ANGLE ? "goAngle" : "rotate", value);
        return ESP_ERR_TIMEOUT;
    }

    ESP_LOGD(TAG, "[%s] queued %s %.2f", axis_.name(),
             type == CMD_GO_ANGLE ? "goAngle" : "rotate", value);
    return ESP_OK;
}

esp_err_t AxisWorker::runPrivileged(command_type_t type) {
    if (task_ == nullptr) {
        ESP_LOGW(TAG, "Worker not running");
        return ESP_ERR_INVALID_STATE;
    }

    MotionTicket barrier;
    esp_err_t ret = barrier.arm();
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "[%s] failed to create barrier: %s", axis_.name(), esp_err_to_name(ret));
        return ret;
    }

    xSemaphoreTake(control_mutex_, portMAX_DELAY);

    uint32_t flushed = flushPending();
    abort_.store(true);

    command_t cmd = {type, 0.0, &barrier};
    if (xQueueSendToFront(queue_, &cmd, portMAX_DELAY) == pdTRUE) {
        barrier.wait(portMAX_DELAY);
    } else {
        abort_.store(false);
        ret = ESP_FAIL;
    }

    xSemaphoreGive(control_mutex_);

    if (ret == ESP_OK) {
        ESP_LOGI(TAG, "[%s] %s applied, %lu queued command(s) cancelled", axis_.name(),
                 type == CMD_ZERO ? "zero" : "stop", static_cast<unsigned long>(flushed));
    } else {
        ESP_LOGE(TAG, "[%s] failed to post %s", axis_.name(), type == CMD_ZERO ? "zero" : "stop");
    }
    return ret;
}

uint32_t AxisWorker::flushPending() {
    uint32_t flushed = 0;
    command_t cmd;
    while (xQueueReceive(queue_, &cmd, 0) == pdTRUE) {
        if (cmd.type == CMD_GO_ANGLE || cmd.type == CMD_ROTATE) {
            outstanding_.fetch_sub(1);
            axis_.recordMove(false);
        }
        if (cmd.ticket != nullptr) {
            cmd.ticket->resolve(MOTION_RESULT_CANCELLED);
        }
        flushed++;
    }
    return flushed;
}

void AxisWorker::taskEntry(void* arg) {
    static_cast<AxisWorker*>(arg)->run();
}

void AxisWorker::run() {
    command_t cmd;
    while (1) {
        if (xQueueReceive(queue_, &cmd, portMAX_DELAY) != pdTRUE) {
            continue;
        }
        if (cmd.type == CMD_SHUTDOWN) {
            break;
        }
        execute(cmd);
    }

    xSemaphoreGive(exited_);
    vTaskDelete(nullptr);
}

void AxisWorker::execute(const command_t& cmd) {
    esp_err_t ret = ESP_OK;

    switch (cmd.type) {
        case CMD_GO_ANGLE:
            ret = motion_.goToAngle(axis_, cmd.value, &abort_);
            break;

        case CMD_ROTATE:
            ret = motion_.rotateRelative(axis_, cmd.value, &abort_);
            break;

        case CMD_ZERO:
            abort_.store(false);
            axis_.zero();
            break;

        case CMD_STOP:
            abort_.store(false);
            break;

        default:
            ESP_LOGW(TAG, "[%s] unknown command type: %d", axis_.name(), cmd.type);
            ret = ESP_ERR_INVALID_ARG;
            break;
    }

    if (cmd.type == CMD_GO_ANGLE || cmd.type == CMD_ROTATE) {
        outstanding_.fetch_sub(1);
    }

    if (cmd.ticket != nullptr) {
        motion_result_t result = MOTION_RESULT_COMPLETED;
        if (ret == ESP_ERR_NOT_FINISHED) {
            result = MOTION_RESULT_CANCELLED;
        } else if (ret != ESP_OK) {
            result = MOTION_RESULT_FAILED;
        }
        cmd.ticket->resolve(result);
    }
}
