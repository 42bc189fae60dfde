/**
 * @file MotionTicket.cpp
 * @brief Implementation of command completion tickets
 */

#include "MotionTicket.hpp"
#include "esp_log.h"
#include "freertos/task.h"

static const char *TAG = "MotionTicket";

static const char* result_names[] = {
    "NONE",
    "PENDING",
    "COMPLETED",
    "CANCELLED",
    "FAILED"
};

MotionTicket::MotionTicket() :
    done_(xSemaphoreCreateBinary()),
    result_(MOTION_RESULT_NONE)
{
    if (done_ == nullptr) {
        ESP_LOGE(TAG, "Failed to create completion semaphore");
    }
}

MotionTicket::~MotionTicket() {
    if (done_ != nullptr) {
        vSemaphoreDelete(done_);
        done_ = nullptr;
    }
}

esp_err_t MotionTicket::arm() {
    if (done_ == nullptr) {
        return ESP_ERR_NO_MEM;
    }
    if (result_.load() == MOTION_RESULT_PENDING) {
        return ESP_ERR_INVALID_STATE;
    }
    // Drop a give left over from a resolve nobody waited for
    xSemaphoreTake(done_, 0);
    result_.store(MOTION_RESULT_PENDING);
    return ESP_OK;
}

void MotionTicket::disarm() {
    result_.store(MOTION_RESULT_NONE);
}

void MotionTicket::resolve(motion_result_t result) {
    result_.store(result);
    if (done_ != nullptr) {
        xSemaphoreGive(done_);
    }
}

bool MotionTicket::wait(TickType_t ticks_to_wait) {
    if (done_ == nullptr) {
        return false;
    }

    TimeOut_t timeout;
    vTaskSetTimeOutState(&timeout);

    while (1) {
        motion_result_t current = result_.load();
        if (current == MOTION_RESULT_NONE) {
            return false;
        }
        if (current != MOTION_RESULT_PENDING) {
            return true;
        }
        if (xSemaphoreTake(done_, ticks_to_wait) != pdTRUE) {
            return result_.load() != MOTION_RESULT_PENDING;
        }
        // A give can belong to the previous command: resolve() stores the
        // result first, so it may land after the ticket was re-armed
        if (result_.load() != MOTION_RESULT_PENDING) {
            return true;
        }
        if (xTaskCheckForTimeOut(&timeout, &ticks_to_wait) == pdTRUE) {
            return false;
        }
    }
}

const char* MotionTicket::getResultName(motion_result_t result) {
    if (result < MOTION_RESULT_COUNT) {
        return result_names[result];
    }
    return "UNKNOWN";
}
