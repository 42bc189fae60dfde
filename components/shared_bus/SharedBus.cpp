/**
 * @file SharedBus.cpp
 * @brief Implementation of the shared register word
 */

#include "SharedBus.hpp"
#include <string.h>
#include <algorithm>
#include "esp_log.h"

static const char *TAG = "SharedBus";

SharedBus::SharedBus(const shared_bus_config_t& config) :
    config_(config),
    bit_width_(0),
    word_(0),
    claimed_mask_(0),
    mutex_(nullptr)
{
    memset(&statistics_, 0, sizeof(statistics_));

    if (config.axis_count == 0 || config.axis_count > SHARED_BUS_MAX_AXES) {
        ESP_LOGE(TAG, "Axis count %u outside 1..%d", config.axis_count, SHARED_BUS_MAX_AXES);
        return;
    }
    if (config.min_width > SHARED_BUS_MAX_AXES * SHARED_BUS_BITS_PER_AXIS) {
        ESP_LOGE(TAG, "Minimum width %u exceeds 32 bits", config.min_width);
        return;
    }
    if (config.transmit == nullptr) {
        ESP_LOGE(TAG, "No bus driver");
        return;
    }

    bit_width_ = std::max<uint8_t>(config.min_width,
                                   config.axis_count * SHARED_BUS_BITS_PER_AXIS);

    mutex_ = xSemaphoreCreateMutex();
    if (mutex_ == nullptr) {
        ESP_LOGE(TAG, "Failed to create bus mutex");
        return;
    }

    ESP_LOGI(TAG, "Shared bus ready: %u axes, %u bits per transfer",
             config_.axis_count, bit_width_);
}

SharedBus::~SharedBus() {
    if (mutex_ != nullptr) {
        vSemaphoreDelete(mutex_);
        mutex_ = nullptr;
    }
}

shared_bus_config_t SharedBus::defaultConfig(uint8_t axis_count,
                                             bus_transmit_callback_t transmit,
                                             void* transmit_ctx) {
    shared_bus_config_t config = {
        .axis_count = axis_count,
        .min_width = SHARED_BUS_DEFAULT_MIN_WIDTH,
        .transmit = transmit,
        .transmit_ctx = transmit_ctx
    };
    return config;
}

void SharedBus::transmitLocked() {
    config_.transmit(config_.transmit_ctx, word_, bit_width_);
    statistics_.transmit_count++;
    statistics_.last_word = word_;
}

uint32_t SharedBus::applyAxisNibble(uint8_t bit_offset, uint8_t nibble) {
    if (mutex_ == nullptr) {
        ESP_LOGW(TAG, "Bus not initialized");
        return 0;
    }

    if ((bit_offset % SHARED_BUS_BITS_PER_AXIS) != 0 ||
        bit_offset + SHARED_BUS_BITS_PER_AXIS > config_.axis_count * SHARED_BUS_BITS_PER_AXIS) {
        ESP_LOGE(TAG, "Bit offset %u is not an axis slice on this bus", bit_offset);
        return word();
    }

    const uint32_t mask = 0xFu << bit_offset;

    xSemaphoreTake(mutex_, portMAX_DELAY);
    word_ = (word_ & ~mask) | ((static_cast<uint32_t>(nibble) & 0xFu) << bit_offset);
    transmitLocked();
    uint32_t committed = word_;
    xSemaphoreGive(mutex_);

    return committed;
}

esp_err_t SharedBus::claimSlot(uint8_t axis_id) {
    if (mutex_ == nullptr) {
        return ESP_ERR_INVALID_STATE;
    }
    if (axis_id >= config_.axis_count) {
        ESP_LOGE(TAG, "Axis %u does not fit a %u-axis bus", axis_id, config_.axis_count);
        return ESP_ERR_INVALID_ARG;
    }

    esp_err_t ret = ESP_OK;
    xSemaphoreTake(mutex_, portMAX_DELAY);
    if (claimed_mask_ & (1u << axis_id)) {
        ret = ESP_ERR_INVALID_STATE;
    } else {
        claimed_mask_ |= (1u << axis_id);
    }
    xSemaphoreGive(mutex_);

    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Slot %u already claimed", axis_id);
    }
    return ret;
}

void SharedBus::releaseSlot(uint8_t axis_id) {
    if (mutex_ == nullptr || axis_id >= config_.axis_count) {
        return;
    }
    xSemaphoreTake(mutex_, portMAX_DELAY);
    claimed_mask_ &= ~(1u << axis_id);
    xSemaphoreGive(mutex_);
}

void SharedBus::clear() {
    if (mutex_ == nullptr) {
        return;
    }
    xSemaphoreTake(mutex_, portMAX_DELAY);
    word_ = 0;
    transmitLocked();
    xSemaphoreGive(mutex_);
    ESP_LOGI(TAG, "Bus outputs cleared");
}

uint32_t SharedBus::word() const {
    if (mutex_ == nullptr) {
        return 0;
    }
    xSemaphoreTake(mutex_, portMAX_DELAY);
    uint32_t snapshot = word_;
    xSemaphoreGive(mutex_);
    return snapshot;
}

bool SharedBus::getStatistics(shared_bus_statistics_t* stats) const {
    if (mutex_ == nullptr || stats == nullptr) {
        return false;
    }
    xSemaphoreTake(mutex_, portMAX_DELAY);
    memcpy(stats, &statistics_, sizeof(shared_bus_statistics_t));
    xSemaphoreGive(mutex_);
    return true;
}
