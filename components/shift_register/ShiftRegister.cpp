/**
 * @file ShiftRegister.cpp
 * @brief Implementation of C++ shift register wrapper
 */

#include "ShiftRegister.hpp"
#include "esp_log.h"

static const char *TAG = "ShiftRegister";

ShiftRegister::ShiftRegister(const shift_register_config_t& config)
    : handle_(shift_register_hal_init(&config))
{
    if (handle_ == nullptr) {
        ESP_LOGE(TAG, "Failed to initialize shift register");
        // Exceptions are disabled, callers check isInitialized()
    }
}

ShiftRegister::~ShiftRegister() {
    if (handle_ != nullptr) {
        shift_register_hal_deinit(handle_);
        handle_ = nullptr;
    }
}

ShiftRegister::ShiftRegister(ShiftRegister&& other) noexcept
    : handle_(other.handle_)
{
    other.handle_ = nullptr;
}

ShiftRegister& ShiftRegister::operator=(ShiftRegister&& other) noexcept {
    if (this != &other) {
        if (handle_ != nullptr) {
            shift_register_hal_deinit(handle_);
        }
        handle_ = other.handle_;
        other.handle_ = nullptr;
    }
    return *this;
}

void ShiftRegister::transmit(uint32_t word, uint8_t bit_width) {
    if (handle_ == nullptr) {
        ESP_LOGW(TAG, "Shift register not initialized");
        return;
    }
    shift_register_hal_transmit(handle_, word, bit_width);
}

uint32_t ShiftRegister::getTransferCount() const {
    return shift_register_hal_get_transfer_count(handle_);
}

void ShiftRegister::transmitCallback(void* ctx, uint32_t word, uint8_t bit_width) {
    if (ctx == nullptr) {
        return;
    }
    static_cast<ShiftRegister*>(ctx)->transmit(word, bit_width);
}
