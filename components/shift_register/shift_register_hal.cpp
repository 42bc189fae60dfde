/**
 * @file shift_register_hal.cpp
 * @brief GPIO bit-bang implementation of the shift register HAL
 */

#include "shift_register_hal.h"
#include <stdlib.h>
#include <string.h>
#include "esp_log.h"
#include "esp_rom_sys.h"

static const char *TAG = "SHIFT_REG_HAL";

/**
 * @brief Internal structure for shift register handle
 */
struct shift_register_handle_s {
    shift_register_config_t config;
    uint32_t transfer_count;
};

static inline void pulse_pin(const shift_register_handle_s* handle, gpio_num_t pin) {
    gpio_set_level(pin, 1);
    if (handle->config.pulse_width_us > 0) {
        esp_rom_delay_us(handle->config.pulse_width_us);
    }
    gpio_set_level(pin, 0);
}

shift_register_handle_t shift_register_hal_init(const shift_register_config_t* config) {
    if (!config) {
        ESP_LOGE(TAG, "Invalid config");
        return NULL;
    }

    gpio_config_t io_conf;
    memset(&io_conf, 0, sizeof(io_conf));
    io_conf.pin_bit_mask = (1ULL << config->data_pin) |
                           (1ULL << config->clock_pin) |
                           (1ULL << config->latch_pin);
    io_conf.mode = GPIO_MODE_OUTPUT;
    io_conf.pull_up_en = GPIO_PULLUP_DISABLE;
    io_conf.pull_down_en = GPIO_PULLDOWN_DISABLE;
    io_conf.intr_type = GPIO_INTR_DISABLE;

    esp_err_t ret = gpio_config(&io_conf);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to configure GPIO: %s", esp_err_to_name(ret));
        return NULL;
    }

    shift_register_handle_t handle = (shift_register_handle_t)malloc(sizeof(struct shift_register_handle_s));
    if (!handle) {
        ESP_LOGE(TAG, "Failed to allocate shift register handle");
        return NULL;
    }

    memset(handle, 0, sizeof(struct shift_register_handle_s));
    memcpy(&handle->config, config, sizeof(shift_register_config_t));

    gpio_set_level(config->data_pin, 0);
    gpio_set_level(config->clock_pin, 0);
    gpio_set_level(config->latch_pin, 0);

    ESP_LOGI(TAG, "Shift register initialized: data=%d clock=%d latch=%d",
             config->data_pin, config->clock_pin, config->latch_pin);

    return handle;
}

void shift_register_hal_deinit(shift_register_handle_t handle) {
    if (!handle) {
        return;
    }

    gpio_set_level(handle->config.data_pin, 0);
    gpio_set_level(handle->config.clock_pin, 0);
    gpio_set_level(handle->config.latch_pin, 0);

    free(handle);
    ESP_LOGI(TAG, "Shift register deinitialized");
}

void shift_register_hal_transmit(shift_register_handle_t handle, uint32_t word, uint8_t bit_width) {
    if (!handle) {
        return;
    }

    if (bit_width == 0 || bit_width > SHIFT_REGISTER_MAX_BITS) {
        ESP_LOGW(TAG, "Invalid bit width %u, transfer skipped", bit_width);
        return;
    }

    // LSB first
    for (uint8_t i = 0; i < bit_width; i++) {
        gpio_set_level(handle->config.data_pin, (word >> i) & 0x1);
        pulse_pin(handle, handle->config.clock_pin);
    }
    pulse_pin(handle, handle->config.latch_pin);

    handle->transfer_count++;
}

uint32_t shift_register_hal_get_transfer_count(shift_register_handle_t handle) {
    if (!handle) {
        return 0;
    }
    return handle->transfer_count;
}
