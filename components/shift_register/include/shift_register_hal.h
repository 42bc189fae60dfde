/**
 * @file shift_register_hal.h
 * @brief Hardware Abstraction Layer for a chain of 74HC595 shift registers
 *
 * Provides low-level C interface for bit-banging a word onto a serial-in,
 * parallel-out register chain over three GPIO lines (data, clock, latch).
 * The register outputs drive the ULN2003 inputs of every stepper axis.
 *
 * Bit order is LSB-first: bit 0 of the word is clocked out first, so with
 * two chained registers bit 0 ends up on the last output of the far register.
 * Axis slice assignment depends on this, wire accordingly.
 */

#ifndef SHIFT_REGISTER_HAL_H
#define SHIFT_REGISTER_HAL_H

#include <stdint.h>
#include <stdbool.h>
#include "driver/gpio.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Longest word the HAL can shift in one transfer
 */
#define SHIFT_REGISTER_MAX_BITS 32

/**
 * @brief Shift register chain configuration structure
 */
typedef struct {
    gpio_num_t data_pin;
    gpio_num_t clock_pin;
    gpio_num_t latch_pin;
    uint32_t pulse_width_us;    // High time of clock/latch pulses, 0 = as fast as GPIO allows
} shift_register_config_t;

/**
 * @brief Shift register handle
 */
typedef struct shift_register_handle_s* shift_register_handle_t;

/**
 * @brief Initialize shift register driver
 *
 * @param config Pointer to chain configuration structure
 *
 * @return shift_register_handle_t Handle to the chain, or NULL on failure
 * @note After initialization:
 *
 * - All three pins are outputs driven LOW.
 *
 * - Register contents are unchanged until the first transmit.
 */
shift_register_handle_t shift_register_hal_init(const shift_register_config_t* config);

/**
 * @brief Deinitialize shift register driver
 *
 * @note Pins are left driven LOW. Memory allocated for the handle is freed.
 */
void shift_register_hal_deinit(shift_register_handle_t handle);

/**
 * @brief Shift a word into the chain and latch it onto the outputs
 *
 * @param handle Handle to the chain
 * @param word Value to shift, LSB first
 * @param bit_width Number of bits to shift (1..SHIFT_REGISTER_MAX_BITS)
 *
 * @note Fire-and-forget: the chain has no readback, so failures are not observable.
 */
void shift_register_hal_transmit(shift_register_handle_t handle, uint32_t word, uint8_t bit_width);

/**
 * @brief Get number of transfers latched since init
 */
uint32_t shift_register_hal_get_transfer_count(shift_register_handle_t handle);

#ifdef __cplusplus
}
#endif

#endif // SHIFT_REGISTER_HAL_H
