/**
 * @file ShiftRegister.hpp
 * @brief C++ API wrapper for the shift register chain
 *
 * Object-oriented interface over the shift register HAL.
 * Owns the HAL handle (RAII) and exposes a C-style transmit trampoline
 * that can be handed to SharedBus as its bus driver.
 */

#ifndef SHIFT_REGISTER_HPP
#define SHIFT_REGISTER_HPP

#include "shift_register_hal.h"
#include <cstdint>

/**
 * @brief C++ wrapper class for a 74HC595 chain
 */
class ShiftRegister {
public:
    /**
     * @brief Constructor
     * @param config Pin and timing configuration
     */
    explicit ShiftRegister(const shift_register_config_t& config);

    /**
     * @brief Destructor
     */
    ~ShiftRegister();

    ShiftRegister(const ShiftRegister&) = delete;
    ShiftRegister& operator=(const ShiftRegister&) = delete;

    ShiftRegister(ShiftRegister&& other) noexcept;
    ShiftRegister& operator=(ShiftRegister&& other) noexcept;

    /**
     * @brief Shift and latch a word, LSB first
     */
    void transmit(uint32_t word, uint8_t bit_width);

    /**
     * @brief Number of words latched so far
     */
    uint32_t getTransferCount() const;

    /**
     * @brief Check if initialized
     */
    bool isInitialized() const { return handle_ != nullptr; }

    /**
     * @brief Bus driver trampoline
     *
     * Matches bus_transmit_callback_t; ctx must point to a ShiftRegister.
     */
    static void transmitCallback(void* ctx, uint32_t word, uint8_t bit_width);

private:
    shift_register_handle_t handle_;
};

#endif // SHIFT_REGISTER_HPP
