/**
 * @file SharedBus.hpp
 * @brief Combined output word shared by every axis on one register chain
 *
 * Each axis owns a 4-bit slice of the word. SharedBus serializes the
 * read-modify-write-transmit cycle so that concurrent axis tasks never
 * overwrite each other's coil bits.
 */

#ifndef SHARED_BUS_HPP
#define SHARED_BUS_HPP

#include <cstdint>
#include "esp_err.h"
#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"

#define SHARED_BUS_BITS_PER_AXIS    4
#define SHARED_BUS_MAX_AXES         8       // 32-bit word
#define SHARED_BUS_DEFAULT_MIN_WIDTH 8      // one 74HC595

/**
 * @brief Bus driver callback
 *
 * Serializes bit_width bits of word onto the physical bus. Called with the
 * bus lock held, must not call back into SharedBus.
 */
typedef void (*bus_transmit_callback_t)(void* ctx, uint32_t word, uint8_t bit_width);

/**
 * @brief Shared bus configuration
 */
typedef struct {
    uint8_t axis_count;                 // Number of 4-bit slots carried by the chain
    uint8_t min_width;                  // Minimum bits per transfer
    bus_transmit_callback_t transmit;   // Bus driver
    void* transmit_ctx;                 // Passed to transmit
} shared_bus_config_t;

/**
 * @brief Shared bus statistics
 */
typedef struct {
    uint32_t transmit_count;            // Words pushed to the bus driver
    uint32_t last_word;                 // Last word transmitted
} shared_bus_statistics_t;

class SharedBus {
public:
    /**
     * @brief Constructor
     *
     * Fails (isInitialized() == false) if axis_count is 0 or above
     * SHARED_BUS_MAX_AXES, if min_width exceeds 32, or if no transmit
     * callback is given.
     */
    explicit SharedBus(const shared_bus_config_t& config);

    ~SharedBus();

    // Axes keep a reference to the bus
    SharedBus(const SharedBus&) = delete;
    SharedBus& operator=(const SharedBus&) = delete;
    SharedBus(SharedBus&&) = delete;
    SharedBus& operator=(SharedBus&&) = delete;

    /**
     * @brief Default configuration for a given axis count and driver
     */
    static shared_bus_config_t defaultConfig(uint8_t axis_count,
                                             bus_transmit_callback_t transmit,
                                             void* transmit_ctx);

    /**
     * @brief Replace one axis slice and push the word to the bus
     *
     * Atomic with respect to every other caller: clears the 4 bits at
     * bit_offset, ORs in nibble, stores and transmits the result.
     *
     * @param bit_offset Slice start, multiple of 4 inside the bus width
     * @param nibble Coil pattern, only the low 4 bits are used
     * @return The word now on the bus
     */
    uint32_t applyAxisNibble(uint8_t bit_offset, uint8_t nibble);

    /**
     * @brief Reserve the slice for axis_id
     *
     * @return ESP_OK, ESP_ERR_INVALID_ARG if the id does not fit the bus,
     *         ESP_ERR_INVALID_STATE if already claimed or bus not initialized
     */
    esp_err_t claimSlot(uint8_t axis_id);

    /**
     * @brief Give a slice back
     */
    void releaseSlot(uint8_t axis_id);

    /**
     * @brief Drive every output low
     */
    void clear();

    /**
     * @brief Snapshot of the combined word
     */
    uint32_t word() const;

    /**
     * @brief Bits per transfer: max(min_width, 4 * axis_count)
     */
    uint8_t bitWidth() const { return bit_width_; }

    uint8_t axisCount() const { return config_.axis_count; }

    bool getStatistics(shared_bus_statistics_t* stats) const;

    bool isInitialized() const { return mutex_ != nullptr; }

private:
    void transmitLocked();

    shared_bus_config_t config_;
    uint8_t bit_width_;
    uint32_t word_;
    uint32_t claimed_mask_;
    shared_bus_statistics_t statistics_;
    SemaphoreHandle_t mutex_;
};

#endif // SHARED_BUS_HPP
