/**
 * @file StepperAxis.hpp
 * @brief Angular state of one stepper axis on a shared register bus
 *
 * Tracks shaft angle and commutation position for a motor whose coils
 * occupy one 4-bit slice of a SharedBus word. step() is the only way
 * the coils change during motion.
 */

#ifndef STEPPER_AXIS_HPP
#define STEPPER_AXIS_HPP

#include <cstdint>
#include "esp_err.h"
#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"
#include "SharedBus.hpp"

/**
 * @brief Axis motion states
 */
typedef enum {
    AXIS_STATE_IDLE = 0,
    AXIS_STATE_MOVING,
    AXIS_STATE_COUNT
} axis_state_t;

/**
 * @brief Axis configuration
 */
typedef struct {
    uint8_t id;                         // Bus slot, bit offset = 4 * id
    const char* name;                   // Used in log lines only
    uint32_t steps_per_revolution;      // Half steps per output shaft turn
} stepper_axis_config_t;

/**
 * @brief Axis statistics
 */
typedef struct {
    uint32_t steps_taken;
    uint32_t moves_completed;
    uint32_t moves_cancelled;
} stepper_axis_statistics_t;

class StepperAxis {
public:
    /**
     * @brief Constructor
     *
     * Claims slot config.id on the bus. Check isInitialized(): construction
     * fails for an id the bus cannot carry, an already claimed slot, or zero
     * steps per revolution.
     *
     * @param bus Bus shared with the other axes, must outlive the axis
     * @param config Axis configuration
     */
    StepperAxis(SharedBus& bus, const stepper_axis_config_t& config);

    ~StepperAxis();

    StepperAxis(const StepperAxis&) = delete;
    StepperAxis& operator=(const StepperAxis&) = delete;
    StepperAxis(StepperAxis&&) = delete;
    StepperAxis& operator=(StepperAxis&&) = delete;

    /**
     * @brief Default configuration for a slot
     */
    static stepper_axis_config_t defaultConfig(uint8_t id, const char* name);

    /**
     * @brief Take one half step
     *
     * Advances the commutation position, writes the new nibble through the
     * bus, then moves the angle by 1/steps_per_degree.
     *
     * @param direction +1 or -1
     * @return ESP_OK, ESP_ERR_INVALID_ARG for any other direction
     */
    esp_err_t step(int8_t direction);

    /**
     * @brief Declare the current shaft position as 0 degrees
     *
     * Resets angle and commutation position. Idempotent.
     */
    void zero();

    /**
     * @brief De-energize this axis's coils
     *
     * Writes a zero nibble to the slice; angle and step index are kept.
     */
    void release();

    /**
     * @brief Angle snapshot in [0, 360)
     */
    double currentAngle() const;

    /**
     * @brief Commutation position in [0, 8)
     */
    uint8_t stepIndex() const;

    axis_state_t getState() const;

    /**
     * @brief Set motion state (motion controller only)
     */
    void setState(axis_state_t state);

    /**
     * @brief Record the outcome of a move
     */
    void recordMove(bool completed);

    bool getStatistics(stepper_axis_statistics_t* stats) const;

    uint8_t id() const { return config_.id; }
    uint8_t bitOffset() const { return bit_offset_; }
    const char* name() const { return config_.name; }
    double stepsPerDegree() const { return steps_per_degree_; }

    bool isInitialized() const { return guard_ != nullptr; }

    static const char* getStateName(axis_state_t state);

private:
    SharedBus& bus_;
    stepper_axis_config_t config_;
    uint8_t bit_offset_;
    double steps_per_degree_;

    // Guarded by guard_
    double angle_;
    uint8_t step_index_;
    axis_state_t state_;
    stepper_axis_statistics_t statistics_;

    SemaphoreHandle_t guard_;
};

#endif // STEPPER_AXIS_HPP
