/**
 * @file main.cpp
 * @brief Two-axis turret demo on a shared 74HC595 bus
 *
 * Brings up the register chain, azimuth and elevation axes and one worker
 * task per axis, zeroes both and runs a fixed move sequence on them
 * concurrently.
 */

#include <stdio.h>
#include <iterator>
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "esp_log.h"
#include "sdkconfig.h"

#include "ShiftRegister.hpp"
#include "SharedBus.hpp"
#include "StepperAxis.hpp"
#include "MotionController.hpp"
#include "MotionTicket.hpp"
#include "AxisWorker.hpp"

static const char *TAG = "MAIN";

#define AXIS_ID_AZIMUTH     0
#define AXIS_ID_ELEVATION   1
#define AXIS_COUNT          2

static const double azimuth_sequence[] = { 90.0, -45.0, -135.0, 135.0, 0.0 };
static const double elevation_sequence[] = { -90.0, 45.0 };

/**
 * @brief Queue a list of absolute targets on one worker
 *
 * @return Number of commands accepted
 */
static size_t queue_sequence(AxisWorker& worker, const double* targets, size_t count, MotionTicket* tickets) {
    size_t queued = 0;
    for (size_t i = 0; i < count; i++) {
        esp_err_t ret = worker.goAngle(targets[i], &tickets[i], portMAX_DELAY);
        if (ret != ESP_OK) {
            ESP_LOGE(TAG, "[%s] goAngle(%.1f) rejected: %s",
                     worker.axis().name(), targets[i], esp_err_to_name(ret));
            break;
        }
        queued++;
    }
    return queued;
}

static void wait_sequence(AxisWorker& worker, const double* targets, size_t count, MotionTicket* tickets) {
    for (size_t i = 0; i < count; i++) {
        tickets[i].wait(portMAX_DELAY);
        ESP_LOGI(TAG, "[%s] goAngle(%.1f) %s, angle=%.2f",
                 worker.axis().name(), targets[i],
                 MotionTicket::getResultName(tickets[i].result()),
                 worker.currentAngle());
    }
}

static void log_statistics(const StepperAxis& axis) {
    stepper_axis_statistics_t stats;
    if (axis.getStatistics(&stats)) {
        ESP_LOGI(TAG, "[%s] steps=%lu completed=%lu cancelled=%lu", axis.name(),
                 static_cast<unsigned long>(stats.steps_taken),
                 static_cast<unsigned long>(stats.moves_completed),
                 static_cast<unsigned long>(stats.moves_cancelled));
    }
}

static void run_turret() {
    shift_register_config_t register_config = {
        .data_pin = static_cast<gpio_num_t>(CONFIG_TURRET_BUS_DATA_PIN),
        .clock_pin = static_cast<gpio_num_t>(CONFIG_TURRET_BUS_CLOCK_PIN),
        .latch_pin = static_cast<gpio_num_t>(CONFIG_TURRET_BUS_LATCH_PIN),
        .pulse_width_us = CONFIG_TURRET_BUS_PULSE_WIDTH_US
    };
    ShiftRegister shift_register(register_config);
    if (!shift_register.isInitialized()) {
        ESP_LOGE(TAG, "Failed to initialize shift register");
        return;
    }

    shared_bus_config_t bus_config = SharedBus::defaultConfig(AXIS_COUNT, ShiftRegister::transmitCallback,
                                                              &shift_register);
    bus_config.min_width = CONFIG_TURRET_BUS_MIN_WIDTH;
    SharedBus bus(bus_config);
    if (!bus.isInitialized()) {
        ESP_LOGE(TAG, "Failed to initialize shared bus");
        return;
    }
    bus.clear();

    stepper_axis_config_t az_config = StepperAxis::defaultConfig(AXIS_ID_AZIMUTH, "az");
    az_config.steps_per_revolution = CONFIG_TURRET_STEPS_PER_REVOLUTION;
    StepperAxis azimuth(bus, az_config);

    stepper_axis_config_t el_config = StepperAxis::defaultConfig(AXIS_ID_ELEVATION, "el");
    el_config.steps_per_revolution = CONFIG_TURRET_STEPS_PER_REVOLUTION;
    StepperAxis elevation(bus, el_config);

    if (!azimuth.isInitialized() || !elevation.isInitialized()) {
        ESP_LOGE(TAG, "Failed to initialize axes");
        return;
    }

    motion_controller_config_t motion_config = motion_controller_get_default_config();
    motion_config.step_delay_us = CONFIG_TURRET_STEP_DELAY_US;
    MotionController motion(motion_config);

    axis_worker_config_t worker_config = AxisWorker::defaultConfig();
    worker_config.queue_depth = CONFIG_TURRET_WORKER_QUEUE_DEPTH;
    worker_config.task_stack_size = CONFIG_TURRET_WORKER_STACK_SIZE;
    worker_config.task_priority = CONFIG_TURRET_WORKER_PRIORITY;

    // Outlive the workers that hold their addresses
    MotionTicket az_tickets[std::size(azimuth_sequence)];
    MotionTicket el_tickets[std::size(elevation_sequence)];

    {
        AxisWorker az_worker(azimuth, motion, worker_config);
        AxisWorker el_worker(elevation, motion, worker_config);
        if (!az_worker.isInitialized() || !el_worker.isInitialized()) {
            ESP_LOGE(TAG, "Failed to start axis workers");
            return;
        }

        ESP_ERROR_CHECK(az_worker.zero());
        ESP_ERROR_CHECK(el_worker.zero());
        ESP_LOGI(TAG, "Axes zeroed");

        size_t az_queued = queue_sequence(az_worker, azimuth_sequence, std::size(azimuth_sequence), az_tickets);
        size_t el_queued = queue_sequence(el_worker, elevation_sequence, std::size(elevation_sequence), el_tickets);

        ESP_LOGI(TAG, "Sequence queued (az %u, el %u), main task is free",
                 static_cast<unsigned>(az_queued), static_cast<unsigned>(el_queued));

        wait_sequence(az_worker, azimuth_sequence, az_queued, az_tickets);
        wait_sequence(el_worker, elevation_sequence, el_queued, el_tickets);
    }

    log_statistics(azimuth);
    log_statistics(elevation);

    shared_bus_statistics_t bus_stats;
    if (bus.getStatistics(&bus_stats)) {
        ESP_LOGI(TAG, "Bus: %lu words sent, last=0x%08lx",
                 static_cast<unsigned long>(bus_stats.transmit_count),
                 static_cast<unsigned long>(bus_stats.last_word));
    }

    azimuth.release();
    elevation.release();
    bus.clear();
}

extern "C" void app_main(void)
{
    ESP_LOGI(TAG, "=== Turret Controller ===");

    run_turret();

    ESP_LOGI(TAG, "Sequence finished, coils released");

    while (1) {
        vTaskDelay(pdMS_TO_TICKS(1000));
    }
}
