/**
 * @file AxisWorker.hpp
 * @brief Per-axis FreeRTOS task that executes queued motion commands
 *
 * Every axis gets its own task and command queue, so axes move
 * concurrently while each axis runs its own commands strictly in
 * submission order. goAngle()/rotate() only enqueue; the task calls the
 * motion controller and blocks for the duration of each move.
 *
 * zero() and stop() are privileged: they flush the queue (pending tickets
 * resolve CANCELLED), abort the move in flight at the next step boundary,
 * and run ahead of anything submitted afterwards. Both block until the
 * worker has applied them.
 */

#ifndef AXIS_WORKER_HPP
#define AXIS_WORKER_HPP

#include <atomic>
#include <cstdint>
#include "esp_err.h"
#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"
#include "freertos/semphr.h"
#include "freertos/task.h"
#include "StepperAxis.hpp"
#include "MotionController.hpp"
#include "MotionTicket.hpp"

/**
 * @brief Worker configuration
 */
typedef struct {
    uint32_t queue_depth;           // Pending commands before submit reports backpressure
    uint32_t task_stack_size;       // Bytes
    UBaseType_t task_priority;
} axis_worker_config_t;

class AxisWorker {
public:
    /**
     * @brief Create the command queue and start the axis task
     *
     * @param axis Axis driven by this worker, must outlive it
     * @param motion Motion controller, must outlive it
     * @param config Queue and task parameters
     */
    AxisWorker(StepperAxis& axis, const MotionController& motion, const axis_worker_config_t& config);

    /**
     * @brief Cancel pending commands, abort the current move and stop the task
     */
    ~AxisWorker();

    AxisWorker(const AxisWorker&) = delete;
    AxisWorker& operator=(const AxisWorker&) = delete;
    AxisWorker(AxisWorker&&) = delete;
    AxisWorker& operator=(AxisWorker&&) = delete;

    static axis_worker_config_t defaultConfig();

    /**
     * @brief Queue a move to an absolute angle along the shorter arc
     *
     * The shortest path is resolved when the command starts executing,
     * against the angle reached by the commands ahead of it.
     *
     * @param target_deg Any finite angle, folded into [0, 360)
     * @param ticket Optional completion signal
     * @param ticks_to_wait How long to wait for queue space
     * @return ESP_OK if queued,
     *         ESP_ERR_INVALID_ARG for a non-finite target,
     *         ESP_ERR_INVALID_STATE if the worker is not running or the ticket is still pending,
     *         ESP_ERR_TIMEOUT if the queue stayed full
     */
    esp_err_t goAngle(double target_deg, MotionTicket* ticket = nullptr, TickType_t ticks_to_wait = 0);

    /**
     * @brief Queue a relative rotation
     *
     * Same contract as goAngle().
     */
    esp_err_t rotate(double delta_deg, MotionTicket* ticket = nullptr, TickType_t ticks_to_wait = 0);

    /**
     * @brief Flush, abort, then reset angle and step index to 0
     */
    esp_err_t zero();

    /**
     * @brief Flush and abort without touching the angle
     */
    esp_err_t stop();

    /**
     * @brief Non-blocking angle snapshot
     */
    double currentAngle() const { return axis_.currentAngle(); }

    /**
     * @brief True while a submitted command is queued or executing
     */
    bool isBusy() const { return outstanding_.load() > 0; }

    /**
     * @brief Commands waiting behind the current one
     */
    uint32_t pendingCount() const;

    StepperAxis& axis() { return axis_; }

    bool isInitialized() const { return task_ != nullptr; }

private:
    enum command_type_t : uint8_t {
        CMD_GO_ANGLE = 0,
        CMD_ROTATE,
        CMD_ZERO,
        CMD_STOP,
        CMD_SHUTDOWN
    };

    struct command_t {
        command_type_t type;
        double value;
        MotionTicket* ticket;
    };

    static void taskEntry(void* arg);
    void run();
    void execute(const command_t& cmd);

    esp_err_t submit(command_type_t type, double value, MotionTicket* ticket, TickType_t ticks_to_wait);
    esp_err_t runPrivileged(command_type_t type);
    uint32_t flushPending();

    StepperAxis& axis_;
    const MotionController& motion_;
    axis_worker_config_t config_;

    QueueHandle_t queue_;
    TaskHandle_t task_;
    SemaphoreHandle_t exited_;
    SemaphoreHandle_t control_mutex_;

    std::atomic<bool> abort_;
    std::atomic<uint32_t> outstanding_;
};

#endif // AXIS_WORKER_HPP
