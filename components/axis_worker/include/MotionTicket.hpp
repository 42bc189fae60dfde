/**
 * @file MotionTicket.hpp
 * @brief Completion signal for one queued axis command
 *
 * Hand a ticket to AxisWorker::goAngle()/rotate() and wait() on it instead
 * of polling the axis angle. The ticket must outlive the command it is
 * attached to and can be reused once resolved.
 */

#ifndef MOTION_TICKET_HPP
#define MOTION_TICKET_HPP

#include <atomic>
#include "esp_err.h"
#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"

/**
 * @brief Outcome of a queued command
 */
typedef enum {
    MOTION_RESULT_NONE = 0,     // Never submitted
    MOTION_RESULT_PENDING,      // Queued or executing
    MOTION_RESULT_COMPLETED,    // Ran to the last step
    MOTION_RESULT_CANCELLED,    // Flushed from the queue or aborted between steps
    MOTION_RESULT_FAILED,       // Rejected by the motion controller
    MOTION_RESULT_COUNT
} motion_result_t;

class MotionTicket {
public:
    MotionTicket();
    ~MotionTicket();

    // The worker queue stores the ticket's address
    MotionTicket(const MotionTicket&) = delete;
    MotionTicket& operator=(const MotionTicket&) = delete;
    MotionTicket(MotionTicket&&) = delete;
    MotionTicket& operator=(MotionTicket&&) = delete;

    /**
     * @brief Block until the command is resolved
     *
     * @param ticks_to_wait FreeRTOS ticks, portMAX_DELAY to wait forever
     * @return true if resolved, false on timeout or if never submitted
     */
    bool wait(TickType_t ticks_to_wait = portMAX_DELAY);

    motion_result_t result() const { return result_.load(); }

    bool isPending() const { return result_.load() == MOTION_RESULT_PENDING; }

    bool isInitialized() const { return done_ != nullptr; }

    static const char* getResultName(motion_result_t result);

private:
    friend class AxisWorker;

    /**
     * @brief Mark pending before the command is queued
     *
     * @return ESP_ERR_INVALID_STATE if still pending from an earlier command
     */
    esp_err_t arm();

    /**
     * @brief Roll back arm() when the command never made it into the queue
     */
    void disarm();

    void resolve(motion_result_t result);

    SemaphoreHandle_t done_;
    std::atomic<motion_result_t> result_;
};

#endif // MOTION_TICKET_HPP
