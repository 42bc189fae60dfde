/**
 * @file step_sequence.h
 * @brief Half-step commutation table for 4-coil unipolar steppers
 *
 * Eight nibbles, one per half step. Bit n energizes coil n through the
 * ULN2003 input wired to that register output. Walking the table forward
 * turns the shaft counterclockwise (positive angle).
 */

#ifndef STEP_SEQUENCE_H
#define STEP_SEQUENCE_H

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

#define STEP_SEQUENCE_LENGTH 8

/**
 * @brief Commutation pattern, shared read-only by all axes
 */
extern const uint8_t STEP_SEQUENCE[STEP_SEQUENCE_LENGTH];

/**
 * @brief Advance a sequence position by one half step
 *
 * @param index Current position, 0..7
 * @param direction +1 or -1
 * @return New position, always in 0..7
 */
uint8_t step_sequence_advance(uint8_t index, int8_t direction);

/**
 * @brief Coil nibble for a sequence position
 */
uint8_t step_sequence_nibble(uint8_t index);

#ifdef __cplusplus
}
#endif

#endif // STEP_SEQUENCE_H
