/**
 * @file step_sequence.cpp
 * @brief Half-step commutation table
 */

#include "step_sequence.h"

const uint8_t STEP_SEQUENCE[STEP_SEQUENCE_LENGTH] = {
    0b0001, 0b0011, 0b0010, 0b0110,
    0b0100, 0b1100, 0b1000, 0b1001
};

uint8_t step_sequence_advance(uint8_t index, int8_t direction) {
    int next = (static_cast<int>(index % STEP_SEQUENCE_LENGTH) + direction) % STEP_SEQUENCE_LENGTH;
    if (next < 0) {
        next += STEP_SEQUENCE_LENGTH;
    }
    return static_cast<uint8_t>(next);
}

uint8_t step_sequence_nibble(uint8_t index) {
    return STEP_SEQUENCE[index % STEP_SEQUENCE_LENGTH];
}
