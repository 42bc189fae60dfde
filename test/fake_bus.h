/**
 * @file fake_bus.h
 * @brief Recording bus driver for host tests
 */

#ifndef FAKE_BUS_H
#define FAKE_BUS_H

#include <cstdint>
#include <vector>

/**
 * @brief Stands in for the register chain, keeps every transfer
 *
 * SharedBus invokes the callback with its lock held, so transfers arrive
 * one at a time. Read the vectors only once the axes are idle.
 */
struct FakeBus {
    std::vector<uint32_t> words;
    std::vector<uint8_t> widths;

    static void transmit(void* ctx, uint32_t word, uint8_t bit_width) {
        FakeBus* self = static_cast<FakeBus*>(ctx);
        self->words.push_back(word);
        self->widths.push_back(bit_width);
    }

    uint32_t last() const { return words.empty() ? 0 : words.back(); }
};

#endif // FAKE_BUS_H
