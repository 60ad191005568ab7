/**
 * File: i2s_output.hpp
 * Description: Interface for the PIO based I2S output.
 */

#ifndef I2S_OUTPUT_H
#define I2S_OUTPUT_H

#include <stdio.h>
#include "pico/stdlib.h"
#include "hardware/pio.h"
#include "config.hpp"
#include "sequencer_program.hpp"

/**
 * @brief TX FIFO of the data/BCK state machine, as seen by the streaming loop.
 */
struct PioTxQueue {
    PIO pio;
    uint sm;

    bool is_full() const { return pio_sm_is_tx_fifo_full(pio, sm); }
    void write(uint32_t word) { pio_sm_put(pio, sm, word); }
};

// --- Public API ---

/**
 * @brief Assigns the pins to the PIO block, installs both programs and
 * applies their clock divisors. The state machines are left stopped.
 * Panics if the PIO block has no room for the programs or no free state machines.
 */
void set_i2s(const StreamConfig &config, const SequencerDivisors &divisors);

/**
 * @brief Enables both state machines with one register write so their
 * clock dividers start on the same sys_clk edge.
 */
void start_i2s();

/**
 * @brief Queue feeding the data/BCK state machine. Valid after set_i2s().
 */
PioTxQueue i2s_tx_queue();

#endif // I2S_OUTPUT_H
