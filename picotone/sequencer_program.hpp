/**
 * File: sequencer_program.hpp
 * Description: The two PIO programs that generate the I2S signals.
 *
 * Program A (i2s_data_bck.pio) shifts one data bit per BCK period.
 * Program B (i2s_lrck.pio) toggles LRCK once per frame.
 * The instruction tables below mirror the .pio sources so that host code can
 * reason about (and simulate) the programs without the SDK.
 */

#ifndef SEQUENCER_PROGRAM_H
#define SEQUENCER_PROGRAM_H

#include <stdint.h>
#include <stddef.h>
#include "clock_divisor.hpp"
#include "config.hpp"

// Instructions executed per logical transition
constexpr float DATA_BCK_CYCLES_PER_BIT = 4.0f;
constexpr float LRCK_CYCLES_PER_FRAME = 2.0f;

enum class SequencerOpKind : uint8_t {
    PullIfEmptyNoBlock,   // pull ifempty noblock
    Nop,                  // nop (mov y, y)
    OutPins1,             // out pins, 1
};

struct SequencerOp {
    SequencerOpKind kind;
    uint8_t side;         // side-set value driven while the op executes
};

struct SequencerProgram {
    const char *name;
    const SequencerOp *ops;
    size_t length;
    float cycles_per_transition;
};

extern const SequencerProgram DATA_BCK_PROGRAM;
extern const SequencerProgram LRCK_PROGRAM;

struct SequencerDivisors {
    ClockDivisor data_bck;
    ClockDivisor lrck;
};

/**
 * @brief Derives both clock divisors for the configured sample rate.
 * Program A runs at the BCK rate, program B at the LRCK rate.
 * @return false if either divisor cannot be programmed.
 */
bool compute_sequencer_divisors(const StreamConfig &config, SequencerDivisors *out);

#endif /* SEQUENCER_PROGRAM_H */
