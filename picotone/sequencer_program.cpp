#include "sequencer_program.hpp"
#include <stdio.h>

// Keep in step with i2s_data_bck.pio
static const SequencerOp DATA_BCK_OPS[] = {
    { SequencerOpKind::PullIfEmptyNoBlock, 0 },
    { SequencerOpKind::Nop, 0 },
    { SequencerOpKind::OutPins1, 1 },
    { SequencerOpKind::Nop, 1 },
};

// Keep in step with i2s_lrck.pio
static const SequencerOp LRCK_OPS[] = {
    { SequencerOpKind::Nop, 1 },
    { SequencerOpKind::Nop, 0 },
};

static_assert(sizeof(DATA_BCK_OPS) / sizeof(DATA_BCK_OPS[0]) == (size_t)DATA_BCK_CYCLES_PER_BIT,
              "data/BCK program length must match its cycles per bit");
static_assert(sizeof(LRCK_OPS) / sizeof(LRCK_OPS[0]) == (size_t)LRCK_CYCLES_PER_FRAME,
              "LRCK program length must match its cycles per frame");

const SequencerProgram DATA_BCK_PROGRAM = {
    "i2s_data_bck", DATA_BCK_OPS, sizeof(DATA_BCK_OPS) / sizeof(DATA_BCK_OPS[0]),
    DATA_BCK_CYCLES_PER_BIT
};

const SequencerProgram LRCK_PROGRAM = {
    "i2s_lrck", LRCK_OPS, sizeof(LRCK_OPS) / sizeof(LRCK_OPS[0]),
    LRCK_CYCLES_PER_FRAME
};

bool compute_sequencer_divisors(const StreamConfig &config, SequencerDivisors *out) {
    I2sClockRates rates = clock_rates_for(config.sample_rate);

    SequencerDivisors divisors;
    if (!compute_divisor(config.base_clock_hz, DATA_BCK_PROGRAM.cycles_per_transition,
                         rates.bck_hz, &divisors.data_bck)) {
        return false;
    }
    if (!compute_divisor(config.base_clock_hz, LRCK_PROGRAM.cycles_per_transition,
                         rates.lrck_hz, &divisors.lrck)) {
        return false;
    }

    printf("[I2S] %s: BCK div %u + %u/256, LRCK div %u + %u/256\n",
           sample_rate_name(config.sample_rate),
           (unsigned)divisors.data_bck.integer, (unsigned)divisors.data_bck.frac,
           (unsigned)divisors.lrck.integer, (unsigned)divisors.lrck.frac);

    *out = divisors;
    return true;
}
