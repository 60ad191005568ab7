#include "i2s_output.hpp"
#include "i2s_data_bck.pio.h"
#include "i2s_lrck.pio.h"

// --- Internal Driver State ---
static PIO i2s_pio = pio0;
static uint data_bck_sm;
static uint lrck_sm;

static uint install_program(const pio_program_t *program, const char *name) {
    if (!pio_can_add_program(i2s_pio, program)) {
        panic("No PIO instruction memory for %s", name);
    }
    return pio_add_program(i2s_pio, program);
}

// --- 1. Initialization Logic ---

void set_i2s(const StreamConfig &config, const SequencerDivisors &divisors) {
    i2s_pio = config.pio_index == 0 ? pio0 : pio1;

    // Both programs must live in the same block to share one enable write
    uint data_bck_offset = install_program(&i2s_data_bck_program, DATA_BCK_PROGRAM.name);
    uint lrck_offset = install_program(&i2s_lrck_program, LRCK_PROGRAM.name);

    data_bck_sm = (uint)pio_claim_unused_sm(i2s_pio, true);
    lrck_sm = (uint)pio_claim_unused_sm(i2s_pio, true);

    i2s_data_bck_program_init(i2s_pio, data_bck_sm, data_bck_offset,
                              config.data_pin, config.bck_pin,
                              divisors.data_bck.integer, divisors.data_bck.frac);
    i2s_lrck_program_init(i2s_pio, lrck_sm, lrck_offset, config.lrck_pin,
                          divisors.lrck.integer, divisors.lrck.frac);

    printf("[I2S] PIO%lu: data/BCK on SM%u (GPIO %lu/%lu), LRCK on SM%u (GPIO %lu)\n",
           (unsigned long)config.pio_index, data_bck_sm,
           (unsigned long)config.data_pin, (unsigned long)config.bck_pin,
           lrck_sm, (unsigned long)config.lrck_pin);
}

// --- 2. Synchronized Start ---

void start_i2s() {
    uint32_t mask = (1u << data_bck_sm) | (1u << lrck_sm);

    // Sets CLKDIV_RESTART and SM_ENABLE for both machines in a single write.
    // Separate pio_sm_set_enabled() calls would leave LRCK out of phase.
    pio_enable_sm_mask_in_sync(i2s_pio, mask);
}

PioTxQueue i2s_tx_queue() {
    PioTxQueue queue;
    queue.pio = i2s_pio;
    queue.sm = data_bck_sm;
    return queue;
}
