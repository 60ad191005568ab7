/**
 * Project: picotone (RP2040 PIO I2S tone generator)
 * File: main.cpp
 * Description:
 * Firmware entry point. Streams a fixed test tone to a PCM510xA DAC.
 * * Architecture:
 * 1. Sample table generated and encoded once at boot.
 * 2. Two PIO state machines produce data/BCK and LRCK, started together.
 * 3. Main loop keeps the data/BCK TX FIFO full, forever.
 */

#include "config.hpp"
#include "sequencer_program.hpp"
#include "wavetables.hpp"
#include "sample_encoder.hpp"
#include "streaming.hpp"
#include "i2s_output.hpp"
#include "hardware/clocks.h"
#include <stdio.h>

// --- Sample Storage ---
// Written once below, read-only while streaming
static int32_t sample_table[MAX_TABLE_SIZE];
static uint32_t encoded_table[MAX_TABLE_SIZE];

// --- Main Application ---
int main() {
    const StreamConfig config = default_stream_config();

    // 1. System Initialization
    // The divisors assume this exact sys_clk
    set_sys_clock_khz((uint32_t)(config.base_clock_hz / 1000.0f), true);
    stdio_init_all();
    printf("=== picotone Starting ===\n");

    uint32_t sys_hz = clock_get_hz(clk_sys);
    if (sys_hz != (uint32_t)config.base_clock_hz) {
        panic("sys_clk is %lu Hz, expected %lu Hz",
              (unsigned long)sys_hz, (unsigned long)config.base_clock_hz);
    }

    if (!validate_stream_config(config)) {
        panic("Invalid stream configuration");
    }

    SequencerDivisors divisors;
    if (!compute_sequencer_divisors(config, &divisors)) {
        panic("Clock divisors out of range for %s", sample_rate_name(config.sample_rate));
    }

    // 2. Sample Table
    float lrck_hz = clock_rates_for(config.sample_rate).lrck_hz;
    if (!generate_sine_table(sample_table, config.table_size, config.tone_hz, lrck_hz,
                             config.amplitude)) {
        panic("Sample table generation failed");
    }
    encode_table(sample_table, encoded_table, config.table_size, config.is_24bit);
    printf("[System] %u samples encoded\n", (unsigned)config.table_size);

    gpio_init(config.led_pin);
    gpio_set_dir(config.led_pin, GPIO_OUT);
    gpio_put(config.led_pin, 1);

    // 3. Hardware Setup
    set_i2s(config, divisors);
    printf("[System] PIO Programs Installed\n");

    // 4. Critical Startup Sequence
    // Both state machines in one enable, then let the DAC PLL lock
    start_i2s();
    sleep_ms(config.settle_delay_ms);

    printf("[System] Streaming...\n");

    // --- 5. Main Real-Time Loop ---
    PioTxQueue queue = i2s_tx_queue();
    stream_forever(queue, encoded_table, config.table_size);
}
