/**
 * File: config.hpp
 * Description: Startup configuration for the tone streamer.
 * Everything here is fixed before the state machines start; nothing is
 * reconfigured while streaming.
 */

#ifndef CONFIG_H
#define CONFIG_H

#include <stdint.h>
#include <stddef.h>
#include "sample_rates.hpp"

// --- Fixed Limits ---
#define MAX_TABLE_SIZE 4096
#define MAX_GPIO_COUNT 30

// Largest magnitude each encoding can carry without touching the sign bit
constexpr int32_t FULL_SCALE_24BIT = 0x7FFFFF;
constexpr int32_t FULL_SCALE_32BIT = 0x7FFFFFFF;

// --- Defaults ---
constexpr float DEFAULT_BASE_CLOCK_HZ = 125e6f;
constexpr size_t DEFAULT_TABLE_SIZE = 1920;
constexpr float DEFAULT_TONE_HZ = 300.0f;
constexpr int32_t DEFAULT_AMPLITUDE = 0x6FFFFF;

constexpr uint32_t I2S_DATA_PIN = 9;
constexpr uint32_t I2S_BCK_PIN = 10;
constexpr uint32_t I2S_LRCK_PIN = 11;
constexpr uint32_t STATUS_LED_PIN = 25;
constexpr uint32_t SETTLE_DELAY_MS = 500;

/**
 * @brief Immutable stream configuration.
 * Built once at boot and passed by const reference to every setup stage.
 */
struct StreamConfig {
    float base_clock_hz;       // sys_clk feeding the PIO dividers
    SampleRate sample_rate;    // LRCK / BCK pair
    size_t table_size;         // samples in one seamless loop
    float tone_hz;
    int32_t amplitude;         // peak sample magnitude
    bool is_24bit;             // 24-bit payload with sign at bit 31

    uint32_t pio_index;        // 0 or 1
    uint32_t data_pin;
    uint32_t bck_pin;
    uint32_t lrck_pin;
    uint32_t led_pin;
    uint32_t settle_delay_ms;
};

/**
 * @brief Returns the board defaults: 300 Hz tone at 192 kHz, 24-bit.
 */
StreamConfig default_stream_config();

/**
 * @brief Sample magnitude limit for the configured encoding.
 */
int32_t full_scale_for(const StreamConfig &config);

/**
 * @brief Checks pins, table size and amplitude headroom.
 * Logs the first problem found.
 * @return true when the configuration can be used to start streaming.
 */
bool validate_stream_config(const StreamConfig &config);

#endif /* CONFIG_H */
