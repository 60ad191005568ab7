#include "config.hpp"
#include <stdio.h>

StreamConfig default_stream_config() {
    StreamConfig config;
    config.base_clock_hz = DEFAULT_BASE_CLOCK_HZ;
    config.sample_rate = SampleRate::Freq192kHz;
    config.table_size = DEFAULT_TABLE_SIZE;
    config.tone_hz = DEFAULT_TONE_HZ;
    config.amplitude = DEFAULT_AMPLITUDE;
    config.is_24bit = true;

    config.pio_index = 0;
    config.data_pin = I2S_DATA_PIN;
    config.bck_pin = I2S_BCK_PIN;
    config.lrck_pin = I2S_LRCK_PIN;
    config.led_pin = STATUS_LED_PIN;
    config.settle_delay_ms = SETTLE_DELAY_MS;
    return config;
}

int32_t full_scale_for(const StreamConfig &config) {
    return config.is_24bit ? FULL_SCALE_24BIT : FULL_SCALE_32BIT;
}

bool validate_stream_config(const StreamConfig &config) {
    if (!(config.base_clock_hz > 0.0f)) {
        printf("[Config] Base clock must be positive\n");
        return false;
    }

    if (config.table_size == 0 || config.table_size > MAX_TABLE_SIZE) {
        printf("[Config] Table size %u outside 1..%d\n",
               (unsigned)config.table_size, MAX_TABLE_SIZE);
        return false;
    }

    // Headroom: the peak must stay strictly below full scale
    if (config.amplitude <= 0 || config.amplitude >= full_scale_for(config)) {
        printf("[Config] Amplitude 0x%lX outside (0, 0x%lX)\n",
               (unsigned long)config.amplitude, (unsigned long)full_scale_for(config));
        return false;
    }

    if (config.pio_index > 1) {
        printf("[Config] PIO block %lu does not exist\n", (unsigned long)config.pio_index);
        return false;
    }

    const uint32_t pins[] = { config.data_pin, config.bck_pin, config.lrck_pin, config.led_pin };
    const int num_pins = sizeof(pins) / sizeof(pins[0]);
    for (int i = 0; i < num_pins; i++) {
        if (pins[i] >= MAX_GPIO_COUNT) {
            printf("[Config] GPIO %lu out of range\n", (unsigned long)pins[i]);
            return false;
        }
        for (int j = i + 1; j < num_pins; j++) {
            if (pins[i] == pins[j]) {
                printf("[Config] GPIO %lu assigned twice\n", (unsigned long)pins[i]);
                return false;
            }
        }
    }

    return true;
}
