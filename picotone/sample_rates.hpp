/**
 * File: sample_rates.hpp
 * Description: Supported LRCK rates and the BCK rate each one needs.
 * Values follow the PCM510xA "BCK Rates by LRCK Sample Rate" table.
 */

#ifndef SAMPLE_RATES_H
#define SAMPLE_RATES_H

#include <stdint.h>

// BCK periods per LRCK period. The DAC counts this as 64x: two BCK edges per bit.
constexpr uint32_t BCK_PER_LRCK = 32;

enum class SampleRate : uint8_t {
    Freq32kHz,
    Freq44_1kHz,
    Freq48kHz,
    Freq96kHz,
    Freq192kHz,
    Freq384kHz,
};

constexpr int NUM_SAMPLE_RATES = 6;

struct I2sClockRates {
    float lrck_hz;
    float bck_hz;
};

/**
 * @brief Looks up the LRCK/BCK pair for a sample rate.
 */
I2sClockRates clock_rates_for(SampleRate rate);

const char *sample_rate_name(SampleRate rate);

#endif /* SAMPLE_RATES_H */
