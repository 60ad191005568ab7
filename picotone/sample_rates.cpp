#include "sample_rates.hpp"

struct RateEntry {
    I2sClockRates rates;
    const char *name;
};

// Indexed by SampleRate
static const RateEntry RATE_TABLE[NUM_SAMPLE_RATES] = {
    { { 32000.0f, 1.024e6f }, "32kHz" },
    { { 44100.0f, 1.4112e6f }, "44.1kHz" },
    { { 48000.0f, 1.536e6f }, "48kHz" },
    { { 96000.0f, 3.072e6f }, "96kHz" },
    { { 192000.0f, 6.144e6f }, "192kHz" },
    { { 384000.0f, 12.288e6f }, "384kHz" },
};

I2sClockRates clock_rates_for(SampleRate rate) {
    return RATE_TABLE[static_cast<int>(rate)].rates;
}

const char *sample_rate_name(SampleRate rate) {
    return RATE_TABLE[static_cast<int>(rate)].name;
}
