/**
 * File: wavetables.cpp
 * Description: Generates the sample table streamed to the DAC.
 */

#include "wavetables.hpp"
#include <math.h>
#include <stdio.h>

#define TWO_PI 6.28318530718
#define HALF_PI 1.57079632679
#define PI_F 3.14159265359f

// Tolerance on the period count before the table is considered seamless
#define PERIOD_EPSILON 1e-3

float approx_sine(float angle) {
    // Reduce to [0, 2PI)
    float x = fmodf(angle, (float)TWO_PI);
    if (x < 0.0f) x += (float)TWO_PI;

    // Fold onto [-PI/2, PI/2] where the series converges quickly
    if (x > 3.0f * (float)HALF_PI) {
        x -= (float)TWO_PI;
    } else if (x > (float)HALF_PI) {
        x = PI_F - x;
    }

    float x2 = x * x;
    float x3 = x2 * x;
    float x5 = x3 * x2;
    return x - x3 / 6.0f + x5 / 120.0f;
}

bool generate_sine_table(int32_t *table, size_t table_size, float frequency,
                         float sample_rate, int32_t amplitude) {
    if (table == NULL || table_size == 0) {
        printf("[Synth] Empty sample table\n");
        return false;
    }
    if (!(frequency > 0.0f) || !(sample_rate > 0.0f) || amplitude <= 0) {
        printf("[Synth] Tone parameters must be positive\n");
        return false;
    }

    float omega = (float)TWO_PI * frequency / sample_rate;
    if (omega > MAX_ANGLE_STEP) {
        printf("[Synth] Phase step %.4f rad too large for the approximation\n", omega);
        return false;
    }

    // Whole periods only, otherwise the loop point clicks
    double periods = (double)table_size * frequency / sample_rate;
    double whole_periods = floor(periods + 0.5);
    if (whole_periods < 1.0 || fabs(periods - whole_periods) > PERIOD_EPSILON) {
        printf("[Synth] %u samples hold %.4f periods, need a whole number\n",
               (unsigned)table_size, periods);
        return false;
    }

    printf("[Synth] Generating %.1f Hz tone (Len: %u, Periods: %d)...\n",
           frequency, (unsigned)table_size, (int)whole_periods);

    for (size_t i = 0; i < table_size; i++) {
        float angle = omega * (float)i;
        long long sample = llroundf((float)amplitude * approx_sine(angle));

        // Truncation error can push the peaks slightly past the amplitude
        if (sample > amplitude) sample = amplitude;
        else if (sample < -amplitude) sample = -amplitude;

        table[i] = (int32_t)sample;
    }

    return true;
}
