#include "clock_divisor.hpp"
#include <math.h>
#include <stdio.h>

bool compute_divisor(float base_clock_hz, float cycles_per_transition, float target_hz,
                     ClockDivisor *out) {
    if (!(base_clock_hz > 0.0f) || !(cycles_per_transition > 0.0f) || !(target_hz > 0.0f) ||
        !isfinite(base_clock_hz) || !isfinite(cycles_per_transition) || !isfinite(target_hz)) {
        printf("[Clock] Invalid divisor inputs (base %.1f, cycles %.1f, target %.1f)\n",
               base_clock_hz, cycles_per_transition, target_hz);
        return false;
    }

    float divisor = (base_clock_hz / cycles_per_transition) / target_hz;

    // Below unity the state machine cannot run fast enough
    if (divisor < 1.0f) {
        printf("[Clock] Divisor %.4f below 1 for %.1f Hz\n", divisor, target_hz);
        return false;
    }
    if (divisor >= CLOCK_DIVISOR_MAX) {
        printf("[Clock] Divisor %.1f exceeds 16-bit range for %.1f Hz\n", divisor, target_hz);
        return false;
    }

    uint16_t whole = (uint16_t)divisor;
    uint8_t frac = (uint8_t)((divisor - (float)whole) * CLOCK_DIVISOR_FRAC_SCALE);

    out->integer = whole;
    out->frac = frac;
    return true;
}

float divisor_value(const ClockDivisor &divisor) {
    return (float)divisor.integer + (float)divisor.frac / CLOCK_DIVISOR_FRAC_SCALE;
}
