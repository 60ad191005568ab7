/**
 * File: clock_divisor.hpp
 * Description: Fixed-point PIO clock divisor calculation.
 *
 * A state machine executes one instruction every (integer + frac/256)
 * sys_clk ticks. The programs spend a fixed number of instructions per
 * logical transition, so the divisor for a target rate is
 *
 *     (base_clock / cycles_per_transition) / target_hz
 */

#ifndef CLOCK_DIVISOR_H
#define CLOCK_DIVISOR_H

#include <stdint.h>

constexpr float CLOCK_DIVISOR_FRAC_SCALE = 256.0f;
constexpr float CLOCK_DIVISOR_MAX = 65536.0f;

struct ClockDivisor {
    uint16_t integer;
    uint8_t frac;
};

/**
 * @brief Splits the ideal divisor into its 16.8 fixed-point parts.
 * Both parts are truncated toward zero. Divisors below 1 or at/above 65536
 * cannot be programmed and are rejected instead of clamped.
 *
 * @param base_clock_hz          sys_clk frequency
 * @param cycles_per_transition  instructions the program spends per output transition
 * @param target_hz              required transition rate
 * @param out                    written only on success
 * @return false if any input is non-positive or the divisor is out of range
 */
bool compute_divisor(float base_clock_hz, float cycles_per_transition, float target_hz,
                     ClockDivisor *out);

/**
 * @brief The divisor as the hardware applies it: integer + frac / 256.
 */
float divisor_value(const ClockDivisor &divisor);

#endif /* CLOCK_DIVISOR_H */
