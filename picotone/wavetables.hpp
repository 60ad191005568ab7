#ifndef WAVETABLES_H
#define WAVETABLES_H

#include <stdint.h>
#include <stddef.h>

// Largest per-sample phase step accepted by the table generator (8 samples per period)
constexpr float MAX_ANGLE_STEP = 0.78539816f;

/**
 * @brief Lightweight sine approximation.
 * Folds the angle into [-PI/2, PI/2] by symmetry and evaluates the odd power
 * series x - x^3/6 + x^5/120. Nothing beyond the fifth power is used, so the
 * worst error is about 0.45% at the peaks. Good enough for a test tone, not a
 * general purpose sinf().
 */
float approx_sine(float angle);

/**
 * @brief Fills a table with a tone that loops seamlessly.
 * sample[i] = round(amplitude * approx_sine(2*PI*frequency/sample_rate * i)),
 * clamped to +/- amplitude.
 *
 * The table must hold a whole number of periods
 * (table_size * frequency / sample_rate is an integer) and the phase step must
 * not exceed MAX_ANGLE_STEP.
 *
 * @return false if a precondition does not hold. The table is left untouched.
 */
bool generate_sine_table(int32_t *table, size_t table_size, float frequency,
                         float sample_rate, int32_t amplitude);

#endif /* WAVETABLES_H */
