/**
 * File: sample_encoder.hpp
 * Description: Converts signed samples into the 32-bit words shifted out by
 * the data/BCK state machine.
 *
 * The state machine shifts the OSR right (LSB first), while the DAC expects
 * the MSB first. Words are therefore bit-reversed before they reach the FIFO.
 */

#ifndef SAMPLE_ENCODER_H
#define SAMPLE_ENCODER_H

#include <stdint.h>
#include <stddef.h>

/**
 * @brief Reassembles the sample's two's complement bytes into a 32-bit word.
 * 24-bit mode copies three bytes, then puts the low 7 bits of the top byte in
 * bits 24..30 and its sign bit in bit 31.
 */
uint32_t pack_sample_bytes(int32_t sample, bool is_24bit);

/**
 * @brief Mirrors all 32 bits (bit 0 <-> bit 31).
 */
uint32_t bit_reverse(uint32_t value);

/**
 * @brief Wire word for one sample: bit_reverse(pack_sample_bytes(sample)).
 */
uint32_t encode_sample(int32_t sample, bool is_24bit);

/**
 * @brief Inverse of encode_sample().
 */
int32_t decode_word(uint32_t word, bool is_24bit);

/**
 * @brief Precomputes the wire words for a whole sample table.
 */
void encode_table(const int32_t *samples, uint32_t *words, size_t count, bool is_24bit);

#endif /* SAMPLE_ENCODER_H */
