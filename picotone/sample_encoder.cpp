#include "sample_encoder.hpp"

#define BITS_PER_BYTE 8
#define BYTE_MASK 0xFFu
#define SIGN_BYTE_MAGNITUDE_MASK 0x7Fu
#define SIGN_BYTE_SIGN_MASK 0x80u
#define WORD_SIGN_BIT 0x80000000u

// Byte n of the sample's two's complement representation, least significant first
static inline uint8_t sample_byte(uint32_t bits, int n) {
    return (uint8_t)((bits >> (BITS_PER_BYTE * n)) & BYTE_MASK);
}

uint32_t pack_sample_bytes(int32_t sample, bool is_24bit) {
    uint32_t bits = (uint32_t)sample;
    uint32_t word = 0;

    int byte_count = is_24bit ? 3 : 4;
    for (int i = 0; i < byte_count; i++) {
        word |= (uint32_t)sample_byte(bits, i) << (BITS_PER_BYTE * i);
    }

    if (is_24bit) {
        uint8_t top = sample_byte(bits, 3);
        word |= (uint32_t)(top & SIGN_BYTE_MAGNITUDE_MASK) << 24;

        // Sign goes back in at bit 31
        if (top & SIGN_BYTE_SIGN_MASK) {
            word |= WORD_SIGN_BIT;
        }
    }

    return word;
}

uint32_t bit_reverse(uint32_t value) {
    // Fixed 32 iterations so a lone bit 31 needs no special case
    uint32_t reversed = 0;
    for (int i = 0; i < 32; i++) {
        reversed = (reversed << 1) | (value & 1u);
        value >>= 1;
    }
    return reversed;
}

uint32_t encode_sample(int32_t sample, bool is_24bit) {
    return bit_reverse(pack_sample_bytes(sample, is_24bit));
}

int32_t decode_word(uint32_t word, bool is_24bit) {
    uint32_t packed = bit_reverse(word);

    if (is_24bit) {
        // Rebuild the top byte from bits 24..30 and the sign at bit 31
        uint32_t top = (packed >> 24) & SIGN_BYTE_MAGNITUDE_MASK;
        if (packed & WORD_SIGN_BIT) top |= SIGN_BYTE_SIGN_MASK;
        packed = (packed & 0x00FFFFFFu) | (top << 24);
    }

    return (int32_t)packed;
}

void encode_table(const int32_t *samples, uint32_t *words, size_t count, bool is_24bit) {
    for (size_t i = 0; i < count; i++) {
        words[i] = encode_sample(samples[i], is_24bit);
    }
}
