// ── Offline I2S Stream Simulator ─────────────────────────────────────────────
//
// Runs the firmware startup path on the host and pushes the encoded table
// through the cycle level PIO model:
//   1. Default config, clock divisors, sample table, wire encoding
//   2. Prime the data/BCK FIFO and start both machines together
//   3. Stream with backpressure, latching DATA on every BCK rising edge
//   4. Rebuild 32-bit words, compare against the table, check LRCK framing
//   5. Write the received samples to i2s_capture.raw (int32 LE)
//
// Usage:
//   ./simulate_i2s [frames]        # default 1920 frames (one table)

#include <stdio.h>
#include <stdlib.h>
#include <stdint.h>
#include <vector>

#include "config.hpp"
#include "sequencer_program.hpp"
#include "sequencer_sim.hpp"
#include "wavetables.hpp"
#include "sample_encoder.hpp"
#include "streaming.hpp"

// ── Pin Capture ──────────────────────────────────────────────────────────────

struct Capture {
    SimSequencerGroup &group;
    SimPins last;
    uint32_t shift = 0;
    uint32_t bits = 0;
    uint64_t total_bits = 0;
    std::vector<uint32_t> words;
    uint32_t lrck_edges = 0;
    uint32_t lrck_min_offset = BCK_PER_LRCK;
    uint32_t lrck_max_offset = 0;

    explicit Capture(SimSequencerGroup &g) : group(g) { last = g.pins(); }

    void step() {
        group.tick();
        SimPins now = group.pins();

        if (!last.bck && now.bck) {
            shift = (shift << 1) | now.data;
            total_bits++;
            if (++bits == 32) {
                words.push_back(shift);
                shift = 0;
                bits = 0;
            }
        }
        // Where in the 32-bit word each frame starts
        if (!last.lrck && now.lrck) {
            uint32_t offset = (uint32_t)(total_bits % BCK_PER_LRCK);
            if (offset < lrck_min_offset) lrck_min_offset = offset;
            if (offset > lrck_max_offset) lrck_max_offset = offset;
            lrck_edges++;
        }
        last = now;
    }
};

// Busy-waiting on a full FIFO advances simulated time
struct SimTxQueue {
    Capture &capture;

    bool is_full() {
        bool full = capture.group.data_bck().tx_full();
        if (full) capture.step();
        return full;
    }
    void write(uint32_t word) { capture.group.data_bck().put(word); }
};

int main(int argc, char **argv) {
    StreamConfig config = default_stream_config();
    size_t frames = config.table_size;
    if (argc > 1) frames = strtoul(argv[1], NULL, 10);

    if (!validate_stream_config(config)) return 1;

    SequencerDivisors divisors;
    if (!compute_sequencer_divisors(config, &divisors)) return 1;

    std::vector<int32_t> samples(config.table_size);
    std::vector<uint32_t> encoded(config.table_size);
    float lrck_hz = clock_rates_for(config.sample_rate).lrck_hz;
    if (!generate_sine_table(samples.data(), samples.size(), config.tone_hz, lrck_hz,
                             config.amplitude)) {
        return 1;
    }
    encode_table(samples.data(), encoded.data(), encoded.size(), config.is_24bit);

    SimSequencerGroup group(divisors);
    Capture capture(group);
    SimTxQueue queue{ capture };

    // Prime so the first pull finds data
    size_t cursor = 0;
    for (size_t i = 0; i < SIM_TX_FIFO_DEPTH; i++) {
        group.data_bck().put(encoded[cursor]);
        cursor = (cursor + 1) % encoded.size();
    }
    group.start_in_sync();
    printf("Start ticks: data/BCK %lld, LRCK %lld\n",
           (long long)group.data_bck().first_exec_tick(),
           (long long)group.lrck().first_exec_tick());

    printf("Streaming %u frames...\n", (unsigned)frames);
    push_words(queue, encoded.data(), encoded.size(), cursor, frames);

    // Compare received words against the table
    uint32_t mismatches = 0;
    std::vector<int32_t> received(capture.words.size());
    for (size_t i = 0; i < capture.words.size(); i++) {
        received[i] = decode_word(bit_reverse(capture.words[i]), config.is_24bit);
        if (received[i] != samples[i % samples.size()]) mismatches++;
    }

    printf("Words received: %u, mismatches: %u, underflows: %u\n",
           (unsigned)received.size(), mismatches, group.data_bck().underflows());
    printf("LRCK edges: %u, frame start offset %u..%u bits\n",
           capture.lrck_edges, capture.lrck_min_offset, capture.lrck_max_offset);
    printf("Simulated time: %.3f ms\n", (double)group.now() * 1000.0 / config.base_clock_hz);

    FILE *f = fopen("i2s_capture.raw", "wb");
    if (!f) {
        fprintf(stderr, "Cannot open i2s_capture.raw\n");
        return 1;
    }
    fwrite(received.data(), sizeof(int32_t), received.size(), f);
    fclose(f);

    printf("Done. Saved to i2s_capture.raw\n");
    return mismatches == 0 ? 0 : 1;
}
