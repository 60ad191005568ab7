// StreamingTests.cpp
// Table streaming with backpressure, against a scripted queue and against the
// simulated state machines.

#include <gtest/gtest.h>
#include <vector>
#include "config.hpp"
#include "sequencer_program.hpp"
#include "sequencer_sim.hpp"
#include "sample_encoder.hpp"
#include "streaming.hpp"
#include "wavetables.hpp"

namespace {

// Reports full for busy_polls polls before each accepted write
struct ScriptedQueue {
    size_t busy_polls = 0;
    size_t pending = 0;
    size_t polls = 0;
    std::vector<uint32_t> written;

    bool is_full() {
        polls++;
        if (pending > 0) {
            pending--;
            return true;
        }
        return false;
    }
    void write(uint32_t word) {
        written.push_back(word);
        pending = busy_polls;
    }
};

// Each poll of a full FIFO advances simulated time by one sys_clk tick
struct SimTxQueue {
    SimSequencerGroup &group;
    std::vector<uint32_t> received;
    SimPins last;
    uint32_t shift = 0;
    int bits = 0;

    explicit SimTxQueue(SimSequencerGroup &g) : group(g) { last = g.pins(); }

    void step() {
        group.tick();
        SimPins now = group.pins();
        if (!last.bck && now.bck) {
            shift = (shift << 1) | now.data;
            if (++bits == 32) {
                received.push_back(shift);
                shift = 0;
                bits = 0;
            }
        }
        last = now;
    }

    bool is_full() {
        bool full = group.data_bck().tx_full();
        if (full) step();
        return full;
    }
    void write(uint32_t word) { EXPECT_TRUE(group.data_bck().put(word)); }
};

} // namespace

//==============================================================================
// Ordering and wrap
//==============================================================================

TEST(StreamingTests, WritesInTableOrderAndWraps) {
    const uint32_t words[] = { 10, 20, 30 };
    ScriptedQueue queue;

    size_t cursor = push_words(queue, words, 3, 0, 7);

    std::vector<uint32_t> expected = { 10, 20, 30, 10, 20, 30, 10 };
    EXPECT_EQ(queue.written, expected);
    EXPECT_EQ(cursor, 1u);
}

TEST(StreamingTests, ResumesFromCursor) {
    const uint32_t words[] = { 10, 20, 30 };
    ScriptedQueue queue;

    size_t cursor = push_words(queue, words, 3, 2, 2);

    std::vector<uint32_t> expected = { 30, 10 };
    EXPECT_EQ(queue.written, expected);
    EXPECT_EQ(cursor, 1u);
}

TEST(StreamingTests, ZeroWritesLeavesCursor) {
    const uint32_t words[] = { 10, 20, 30 };
    ScriptedQueue queue;
    EXPECT_EQ(push_words(queue, words, 3, 2, 0), 2u);
    EXPECT_TRUE(queue.written.empty());
}

//==============================================================================
// Backpressure
//==============================================================================

TEST(StreamingTests, SpinsWhileFullWithoutDropping) {
    const uint32_t words[] = { 1, 2, 3, 4 };
    ScriptedQueue queue;
    queue.busy_polls = 5;

    push_words(queue, words, 4, 0, 4);

    std::vector<uint32_t> expected = { 1, 2, 3, 4 };
    EXPECT_EQ(queue.written, expected);
    // One free poll per write plus 5 busy polls after each of the first three
    EXPECT_EQ(queue.polls, 4u + 3u * 5u);
}

//==============================================================================
// End to end through the state machine model
//==============================================================================

TEST(StreamingTests, TableArrivesBitExactThroughSequencers) {
    StreamConfig config = default_stream_config();
    config.table_size = 640;  // one period of 300 Hz at 192 kHz

    SequencerDivisors divisors;
    ASSERT_TRUE(compute_sequencer_divisors(config, &divisors));

    std::vector<int32_t> samples(config.table_size);
    std::vector<uint32_t> encoded(config.table_size);
    ASSERT_TRUE(generate_sine_table(samples.data(), samples.size(), config.tone_hz,
                                    clock_rates_for(config.sample_rate).lrck_hz,
                                    config.amplitude));
    encode_table(samples.data(), encoded.data(), encoded.size(), config.is_24bit);

    SimSequencerGroup group(divisors);
    SimTxQueue queue(group);

    // Fill the FIFO first, then start both machines together
    size_t cursor = push_words(queue, encoded.data(), encoded.size(), 0, SIM_TX_FIFO_DEPTH);
    group.start_in_sync();
    push_words(queue, encoded.data(), encoded.size(), cursor, 700);

    ASSERT_GE(queue.received.size(), 690u);
    for (size_t i = 0; i < queue.received.size(); i++) {
        int32_t sample = decode_word(bit_reverse(queue.received[i]), config.is_24bit);
        ASSERT_EQ(sample, samples[i % samples.size()]) << "word " << i;
    }
    EXPECT_EQ(group.data_bck().underflows(), 0u);
}
