/**
 * File: streaming.hpp
 * Description: Feeds the encoded table into the data/BCK state machine.
 *
 * Queue is anything with `bool is_full()` and `void write(uint32_t)`:
 * PioTxQueue on the board, simulated FIFOs on the host.
 */

#ifndef STREAMING_H
#define STREAMING_H

#include <stdint.h>
#include <stddef.h>

/**
 * @brief Writes n_writes words in table order, starting at cursor and
 * wrapping at count. Spins while the queue is full; nothing is dropped or
 * reordered.
 * @return cursor of the next word to write
 */
template <typename Queue>
size_t push_words(Queue &queue, const uint32_t *words, size_t count, size_t cursor,
                  size_t n_writes) {
    for (size_t n = 0; n < n_writes; n++) {
        // Backpressure: the state machine drains one word per 32 BCK periods
        while (queue.is_full()) {
        }
        queue.write(words[cursor]);

        cursor++;
        if (cursor == count) cursor = 0;
    }
    return cursor;
}

/**
 * @brief Streams the table forever. Never returns.
 */
template <typename Queue>
[[noreturn]] void stream_forever(Queue &queue, const uint32_t *words, size_t count) {
    size_t cursor = 0;
    while (true) {
        cursor = push_words(queue, words, count, cursor, count);
    }
}

#endif /* STREAMING_H */
