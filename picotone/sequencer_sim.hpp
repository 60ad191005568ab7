/**
 * File: sequencer_sim.hpp
 * Description: Cycle level host model of the two I2S state machines.
 *
 * One tick() is one sys_clk cycle. Each machine owns a 16.8 fractional clock
 * divider, a 4 word TX FIFO and an OSR that shifts right, and runs the
 * instruction table from sequencer_program.hpp. Used by the tests and by the
 * offline simulator to check phase alignment and the serial bit stream.
 */

#ifndef SEQUENCER_SIM_H
#define SEQUENCER_SIM_H

#include <stdint.h>
#include <stddef.h>
#include <deque>
#include "sequencer_program.hpp"

constexpr size_t SIM_TX_FIFO_DEPTH = 4;
constexpr uint32_t SIM_OSR_BITS = 32;

class SimStateMachine {
public:
    void configure(const SequencerProgram &program, ClockDivisor divisor);

    /** Resets the fractional divider so the next enabled tick executes. */
    void restart_clock();
    void set_enabled(bool enabled) { enabled_ = enabled; }
    bool enabled() const { return enabled_; }

    bool tx_full() const { return fifo_.size() >= SIM_TX_FIFO_DEPTH; }
    bool tx_empty() const { return fifo_.empty(); }
    size_t tx_level() const { return fifo_.size(); }

    /** Like a FIFO write on hardware: dropped when full. */
    bool put(uint32_t word);

    /**
     * @brief Advances one sys_clk tick.
     * @return true if an instruction executed on this tick
     */
    bool tick(uint64_t now);

    uint8_t side_pin() const { return side_pin_; }
    uint8_t out_pin() const { return out_pin_; }
    uint64_t executed() const { return executed_; }
    int64_t first_exec_tick() const { return first_exec_tick_; }
    uint32_t underflows() const { return underflows_; }

private:
    void execute(const SequencerOp &op);

    const SequencerProgram *program_ = nullptr;
    uint32_t divisor_256_ = 256;   // divisor in 1/256 units
    uint32_t accum_ = 0;
    bool enabled_ = false;

    size_t pc_ = 0;
    uint32_t osr_ = 0;
    uint32_t osr_shifted_ = SIM_OSR_BITS;  // starts empty
    uint32_t x_ = 0;
    std::deque<uint32_t> fifo_;

    uint8_t side_pin_ = 0;
    uint8_t out_pin_ = 0;
    uint64_t executed_ = 0;
    int64_t first_exec_tick_ = -1;
    uint32_t underflows_ = 0;
};

struct SimPins {
    uint8_t data;
    uint8_t bck;
    uint8_t lrck;
};

/**
 * @brief The data/BCK and LRCK machines of one PIO block.
 */
class SimSequencerGroup {
public:
    explicit SimSequencerGroup(const SequencerDivisors &divisors);

    SimStateMachine &data_bck() { return data_bck_; }
    SimStateMachine &lrck() { return lrck_; }
    const SimStateMachine &data_bck() const { return data_bck_; }
    const SimStateMachine &lrck() const { return lrck_; }

    /** Equivalent of pio_enable_sm_mask_in_sync() on both machines. */
    void start_in_sync();

    /** Starts a single machine, as pio_sm_set_enabled() would. */
    void start(SimStateMachine &sm);

    void tick();
    uint64_t now() const { return now_; }
    SimPins pins() const;

private:
    SimStateMachine data_bck_;
    SimStateMachine lrck_;
    uint64_t now_ = 0;
};

#endif /* SEQUENCER_SIM_H */
