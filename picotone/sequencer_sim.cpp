#include "sequencer_sim.hpp"

void SimStateMachine::configure(const SequencerProgram &program, ClockDivisor divisor) {
    program_ = &program;
    divisor_256_ = ((uint32_t)divisor.integer << 8) | divisor.frac;
    pc_ = 0;
    osr_ = 0;
    osr_shifted_ = SIM_OSR_BITS;
    fifo_.clear();
    restart_clock();
}

void SimStateMachine::restart_clock() {
    // One tick short of a full period
    accum_ = divisor_256_ - 256;
}

bool SimStateMachine::put(uint32_t word) {
    if (tx_full()) return false;
    fifo_.push_back(word);
    return true;
}

bool SimStateMachine::tick(uint64_t now) {
    if (!enabled_ || program_ == nullptr) return false;

    accum_ += 256;
    if (accum_ < divisor_256_) return false;
    accum_ -= divisor_256_;

    execute(program_->ops[pc_]);
    pc_++;
    if (pc_ == program_->length) pc_ = 0;

    if (first_exec_tick_ < 0) first_exec_tick_ = (int64_t)now;
    executed_++;
    return true;
}

void SimStateMachine::execute(const SequencerOp &op) {
    side_pin_ = op.side;

    switch (op.kind) {
    case SequencerOpKind::PullIfEmptyNoBlock:
        if (osr_shifted_ >= SIM_OSR_BITS) {
            if (!fifo_.empty()) {
                osr_ = fifo_.front();
                fifo_.pop_front();
            } else {
                // Non-blocking pull from an empty FIFO copies X
                osr_ = x_;
                underflows_++;
            }
            osr_shifted_ = 0;
        }
        break;
    case SequencerOpKind::Nop:
        break;
    case SequencerOpKind::OutPins1:
        out_pin_ = (uint8_t)(osr_ & 1u);
        osr_ >>= 1;
        if (osr_shifted_ < SIM_OSR_BITS) osr_shifted_++;
        break;
    }
}

SimSequencerGroup::SimSequencerGroup(const SequencerDivisors &divisors) {
    data_bck_.configure(DATA_BCK_PROGRAM, divisors.data_bck);
    lrck_.configure(LRCK_PROGRAM, divisors.lrck);
}

void SimSequencerGroup::start_in_sync() {
    data_bck_.restart_clock();
    lrck_.restart_clock();
    data_bck_.set_enabled(true);
    lrck_.set_enabled(true);
}

void SimSequencerGroup::start(SimStateMachine &sm) {
    sm.restart_clock();
    sm.set_enabled(true);
}

void SimSequencerGroup::tick() {
    data_bck_.tick(now_);
    lrck_.tick(now_);
    now_++;
}

SimPins SimSequencerGroup::pins() const {
    SimPins pins;
    pins.data = data_bck_.out_pin();
    pins.bck = data_bck_.side_pin();
    pins.lrck = lrck_.side_pin();
    return pins;
}
