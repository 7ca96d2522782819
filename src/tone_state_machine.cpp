#include "tone_state_machine.hpp"

namespace dtmfdec::node {

ToneStateMachine::ToneStateMachine(int min_hold_blocks)
    : min_hold_blocks_(min_hold_blocks < 1 ? 1 : min_hold_blocks) {}

void ToneStateMachine::step(std::optional<char> symbol, std::uint64_t block_index,
                            std::vector<KeyEvent>& out) {
    switch (state_) {
        case ToneState::Idle:
            if (symbol) begin_hold(*symbol, block_index, out);
            return;

        case ToneState::Holding:
            if (symbol && symbol == held_) {
                ++count_;
                if (count_ >= min_hold_blocks_) confirm(block_index, out);
                return;
            }
            // Candidate dropped before confirmation: discard silently.
            go_idle();
            if (symbol) begin_hold(*symbol, block_index, out);
            return;

        case ToneState::Confirmed:
            if (symbol && symbol == held_) {
                ++count_;
                return;
            }
            out.push_back({KeyEventType::Released, *held_, block_index});
            go_idle();
            if (symbol) begin_hold(*symbol, block_index, out);
            return;
    }
}

void ToneStateMachine::reset() {
    go_idle();
    last_emitted_.reset();
}

void ToneStateMachine::flush(std::uint64_t block_index, std::vector<KeyEvent>& out) {
    if (state_ == ToneState::Confirmed) {
        out.push_back({KeyEventType::Released, *held_, block_index});
    }
    reset();
}

void ToneStateMachine::begin_hold(char symbol, std::uint64_t block_index,
                                  std::vector<KeyEvent>& out) {
    state_ = ToneState::Holding;
    held_  = symbol;
    count_ = 1;
    if (count_ >= min_hold_blocks_) confirm(block_index, out);
}

void ToneStateMachine::confirm(std::uint64_t block_index, std::vector<KeyEvent>& out) {
    state_        = ToneState::Confirmed;
    last_emitted_ = held_;
    out.push_back({KeyEventType::Pressed, *held_, block_index});
}

void ToneStateMachine::go_idle() {
    state_ = ToneState::Idle;
    held_.reset();
    count_ = 0;
}

} // namespace dtmfdec::node
