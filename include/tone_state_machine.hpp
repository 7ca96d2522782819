#ifndef DTMFDEC_NODE_TONE_STATE_MACHINE_HPP
#define DTMFDEC_NODE_TONE_STATE_MACHINE_HPP

#include <cstdint>
#include <optional>
#include <vector>

namespace dtmfdec::node {

enum class KeyEventType {
    Pressed,
    Released
};

/// A discrete key transition produced by the state machine.
struct KeyEvent {
    KeyEventType  type        = KeyEventType::Pressed;
    char          symbol      = '\0';
    std::uint64_t block_index = 0;   // block that triggered the event
};

enum class ToneState {
    Idle,       // no tone held
    Holding,    // candidate seen, not yet long enough
    Confirmed   // press emitted, waiting for the tone to end
};

/// Turns per-block symbol decisions into debounced press/release events.
///
///   Idle      + none -> Idle
///   Idle      + X    -> Holding(X, 1)
///   Holding   + X    -> Holding(X, c+1); at min_hold_blocks -> Confirmed(X), press X
///   Holding   + Y    -> Holding(Y, 1) or Idle; no event
///   Confirmed + X    -> Confirmed(X); no event
///   Confirmed + Y    -> release X, then Holding(Y, 1) or Idle
///
/// Not thread-safe; one instance per decoding session.
class ToneStateMachine {
public:
    explicit ToneStateMachine(int min_hold_blocks = 2);

    /// Feed the decision for one block. Events are appended to `out`.
    void step(std::optional<char> symbol, std::uint64_t block_index,
              std::vector<KeyEvent>& out);

    /// Back to Idle with no events (stream restart).
    void reset();

    /// Release a confirmed key, if any, then reset.
    void flush(std::uint64_t block_index, std::vector<KeyEvent>& out);

    ToneState           state() const noexcept { return state_; }
    std::optional<char> held_symbol() const noexcept { return held_; }
    int                 hold_count() const noexcept { return count_; }
    std::optional<char> last_emitted() const noexcept { return last_emitted_; }
    int                 min_hold_blocks() const noexcept { return min_hold_blocks_; }

private:
    int                 min_hold_blocks_;
    ToneState           state_ = ToneState::Idle;
    std::optional<char> held_;
    int                 count_ = 0;
    std::optional<char> last_emitted_;

    /// Start holding a new candidate; confirms at once when min_hold_blocks is 1.
    void begin_hold(char symbol, std::uint64_t block_index,
                    std::vector<KeyEvent>& out);

    void confirm(std::uint64_t block_index, std::vector<KeyEvent>& out);
    void go_idle();
};

} // namespace dtmfdec::node

#endif // DTMFDEC_NODE_TONE_STATE_MACHINE_HPP
