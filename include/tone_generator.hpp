#ifndef DTMFDEC_NODE_TONE_GENERATOR_HPP
#define DTMFDEC_NODE_TONE_GENERATOR_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace dtmfdec::node {

/// Timing and level of synthesized key presses.
struct ToneTiming {
    double sample_rate = 8000.0;
    double tone_ms     = 100.0;   // duration of each key
    double gap_ms      = 100.0;   // silence after each key
    double amplitude   = 0.4;     // per-tone peak level; the pair sums to 2x
};

/// Result of rendering a key string.
struct RenderResult {
    bool               ok = false;
    std::vector<float> pcm;
    std::string        error;
};

/// Synthesizes DTMF key sequences as mono float PCM.
class ToneGenerator {
public:
    explicit ToneGenerator(const ToneTiming& timing = {});

    /// Render every key of `keys` as tone followed by gap.
    /// Fails on any character that is not a keypad symbol.
    RenderResult render(std::string_view keys) const;

    /// Append `samples` samples of the key's tone pair to `pcm`.
    /// Returns false if `symbol` is not on the keypad.
    bool append_tone(char symbol, std::size_t samples, std::vector<float>& pcm) const;

    /// Append `samples` zero samples to `pcm`.
    static void append_silence(std::size_t samples, std::vector<float>& pcm);

    /// Samples in `ms` milliseconds at the configured rate.
    std::size_t samples_for(double ms) const;

private:
    ToneTiming timing_;
};

} // namespace dtmfdec::node

#endif // DTMFDEC_NODE_TONE_GENERATOR_HPP
