#ifndef DTMFDEC_NODE_DTMF_TONES_HPP
#define DTMFDEC_NODE_DTMF_TONES_HPP

#include <array>
#include <cstddef>

namespace dtmfdec::node {

/// Row (low group) frequencies of the DTMF keypad, in Hz.
inline constexpr std::array<int, 4> kLowGroupHz  = {697, 770, 852, 941};

/// Column (high group) frequencies of the DTMF keypad, in Hz.
inline constexpr std::array<int, 4> kHighGroupHz = {1209, 1336, 1477, 1633};

inline constexpr std::size_t kToneCount = kLowGroupHz.size() + kHighGroupHz.size();

/// All eight tones, low group first, ascending.
inline constexpr std::array<int, kToneCount> kToneFrequenciesHz = {
    697, 770, 852, 941, 1209, 1336, 1477, 1633};

/// Energy measured at one target frequency for one block.
struct FrequencyEnergy {
    int    frequency_hz = 0;
    double energy       = 0.0;
};

/// Per-block energies, indexed like kToneFrequenciesHz.
using Spectrum = std::array<FrequencyEnergy, kToneCount>;

/// A validated low/high tone pair with the energies that won the selection.
struct TonePair {
    int    low_hz      = 0;
    int    high_hz     = 0;
    double low_energy  = 0.0;
    double high_energy = 0.0;
};

/// Tone pair resolved to a keypad symbol for the current block.
struct ToneCandidate {
    TonePair pair;
    char     symbol = '\0';
};

} // namespace dtmfdec::node

#endif // DTMFDEC_NODE_DTMF_TONES_HPP
