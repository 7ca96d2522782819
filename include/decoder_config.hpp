#ifndef DTMFDEC_NODE_DECODER_CONFIG_HPP
#define DTMFDEC_NODE_DECODER_CONFIG_HPP

#include <cstddef>
#include <string>

namespace dtmfdec::node {

/// Detection parameters for one decoding session.
///
/// Energies are raw Goertzel powers of a full block, so
/// min_energy_threshold scales with block_length^2 and input gain.
struct DecoderConfig {
    double      sample_rate          = 8000.0;  // Hz, must match the source
    std::size_t block_length         = 205;     // samples per block (~25.6 ms)
    double      min_energy_threshold = 5.0;     // absolute floor for both peaks
    double      min_peak_ratio       = 6.0;     // peak vs. runner-up in its group
    double      max_twist_ratio      = 10.0;    // louder vs. quieter tone; 0 = off
    int         min_hold_blocks      = 2;       // consecutive blocks to confirm
};

/// Outcome of validate_config().
struct ConfigCheck {
    bool        valid = false;
    std::string error;
};

/// Reject configurations that would break detection or the state machine.
ConfigCheck validate_config(const DecoderConfig& cfg);

/// Frequency resolution of one block in Hz.
double block_resolution(const DecoderConfig& cfg);

} // namespace dtmfdec::node

#endif // DTMFDEC_NODE_DECODER_CONFIG_HPP
