#include "decoder_config.hpp"

#include <cmath>

#include "dtmf_tones.hpp"

namespace dtmfdec::node {

namespace {

// Adjacent rows 697/770 Hz are 73 Hz apart; a coarser block smears them.
constexpr double kMaxResolutionHz = 60.0;

} // namespace

double block_resolution(const DecoderConfig& cfg) {
    if (cfg.block_length == 0) return 0.0;
    return cfg.sample_rate / static_cast<double>(cfg.block_length);
}

ConfigCheck validate_config(const DecoderConfig& cfg) {
    if (!std::isfinite(cfg.sample_rate) || cfg.sample_rate <= 0.0) {
        return {false, "sample_rate must be a positive number"};
    }
    if (cfg.sample_rate / 2.0 <= static_cast<double>(kHighGroupHz.back())) {
        return {false, "sample_rate too low: " +
                       std::to_string(kHighGroupHz.back()) +
                       " Hz must lie below Nyquist"};
    }
    if (cfg.block_length == 0) {
        return {false, "block_length must be at least 1 sample"};
    }
    if (block_resolution(cfg) > kMaxResolutionHz) {
        return {false, "block_length too short: resolution " +
                       std::to_string(block_resolution(cfg)) +
                       " Hz exceeds 60 Hz"};
    }
    if (!std::isfinite(cfg.min_energy_threshold) ||
        cfg.min_energy_threshold < 0.0) {
        return {false, "min_energy_threshold must be non-negative"};
    }
    if (!std::isfinite(cfg.min_peak_ratio) || cfg.min_peak_ratio < 1.0) {
        return {false, "min_peak_ratio must be at least 1"};
    }
    if (!std::isfinite(cfg.max_twist_ratio) ||
        (cfg.max_twist_ratio != 0.0 && cfg.max_twist_ratio < 1.0)) {
        return {false, "max_twist_ratio must be 0 (disabled) or at least 1"};
    }
    if (cfg.min_hold_blocks < 1) {
        return {false, "min_hold_blocks must be at least 1"};
    }
    return {true, {}};
}

} // namespace dtmfdec::node
