#include "peak_selector.hpp"

#include <algorithm>

namespace dtmfdec::node {

PeakSelector::PeakSelector(double min_energy_threshold, double min_peak_ratio,
                           double max_twist_ratio)
    : min_energy_threshold_(min_energy_threshold),
      min_peak_ratio_(min_peak_ratio),
      max_twist_ratio_(max_twist_ratio) {}

PeakSelector::PeakSelector(const DecoderConfig& cfg)
    : PeakSelector(cfg.min_energy_threshold, cfg.min_peak_ratio,
                   cfg.max_twist_ratio) {}

std::size_t PeakSelector::group_peak(const Spectrum& spectrum, std::size_t first,
                                     double& runner_up) {
    constexpr std::size_t kGroupSize = kLowGroupHz.size();

    // Strict '>' keeps the earliest (lowest-frequency) entry on a tie.
    std::size_t best = first;
    for (std::size_t i = first + 1; i < first + kGroupSize; ++i) {
        if (spectrum[i].energy > spectrum[best].energy) best = i;
    }

    runner_up = 0.0;
    for (std::size_t i = first; i < first + kGroupSize; ++i) {
        if (i != best) runner_up = std::max(runner_up, spectrum[i].energy);
    }
    return best;
}

bool PeakSelector::peak_is_clear(double peak, double runner_up) const {
    if (peak <= min_energy_threshold_) return false;
    return peak >= min_peak_ratio_ * runner_up;
}

std::optional<TonePair> PeakSelector::select(const Spectrum& spectrum) const {
    double low_runner_up  = 0.0;
    double high_runner_up = 0.0;

    const std::size_t low  = group_peak(spectrum, 0, low_runner_up);
    const std::size_t high = group_peak(spectrum, kLowGroupHz.size(), high_runner_up);

    const double low_energy  = spectrum[low].energy;
    const double high_energy = spectrum[high].energy;

    if (!peak_is_clear(low_energy, low_runner_up)) return std::nullopt;
    if (!peak_is_clear(high_energy, high_runner_up)) return std::nullopt;

    if (max_twist_ratio_ > 0.0) {
        const double louder  = std::max(low_energy, high_energy);
        const double quieter = std::min(low_energy, high_energy);
        if (louder > max_twist_ratio_ * quieter) return std::nullopt;
    }

    return TonePair{spectrum[low].frequency_hz, spectrum[high].frequency_hz,
                    low_energy, high_energy};
}

} // namespace dtmfdec::node
