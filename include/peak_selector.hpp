#ifndef DTMFDEC_NODE_PEAK_SELECTOR_HPP
#define DTMFDEC_NODE_PEAK_SELECTOR_HPP

#include <optional>

#include "decoder_config.hpp"
#include "dtmf_tones.hpp"

namespace dtmfdec::node {

/// Picks the strongest row and column tone of a block and decides whether
/// they form a credible DTMF pair.
///
/// A pair is accepted only when
///   - both peaks exceed min_energy_threshold,
///   - each peak is at least min_peak_ratio times every other tone of its
///     own group,
///   - if max_twist_ratio > 0, the louder peak is at most max_twist_ratio
///     times the quieter one.
class PeakSelector {
public:
    PeakSelector(double min_energy_threshold, double min_peak_ratio,
                 double max_twist_ratio);

    explicit PeakSelector(const DecoderConfig& cfg);

    /// Returns the accepted pair, or nullopt when no tone is present.
    std::optional<TonePair> select(const Spectrum& spectrum) const;

private:
    double min_energy_threshold_;
    double min_peak_ratio_;
    double max_twist_ratio_;

    /// Index of the group peak within [first, first + 4); ties go to the
    /// lower frequency. Sets `runner_up` to the best remaining energy.
    static std::size_t group_peak(const Spectrum& spectrum, std::size_t first,
                                  double& runner_up);

    bool peak_is_clear(double peak, double runner_up) const;
};

} // namespace dtmfdec::node

#endif // DTMFDEC_NODE_PEAK_SELECTOR_HPP
