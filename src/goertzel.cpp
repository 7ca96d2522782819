#include "goertzel.hpp"

#include <cmath>

namespace dtmfdec::node {

GoertzelFilter::GoertzelFilter(double target_freq, double sample_rate)
    : target_freq_(target_freq),
      sample_rate_(sample_rate) {
    // Exact target frequency, not the nearest DFT bin.
    coeff_ = 2.0 * std::cos(2.0 * M_PI * target_freq_ / sample_rate_);
}

double GoertzelFilter::energy(const float* samples, std::size_t count) const {
    if (samples == nullptr || count == 0) return 0.0;

    double s0 = 0.0;
    double s1 = 0.0;
    double s2 = 0.0;

    for (std::size_t i = 0; i < count; ++i) {
        s0 = static_cast<double>(samples[i]) + coeff_ * s1 - s2;
        s2 = s1;
        s1 = s0;
    }

    // Power = s1^2 + s2^2 - coeff * s1 * s2
    double power = s1 * s1 + s2 * s2 - coeff_ * s1 * s2;

    // Rounding can leave a tiny negative residue for near-silent input.
    return power > 0.0 ? power : 0.0;
}

double goertzel_energy(const float* samples, std::size_t count,
                       double target_freq, double sample_rate) {
    return GoertzelFilter(target_freq, sample_rate).energy(samples, count);
}

} // namespace dtmfdec::node
