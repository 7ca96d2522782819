#ifndef DTMFDEC_NODE_GOERTZEL_HPP
#define DTMFDEC_NODE_GOERTZEL_HPP

#include <cstddef>

namespace dtmfdec::node {

/// Single-frequency energy estimator using the Goertzel algorithm.
///
/// Computes |X(f)|^2 of one rectangular-windowed block at an arbitrary
/// target frequency. Holds no state between blocks; the coefficient is
/// precomputed once per (frequency, sample rate).
class GoertzelFilter {
public:
    /// @param target_freq  Frequency to measure in Hz (e.g. 697)
    /// @param sample_rate  Audio sample rate (e.g. 8000)
    GoertzelFilter(double target_freq, double sample_rate);

    /// Energy of `count` samples at the target frequency.
    /// A zero-length block has zero energy.
    double energy(const float* samples, std::size_t count) const;

    double target_freq() const noexcept { return target_freq_; }
    double sample_rate() const noexcept { return sample_rate_; }
    double coeff() const noexcept { return coeff_; }

private:
    double target_freq_;
    double sample_rate_;
    double coeff_;       // 2 * cos(2π * f / fs)
};

/// One-shot form: energy of a block at `target_freq`.
double goertzel_energy(const float* samples, std::size_t count,
                       double target_freq, double sample_rate);

} // namespace dtmfdec::node

#endif // DTMFDEC_NODE_GOERTZEL_HPP
