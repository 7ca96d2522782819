#ifndef DTMFDEC_NODE_FILTER_BANK_HPP
#define DTMFDEC_NODE_FILTER_BANK_HPP

#include <array>
#include <cstddef>

#include "dtmf_tones.hpp"
#include "goertzel.hpp"

namespace dtmfdec::node {

/// Eight Goertzel filters tuned to the DTMF row and column tones.
class FilterBank {
public:
    explicit FilterBank(double sample_rate);

    /// Measure one block at every DTMF frequency.
    /// Entries follow kToneFrequenciesHz order.
    Spectrum analyze(const float* samples, std::size_t count) const;

    double sample_rate() const noexcept { return sample_rate_; }

private:
    double sample_rate_;
    std::array<GoertzelFilter, kToneCount> filters_;
};

} // namespace dtmfdec::node

#endif // DTMFDEC_NODE_FILTER_BANK_HPP
