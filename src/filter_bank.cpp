#include "filter_bank.hpp"

#include <utility>

namespace dtmfdec::node {

namespace {

template <std::size_t... I>
std::array<GoertzelFilter, kToneCount> make_filters(double sample_rate,
                                                    std::index_sequence<I...>) {
    return {GoertzelFilter(static_cast<double>(kToneFrequenciesHz[I]),
                           sample_rate)...};
}

} // namespace

FilterBank::FilterBank(double sample_rate)
    : sample_rate_(sample_rate),
      filters_(make_filters(sample_rate, std::make_index_sequence<kToneCount>{})) {}

Spectrum FilterBank::analyze(const float* samples, std::size_t count) const {
    Spectrum spectrum{};
    for (std::size_t i = 0; i < kToneCount; ++i) {
        spectrum[i].frequency_hz = kToneFrequenciesHz[i];
        spectrum[i].energy       = filters_[i].energy(samples, count);
    }
    return spectrum;
}

} // namespace dtmfdec::node
