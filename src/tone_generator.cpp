#include "tone_generator.hpp"

#include <cmath>

#include "symbol_mapper.hpp"

namespace dtmfdec::node {

ToneGenerator::ToneGenerator(const ToneTiming& timing) : timing_(timing) {}

std::size_t ToneGenerator::samples_for(double ms) const {
    if (ms <= 0.0) return 0;
    return static_cast<std::size_t>(std::lround(timing_.sample_rate * ms / 1000.0));
}

bool ToneGenerator::append_tone(char symbol, std::size_t samples,
                                std::vector<float>& pcm) const {
    auto tones = SymbolMapper::tones_for(symbol);
    if (!tones) return false;

    const double w_low  = 2.0 * M_PI * tones->low_hz / timing_.sample_rate;
    const double w_high = 2.0 * M_PI * tones->high_hz / timing_.sample_rate;

    pcm.reserve(pcm.size() + samples);
    for (std::size_t n = 0; n < samples; ++n) {
        const double t = static_cast<double>(n);
        pcm.push_back(static_cast<float>(
            timing_.amplitude * (std::sin(w_low * t) + std::sin(w_high * t))));
    }
    return true;
}

void ToneGenerator::append_silence(std::size_t samples, std::vector<float>& pcm) {
    pcm.insert(pcm.end(), samples, 0.0f);
}

RenderResult ToneGenerator::render(std::string_view keys) const {
    RenderResult result;
    const std::size_t tone_len = samples_for(timing_.tone_ms);
    const std::size_t gap_len  = samples_for(timing_.gap_ms);

    result.pcm.reserve(keys.size() * (tone_len + gap_len));

    for (char key : keys) {
        if (!append_tone(key, tone_len, result.pcm)) {
            result.pcm.clear();
            result.error = std::string("not a DTMF key: '") + key + "'";
            return result;
        }
        append_silence(gap_len, result.pcm);
    }

    result.ok = true;
    return result;
}

} // namespace dtmfdec::node
