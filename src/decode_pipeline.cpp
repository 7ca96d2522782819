#include "decode_pipeline.hpp"

#include <cmath>
#include <utility>

#include "symbol_mapper.hpp"

namespace dtmfdec::node {

std::unique_ptr<DecodePipeline> DecodePipeline::create(const DecoderConfig& cfg,
                                                       std::string& error) {
    ConfigCheck check = validate_config(cfg);
    if (!check.valid) {
        error = check.error;
        return nullptr;
    }
    error.clear();
    return std::unique_ptr<DecodePipeline>(new DecodePipeline(cfg));
}

DecodePipeline::DecodePipeline(const DecoderConfig& cfg)
    : cfg_(cfg),
      bank_(cfg.sample_rate),
      selector_(cfg),
      machine_(cfg.min_hold_blocks) {}

void DecodePipeline::subscribe(EventCallback callback) {
    if (callback) subscribers_.push_back(std::move(callback));
}

BlockResult DecodePipeline::process(const std::vector<float>& block) {
    return process(block.data(), block.size());
}

BlockResult DecodePipeline::process(const float* samples, std::size_t count) {
    BlockResult result;

    // Contract checks: reject without touching the session state.
    if (samples == nullptr || count == 0) {
        result.status = BlockStatus::RejectedEmpty;
        result.error  = "empty block";
        return result;
    }
    if (count != cfg_.block_length) {
        result.status = BlockStatus::RejectedLength;
        result.error  = "block has " + std::to_string(count) +
                        " samples, expected " + std::to_string(cfg_.block_length);
        return result;
    }
    for (std::size_t i = 0; i < count; ++i) {
        if (!std::isfinite(samples[i])) {
            result.status = BlockStatus::RejectedNonFinite;
            result.error  = "non-finite sample at index " + std::to_string(i);
            return result;
        }
    }

    // Stage 1: per-tone energies.
    result.spectrum = bank_.analyze(samples, count);

    // Stage 2: peak selection, Stage 3: keypad lookup.
    if (auto pair = selector_.select(result.spectrum)) {
        if (auto symbol = SymbolMapper::resolve(pair->low_hz, pair->high_hz)) {
            result.candidate = ToneCandidate{*pair, *symbol};
        }
    }

    // Stage 4: debounce into discrete events.
    std::optional<char> symbol;
    if (result.candidate) symbol = result.candidate->symbol;
    machine_.step(symbol, blocks_, result.events);
    ++blocks_;

    publish(result.events);
    return result;
}

DecodeSummary DecodePipeline::decode(const std::vector<float>& pcm) {
    DecodeSummary summary;
    const std::size_t n = cfg_.block_length;

    for (std::size_t off = 0; off + n <= pcm.size(); off += n) {
        BlockResult r = process(pcm.data() + off, n);
        ++summary.blocks;
        if (!r.accepted()) {
            ++summary.rejected;
            if (summary.error.empty()) {
                summary.error = "block " + std::to_string(summary.blocks - 1) +
                                ": " + r.error;
            }
            continue;
        }
        summary.events.insert(summary.events.end(), r.events.begin(), r.events.end());
    }
    return summary;
}

void DecodePipeline::reset() {
    machine_.reset();
}

std::vector<KeyEvent> DecodePipeline::flush() {
    std::vector<KeyEvent> events;
    machine_.flush(blocks_, events);
    publish(events);
    return events;
}

void DecodePipeline::publish(const std::vector<KeyEvent>& events) const {
    for (const auto& ev : events) {
        for (const auto& cb : subscribers_) cb(ev);
    }
}

const char* block_status_name(BlockStatus status) {
    switch (status) {
        case BlockStatus::Accepted:          return "accepted";
        case BlockStatus::RejectedEmpty:     return "rejected_empty";
        case BlockStatus::RejectedLength:    return "rejected_length";
        case BlockStatus::RejectedNonFinite: return "rejected_non_finite";
    }
    return "unknown";
}

} // namespace dtmfdec::node
