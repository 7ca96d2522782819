#ifndef DTMFDEC_NODE_DECODE_PIPELINE_HPP
#define DTMFDEC_NODE_DECODE_PIPELINE_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "decoder_config.hpp"
#include "dtmf_tones.hpp"
#include "filter_bank.hpp"
#include "peak_selector.hpp"
#include "tone_state_machine.hpp"

namespace dtmfdec::node {

/// Why a block was or was not taken into the session.
enum class BlockStatus {
    Accepted,
    RejectedEmpty,
    RejectedLength,
    RejectedNonFinite
};

/// Result of processing one block, with staged intermediate values.
struct BlockResult {
    BlockStatus status = BlockStatus::Accepted;

    // Populated for accepted blocks.
    Spectrum                     spectrum{};
    std::optional<ToneCandidate> candidate;
    std::vector<KeyEvent>        events;

    std::string error;

    bool accepted() const noexcept { return status == BlockStatus::Accepted; }
};

/// Result of decoding a whole PCM buffer.
struct DecodeSummary {
    std::vector<KeyEvent> events;
    std::size_t           blocks   = 0;   // whole blocks offered
    std::size_t           rejected = 0;   // blocks that failed the contract checks
    std::string           error;          // first rejection reason, if any
};

using EventCallback = std::function<void(const KeyEvent&)>;

/// Block-at-a-time DTMF decoder for one session:
///
///   samples -> FilterBank -> PeakSelector -> SymbolMapper -> ToneStateMachine
///
/// Synchronous and single-threaded; callers must serialise process() calls.
class DecodePipeline {
public:
    /// Validate `cfg` and build a pipeline. Returns nullptr and sets
    /// `error` if the configuration is inconsistent.
    static std::unique_ptr<DecodePipeline> create(const DecoderConfig& cfg,
                                                  std::string& error);

    /// Register a consumer; events reach subscribers in registration order.
    void subscribe(EventCallback callback);

    /// Run one block of exactly block_length samples through the pipeline.
    BlockResult process(const float* samples, std::size_t count);
    BlockResult process(const std::vector<float>& block);

    /// Split `pcm` into whole blocks and process each one.
    /// A trailing partial block is ignored.
    DecodeSummary decode(const std::vector<float>& pcm);

    /// Drop any held tone without emitting events.
    void reset();

    /// Emit the release of a confirmed key (end of stream), then reset.
    std::vector<KeyEvent> flush();

    const DecoderConfig&    config() const noexcept { return cfg_; }
    const ToneStateMachine& state_machine() const noexcept { return machine_; }
    std::uint64_t           blocks_processed() const noexcept { return blocks_; }

private:
    explicit DecodePipeline(const DecoderConfig& cfg);

    DecoderConfig              cfg_;
    FilterBank                 bank_;
    PeakSelector               selector_;
    ToneStateMachine           machine_;
    std::vector<EventCallback> subscribers_;
    std::uint64_t              blocks_ = 0;

    void publish(const std::vector<KeyEvent>& events) const;
};

const char* block_status_name(BlockStatus status);

} // namespace dtmfdec::node

#endif // DTMFDEC_NODE_DECODE_PIPELINE_HPP
