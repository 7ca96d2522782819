#include <limits>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "decode_pipeline.hpp"
#include "signal_helpers.hpp"

namespace dtmfdec::node {
namespace {

using test::append;
using test::kBlock;
using test::kRate;
using test::key_blocks;
using test::silence_blocks;

class DecodePipelineTest : public ::testing::Test {
protected:
    std::unique_ptr<DecodePipeline> make(int hold = 3) {
        DecoderConfig cfg;
        cfg.sample_rate     = kRate;
        cfg.block_length    = kBlock;
        cfg.min_hold_blocks = hold;

        std::string error;
        auto pipeline = DecodePipeline::create(cfg, error);
        EXPECT_TRUE(pipeline) << error;
        return pipeline;
    }

    static std::string render(const std::vector<KeyEvent>& events) {
        std::string out;
        for (const auto& ev : events) {
            if (!out.empty()) out += ' ';
            out += ev.type == KeyEventType::Pressed ? '+' : '-';
            out += ev.symbol;
        }
        return out;
    }
};

TEST_F(DecodePipelineTest, RejectsInconsistentConfig) {
    DecoderConfig cfg;
    cfg.min_hold_blocks = 0;

    std::string error;
    EXPECT_FALSE(DecodePipeline::create(cfg, error));
    EXPECT_FALSE(error.empty());
}

TEST_F(DecodePipelineTest, EveryKeyDecodesToExactlyOnePress) {
    for (char key : std::string("0123456789*#ABCD")) {
        auto pipeline = make(3);
        ASSERT_TRUE(pipeline);

        auto pcm = key_blocks(key, 3);
        DecodeSummary summary = pipeline->decode(pcm);

        ASSERT_EQ(summary.events.size(), 1u) << "key " << key;
        EXPECT_EQ(summary.events[0].type, KeyEventType::Pressed);
        EXPECT_EQ(summary.events[0].symbol, key);
        EXPECT_EQ(summary.events[0].block_index, 2u);
    }
}

TEST_F(DecodePipelineTest, CandidateCarriesResolvedPair) {
    auto pipeline = make();
    ASSERT_TRUE(pipeline);

    BlockResult r = pipeline->process(key_blocks('8', 1));
    ASSERT_TRUE(r.accepted());
    ASSERT_TRUE(r.candidate.has_value());
    EXPECT_EQ(r.candidate->symbol, '8');
    EXPECT_EQ(r.candidate->pair.low_hz, 852);
    EXPECT_EQ(r.candidate->pair.high_hz, 1336);
    EXPECT_TRUE(r.events.empty());
}

TEST_F(DecodePipelineTest, SilenceNeverPresses) {
    auto pipeline = make();
    ASSERT_TRUE(pipeline);

    DecodeSummary summary = pipeline->decode(silence_blocks(40));
    EXPECT_TRUE(summary.events.empty());
    EXPECT_EQ(summary.blocks, 40u);
    EXPECT_EQ(pipeline->state_machine().state(), ToneState::Idle);
}

TEST_F(DecodePipelineTest, TransientToneIsDebounced) {
    auto pipeline = make(3);
    ASSERT_TRUE(pipeline);

    std::vector<float> pcm = key_blocks('7', 2);
    append(pcm, silence_blocks(10));

    EXPECT_TRUE(pipeline->decode(pcm).events.empty());
    EXPECT_EQ(pipeline->state_machine().state(), ToneState::Idle);
}

TEST_F(DecodePipelineTest, HeldToneGivesOnePressAndOneRelease) {
    for (std::size_t k : {0u, 1u, 5u, 20u}) {
        auto pipeline = make(3);
        ASSERT_TRUE(pipeline);

        std::vector<float> pcm = key_blocks('#', 3 + k);
        append(pcm, silence_blocks(4));

        EXPECT_EQ(render(pipeline->decode(pcm).events), "+# -#") << "k=" << k;
    }
}

TEST_F(DecodePipelineTest, DirectSwitchReleasesFirstKey) {
    auto pipeline = make(3);
    ASSERT_TRUE(pipeline);

    std::vector<float> pcm = key_blocks('1', 5);
    append(pcm, key_blocks('5', 5));
    append(pcm, silence_blocks(3));

    EXPECT_EQ(render(pipeline->decode(pcm).events), "+1 -1 +5 -5");
}

// 8 kHz, 205-sample blocks, 400 ms of 697+1209 Hz then 200 ms of silence.
TEST_F(DecodePipelineTest, SustainedKeyOneScenario) {
    auto pipeline = make(3);
    ASSERT_TRUE(pipeline);

    const std::size_t tone_len    = static_cast<std::size_t>(0.4 * kRate);
    const std::size_t silence_len = static_cast<std::size_t>(0.2 * kRate);

    std::vector<float> pcm(tone_len + silence_len, 0.0f);
    for (std::size_t i = 0; i < tone_len; ++i) {
        const double t = static_cast<double>(i) / kRate;
        pcm[i] = static_cast<float>(0.5 * std::sin(2.0 * M_PI * 697.0 * t) +
                                    0.5 * std::sin(2.0 * M_PI * 1209.0 * t));
    }

    std::vector<KeyEvent> seen;
    pipeline->subscribe([&seen](const KeyEvent& ev) { seen.push_back(ev); });

    DecodeSummary summary = pipeline->decode(pcm);
    EXPECT_EQ(summary.rejected, 0u);
    EXPECT_EQ(render(summary.events), "+1 -1");
    EXPECT_EQ(render(seen), "+1 -1");
    EXPECT_EQ(pipeline->state_machine().state(), ToneState::Idle);
}

TEST_F(DecodePipelineTest, RejectsEmptyBlock) {
    auto pipeline = make();
    ASSERT_TRUE(pipeline);

    BlockResult r = pipeline->process(std::vector<float>{});
    EXPECT_EQ(r.status, BlockStatus::RejectedEmpty);
    EXPECT_FALSE(r.accepted());
    EXPECT_EQ(pipeline->blocks_processed(), 0u);
}

TEST_F(DecodePipelineTest, RejectsWrongBlockLength) {
    auto pipeline = make();
    ASSERT_TRUE(pipeline);

    BlockResult r = pipeline->process(std::vector<float>(kBlock - 1, 0.0f));
    EXPECT_EQ(r.status, BlockStatus::RejectedLength);
    EXPECT_NE(r.error.find("205"), std::string::npos);
    EXPECT_EQ(pipeline->blocks_processed(), 0u);
}

TEST_F(DecodePipelineTest, RejectedBlockLeavesStateUntouched) {
    auto pipeline = make(3);
    ASSERT_TRUE(pipeline);

    auto tone = key_blocks('6', 1);
    pipeline->process(tone);
    pipeline->process(tone);
    ASSERT_EQ(pipeline->state_machine().hold_count(), 2);

    std::vector<float> bad = tone;
    bad[17] = std::numeric_limits<float>::quiet_NaN();
    BlockResult r = pipeline->process(bad);
    EXPECT_EQ(r.status, BlockStatus::RejectedNonFinite);
    EXPECT_EQ(pipeline->state_machine().hold_count(), 2);

    bad[17] = std::numeric_limits<float>::infinity();
    EXPECT_EQ(pipeline->process(bad).status, BlockStatus::RejectedNonFinite);

    BlockResult third = pipeline->process(tone);
    ASSERT_EQ(third.events.size(), 1u);
    EXPECT_EQ(third.events[0].symbol, '6');
}

TEST_F(DecodePipelineTest, DecodeReportsRejectedBlocks) {
    auto pipeline = make();
    ASSERT_TRUE(pipeline);

    std::vector<float> pcm = silence_blocks(3);
    pcm[kBlock + 4] = std::numeric_limits<float>::quiet_NaN();
    pcm.resize(pcm.size() + 50, 0.0f);   // trailing partial block is ignored

    DecodeSummary summary = pipeline->decode(pcm);
    EXPECT_EQ(summary.blocks, 3u);
    EXPECT_EQ(summary.rejected, 1u);
    EXPECT_NE(summary.error.find("block 1"), std::string::npos);
    EXPECT_EQ(pipeline->blocks_processed(), 2u);
}

TEST_F(DecodePipelineTest, SubscribersSeeEventsInOrder) {
    auto pipeline = make(2);
    ASSERT_TRUE(pipeline);

    std::string log;
    pipeline->subscribe([&log](const KeyEvent& ev) { log += 'a'; log += ev.symbol; });
    pipeline->subscribe([&log](const KeyEvent& ev) { log += 'b'; log += ev.symbol; });

    std::vector<float> pcm = key_blocks('C', 2);
    append(pcm, silence_blocks(1));
    pipeline->decode(pcm);

    EXPECT_EQ(log, "aCbCaCbC");
}

TEST_F(DecodePipelineTest, FlushReleasesHeldKeyAtEndOfStream) {
    auto pipeline = make(2);
    ASSERT_TRUE(pipeline);

    std::vector<KeyEvent> seen;
    pipeline->subscribe([&seen](const KeyEvent& ev) { seen.push_back(ev); });

    pipeline->decode(key_blocks('D', 4));
    auto released = pipeline->flush();

    EXPECT_EQ(render(released), "-D");
    EXPECT_EQ(render(seen), "+D -D");
    EXPECT_EQ(released[0].block_index, 4u);
}

TEST_F(DecodePipelineTest, ResetForgetsPartialHold) {
    auto pipeline = make(3);
    ASSERT_TRUE(pipeline);

    pipeline->decode(key_blocks('2', 2));
    pipeline->reset();
    EXPECT_TRUE(pipeline->decode(key_blocks('2', 2)).events.empty());
    EXPECT_EQ(render(pipeline->decode(key_blocks('2', 1)).events), "+2");
}

} // namespace
} // namespace dtmfdec::node
