#include <cmath>
#include <limits>

#include <gtest/gtest.h>

#include "decoder_config.hpp"

namespace dtmfdec::node {
namespace {

TEST(DecoderConfigTest, DefaultsAreValid) {
    DecoderConfig cfg;
    auto check = validate_config(cfg);
    EXPECT_TRUE(check.valid) << check.error;
    EXPECT_TRUE(check.error.empty());
    EXPECT_NEAR(block_resolution(cfg), 39.02, 0.01);
}

TEST(DecoderConfigTest, RejectsZeroHoldBlocks) {
    DecoderConfig cfg;
    cfg.min_hold_blocks = 0;
    auto check = validate_config(cfg);
    EXPECT_FALSE(check.valid);
    EXPECT_NE(check.error.find("min_hold_blocks"), std::string::npos);
}

TEST(DecoderConfigTest, RejectsNegativeThresholds) {
    DecoderConfig cfg;
    cfg.min_energy_threshold = -1.0;
    EXPECT_FALSE(validate_config(cfg).valid);

    cfg = DecoderConfig{};
    cfg.min_peak_ratio = -2.0;
    EXPECT_FALSE(validate_config(cfg).valid);

    cfg = DecoderConfig{};
    cfg.min_peak_ratio = 0.5;
    EXPECT_FALSE(validate_config(cfg).valid);

    cfg = DecoderConfig{};
    cfg.max_twist_ratio = -1.0;
    EXPECT_FALSE(validate_config(cfg).valid);

    cfg = DecoderConfig{};
    cfg.max_twist_ratio = 0.5;
    EXPECT_FALSE(validate_config(cfg).valid);
}

TEST(DecoderConfigTest, TwistCheckCanBeDisabled) {
    DecoderConfig cfg;
    cfg.max_twist_ratio = 0.0;
    EXPECT_TRUE(validate_config(cfg).valid);
}

TEST(DecoderConfigTest, RejectsBadSampleRate) {
    DecoderConfig cfg;
    cfg.sample_rate = 0.0;
    EXPECT_FALSE(validate_config(cfg).valid);

    cfg.sample_rate = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(validate_config(cfg).valid);

    // 1633 Hz must stay below Nyquist.
    cfg.sample_rate = 3000.0;
    cfg.block_length = 100;
    EXPECT_FALSE(validate_config(cfg).valid);
}

TEST(DecoderConfigTest, RejectsBlocksTooShortToSeparateRows) {
    DecoderConfig cfg;
    cfg.block_length = 0;
    EXPECT_FALSE(validate_config(cfg).valid);

    cfg.block_length = 120;   // 66.7 Hz bins at 8 kHz
    EXPECT_FALSE(validate_config(cfg).valid);

    cfg.block_length = 134;   // 59.7 Hz bins
    EXPECT_TRUE(validate_config(cfg).valid);
}

TEST(DecoderConfigTest, AcceptsOtherSampleRates) {
    DecoderConfig cfg;
    cfg.sample_rate  = 44100.0;
    cfg.block_length = 1024;
    EXPECT_TRUE(validate_config(cfg).valid);
}

} // namespace
} // namespace dtmfdec::node
