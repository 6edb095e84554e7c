#include <cmath>
#include <limits>
#include <string>

#include <gtest/gtest.h>

#include "internal/sonata_types.hpp"

namespace sonata {
namespace {

// =============================================================================
// 枚举解析
// =============================================================================

TEST(SonataTypesTest, ParseSynthesisMode) {
    SynthesisMode mode = SynthesisMode::LAZY;
    ASSERT_TRUE(parseSynthesisMode("parallel", mode).isOk());
    EXPECT_EQ(mode, SynthesisMode::PARALLEL);
    ASSERT_TRUE(parseSynthesisMode("batched", mode).isOk());
    EXPECT_EQ(mode, SynthesisMode::BATCHED);
    ASSERT_TRUE(parseSynthesisMode("lazy", mode).isOk());
    EXPECT_EQ(mode, SynthesisMode::LAZY);

    EXPECT_EQ(parseSynthesisMode("Lazy", mode).code, ErrorCode::INVALID_MODE);
    EXPECT_EQ(parseSynthesisMode("", mode).code, ErrorCode::INVALID_MODE);
}

TEST(SonataTypesTest, UnspecifiedWireValuesRejected) {
    SynthesisMode mode = SynthesisMode::LAZY;
    EXPECT_EQ(synthesisModeFromWire(0, mode).code, ErrorCode::INVALID_MODE);
    EXPECT_EQ(synthesisModeFromWire(4, mode).code, ErrorCode::INVALID_MODE);
    ASSERT_TRUE(synthesisModeFromWire(synthesisModeToWire(SynthesisMode::BATCHED), mode).isOk());
    EXPECT_EQ(mode, SynthesisMode::BATCHED);

    Quality quality = Quality::MEDIUM;
    EXPECT_EQ(qualityFromWire(0, quality).code, ErrorCode::INVALID_CONFIG);
    ASSERT_TRUE(qualityFromWire(1, quality).isOk());
    EXPECT_EQ(quality, Quality::X_LOW);
    EXPECT_EQ(qualityToWire(Quality::HIGH), 4);
}

TEST(SonataTypesTest, ParseQuality) {
    Quality quality = Quality::MEDIUM;
    ASSERT_TRUE(parseQuality("x-low", quality).isOk());
    EXPECT_EQ(quality, Quality::X_LOW);
    ASSERT_TRUE(parseQuality("x_low", quality).isOk());
    EXPECT_EQ(quality, Quality::X_LOW);
    ASSERT_TRUE(parseQuality("high", quality).isOk());
    EXPECT_STREQ(qualityToString(quality), "high");
    EXPECT_EQ(parseQuality("ultra", quality).code, ErrorCode::INVALID_CONFIG);
}

// =============================================================================
// 语音参数
// =============================================================================

TEST(SonataTypesTest, SpeechArgsMapping) {
    SpeechArgs args;
    EXPECT_TRUE(args.validate().isOk());
    EXPECT_FLOAT_EQ(args.speechSpeed(), 1.0f);
    EXPECT_FLOAT_EQ(args.pitchFactor(), 1.0f);

    args.rate = 100;
    args.pitch = 100;
    EXPECT_FLOAT_EQ(args.speechSpeed(), 2.0f);
    EXPECT_NEAR(args.pitchFactor(), std::sqrt(2.0f), 1e-5f);

    args.rate = 0;
    EXPECT_FLOAT_EQ(args.speechSpeed(), 0.5f);
}

TEST(SonataTypesTest, SpeechArgsRange) {
    SpeechArgs args;
    args.volume = 101;
    EXPECT_EQ(args.validate().code, ErrorCode::INVALID_OPTIONS);

    args = SpeechArgs();
    args.rate = 200;
    EXPECT_EQ(args.validate().code, ErrorCode::INVALID_OPTIONS);

    args = SpeechArgs();
    args.pitch = 101;
    EXPECT_EQ(args.validate().code, ErrorCode::INVALID_OPTIONS);
}

// =============================================================================
// 合成参数
// =============================================================================

TEST(SonataTypesTest, SynthesisOptionsValidation) {
    SynthesisOptions options;
    EXPECT_TRUE(options.validate().isOk());

    options.length_scale = 0.0f;
    EXPECT_EQ(options.validate().code, ErrorCode::INVALID_OPTIONS);
    options.length_scale = -1.0f;
    EXPECT_EQ(options.validate().code, ErrorCode::INVALID_OPTIONS);
    options.length_scale = 1.0f;
    EXPECT_TRUE(options.validate().isOk());

    options = SynthesisOptions();
    options.noise_scale = 0.0f;
    options.noise_w = 0.0f;
    EXPECT_TRUE(options.validate().isOk());

    options.noise_w = std::numeric_limits<float>::infinity();
    EXPECT_EQ(options.validate().code, ErrorCode::INVALID_OPTIONS);

    options = SynthesisOptions();
    options.noise_scale = -0.1f;
    EXPECT_EQ(options.validate().code, ErrorCode::INVALID_OPTIONS);
}

TEST(SonataTypesTest, MergeKeepsUnsetFields) {
    SynthesisOptions base;
    base.speaker = "alice";
    base.length_scale = 1.0f;
    base.noise_scale = 0.667f;
    base.noise_w = 0.8f;

    SynthesisOptions overrides;
    overrides.length_scale = 1.5f;
    overrides.speaker = "bob";

    SynthesisOptions merged = base.mergedWith(overrides);
    EXPECT_EQ(*merged.speaker, "bob");
    EXPECT_FLOAT_EQ(*merged.length_scale, 1.5f);
    EXPECT_FLOAT_EQ(*merged.noise_scale, 0.667f);
    EXPECT_FLOAT_EQ(*merged.noise_w, 0.8f);
}

TEST(SonataTypesTest, VoiceConfigValidation) {
    VoiceConfig config;
    EXPECT_EQ(config.validate().code, ErrorCode::INVALID_CONFIG);

    config.voice_id = "en_US-test-medium";
    EXPECT_EQ(config.validate().code, ErrorCode::INVALID_CONFIG);

    config.default_options.length_scale = 1.0f;
    config.default_options.noise_scale = 0.667f;
    config.default_options.noise_w = 0.8f;
    EXPECT_TRUE(config.validate().isOk());

    config.audio.sample_width = 5;
    EXPECT_EQ(config.validate().code, ErrorCode::INVALID_CONFIG);
}

}  // namespace
}  // namespace sonata
