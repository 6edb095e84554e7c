#include <cstdint>

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "internal/backends/piper/piper_phonemizer.hpp"
#include "internal/backends/piper/piper_voice_config.hpp"

namespace sonata {
namespace piper {
namespace {

const char* const CONFIG_PATH = "/voices/en_US-lessac-medium.onnx.json";

// 最小可用配置: 只有 phoneme_id_map
const char* const MINIMAL_CONFIG = R"({
    "phoneme_id_map": {"_": [0], "^": [1], "$": [2], "a": [3], "b": [4]}
})";

const char* const FULL_CONFIG = R"({
    "audio": {"sample_rate": 16000, "quality": "low"},
    "espeak": {"voice": "de"},
    "language": {"code": "de_DE"},
    "dataset": "thorsten",
    "inference": {"noise_scale": 0.5, "length_scale": 1.2, "noise_w": 0.6},
    "num_speakers": 2,
    "speaker_id_map": {"alice": 0, "bob": 1},
    "phoneme_id_map": {"_": [0], "^": [1], "$": [2], "a": [3, 5]}
})";

// =============================================================================
// Config Parsing
// =============================================================================

TEST(PiperVoiceConfigTest, ModelPathFromConfigPath) {
    EXPECT_EQ(modelPathFromConfigPath("/v/x.onnx.json"), "/v/x.onnx");
    EXPECT_EQ(modelPathFromConfigPath("/v/x.onnx"), "/v/x.onnx");
    EXPECT_EQ(modelPathFromConfigPath(".json"), ".json");
}

TEST(PiperVoiceConfigTest, MinimalConfigUsesDefaults) {
    VoiceConfig voice;
    PiperSettings settings;
    ASSERT_TRUE(parsePiperConfig(MINIMAL_CONFIG, CONFIG_PATH, voice, settings).isOk());

    EXPECT_EQ(voice.voice_id, "en_US-lessac-medium");
    EXPECT_EQ(voice.config_path, CONFIG_PATH);
    EXPECT_EQ(voice.audio.sample_rate, 22050u);
    EXPECT_EQ(voice.audio.num_channels, 1u);
    EXPECT_EQ(voice.audio.sample_width, 2u);
    EXPECT_EQ(voice.quality, Quality::MEDIUM);
    EXPECT_FALSE(voice.supports_streaming_output);
    EXPECT_TRUE(voice.speakers.empty());

    EXPECT_FLOAT_EQ(*voice.default_options.noise_scale, 0.667f);
    EXPECT_FLOAT_EQ(*voice.default_options.length_scale, 1.0f);
    EXPECT_FLOAT_EQ(*voice.default_options.noise_w, 0.8f);
    EXPECT_FALSE(voice.default_options.speaker.has_value());

    EXPECT_EQ(settings.model_path, "/voices/en_US-lessac-medium.onnx");
    EXPECT_EQ(settings.espeak_voice, "en-us");
    EXPECT_EQ(settings.phoneme_type, PhonemeType::ESPEAK);
    EXPECT_EQ(settings.num_speakers, 1);
    EXPECT_EQ(settings.phoneme_id_map.size(), 5u);
}

TEST(PiperVoiceConfigTest, FullConfig) {
    VoiceConfig voice;
    PiperSettings settings;
    ASSERT_TRUE(parsePiperConfig(FULL_CONFIG, CONFIG_PATH, voice, settings).isOk());

    // language-dataset-quality 优先于文件名
    EXPECT_EQ(voice.voice_id, "de_DE-thorsten-low");
    EXPECT_EQ(voice.language, "de_DE");
    EXPECT_EQ(voice.audio.sample_rate, 16000u);
    EXPECT_EQ(voice.quality, Quality::LOW);
    EXPECT_EQ(settings.espeak_voice, "de");

    EXPECT_FLOAT_EQ(*voice.default_options.noise_scale, 0.5f);
    EXPECT_FLOAT_EQ(*voice.default_options.length_scale, 1.2f);
    EXPECT_FLOAT_EQ(*voice.default_options.noise_w, 0.6f);

    ASSERT_EQ(voice.speakers.size(), 2u);
    EXPECT_EQ(voice.speakers.at(0), "alice");
    EXPECT_EQ(voice.speakers.at(1), "bob");
    ASSERT_TRUE(voice.default_options.speaker.has_value());
    EXPECT_EQ(*voice.default_options.speaker, "alice");

    EXPECT_EQ(settings.phoneme_id_map.at(U'a'), (std::vector<int64_t>{3, 5}));
}

TEST(PiperVoiceConfigTest, UnnamedSpeakersAddressedByIndex) {
    const char* text = R"({"num_speakers": 3, "phoneme_id_map": {"_": [0]}})";
    VoiceConfig voice;
    PiperSettings settings;
    ASSERT_TRUE(parsePiperConfig(text, CONFIG_PATH, voice, settings).isOk());

    ASSERT_EQ(voice.speakers.size(), 3u);
    EXPECT_EQ(voice.speakers.at(2), "2");
    EXPECT_EQ(*voice.default_options.speaker, "0");
}

TEST(PiperVoiceConfigTest, DuplicateSpeakerId) {
    const char* text = R"({
        "speaker_id_map": {"alice": 0, "bob": 0},
        "phoneme_id_map": {"_": [0]}
    })";
    VoiceConfig voice;
    PiperSettings settings;
    EXPECT_EQ(parsePiperConfig(text, CONFIG_PATH, voice, settings).code, ErrorCode::INVALID_CONFIG);
}

TEST(PiperVoiceConfigTest, PhonemeIdMapRequired) {
    VoiceConfig voice;
    PiperSettings settings;
    EXPECT_EQ(parsePiperConfig("{}", CONFIG_PATH, voice, settings).code, ErrorCode::INVALID_CONFIG);

    // 缺少 pad
    const char* no_pad = R"({"phoneme_id_map": {"a": [3]}})";
    EXPECT_EQ(parsePiperConfig(no_pad, CONFIG_PATH, voice, settings).code, ErrorCode::INVALID_CONFIG);

    // 多码点音素
    const char* multi = R"({"phoneme_id_map": {"_": [0], "ab": [3]}})";
    EXPECT_EQ(parsePiperConfig(multi, CONFIG_PATH, voice, settings).code, ErrorCode::INVALID_CONFIG);
}

TEST(PiperVoiceConfigTest, MalformedJson) {
    VoiceConfig voice;
    PiperSettings settings;
    EXPECT_EQ(parsePiperConfig("{not json", CONFIG_PATH, voice, settings).code, ErrorCode::INVALID_CONFIG);
    EXPECT_EQ(parsePiperConfig("[1, 2]", CONFIG_PATH, voice, settings).code, ErrorCode::INVALID_CONFIG);

    const char* bad_quality = R"({"audio": {"quality": "ultra"}, "phoneme_id_map": {"_": [0]}})";
    EXPECT_EQ(parsePiperConfig(bad_quality, CONFIG_PATH, voice, settings).code, ErrorCode::INVALID_CONFIG);

    const char* bad_rate = R"({"audio": {"sample_rate": 0}, "phoneme_id_map": {"_": [0]}})";
    EXPECT_EQ(parsePiperConfig(bad_rate, CONFIG_PATH, voice, settings).code, ErrorCode::INVALID_CONFIG);
}

TEST(PiperVoiceConfigTest, StreamingFlag) {
    VoiceConfig voice;
    PiperSettings settings;

    const char* flagged = R"({"streaming": true, "phoneme_id_map": {"_": [0]}})";
    ASSERT_TRUE(parsePiperConfig(flagged, CONFIG_PATH, voice, settings).isOk());
    EXPECT_TRUE(voice.supports_streaming_output);

    ASSERT_TRUE(parsePiperConfig(MINIMAL_CONFIG, "/voices/en_US-lessac+RT-medium.onnx.json",
                                 voice, settings).isOk());
    EXPECT_TRUE(voice.supports_streaming_output);
    EXPECT_EQ(voice.voice_id, "en_US-lessac+RT-medium");
}

TEST(PiperVoiceConfigTest, TextPhonemeType) {
    const char* text = R"({"phoneme_type": "text", "phoneme_id_map": {"_": [0]}})";
    VoiceConfig voice;
    PiperSettings settings;
    ASSERT_TRUE(parsePiperConfig(text, CONFIG_PATH, voice, settings).isOk());
    EXPECT_EQ(settings.phoneme_type, PhonemeType::TEXT);
}

TEST(PiperVoiceConfigTest, LoadMissingFile) {
    VoiceConfig voice;
    PiperSettings settings;
    EXPECT_EQ(loadPiperConfig("/nonexistent/voice.onnx.json", voice, settings).code,
              ErrorCode::MODEL_NOT_FOUND);
}

// =============================================================================
// Phoneme Ids
// =============================================================================

PiperSettings textSettings() {
    VoiceConfig voice;
    PiperSettings settings;
    std::string text = R"({"phoneme_type": "text",
        "phoneme_id_map": {"_": [0], "^": [1], "$": [2], "a": [3], "b": [4]}})";
    EXPECT_TRUE(parsePiperConfig(text, CONFIG_PATH, voice, settings).isOk());
    return settings;
}

TEST(PiperPhonemizerTest, IdLayout) {
    PiperPhonemizer phonemizer(textSettings(), "", 64);

    std::vector<int64_t> ids;
    EXPECT_EQ(phonemizer.phonemesToIds(U"ab", ids), 0u);
    // ^ _ a _ b _ $
    EXPECT_EQ(ids, (std::vector<int64_t>{1, 0, 3, 0, 4, 0, 2}));
}

TEST(PiperPhonemizerTest, UnknownPhonemesSkipped) {
    PiperPhonemizer phonemizer(textSettings(), "", 64);

    std::vector<int64_t> ids;
    EXPECT_EQ(phonemizer.phonemesToIds(U"axb", ids), 1u);
    EXPECT_EQ(ids, (std::vector<int64_t>{1, 0, 3, 0, 4, 0, 2}));
}

TEST(PiperPhonemizerTest, TextPhonemesFromSegment) {
    PiperPhonemizer phonemizer(textSettings(), "", 64);

    std::vector<int64_t> ids;
    ASSERT_TRUE(phonemizer.textToIds("ba", ids).isOk());
    EXPECT_EQ(ids, (std::vector<int64_t>{1, 0, 4, 0, 3, 0, 2}));
}

TEST(PiperPhonemizerTest, SegmentTooLarge) {
    PiperPhonemizer phonemizer(textSettings(), "", 5);

    std::vector<int64_t> ids;
    EXPECT_EQ(phonemizer.textToIds("ab", ids).code, ErrorCode::SEGMENT_TOO_LARGE);
}

}  // namespace
}  // namespace piper
}  // namespace sonata
