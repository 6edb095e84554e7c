#include <algorithm>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "internal/audio/audio_assembler.hpp"
#include "internal/audio/audio_processor.hpp"

namespace sonata {
namespace audio {
namespace {

SegmentAudio makeSegment(const std::vector<float>& samples, const AudioInfo& audio = AudioInfo()) {
    SegmentAudio segment;
    segment.samples = samples;
    segment.audio = audio;
    return segment;
}

uint32_t readLe32(const std::vector<uint8_t>& bytes, size_t offset) {
    return static_cast<uint32_t>(bytes[offset]) |
           (static_cast<uint32_t>(bytes[offset + 1]) << 8) |
           (static_cast<uint32_t>(bytes[offset + 2]) << 16) |
           (static_cast<uint32_t>(bytes[offset + 3]) << 24);
}

uint16_t readLe16(const std::vector<uint8_t>& bytes, size_t offset) {
    return static_cast<uint16_t>(bytes[offset] | (bytes[offset + 1] << 8));
}

// =============================================================================
// RtfTracker
// =============================================================================

TEST(RtfTrackerTest, SequentialSum) {
    RtfTracker tracker(AudioInfo(), RtfTracker::TimingPolicy::SEQUENTIAL_SUM);
    tracker.addSynthesisTime(0.25);
    tracker.addSynthesisTime(0.25);
    tracker.addAudioSamples(22050);

    EXPECT_DOUBLE_EQ(tracker.getSynthesisSeconds(), 0.5);
    EXPECT_DOUBLE_EQ(tracker.getAudioSeconds(), 1.0);

    float rtf = 0.0f;
    ASSERT_TRUE(tracker.computeRtf(rtf).isOk());
    EXPECT_FLOAT_EQ(rtf, 0.5f);
}

TEST(RtfTrackerTest, AudioSecondsCountAllChannels) {
    AudioInfo stereo;
    stereo.sample_rate = 16000;
    stereo.num_channels = 2;
    RtfTracker tracker(stereo, RtfTracker::TimingPolicy::SEQUENTIAL_SUM);
    tracker.addAudioSamples(64000);
    EXPECT_DOUBLE_EQ(tracker.getAudioSeconds(), 2.0);
}

TEST(RtfTrackerTest, ZeroDurationIsAnError) {
    RtfTracker tracker(AudioInfo(), RtfTracker::TimingPolicy::SEQUENTIAL_SUM);
    tracker.addSynthesisTime(1.0);

    float rtf = -1.0f;
    auto err = tracker.computeRtf(rtf);
    EXPECT_EQ(err.code, ErrorCode::ZERO_DURATION_AUDIO);
    EXPECT_FLOAT_EQ(rtf, -1.0f);
}

TEST(RtfTrackerTest, WallClockSpan) {
    RtfTracker tracker(AudioInfo(), RtfTracker::TimingPolicy::WALL_CLOCK_SPAN);
    EXPECT_DOUBLE_EQ(tracker.getSynthesisSeconds(), 0.0);

    tracker.markStart();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    tracker.markEnd();
    tracker.addSynthesisTime(100.0);  // 不计入墙钟跨度
    tracker.addAudioSamples(22050);

    double span = tracker.getSynthesisSeconds();
    EXPECT_GE(span, 0.02);
    EXPECT_LT(span, 10.0);

    float rtf = 0.0f;
    ASSERT_TRUE(tracker.computeRtf(rtf).isOk());
    EXPECT_FLOAT_EQ(rtf, static_cast<float>(span));
}

// =============================================================================
// AudioAssembler
// =============================================================================

TEST(AudioAssemblerTest, EncodesSixteenBitLittleEndian) {
    AudioAssembler assembler{AudioInfo(), SpeechArgs()};

    WaveSamples chunk;
    auto err = assembler.addSegment(makeSegment({0.0f, 0.5f, -1.0f, 1.0f}), 3, chunk);
    ASSERT_TRUE(err.isOk()) << err.toString();

    ASSERT_EQ(chunk.wav_samples.size(), 8u);
    EXPECT_EQ(chunk.index, 3u);
    EXPECT_FALSE(chunk.is_final);
    EXPECT_EQ(readLe16(chunk.wav_samples, 0), 0);
    EXPECT_EQ(static_cast<int16_t>(readLe16(chunk.wav_samples, 2)), 16383);
    EXPECT_EQ(static_cast<int16_t>(readLe16(chunk.wav_samples, 4)), -32767);
    EXPECT_EQ(static_cast<int16_t>(readLe16(chunk.wav_samples, 6)), 32767);
    EXPECT_EQ(assembler.getSpeechSamples(), 4u);
}

TEST(AudioAssemblerTest, RejectsMismatchedAudioInfo) {
    AudioAssembler assembler{AudioInfo(), SpeechArgs()};

    AudioInfo other;
    other.sample_rate = 16000;
    WaveSamples chunk;
    auto err = assembler.addSegment(makeSegment({0.1f}, other), 0, chunk);
    EXPECT_EQ(err.code, ErrorCode::MODEL_FAILURE);
    EXPECT_EQ(assembler.getSpeechSamples(), 0u);
}

TEST(AudioAssemblerTest, VolumeScalesSamples) {
    SpeechArgs args;
    args.volume = 50;
    AudioAssembler assembler(AudioInfo(), args);

    WaveSamples chunk;
    ASSERT_TRUE(assembler.addSegment(makeSegment({1.0f}), 0, chunk).isOk());
    EXPECT_EQ(static_cast<int16_t>(readLe16(chunk.wav_samples, 0)), 16383);
}

TEST(AudioAssemblerTest, MuteProducesZeros) {
    SpeechArgs args;
    args.volume = 0;
    AudioAssembler assembler(AudioInfo(), args);

    WaveSamples chunk;
    ASSERT_TRUE(assembler.addSegment(makeSegment({0.3f, -0.7f}), 0, chunk).isOk());
    for (uint8_t byte : chunk.wav_samples) {
        EXPECT_EQ(byte, 0);
    }
    // 静音的语音仍计入时长
    EXPECT_EQ(assembler.getSpeechSamples(), 2u);
}

TEST(AudioAssemblerTest, HigherPitchShortensSegment) {
    SpeechArgs args;
    args.pitch = 100;
    AudioAssembler assembler(AudioInfo(), args);

    WaveSamples chunk;
    ASSERT_TRUE(assembler.addSegment(makeSegment(std::vector<float>(1000, 0.1f)), 0, chunk).isOk());
    EXPECT_LT(chunk.wav_samples.size(), 2000u);
    EXPECT_EQ(chunk.wav_samples.size(), assembler.getSpeechSamples() * 2);
}

TEST(AudioAssemblerTest, FinishChunkAppendsSilenceOnce) {
    SpeechArgs args;
    args.appended_silence_ms = 100;
    AudioAssembler assembler(AudioInfo(), args);

    WaveSamples chunk;
    ASSERT_TRUE(assembler.addSegment(makeSegment({0.5f, 0.5f}), 0, chunk).isOk());
    assembler.finishChunk(chunk);

    // round(100 * 22050 / 1000) = 2205 帧, 每帧 2 字节
    EXPECT_EQ(chunk.wav_samples.size(), 4u + 2205u * 2u);
    EXPECT_TRUE(chunk.is_final);
    // 静音不计入语音时长
    EXPECT_EQ(assembler.getSpeechSamples(), 2u);
}

TEST(AudioAssemblerTest, AssembleConcatenatesAndAppendsSilence) {
    SpeechArgs args;
    args.appended_silence_ms = 10;
    AudioAssembler assembler(AudioInfo(), args);

    std::vector<WaveSamples> chunks(2);
    ASSERT_TRUE(assembler.addSegment(makeSegment({0.5f}), 0, chunks[0]).isOk());
    ASSERT_TRUE(assembler.addSegment(makeSegment({-0.5f, 0.25f}), 1, chunks[1]).isOk());
    std::vector<uint8_t> first = chunks[0].wav_samples;
    std::vector<uint8_t> second = chunks[1].wav_samples;

    std::vector<uint8_t> buffer;
    assembler.assemble(std::move(chunks), buffer);

    size_t silence_bytes = silenceFrames(10, 22050) * 2;
    ASSERT_EQ(buffer.size(), first.size() + second.size() + silence_bytes);
    EXPECT_TRUE(std::equal(first.begin(), first.end(), buffer.begin()));
    EXPECT_TRUE(std::equal(second.begin(), second.end(), buffer.begin() + first.size()));
    for (size_t i = first.size() + second.size(); i < buffer.size(); ++i) {
        EXPECT_EQ(buffer[i], 0);
    }
}

// =============================================================================
// AudioProcessor
// =============================================================================

TEST(AudioProcessorTest, NormalizePeak) {
    std::vector<float> loud = {0.25f, -0.5f};
    normalizePeak(loud);
    EXPECT_FLOAT_EQ(loud[0], 0.5f);
    EXPECT_FLOAT_EQ(loud[1], -1.0f);

    // 峰值下限 0.01
    std::vector<float> quiet = {0.001f};
    normalizePeak(quiet);
    EXPECT_NEAR(quiet[0], 0.1f, 1e-6f);
}

TEST(AudioProcessorTest, GainClamps) {
    std::vector<float> audio = {0.8f, -0.8f};
    applyGain(audio, 2.0f);
    EXPECT_FLOAT_EQ(audio[0], 1.0f);
    EXPECT_FLOAT_EQ(audio[1], -1.0f);
}

TEST(AudioProcessorTest, EncodeEightBitIsUnsigned) {
    std::vector<uint8_t> out;
    encodePcm({0.0f, 1.0f, -1.0f}, 1, out);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0], 128);
    EXPECT_EQ(out[1], 255);
    EXPECT_EQ(out[2], 1);
}

TEST(AudioProcessorTest, EncodeWideSamples) {
    std::vector<uint8_t> out24;
    encodePcm({0.0f, -1.0f}, 3, out24);
    EXPECT_EQ(out24.size(), 6u);

    std::vector<uint8_t> out32;
    encodePcm({1.0f}, 4, out32);
    ASSERT_EQ(out32.size(), 4u);
    EXPECT_EQ(readLe32(out32, 0), 2147483647u);
}

TEST(AudioProcessorTest, SilenceFramesRounds) {
    EXPECT_EQ(silenceFrames(0, 22050), 0u);
    EXPECT_EQ(silenceFrames(1000, 16000), 16000u);
    EXPECT_EQ(silenceFrames(1, 22050), 22u);     // 22.05
    EXPECT_EQ(silenceFrames(3, 22050), 66u);     // 66.15
    EXPECT_EQ(silenceFrames(2, 44100), 88u);     // 88.2
}

TEST(AudioProcessorTest, EightBitSilenceIsMidpoint) {
    AudioInfo audio;
    audio.sample_rate = 1000;
    audio.sample_width = 1;
    audio.num_channels = 2;

    std::vector<uint8_t> out;
    appendSilence(out, audio, 5);
    ASSERT_EQ(out.size(), 10u);
    for (uint8_t byte : out) {
        EXPECT_EQ(byte, 0x80);
    }
}

TEST(AudioProcessorTest, WriteWavFileHeader) {
    AudioInfo audio;
    audio.sample_rate = 16000;
    audio.num_channels = 1;
    audio.sample_width = 2;
    std::vector<uint8_t> pcm = {1, 2, 3, 4, 5, 6};

    std::string path = ::testing::TempDir() + "sonata_wav_header_test.wav";
    ASSERT_TRUE(writeWavFile(path, pcm, audio).isOk());

    std::ifstream file(path, std::ios::binary);
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    ASSERT_EQ(bytes.size(), 44u + pcm.size());

    EXPECT_EQ(std::string(bytes.begin(), bytes.begin() + 4), "RIFF");
    EXPECT_EQ(readLe32(bytes, 4), 36u + pcm.size());
    EXPECT_EQ(std::string(bytes.begin() + 8, bytes.begin() + 16), "WAVEfmt ");
    EXPECT_EQ(readLe16(bytes, 20), 1);          // PCM
    EXPECT_EQ(readLe16(bytes, 22), 1);          // 声道
    EXPECT_EQ(readLe32(bytes, 24), 16000u);
    EXPECT_EQ(readLe32(bytes, 28), 32000u);     // byte rate
    EXPECT_EQ(readLe16(bytes, 32), 2);          // block align
    EXPECT_EQ(readLe16(bytes, 34), 16);
    EXPECT_EQ(std::string(bytes.begin() + 36, bytes.begin() + 40), "data");
    EXPECT_EQ(readLe32(bytes, 40), pcm.size());
    EXPECT_TRUE(std::equal(pcm.begin(), pcm.end(), bytes.begin() + 44));
}

TEST(AudioProcessorTest, WriteWavFileRejectsEmptyAudio) {
    std::string path = ::testing::TempDir() + "sonata_wav_empty_test.wav";
    auto err = writeWavFile(path, {}, AudioInfo());
    EXPECT_EQ(err.code, ErrorCode::INVALID_CONFIG);
}

TEST(AudioProcessorTest, WriteWavFileReportsUnwritablePath) {
    auto err = writeWavFile("/nonexistent-dir/sub/out.wav", {0, 0}, AudioInfo());
    EXPECT_EQ(err.code, ErrorCode::FILE_WRITE_ERROR);
}

}  // namespace
}  // namespace audio
}  // namespace sonata
