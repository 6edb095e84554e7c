#include "internal/audio/audio_assembler.hpp"

#include <chrono>
#include <cstdint>

#include <string>
#include <utility>
#include <vector>

#include "internal/audio/audio_processor.hpp"

namespace sonata {
namespace audio {

// =============================================================================
// RtfTracker 实现
// =============================================================================

RtfTracker::RtfTracker(const AudioInfo& audio, TimingPolicy policy)
    : audio_(audio)
    , policy_(policy) {
}

void RtfTracker::addSynthesisTime(double seconds) {
    sequential_seconds_ += seconds;
}

void RtfTracker::markStart() {
    start_time_ = Clock::now();
    started_ = true;
}

void RtfTracker::markEnd() {
    end_time_ = Clock::now();
    ended_ = true;
}

void RtfTracker::addAudioSamples(uint64_t num_samples) {
    num_samples_ += num_samples;
}

double RtfTracker::getSynthesisSeconds() const {
    if (policy_ == TimingPolicy::SEQUENTIAL_SUM) {
        return sequential_seconds_;
    }
    if (!started_) {
        return 0.0;
    }
    auto end = ended_ ? end_time_ : Clock::now();
    return std::chrono::duration<double>(end - start_time_).count();
}

double RtfTracker::getAudioSeconds() const {
    double denom = static_cast<double>(audio_.sample_rate) * audio_.num_channels;
    if (denom <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(num_samples_) / denom;
}

ErrorInfo RtfTracker::computeRtf(float& rtf) const {
    double audio_seconds = getAudioSeconds();
    if (audio_seconds == 0.0) {
        return ErrorInfo::error(ErrorCode::ZERO_DURATION_AUDIO,
            "Synthesized audio has zero duration");
    }
    rtf = static_cast<float>(getSynthesisSeconds() / audio_seconds);
    return ErrorInfo::ok();
}

// =============================================================================
// AudioAssembler 实现
// =============================================================================

AudioAssembler::AudioAssembler(const AudioInfo& audio, const SpeechArgs& speech_args)
    : audio_(audio)
    , speech_args_(speech_args)
    , pitch_factor_(speech_args.pitchFactor())
    , gain_(speech_args.gain()) {
}

ErrorInfo AudioAssembler::addSegment(SegmentAudio&& segment, size_t index, WaveSamples& chunk) {
    if (segment.audio != audio_) {
        return ErrorInfo::error(ErrorCode::MODEL_FAILURE, "Audio format mismatch",
            "segment " + std::to_string(index) + ": " +
            std::to_string(segment.audio.sample_rate) + "Hz/" +
            std::to_string(segment.audio.num_channels) + "ch/" +
            std::to_string(segment.audio.sample_width) + "B");
    }

    std::vector<float> samples = std::move(segment.samples);

    // Step 1: 变调 (时长已由 length_scale 补偿)
    samples = shiftPitch(samples, audio_.num_channels, pitch_factor_);

    // Step 2: 音量
    applyGain(samples, gain_);

    // Step 3: 编码
    chunk.wav_samples.clear();
    encodePcm(samples, audio_.sample_width, chunk.wav_samples);
    chunk.index = index;
    chunk.is_final = false;

    speech_samples_ += samples.size();
    return ErrorInfo::ok();
}

void AudioAssembler::finishChunk(WaveSamples& chunk) const {
    appendSilence(chunk.wav_samples, audio_, speech_args_.appended_silence_ms);
    chunk.is_final = true;
}

void AudioAssembler::assemble(std::vector<WaveSamples>&& chunks, std::vector<uint8_t>& buffer) const {
    size_t total = 0;
    for (const auto& chunk : chunks) {
        total += chunk.wav_samples.size();
    }

    buffer.clear();
    buffer.reserve(total);
    for (auto& chunk : chunks) {
        buffer.insert(buffer.end(), chunk.wav_samples.begin(), chunk.wav_samples.end());
        std::vector<uint8_t>().swap(chunk.wav_samples);
    }
    appendSilence(buffer, audio_, speech_args_.appended_silence_ms);
}

}  // namespace audio
}  // namespace sonata
