#ifndef SONATA_AUDIO_ASSEMBLER_HPP
#define SONATA_AUDIO_ASSEMBLER_HPP

/**
 * AudioAssembler - 音频拼装与 RTF 统计
 *
 * 每个分段经过相同的包络处理 (变调 -> 音量) 后编码为 PCM,
 * 因此三种调度模式拼接出的字节完全一致。
 * 末尾静音只追加一次: 完整缓冲的末尾, 或流式最后一块的末尾。
 */

#include <chrono>
#include <cstdint>

#include <vector>

#include "internal/sonata_types.hpp"

namespace sonata {
namespace audio {

// =============================================================================
// RtfTracker (实时率统计)
// =============================================================================

class RtfTracker {
public:
    enum class TimingPolicy {
        SEQUENTIAL_SUM,     // 惰性/批处理: 累加每段的合成耗时
        WALL_CLOCK_SPAN,    // 并行: 首次派发到最后完成的墙钟跨度
    };

    RtfTracker(const AudioInfo& audio, TimingPolicy policy);

    /// @brief 累加一段合成耗时 (SEQUENTIAL_SUM)
    void addSynthesisTime(double seconds);

    /// @brief 记录开始时刻 (WALL_CLOCK_SPAN)
    void markStart();

    /// @brief 记录结束时刻 (WALL_CLOCK_SPAN)
    void markEnd();

    /// @brief 累加语音样本数 (交错样本, 不含末尾静音)
    void addAudioSamples(uint64_t num_samples);

    double getSynthesisSeconds() const;

    /// @brief 语音时长 = 样本数 / (采样率 × 声道数)
    double getAudioSeconds() const;

    /// @brief 计算 RTF
    /// @param rtf [out] 合成耗时 / 语音时长
    /// @return 语音时长为 0 时返回 ZERO_DURATION_AUDIO
    ErrorInfo computeRtf(float& rtf) const;

    TimingPolicy getPolicy() const { return policy_; }

private:
    using Clock = std::chrono::steady_clock;

    AudioInfo audio_;
    TimingPolicy policy_;
    double sequential_seconds_ = 0.0;
    Clock::time_point start_time_;
    Clock::time_point end_time_;
    bool started_ = false;
    bool ended_ = false;
    uint64_t num_samples_ = 0;
};

// =============================================================================
// AudioAssembler (音频拼装)
// =============================================================================

class AudioAssembler {
public:
    AudioAssembler(const AudioInfo& audio, const SpeechArgs& speech_args);

    /// @brief 处理一个分段: 校验格式 -> 变调 -> 音量 -> 编码
    /// @param segment 模型输出 (被消费)
    /// @param index 分段序号
    /// @param chunk [out] 编码后的音频块
    /// @return 格式与音色不一致时返回 MODEL_FAILURE
    ErrorInfo addSegment(SegmentAudio&& segment, size_t index, WaveSamples& chunk);

    /// @brief 在块末尾追加末尾静音, 并标记为最后一块
    void finishChunk(WaveSamples& chunk) const;

    /// @brief 拼接全部块并追加末尾静音
    /// @param chunks 按序的音频块 (被消费)
    /// @param buffer [out] 完整 PCM 缓冲
    void assemble(std::vector<WaveSamples>&& chunks, std::vector<uint8_t>& buffer) const;

    /// @brief 已处理的语音样本数 (交错, 不含静音)
    uint64_t getSpeechSamples() const { return speech_samples_; }

    const AudioInfo& getAudioInfo() const { return audio_; }

private:
    AudioInfo audio_;
    SpeechArgs speech_args_;
    float pitch_factor_;
    float gain_;
    uint64_t speech_samples_ = 0;
};

}  // namespace audio
}  // namespace sonata

#endif  // SONATA_AUDIO_ASSEMBLER_HPP
