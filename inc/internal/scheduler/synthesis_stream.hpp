#ifndef SONATA_SYNTHESIS_STREAM_HPP
#define SONATA_SYNTHESIS_STREAM_HPP

#include <cstddef>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "internal/audio/audio_assembler.hpp"
#include "internal/cancellation_token.hpp"
#include "internal/sonata_types.hpp"
#include "internal/voice/model_gate.hpp"

namespace sonata {

// =============================================================================
// SynthesisJob (单个合成请求的执行上下文)
// =============================================================================
//
// 由引擎在校验通过后构造, 独占本请求的分段/拼装状态;
// 只有 model 是跨请求共享的。
//

struct SynthesisJob {
    std::shared_ptr<const VoiceConfig> voice;
    std::shared_ptr<ModelGate> model;
    SynthesisParams params;             ///< 已合并的参数 (含韵律字段)
    SpeechArgs speech_args;
    SynthesisMode mode = SynthesisMode::LAZY;
    std::string text;
    CancellationToken token;
    bool verbose = false;
};

// =============================================================================
// ISynthesisStream (音频块流接口)
// =============================================================================
//
// 调用方循环调用 next() 拉取有序音频块:
//
//   WaveSamples chunk;
//   while (stream->next(chunk)) {
//       play(chunk.wav_samples);
//   }
//   auto status = stream->getStatus();   // OK / CANCELLED / 错误
//   float rtf;
//   stream->getRtf(rtf);                 // 最后一块交付之后才可用
//

class ISynthesisStream {
public:
    virtual ~ISynthesisStream() = default;

    /// @brief 拉取下一块
    /// @param chunk [out] 音频块
    /// @return false 表示流已结束 (通过 getStatus 查看原因)
    virtual bool next(WaveSamples& chunk) = 0;

    /// @brief 请求取消 (任意线程)
    virtual void cancel() = 0;

    /// @brief 终止状态, 未结束时返回 NOT_FINISHED
    virtual ErrorInfo getStatus() const = 0;

    virtual bool isFinished() const = 0;

    /// @brief 获取实时率
    /// @param rtf [out] 合成耗时 / 语音时长
    /// @return 未结束返回 NOT_FINISHED, 失败返回终止状态
    virtual ErrorInfo getRtf(float& rtf) const = 0;

    /// @brief 已交付的块数
    virtual size_t getChunksDelivered() const = 0;

    virtual SynthesisMode getMode() const = 0;

    /// @brief 合成耗时 (秒, 按模式的计时策略; 结束前为 0)
    virtual double getSynthesisSeconds() const = 0;

    /// @brief 语音时长 (秒, 不含末尾静音; 结束前为 0)
    virtual double getAudioSeconds() const = 0;

    virtual const AudioInfo& getAudioInfo() const = 0;
};

// =============================================================================
// SynthesisStreamBase (惰性/并行流的公共状态)
// =============================================================================

class SynthesisStreamBase : public ISynthesisStream {
public:
    ErrorInfo getStatus() const override;
    bool isFinished() const override;
    ErrorInfo getRtf(float& rtf) const override;
    size_t getChunksDelivered() const override { return delivered_; }
    SynthesisMode getMode() const override { return job_.mode; }
    double getSynthesisSeconds() const override;
    double getAudioSeconds() const override;
    const AudioInfo& getAudioInfo() const override { return job_.voice->audio; }

protected:
    SynthesisStreamBase(SynthesisJob job, audio::RtfTracker::TimingPolicy policy);

    /// @brief 进入终止状态 (仅第一次生效); 成功时计算 RTF
    /// 调用前产生音频的线程必须已停止, 计时在此刻定格
    void finish(const ErrorInfo& status);

    SynthesisJob job_;
    audio::AudioAssembler assembler_;
    audio::RtfTracker tracker_;
    std::atomic<size_t> delivered_{0};

private:
    mutable std::mutex state_mutex_;
    bool finished_ = false;
    ErrorInfo status_ = ErrorInfo::error(ErrorCode::NOT_FINISHED, "Synthesis in progress");
    float rtf_ = 0.0f;
    double synthesis_seconds_ = 0.0;    ///< finish() 时的快照
    double audio_seconds_ = 0.0;
};

}  // namespace sonata

#endif  // SONATA_SYNTHESIS_STREAM_HPP
