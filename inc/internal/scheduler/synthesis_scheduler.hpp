#ifndef SONATA_SYNTHESIS_SCHEDULER_HPP
#define SONATA_SYNTHESIS_SCHEDULER_HPP

/**
 * SynthesisScheduler - 合成调度器
 *
 * 按请求模式选择调度策略:
 * - LAZY:     LazySynthesisStream, 调用方线程逐段合成
 * - PARALLEL: ParallelSynthesisStream, 线程池并发合成, 按序释放
 * - BATCHED:  runBatchedSynthesis, 一次调用, 仅完整缓冲
 *
 * 对确定性模型, 三种模式拼接出的音频字节完全一致。
 */

#include <memory>

#include "internal/scheduler/synthesis_stream.hpp"
#include "internal/sonata_config.hpp"

namespace sonata {

class SynthesisScheduler {
public:
    explicit SynthesisScheduler(const EngineConfig& config);

    /// @brief 打开流式合成 (仅 LAZY / PARALLEL, 且音色支持流式输出)
    /// @param job 合成请求
    /// @param stream [out] 音频块流
    /// @return BATCHED 或音色不支持流式时返回 STREAMING_UNSUPPORTED
    ErrorInfo openStream(SynthesisJob job, std::unique_ptr<ISynthesisStream>& stream);

    /// @brief 合成完整缓冲 (任意模式)
    /// @param job 合成请求
    /// @param result [out] 完整缓冲与 RTF
    /// @return 错误信息
    ErrorInfo synthesize(SynthesisJob job, SynthesisResult& result);

    const EngineConfig& getConfig() const { return config_; }

private:
    /// 创建流 (不检查音色的流式能力)
    std::unique_ptr<ISynthesisStream> createStream(SynthesisJob job);

    EngineConfig config_;
};

}  // namespace sonata

#endif  // SONATA_SYNTHESIS_SCHEDULER_HPP
