#ifndef SONATA_BATCHED_SYNTHESIS_HPP
#define SONATA_BATCHED_SYNTHESIS_HPP

#include "internal/scheduler/synthesis_stream.hpp"

namespace sonata {

/**
 * @brief 批处理模式: 一次合成全部分段, 不产生音频块
 *
 * 调用前检查一次取消令牌; 调用开始后不再响应取消, 结果照常返回。
 * 模型支持批处理时只调用一次 synthesizeBatch, 否则逐段顺序合成。
 *
 * @param job 合成请求
 * @param result [out] 完整缓冲与 RTF
 * @return 错误信息
 */
ErrorInfo runBatchedSynthesis(const SynthesisJob& job, SynthesisResult& result);

}  // namespace sonata

#endif  // SONATA_BATCHED_SYNTHESIS_HPP
