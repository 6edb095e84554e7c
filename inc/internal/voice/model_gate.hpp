#ifndef SONATA_MODEL_GATE_HPP
#define SONATA_MODEL_GATE_HPP

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/backends/speech_model.hpp"
#include "internal/sonata_types.hpp"

namespace sonata {

// =============================================================================
// ModelGate (模型访问门)
// =============================================================================
//
// 每个音色的模型是唯一的跨请求共享可变资源, 所有调用都经过此门:
// - 模型不支持并发时, 以互斥锁串行化调用
// - 模型抛出的异常转换为 MODEL_FAILURE
//

class ModelGate {
public:
    ModelGate(std::shared_ptr<ISpeechModel> model, bool concurrency_safe);

    // 禁止拷贝
    ModelGate(const ModelGate&) = delete;
    ModelGate& operator=(const ModelGate&) = delete;

    /// @brief 合成单个分段
    ErrorInfo synthesize(const std::string& text,
                         const SynthesisParams& params,
                         SegmentAudio& output);

    /// @brief 批量合成
    ErrorInfo synthesizeBatch(const std::vector<std::string>& texts,
                              const SynthesisParams& params,
                              std::vector<SegmentAudio>& outputs);

    bool isConcurrencySafe() const { return concurrency_safe_; }
    bool supportsBatching() const { return model_->supportsBatching(); }
    std::string getName() const { return model_->getName(); }
    AudioInfo getAudioInfo() const { return model_->getAudioInfo(); }

private:
    std::shared_ptr<ISpeechModel> model_;
    bool concurrency_safe_;
    std::mutex mutex_;
};

}  // namespace sonata

#endif  // SONATA_MODEL_GATE_HPP
