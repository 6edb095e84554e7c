#include "internal/voice/model_gate.hpp"

#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace sonata {

ModelGate::ModelGate(std::shared_ptr<ISpeechModel> model, bool concurrency_safe)
    : model_(std::move(model))
    , concurrency_safe_(concurrency_safe) {
}

ErrorInfo ModelGate::synthesize(const std::string& text,
    const SynthesisParams& params,
    SegmentAudio& output) {
    std::unique_lock<std::mutex> lock(mutex_, std::defer_lock);
    if (!concurrency_safe_) {
        lock.lock();
    }

    try {
        return model_->synthesize(text, params, output);
    } catch (const std::exception& e) {
        return ErrorInfo::error(ErrorCode::MODEL_FAILURE,
            model_->getName() + " synthesis failed", e.what());
    }
}

ErrorInfo ModelGate::synthesizeBatch(const std::vector<std::string>& texts,
    const SynthesisParams& params,
    std::vector<SegmentAudio>& outputs) {
    std::unique_lock<std::mutex> lock(mutex_, std::defer_lock);
    if (!concurrency_safe_) {
        lock.lock();
    }

    try {
        return model_->synthesizeBatch(texts, params, outputs);
    } catch (const std::exception& e) {
        return ErrorInfo::error(ErrorCode::MODEL_FAILURE,
            model_->getName() + " batch synthesis failed", e.what());
    }
}

}  // namespace sonata
