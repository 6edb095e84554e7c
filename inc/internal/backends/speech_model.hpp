#ifndef SONATA_SPEECH_MODEL_HPP
#define SONATA_SPEECH_MODEL_HPP

#include <memory>
#include <string>
#include <vector>

#include "internal/sonata_config.hpp"
#include "internal/sonata_types.hpp"

namespace sonata {

// =============================================================================
// Speech Model Interface (语音模型抽象接口)
// =============================================================================
//
// 调度器只通过此接口调用模型。
// 这是策略模式的核心, 允许为每个音色挂接不同的推理实现。
//
// 实现新模型的步骤:
// 1. 继承 ISpeechModel
// 2. 实现所有纯虚函数
// 3. 提供对应的 IVoiceLoader, 或直接通过 SonataEngine::RegisterVoice 注册
//
// 已实现的模型:
// - PiperModel: Piper VITS (ONNX Runtime)
//

class ISpeechModel {
public:
    virtual ~ISpeechModel() = default;

    // -------------------------------------------------------------------------
    // 模型信息
    // -------------------------------------------------------------------------

    /// @brief 获取模型名称 (用于日志)
    virtual std::string getName() const = 0;

    /// @brief 获取输出音频格式 (每个模型唯一)
    virtual AudioInfo getAudioInfo() const = 0;

    /// @brief 是否允许多个线程同时调用 synthesize
    /// @note 加载音色时查询一次, 结果固化在音色配置记录中
    virtual bool isConcurrencySafe() const = 0;

    /// @brief 是否支持一次调用合成多个分段
    virtual bool supportsBatching() const { return false; }

    // -------------------------------------------------------------------------
    // 合成
    // -------------------------------------------------------------------------

    /// @brief 合成单个分段
    /// @param text 分段文本
    /// @param params 已解析的合成参数
    /// @param output [out] 音频样本与格式
    /// @return 错误信息, 分段过长返回 SEGMENT_TOO_LARGE, 推理失败返回 MODEL_FAILURE
    virtual ErrorInfo synthesize(const std::string& text,
                                 const SynthesisParams& params,
                                 SegmentAudio& output) = 0;

    /// @brief 批量合成多个分段
    /// @param texts 分段文本 (按序)
    /// @param params 已解析的合成参数
    /// @param outputs [out] 与 texts 一一对应的音频
    /// @return 错误信息
    virtual ErrorInfo synthesizeBatch(const std::vector<std::string>& texts,
                                      const SynthesisParams& params,
                                      std::vector<SegmentAudio>& outputs) {
        (void)texts;
        (void)params;
        (void)outputs;
        return ErrorInfo::error(ErrorCode::INTERNAL_ERROR, "Batching not supported by " + getName());
    }
};

// =============================================================================
// Voice Loader Interface (音色加载接口)
// =============================================================================

class IVoiceLoader {
public:
    virtual ~IVoiceLoader() = default;

    /// @brief 加载音色配置与模型
    /// @param config_path 音色配置文件路径
    /// @param engine_config 引擎配置
    /// @param voice [out] 音色配置记录
    /// @param model [out] 已初始化的模型
    /// @return 错误信息
    virtual ErrorInfo loadVoice(const std::string& config_path,
                                const EngineConfig& engine_config,
                                VoiceConfig& voice,
                                std::shared_ptr<ISpeechModel>& model) = 0;

    /// @brief 扫描目录中已安装的音色
    /// @param dir 音色目录
    /// @param config_paths [out] 音色配置文件路径 (按音色名排序)
    /// @return 错误信息
    virtual ErrorInfo findVoices(const std::string& dir,
                                 std::vector<std::string>& config_paths) const = 0;
};

}  // namespace sonata

#endif  // SONATA_SPEECH_MODEL_HPP
