#ifndef SONATA_API_HPP
#define SONATA_API_HPP

/**
 * SonataSDK - Sonata Speech Synthesis Engine SDK
 *
 * 语音合成调度引擎, 提供统一的 C++ 接口。
 *
 * 使用示例 1 - 加载音色并合成完整缓冲:
 *
 *   auto engine = std::make_shared<Sonata::SonataEngine>(
 *       Sonata::EngineConfig::FromEnvironment(),
 *       std::make_shared<sonata::piper::PiperVoiceLoader>());
 *
 *   Sonata::VoiceInfo voice;
 *   engine->LoadVoice("en_US-amy-medium.onnx.json", voice);
 *
 *   Sonata::Utterance utterance;
 *   utterance.voice_id = voice.voice_id;
 *   utterance.text = "Hello world. How are you?";
 *   utterance.mode = Sonata::SynthesisMode::PARALLEL;
 *
 *   Sonata::SynthesisResult result;
 *   if (engine->Synthesize(utterance, result).isOk()) {
 *       Sonata::SonataEngine::SaveToWav(result, "out.wav");
 *   }
 *
 * 使用示例 2 - 拉取式流:
 *
 *   std::unique_ptr<Sonata::SynthesisStream> stream;
 *   engine->SynthesizeStreaming(utterance, stream);
 *   Sonata::WaveSamples chunk;
 *   while (stream->Next(chunk)) {
 *       // 播放 chunk.wav_samples ...
 *   }
 *
 * 使用示例 3 - 回调式流:
 *
 *   engine->StreamingCall(utterance, callback);
 */

#include <cstdint>

#include <memory>
#include <string>
#include <vector>

#include "internal/backends/speech_model.hpp"
#include "internal/cancellation_token.hpp"
#include "internal/sonata_config.hpp"
#include "internal/sonata_types.hpp"

// Forward declaration of internal types
namespace sonata {
    class ISynthesisStream;
}  // namespace sonata

namespace Sonata {

// =============================================================================
// 公共类型 (与内部类型一致)
// =============================================================================

using ErrorCode = sonata::ErrorCode;
using ErrorInfo = sonata::ErrorInfo;
using Quality = sonata::Quality;
using SynthesisMode = sonata::SynthesisMode;
using AudioInfo = sonata::AudioInfo;
using SynthesisOptions = sonata::SynthesisOptions;
using SpeechArgs = sonata::SpeechArgs;
using Utterance = sonata::Utterance;
using VoiceConfig = sonata::VoiceConfig;
using VoiceInfo = sonata::VoiceInfo;
using WaveSamples = sonata::WaveSamples;
using SynthesisResult = sonata::SynthesisResult;
using EngineConfig = sonata::EngineConfig;
using CancellationToken = sonata::CancellationToken;
using ISpeechModel = sonata::ISpeechModel;
using IVoiceLoader = sonata::IVoiceLoader;

// =============================================================================
// VoiceSynthesisOptions - 修改音色默认参数的请求
// =============================================================================

struct VoiceSynthesisOptions {
    std::string voice_id;
    SynthesisOptions synthesis_options;     ///< 仅覆盖已设置的字段
};

// =============================================================================
// SynthesisStream - 拉取式音频块流
// =============================================================================

class SynthesisStream {
public:
    /// 构造凭证, 只有 SonataEngine 能创建
    class Key {
        friend class SonataEngine;
        Key() {}
    };

    SynthesisStream(Key key, std::unique_ptr<sonata::ISynthesisStream> stream);
    ~SynthesisStream();

    // 禁止拷贝
    SynthesisStream(const SynthesisStream&) = delete;
    SynthesisStream& operator=(const SynthesisStream&) = delete;

    /// @brief 拉取下一块 (阻塞)
    /// @param chunk [out] 音频块
    /// @return false 表示流已结束, 通过 GetStatus() 查看原因
    bool Next(WaveSamples& chunk);

    /// @brief 取消合成 (可在任意线程调用)
    void Cancel();

    /// @brief 终止状态, 未结束时返回 NOT_FINISHED
    ErrorInfo GetStatus() const;

    /// @brief 是否已结束
    bool IsFinished() const;

    /// @brief 获取实时率 (最后一块交付之后可用)
    /// @param rtf [out] 合成耗时 / 语音时长
    /// @return 错误信息
    ErrorInfo GetRtf(float& rtf) const;

    /// @brief 已交付的块数
    size_t GetChunksDelivered() const;

    /// @brief 音频格式
    AudioInfo GetAudioInfo() const;

    /// @brief 合成模式
    SynthesisMode GetMode() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// =============================================================================
// SynthesisCallback - 回调接口
// =============================================================================

/**
 * @brief 流式合成回调接口 (多态基类)
 *
 * ## 回调调用链
 *
 * ```
 *   StreamingCall()
 *      │
 *      ▼
 *   OnOpen()              ← 请求校验通过, 合成开始
 *      │
 *      ▼
 *   OnChunk() × N         ← 按分段顺序, 每块一次
 *      │
 *      ▼
 *   OnComplete(rtf)       ← 正常完成 (或 OnError / OnCancelled)
 *      │
 *      ▼
 *   OnClose()             ← 无论结果如何最后都会调用
 * ```
 *
 * 请求校验失败时不调用 OnOpen, 只调用 OnError 和 OnClose。
 * 所有回调都在调用 StreamingCall 的线程中执行。
 */
class SynthesisCallback {
public:
    virtual ~SynthesisCallback() = default;

    /// @brief 合成开始
    virtual void OnOpen() {}

    /// @brief 收到一个音频块
    /// @param chunk 音频块
    virtual void OnChunk(const WaveSamples& chunk) {}

    /// @brief 合成正常完成
    /// @param rtf 实时率
    virtual void OnComplete(float rtf) {}

    /// @brief 发生错误
    /// @param error 错误信息
    virtual void OnError(const ErrorInfo& error) {}

    /// @brief 合成被取消
    virtual void OnCancelled() {}

    /// @brief 会话关闭
    virtual void OnClose() {}
};

// =============================================================================
// SonataEngine - 合成引擎
// =============================================================================

class SonataEngine {
public:
    // =========================================================================
    // 构造函数
    // =========================================================================

    /// @brief 构造合成引擎
    /// @param config 引擎配置
    /// @param loader 音色加载器, 为空时只能通过 RegisterVoice 注册音色
    explicit SonataEngine(
            const EngineConfig& config = EngineConfig::Default(),
            std::shared_ptr<IVoiceLoader> loader = nullptr);

    /// @brief 析构函数
    virtual ~SonataEngine();

    // 禁止拷贝
    SonataEngine(const SonataEngine&) = delete;
    SonataEngine& operator=(const SonataEngine&) = delete;

    // =========================================================================
    // 音色管理
    // =========================================================================

    /// @brief 获取引擎版本
    /// @param version [out] 版本号
    /// @return 错误信息
    ErrorInfo GetVersion(std::string& version) const;

    /// @brief 按注册顺序列出已加载的音色
    /// @param voices [out] 音色信息
    /// @return 错误信息
    ErrorInfo ListVoices(std::vector<VoiceInfo>& voices) const;

    /// @brief 通过加载器加载音色
    /// @param config_path 音色配置文件路径
    /// @param info [out] 音色信息
    /// @return 错误信息
    ErrorInfo LoadVoice(const std::string& config_path, VoiceInfo& info);

    /// @brief 加载目录中所有已安装的音色
    /// @param dir 音色目录, 空则使用 EngineConfig::voices_dir
    /// @param loaded [out] 成功加载的音色
    /// @return 错误信息
    ErrorInfo LoadVoicesFromDirectory(const std::string& dir, std::vector<VoiceInfo>& loaded);

    /// @brief 直接注册音色配置与模型
    /// @param config 音色配置记录
    /// @param model 已初始化的模型
    /// @param info [out] 音色信息
    /// @return 错误信息
    ErrorInfo RegisterVoice(const VoiceConfig& config,
                            std::shared_ptr<ISpeechModel> model,
                            VoiceInfo& info);

    /// @brief 卸载音色 (进行中的请求不受影响)
    /// @param voice_id 音色ID
    /// @return 错误信息
    ErrorInfo UnloadVoice(const std::string& voice_id);

    /// @brief 获取音色的默认合成参数
    ErrorInfo GetSynthesisOptions(const std::string& voice_id, SynthesisOptions& options) const;

    /// @brief 修改音色的默认合成参数
    /// @param request 音色ID与要覆盖的参数
    /// @param info [out] 修改后的音色信息
    /// @return 错误信息
    ErrorInfo SetSynthesisOptions(const VoiceSynthesisOptions& request, VoiceInfo& info);

    // =========================================================================
    // 合成
    // =========================================================================

    /// @brief 合成完整缓冲 (阻塞, 支持所有模式)
    /// @param utterance 合成请求
    /// @param result [out] 合成结果
    /// @param token 取消令牌
    /// @return 错误信息
    ErrorInfo Synthesize(const Utterance& utterance,
                         SynthesisResult& result,
                         CancellationToken token = CancellationToken());

    /// @brief 流式合成 (仅 LAZY / PARALLEL)
    /// @param utterance 合成请求
    /// @param stream [out] 音频块流
    /// @param token 取消令牌
    /// @return 错误信息
    ErrorInfo SynthesizeStreaming(const Utterance& utterance,
                                  std::unique_ptr<SynthesisStream>& stream,
                                  CancellationToken token = CancellationToken());

    /// @brief 流式合成 (回调模式, 在当前线程执行直到结束)
    /// @param utterance 合成请求
    /// @param callback 回调对象
    /// @param token 取消令牌
    /// @return 终止状态
    ErrorInfo StreamingCall(const Utterance& utterance,
                            std::shared_ptr<SynthesisCallback> callback,
                            CancellationToken token = CancellationToken());

    // =========================================================================
    // 辅助方法
    // =========================================================================

    /// @brief 将完整缓冲保存为 WAV 文件
    /// @param result 合成结果
    /// @param file_path 输出文件路径
    /// @return 错误信息
    static ErrorInfo SaveToWav(const SynthesisResult& result, const std::string& file_path);

    /// @brief 获取引擎配置
    EngineConfig GetConfig() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace Sonata

#endif  // SONATA_API_HPP
