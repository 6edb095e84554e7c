#ifndef SONATA_VOICE_REGISTRY_HPP
#define SONATA_VOICE_REGISTRY_HPP

#include <cstddef>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/backends/speech_model.hpp"
#include "internal/sonata_types.hpp"
#include "internal/voice/model_gate.hpp"

namespace sonata {

// =============================================================================
// ResolvedVoice (解析结果 - 请求期间持有的不可变快照)
// =============================================================================

struct ResolvedVoice {
    std::shared_ptr<const VoiceConfig> voice;
    std::shared_ptr<ModelGate> model;
    SynthesisParams params;             ///< 合并后的有效参数 (韵律字段未填)
};

// =============================================================================
// VoiceRegistry (音色注册表)
// =============================================================================
//
// 维护已加载的音色, 并将请求中的音色ID解析为具体音色与合并后的参数。
//
// 注册后的 VoiceConfig 不可变; 修改默认参数或重新加载时整体替换快照,
// 正在进行的请求继续使用旧快照。
//

class VoiceRegistry {
public:
    /// 单说话人模型接受的说话人名称
    static constexpr const char* FALLBACK_SPEAKER_NAME = "default";

    VoiceRegistry() = default;

    // 禁止拷贝
    VoiceRegistry(const VoiceRegistry&) = delete;
    VoiceRegistry& operator=(const VoiceRegistry&) = delete;

    // -------------------------------------------------------------------------
    // 注册 / 注销
    // -------------------------------------------------------------------------

    /// @brief 注册音色 (同ID的音色被替换, 保留原注册位置)
    /// @param config 音色配置记录 (concurrency_safe 以模型查询结果为准)
    /// @param model 已初始化的模型
    /// @param info [out] 注册后的音色信息
    /// @return 错误信息
    ErrorInfo registerVoice(const VoiceConfig& config,
                            std::shared_ptr<ISpeechModel> model,
                            VoiceInfo& info);

    /// @brief 注销音色
    ErrorInfo unregisterVoice(const std::string& voice_id);

    // -------------------------------------------------------------------------
    // 查询
    // -------------------------------------------------------------------------

    /// @brief 解析音色并合并参数
    /// @param voice_id 音色ID
    /// @param overrides 请求级参数覆盖 (可选)
    /// @param resolved [out] 音色快照、模型与有效参数
    /// @return VOICE_NOT_FOUND / INVALID_OPTIONS
    ErrorInfo resolve(const std::string& voice_id,
                      const std::optional<SynthesisOptions>& overrides,
                      ResolvedVoice& resolved) const;

    /// @brief 按注册顺序列出音色
    std::vector<std::shared_ptr<const VoiceConfig>> list() const;

    /// @brief 获取音色的默认合成参数
    ErrorInfo getSynthesisOptions(const std::string& voice_id, SynthesisOptions& options) const;

    /// @brief 设置音色的默认合成参数 (仅覆盖已设置字段)
    ErrorInfo setSynthesisOptions(const std::string& voice_id,
                                  const SynthesisOptions& options,
                                  VoiceInfo& info);

    bool contains(const std::string& voice_id) const;
    size_t size() const;

    // -------------------------------------------------------------------------
    // 工具方法
    // -------------------------------------------------------------------------

    /// @brief 将说话人名称或索引解析为说话人ID
    /// @param voice 音色配置
    /// @param speaker 说话人名称或十进制索引 (未设置时取最小索引)
    /// @param params [out] 写入 speaker_id 与 speaker_name
    /// @return 未知说话人返回 INVALID_OPTIONS
    static ErrorInfo resolveSpeaker(const VoiceConfig& voice,
                                    const std::optional<std::string>& speaker,
                                    SynthesisParams& params);

private:
    struct Entry {
        std::shared_ptr<const VoiceConfig> config;
        std::shared_ptr<ModelGate> model;
    };

    mutable std::mutex mutex_;
    std::vector<std::string> order_;
    std::unordered_map<std::string, Entry> voices_;
};

}  // namespace sonata

#endif  // SONATA_VOICE_REGISTRY_HPP
