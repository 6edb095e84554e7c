#include "internal/voice/voice_registry.hpp"

#include <cctype>
#include <cstdint>

#include <algorithm>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sonata {

namespace {

bool isDecimal(const std::string& s) {
    if (s.empty() || s.size() > 18) return false;
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

}  // namespace

// =============================================================================
// 注册 / 注销
// =============================================================================

ErrorInfo VoiceRegistry::registerVoice(const VoiceConfig& config,
    std::shared_ptr<ISpeechModel> model,
    VoiceInfo& info) {
    if (!model) {
        return ErrorInfo::error(ErrorCode::MODEL_NOT_FOUND, "No model for voice", config.voice_id);
    }

    auto err = config.validate();
    if (!err.isOk()) {
        return err;
    }

    if (config.audio != model->getAudioInfo()) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
            "Voice audio info does not match model output", config.voice_id);
    }

    // 默认说话人必须可解析
    SynthesisParams scratch;
    err = resolveSpeaker(config, config.default_options.speaker, scratch);
    if (!err.isOk()) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG, err.message, config.voice_id);
    }

    auto record = std::make_shared<VoiceConfig>(config);
    record->concurrency_safe = model->isConcurrencySafe();

    auto gate = std::make_shared<ModelGate>(std::move(model), record->concurrency_safe);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = voices_.find(record->voice_id);
        if (it == voices_.end()) {
            order_.push_back(record->voice_id);
        }
        voices_[record->voice_id] = Entry{record, gate};
    }

    std::cout << "[VoiceRegistry] Registered voice: " << record->voice_id
              << " (" << record->audio.sample_rate << "Hz, "
              << record->speakers.size() << " speakers, "
              << (record->concurrency_safe ? "concurrent" : "serialized")
              << (record->supports_streaming_output ? ", streaming" : "")
              << ")" << std::endl;

    info = VoiceInfo::fromConfig(*record);
    return ErrorInfo::ok();
}

ErrorInfo VoiceRegistry::unregisterVoice(const std::string& voice_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = voices_.find(voice_id);
    if (it == voices_.end()) {
        return ErrorInfo::error(ErrorCode::VOICE_NOT_FOUND, "Voice not found", voice_id);
    }
    voices_.erase(it);
    order_.erase(std::remove(order_.begin(), order_.end(), voice_id), order_.end());
    return ErrorInfo::ok();
}

// =============================================================================
// 查询
// =============================================================================

ErrorInfo VoiceRegistry::resolve(const std::string& voice_id,
    const std::optional<SynthesisOptions>& overrides,
    ResolvedVoice& resolved) const {
    Entry entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = voices_.find(voice_id);
        if (it == voices_.end()) {
            return ErrorInfo::error(ErrorCode::VOICE_NOT_FOUND, "Voice not found", voice_id);
        }
        entry = it->second;
    }

    SynthesisOptions effective = entry.config->default_options;
    if (overrides) {
        auto err = overrides->validate();
        if (!err.isOk()) {
            return err;
        }
        effective = effective.mergedWith(*overrides);
    }

    SynthesisParams params;
    auto err = resolveSpeaker(*entry.config, effective.speaker, params);
    if (!err.isOk()) {
        return err;
    }
    params.length_scale = *effective.length_scale;
    params.noise_scale = *effective.noise_scale;
    params.noise_w = *effective.noise_w;

    resolved.voice = entry.config;
    resolved.model = entry.model;
    resolved.params = params;
    return ErrorInfo::ok();
}

std::vector<std::shared_ptr<const VoiceConfig>> VoiceRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<const VoiceConfig>> result;
    result.reserve(order_.size());
    for (const auto& id : order_) {
        result.push_back(voices_.at(id).config);
    }
    return result;
}

ErrorInfo VoiceRegistry::getSynthesisOptions(const std::string& voice_id,
    SynthesisOptions& options) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = voices_.find(voice_id);
    if (it == voices_.end()) {
        return ErrorInfo::error(ErrorCode::VOICE_NOT_FOUND, "Voice not found", voice_id);
    }
    options = it->second.config->default_options;
    return ErrorInfo::ok();
}

ErrorInfo VoiceRegistry::setSynthesisOptions(const std::string& voice_id,
    const SynthesisOptions& options,
    VoiceInfo& info) {
    auto err = options.validate();
    if (!err.isOk()) {
        return err;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = voices_.find(voice_id);
    if (it == voices_.end()) {
        return ErrorInfo::error(ErrorCode::VOICE_NOT_FOUND, "Voice not found", voice_id);
    }

    // 新快照整体替换旧快照
    auto record = std::make_shared<VoiceConfig>(*it->second.config);
    record->default_options = record->default_options.mergedWith(options);

    SynthesisParams scratch;
    err = resolveSpeaker(*record, record->default_options.speaker, scratch);
    if (!err.isOk()) {
        return err;
    }

    it->second.config = record;
    info = VoiceInfo::fromConfig(*record);
    return ErrorInfo::ok();
}

bool VoiceRegistry::contains(const std::string& voice_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return voices_.count(voice_id) > 0;
}

size_t VoiceRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return voices_.size();
}

// =============================================================================
// 工具方法
// =============================================================================

ErrorInfo VoiceRegistry::resolveSpeaker(const VoiceConfig& voice,
    const std::optional<std::string>& speaker,
    SynthesisParams& params) {
    params.speaker_id.reset();
    params.speaker_name.clear();

    if (voice.speakers.empty()) {
        // 单说话人模型
        if (speaker && !speaker->empty() && *speaker != FALLBACK_SPEAKER_NAME && *speaker != "0") {
            return ErrorInfo::error(ErrorCode::INVALID_OPTIONS,
                "Voice has a single speaker", "speaker=" + *speaker);
        }
        params.speaker_name = FALLBACK_SPEAKER_NAME;
        return ErrorInfo::ok();
    }

    if (!speaker || speaker->empty()) {
        const auto& first = *voice.speakers.begin();
        params.speaker_id = first.first;
        params.speaker_name = first.second;
        return ErrorInfo::ok();
    }

    for (const auto& [id, name] : voice.speakers) {
        if (name == *speaker) {
            params.speaker_id = id;
            params.speaker_name = name;
            return ErrorInfo::ok();
        }
    }

    if (isDecimal(*speaker)) {
        int64_t id = std::stoll(*speaker);
        auto it = voice.speakers.find(id);
        if (it != voice.speakers.end()) {
            params.speaker_id = it->first;
            params.speaker_name = it->second;
            return ErrorInfo::ok();
        }
    }

    return ErrorInfo::error(ErrorCode::INVALID_OPTIONS, "Unknown speaker",
        "speaker=" + *speaker + " voice=" + voice.voice_id);
}

}  // namespace sonata
