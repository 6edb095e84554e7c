#include "sonata_api.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "internal/audio/audio_processor.hpp"
#include "internal/scheduler/synthesis_scheduler.hpp"
#include "internal/scheduler/synthesis_stream.hpp"
#include "internal/text/text_utils.hpp"
#include "internal/voice/voice_registry.hpp"

#ifndef SONATA_VERSION
#define SONATA_VERSION "0.0.0"
#endif

namespace Sonata {

// =============================================================================
// SynthesisStream 实现
// =============================================================================

struct SynthesisStream::Impl {
    std::unique_ptr<sonata::ISynthesisStream> stream;
};

SynthesisStream::SynthesisStream(Key, std::unique_ptr<sonata::ISynthesisStream> stream)
    : impl_(std::make_unique<Impl>()) {
    impl_->stream = std::move(stream);
}

SynthesisStream::~SynthesisStream() = default;

bool SynthesisStream::Next(WaveSamples& chunk) {
    return impl_->stream->next(chunk);
}

void SynthesisStream::Cancel() {
    impl_->stream->cancel();
}

ErrorInfo SynthesisStream::GetStatus() const {
    return impl_->stream->getStatus();
}

bool SynthesisStream::IsFinished() const {
    return impl_->stream->isFinished();
}

ErrorInfo SynthesisStream::GetRtf(float& rtf) const {
    return impl_->stream->getRtf(rtf);
}

size_t SynthesisStream::GetChunksDelivered() const {
    return impl_->stream->getChunksDelivered();
}

AudioInfo SynthesisStream::GetAudioInfo() const {
    return impl_->stream->getAudioInfo();
}

SynthesisMode SynthesisStream::GetMode() const {
    return impl_->stream->getMode();
}

// =============================================================================
// SonataEngine 实现
// =============================================================================

struct SonataEngine::Impl {
    EngineConfig config;
    std::shared_ptr<IVoiceLoader> loader;
    sonata::VoiceRegistry registry;
    std::unique_ptr<sonata::SynthesisScheduler> scheduler;

    /// 校验请求并构造合成任务 (不调用模型)
    ErrorInfo prepareJob(const Utterance& utterance,
                         const CancellationToken& token,
                         sonata::SynthesisJob& job) const;
};

ErrorInfo SonataEngine::Impl::prepareJob(const Utterance& utterance,
    const CancellationToken& token,
    sonata::SynthesisJob& job) const {
    if (sonata::text::isBlank(utterance.text)) {
        return ErrorInfo::error(ErrorCode::INVALID_TEXT, "Text is empty");
    }

    auto err = utterance.speech_args.validate();
    if (!err.isOk()) {
        return err;
    }

    if (!utterance.mode) {
        return ErrorInfo::error(ErrorCode::INVALID_MODE, "Synthesis mode not specified");
    }

    sonata::ResolvedVoice resolved;
    err = registry.resolve(utterance.voice_id, utterance.synthesis_options, resolved);
    if (!err.isOk()) {
        return err;
    }

    job.voice = resolved.voice;
    job.model = resolved.model;
    job.params = resolved.params;
    job.params.speech_speed = utterance.speech_args.speechSpeed();
    job.params.pitch_factor = utterance.speech_args.pitchFactor();
    job.speech_args = utterance.speech_args;
    job.mode = *utterance.mode;
    job.text = utterance.text;
    job.token = token;
    job.verbose = config.verbose;
    return ErrorInfo::ok();
}

SonataEngine::SonataEngine(const EngineConfig& config, std::shared_ptr<IVoiceLoader> loader)
    : impl_(std::make_unique<Impl>()) {
    impl_->config = config;
    impl_->loader = std::move(loader);

    auto err = config.validate();
    if (!err.isOk()) {
        std::cerr << "[SonataEngine] Invalid config, using defaults: " << err.toString() << std::endl;
        impl_->config = EngineConfig::Default();
        impl_->config.voices_dir = config.voices_dir;
        impl_->config.espeak_data_dir = config.espeak_data_dir;
        impl_->config.verbose = config.verbose;
    }

    impl_->scheduler = std::make_unique<sonata::SynthesisScheduler>(impl_->config);
}

SonataEngine::~SonataEngine() = default;

// =============================================================================
// 音色管理
// =============================================================================

ErrorInfo SonataEngine::GetVersion(std::string& version) const {
    version = SONATA_VERSION;
    return ErrorInfo::ok();
}

ErrorInfo SonataEngine::ListVoices(std::vector<VoiceInfo>& voices) const {
    voices.clear();
    for (const auto& config : impl_->registry.list()) {
        voices.push_back(VoiceInfo::fromConfig(*config));
    }
    return ErrorInfo::ok();
}

ErrorInfo SonataEngine::LoadVoice(const std::string& config_path, VoiceInfo& info) {
    if (!impl_->loader) {
        return ErrorInfo::error(ErrorCode::MODEL_NOT_FOUND, "No voice loader configured", config_path);
    }

    VoiceConfig voice;
    std::shared_ptr<ISpeechModel> model;
    auto err = impl_->loader->loadVoice(EngineConfig::expandPath(config_path), impl_->config, voice, model);
    if (!err.isOk()) {
        std::cerr << "[SonataEngine] Failed to load voice " << config_path << ": "
                  << err.toString() << std::endl;
        return err;
    }

    return impl_->registry.registerVoice(voice, std::move(model), info);
}

ErrorInfo SonataEngine::LoadVoicesFromDirectory(const std::string& dir, std::vector<VoiceInfo>& loaded) {
    loaded.clear();
    if (!impl_->loader) {
        return ErrorInfo::error(ErrorCode::MODEL_NOT_FOUND, "No voice loader configured", dir);
    }

    std::string voices_dir = dir.empty() ? impl_->config.getExpandedVoicesDir() : EngineConfig::expandPath(dir);
    if (voices_dir.empty()) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Voices directory not set");
    }

    std::vector<std::string> config_paths;
    auto err = impl_->loader->findVoices(voices_dir, config_paths);
    if (!err.isOk()) {
        return err;
    }

    // 单个音色加载失败不影响其他音色
    ErrorInfo first_error = ErrorInfo::ok();
    for (const auto& path : config_paths) {
        VoiceInfo info;
        err = LoadVoice(path, info);
        if (err.isOk()) {
            loaded.push_back(info);
        } else if (first_error.isOk()) {
            first_error = err;
        }
    }

    std::cout << "[SonataEngine] Loaded " << loaded.size() << "/" << config_paths.size()
              << " voices from " << voices_dir << std::endl;

    if (loaded.empty() && !first_error.isOk()) {
        return first_error;
    }
    return ErrorInfo::ok();
}

ErrorInfo SonataEngine::RegisterVoice(const VoiceConfig& config,
    std::shared_ptr<ISpeechModel> model,
    VoiceInfo& info) {
    return impl_->registry.registerVoice(config, std::move(model), info);
}

ErrorInfo SonataEngine::UnloadVoice(const std::string& voice_id) {
    return impl_->registry.unregisterVoice(voice_id);
}

ErrorInfo SonataEngine::GetSynthesisOptions(const std::string& voice_id, SynthesisOptions& options) const {
    return impl_->registry.getSynthesisOptions(voice_id, options);
}

ErrorInfo SonataEngine::SetSynthesisOptions(const VoiceSynthesisOptions& request, VoiceInfo& info) {
    return impl_->registry.setSynthesisOptions(request.voice_id, request.synthesis_options, info);
}

// =============================================================================
// 合成
// =============================================================================

ErrorInfo SonataEngine::Synthesize(const Utterance& utterance,
    SynthesisResult& result,
    CancellationToken token) {
    sonata::SynthesisJob job;
    auto err = impl_->prepareJob(utterance, token, job);
    if (!err.isOk()) {
        return err;
    }
    return impl_->scheduler->synthesize(std::move(job), result);
}

ErrorInfo SonataEngine::SynthesizeStreaming(const Utterance& utterance,
    std::unique_ptr<SynthesisStream>& stream,
    CancellationToken token) {
    sonata::SynthesisJob job;
    auto err = impl_->prepareJob(utterance, token, job);
    if (!err.isOk()) {
        return err;
    }

    std::unique_ptr<sonata::ISynthesisStream> inner;
    err = impl_->scheduler->openStream(std::move(job), inner);
    if (!err.isOk()) {
        return err;
    }

    stream = std::make_unique<SynthesisStream>(SynthesisStream::Key(), std::move(inner));
    return ErrorInfo::ok();
}

ErrorInfo SonataEngine::StreamingCall(const Utterance& utterance,
    std::shared_ptr<SynthesisCallback> callback,
    CancellationToken token) {
    std::unique_ptr<SynthesisStream> stream;
    auto err = SynthesizeStreaming(utterance, stream, token);
    if (!err.isOk()) {
        if (callback) {
            callback->OnError(err);
            callback->OnClose();
        }
        return err;
    }

    if (callback) {
        callback->OnOpen();
    }

    WaveSamples chunk;
    while (stream->Next(chunk)) {
        if (callback) {
            callback->OnChunk(chunk);
        }
    }

    auto status = stream->GetStatus();
    float rtf = 0.0f;
    if (status.isOk()) {
        status = stream->GetRtf(rtf);
    }

    if (callback) {
        if (status.isOk()) {
            callback->OnComplete(rtf);
        } else if (status.isCancelled()) {
            callback->OnCancelled();
        } else {
            callback->OnError(status);
        }
        callback->OnClose();
    }
    return status;
}

// =============================================================================
// 辅助方法
// =============================================================================

ErrorInfo SonataEngine::SaveToWav(const SynthesisResult& result, const std::string& file_path) {
    return sonata::audio::writeWavFile(file_path, result.wav_samples, result.audio);
}

EngineConfig SonataEngine::GetConfig() const {
    return impl_->config;
}

}  // namespace Sonata
