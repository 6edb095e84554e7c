#ifndef SONATA_TESTS_FAKE_SPEECH_MODEL_HPP
#define SONATA_TESTS_FAKE_SPEECH_MODEL_HPP

#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "internal/backends/speech_model.hpp"
#include "internal/sonata_types.hpp"

namespace sonata {
namespace test_support {

// =============================================================================
// FakeSpeechModel - deterministic model for scheduler tests
// =============================================================================
//
// Each segment produces FRAMES_PER_BYTE frames per byte of text, with sample
// values derived from the text only, so identical inputs always produce
// identical audio regardless of mode or thread.
//

class FakeSpeechModel : public ISpeechModel {
public:
    static constexpr size_t FRAMES_PER_BYTE = 40;

    explicit FakeSpeechModel(const AudioInfo& audio = AudioInfo(), bool concurrency_safe = true)
        : audio_(audio)
        , concurrency_safe_(concurrency_safe) {
    }

    // -------------------------------------------------------------------------
    // Behavior knobs (set before synthesis starts)
    // -------------------------------------------------------------------------

    void setDefaultLatency(std::chrono::milliseconds latency) { default_latency_ = latency; }
    void setLatency(const std::string& text, std::chrono::milliseconds latency) { latencies_[text] = latency; }
    void failOn(const std::string& text) { failing_.insert(text); }
    void throwOn(const std::string& text) { throwing_.insert(text); }
    void silentOn(const std::string& text) { silent_.insert(text); }
    void mismatchOn(const std::string& text, const AudioInfo& audio) { mismatched_[text] = audio; }
    void setMaxTextBytes(size_t max_bytes) { max_text_bytes_ = max_bytes; }
    void setBatching(bool enabled) { batching_ = enabled; }

    // -------------------------------------------------------------------------
    // 调用记录
    // -------------------------------------------------------------------------

    int getMaxActive() const { return max_active_; }
    int getCallCount() const { return calls_; }
    int getBatchCallCount() const { return batch_calls_; }

    std::vector<std::string> getSynthesizedTexts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return texts_;
    }

    std::vector<SynthesisParams> getSeenParams() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return params_;
    }

    /// Samples the model produces for one segment
    static std::vector<float> samplesFor(const std::string& text, uint32_t num_channels) {
        std::vector<float> samples(text.size() * FRAMES_PER_BYTE * num_channels);
        for (size_t i = 0; i < samples.size(); ++i) {
            unsigned char c = static_cast<unsigned char>(text[(i / FRAMES_PER_BYTE) % text.size()]);
            samples[i] = static_cast<float>(static_cast<int>((c + i) % 64) - 32) / 64.0f;
        }
        return samples;
    }

    // -------------------------------------------------------------------------
    // ISpeechModel interface
    // -------------------------------------------------------------------------

    std::string getName() const override { return "FakeSpeechModel"; }
    AudioInfo getAudioInfo() const override { return audio_; }
    bool isConcurrencySafe() const override { return concurrency_safe_; }
    bool supportsBatching() const override { return batching_; }

    ErrorInfo synthesize(const std::string& text,
                         const SynthesisParams& params,
                         SegmentAudio& output) override {
        int active = ++active_;
        int seen = max_active_.load();
        while (active > seen && !max_active_.compare_exchange_weak(seen, active)) {
        }
        calls_++;

        ActiveGuard guard{active_};
        return render(text, params, output);
    }

    ErrorInfo synthesizeBatch(const std::vector<std::string>& texts,
                              const SynthesisParams& params,
                              std::vector<SegmentAudio>& outputs) override {
        batch_calls_++;
        outputs.clear();
        for (const auto& text : texts) {
            SegmentAudio output;
            auto err = render(text, params, output);
            if (!err.isOk()) {
                return err;
            }
            outputs.push_back(std::move(output));
        }
        return ErrorInfo::ok();
    }

private:
    struct ActiveGuard {
        std::atomic<int>& active;
        ~ActiveGuard() { active--; }
    };

    ErrorInfo render(const std::string& text, const SynthesisParams& params, SegmentAudio& output) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            texts_.push_back(text);
            params_.push_back(params);
        }

        auto latency = default_latency_;
        auto it = latencies_.find(text);
        if (it != latencies_.end()) {
            latency = it->second;
        }
        if (latency.count() > 0) {
            std::this_thread::sleep_for(latency);
        }

        if (throwing_.count(text)) {
            throw std::runtime_error("fake model crashed on: " + text);
        }
        if (failing_.count(text)) {
            return ErrorInfo::error(ErrorCode::MODEL_FAILURE, "Fake failure", text);
        }
        if (max_text_bytes_ > 0 && text.size() > max_text_bytes_) {
            return ErrorInfo::error(ErrorCode::SEGMENT_TOO_LARGE, "Fake segment too large", text);
        }

        output.audio = audio_;
        auto mismatch = mismatched_.find(text);
        if (mismatch != mismatched_.end()) {
            output.audio = mismatch->second;
        }
        if (!silent_.count(text)) {
            output.samples = samplesFor(text, output.audio.num_channels);
        }
        output.infer_seconds = static_cast<double>(latency.count()) / 1000.0;
        return ErrorInfo::ok();
    }

    AudioInfo audio_;
    bool concurrency_safe_;
    bool batching_ = false;
    size_t max_text_bytes_ = 0;
    std::chrono::milliseconds default_latency_{0};
    std::map<std::string, std::chrono::milliseconds> latencies_;
    std::set<std::string> failing_;
    std::set<std::string> throwing_;
    std::set<std::string> silent_;
    std::map<std::string, AudioInfo> mismatched_;

    std::atomic<int> active_{0};
    std::atomic<int> max_active_{0};
    std::atomic<int> calls_{0};
    std::atomic<int> batch_calls_{0};

    mutable std::mutex mutex_;
    std::vector<std::string> texts_;
    std::vector<SynthesisParams> params_;
};

// =============================================================================
// Helpers
// =============================================================================

inline VoiceConfig makeVoiceConfig(const std::string& voice_id,
                                   const AudioInfo& audio = AudioInfo(),
                                   bool supports_streaming = true) {
    VoiceConfig config;
    config.voice_id = voice_id;
    config.language = "en_US";
    config.quality = Quality::MEDIUM;
    config.audio = audio;
    config.default_options.length_scale = 1.0f;
    config.default_options.noise_scale = 0.667f;
    config.default_options.noise_w = 0.8f;
    config.supports_streaming_output = supports_streaming;
    return config;
}

}  // namespace test_support
}  // namespace sonata

#endif  // SONATA_TESTS_FAKE_SPEECH_MODEL_HPP
