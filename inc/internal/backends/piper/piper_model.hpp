#ifndef SONATA_PIPER_MODEL_HPP
#define SONATA_PIPER_MODEL_HPP

#include <onnxruntime_cxx_api.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/backends/piper/piper_phonemizer.hpp"
#include "internal/backends/piper/piper_voice_config.hpp"
#include "internal/backends/speech_model.hpp"

namespace sonata {
namespace piper {

// =============================================================================
// PiperModel - Piper VITS voice (ONNX Runtime)
// =============================================================================
//
// Input:  input [1, n] + input_lengths [1] + scales [3] (+ sid [1])
// Output: output [1, 1, samples] float waveform
//
// Session::Run is thread-safe, so one model serves concurrent segments
// without locking.
//

class PiperModel : public ISpeechModel {
public:
    PiperModel(const VoiceConfig& voice, const PiperSettings& settings);
    ~PiperModel() override;

    /// @brief Create the ONNX session and optionally warm it up
    ErrorInfo initialize(const EngineConfig& config);

    // -------------------------------------------------------------------------
    // ISpeechModel interface
    // -------------------------------------------------------------------------

    std::string getName() const override;
    AudioInfo getAudioInfo() const override;
    bool isConcurrencySafe() const override { return true; }

    ErrorInfo synthesize(const std::string& text,
                         const SynthesisParams& params,
                         SegmentAudio& output) override;

private:
    /// @brief Run ONNX inference on phoneme ids
    std::vector<float> runInference(const std::vector<int64_t>& phoneme_ids,
                                    const SynthesisParams& params);

    VoiceConfig voice_;
    PiperSettings settings_;
    std::unique_ptr<PiperPhonemizer> phonemizer_;

    // ONNX Runtime
    std::unique_ptr<Ort::Env> env_;
    std::unique_ptr<Ort::Session> session_;

    bool initialized_ = false;
};

}  // namespace piper
}  // namespace sonata

#endif  // SONATA_PIPER_MODEL_HPP
