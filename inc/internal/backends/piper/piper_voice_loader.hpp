#ifndef SONATA_PIPER_VOICE_LOADER_HPP
#define SONATA_PIPER_VOICE_LOADER_HPP

#include <memory>
#include <string>
#include <vector>

#include "internal/backends/speech_model.hpp"

namespace sonata {
namespace piper {

// =============================================================================
// PiperVoiceLoader - loads <model>.onnx + <model>.onnx.json voices
// =============================================================================
//
// Installed voices live in one directory per voice, named
// <language>-<name>-<quality> (e.g. en_US-amy-medium), each holding
// a model and its config.
//

class PiperVoiceLoader : public IVoiceLoader {
public:
    PiperVoiceLoader() = default;

    ErrorInfo loadVoice(const std::string& config_path,
                        const EngineConfig& engine_config,
                        VoiceConfig& voice,
                        std::shared_ptr<ISpeechModel>& model) override;

    ErrorInfo findVoices(const std::string& dir,
                         std::vector<std::string>& config_paths) const override;

    /// @brief Whether a directory name follows <language>-<name>-<quality>
    static bool isVoiceDirectoryName(const std::string& name);
};

}  // namespace piper
}  // namespace sonata

#endif  // SONATA_PIPER_VOICE_LOADER_HPP
