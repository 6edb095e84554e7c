#ifndef SONATA_PIPER_VOICE_CONFIG_HPP
#define SONATA_PIPER_VOICE_CONFIG_HPP

#include <cstdint>

#include <map>
#include <string>
#include <vector>

#include "internal/sonata_types.hpp"

namespace sonata {
namespace piper {

// =============================================================================
// PiperSettings - model-specific settings from <model>.onnx.json
// =============================================================================

enum class PhonemeType {
    ESPEAK,     // phonemes produced by espeak-ng
    TEXT,       // text codepoints used as phonemes
};

struct PiperSettings {
    std::string espeak_voice = "en-us";
    PhonemeType phoneme_type = PhonemeType::ESPEAK;
    std::map<char32_t, std::vector<int64_t>> phoneme_id_map;
    std::string model_path;     // <model>.onnx
    int num_speakers = 1;
};

// Special phonemes of the Piper id layout
constexpr char32_t PHONEME_PAD = U'_';
constexpr char32_t PHONEME_BOS = U'^';
constexpr char32_t PHONEME_EOS = U'$';

// =============================================================================
// Config Parsing
// =============================================================================

/// @brief Model path for a voice config path ("x.onnx.json" -> "x.onnx")
std::string modelPathFromConfigPath(const std::string& config_path);

/// @brief Parse a Piper voice config
/// @param json_text Contents of <model>.onnx.json
/// @param config_path Path the contents were read from (used for the voice id fallback)
/// @param voice [out] Engine-side voice record
/// @param settings [out] Piper-specific settings
/// @return INVALID_CONFIG on malformed JSON or invalid fields
ErrorInfo parsePiperConfig(const std::string& json_text,
                           const std::string& config_path,
                           VoiceConfig& voice,
                           PiperSettings& settings);

/// @brief Read and parse a Piper voice config file
ErrorInfo loadPiperConfig(const std::string& config_path,
                          VoiceConfig& voice,
                          PiperSettings& settings);

}  // namespace piper
}  // namespace sonata

#endif  // SONATA_PIPER_VOICE_CONFIG_HPP
