#include "internal/sonata_types.hpp"

#include <cmath>
#include <cstdint>

#include <string>

namespace sonata {

// =============================================================================
// Quality
// =============================================================================

ErrorInfo parseQuality(const std::string& str, Quality& quality) {
    if (str == "x_low" || str == "x-low") {
        quality = Quality::X_LOW;
    } else if (str == "low") {
        quality = Quality::LOW;
    } else if (str == "medium") {
        quality = Quality::MEDIUM;
    } else if (str == "high") {
        quality = Quality::HIGH;
    } else {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Unknown voice quality", str);
    }
    return ErrorInfo::ok();
}

ErrorInfo qualityFromWire(int32_t value, Quality& quality) {
    switch (value) {
        case 1: quality = Quality::X_LOW;  return ErrorInfo::ok();
        case 2: quality = Quality::LOW;    return ErrorInfo::ok();
        case 3: quality = Quality::MEDIUM; return ErrorInfo::ok();
        case 4: quality = Quality::HIGH;   return ErrorInfo::ok();
        default:
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Unspecified or unknown quality",
                "value=" + std::to_string(value));
    }
}

int32_t qualityToWire(Quality quality) {
    switch (quality) {
        case Quality::X_LOW:  return 1;
        case Quality::LOW:    return 2;
        case Quality::MEDIUM: return 3;
        case Quality::HIGH:   return 4;
        default:              return 0;
    }
}

// =============================================================================
// Synthesis Mode
// =============================================================================

ErrorInfo parseSynthesisMode(const std::string& str, SynthesisMode& mode) {
    if (str == "lazy") {
        mode = SynthesisMode::LAZY;
    } else if (str == "parallel") {
        mode = SynthesisMode::PARALLEL;
    } else if (str == "batched") {
        mode = SynthesisMode::BATCHED;
    } else {
        return ErrorInfo::error(ErrorCode::INVALID_MODE, "Unknown synthesis mode", str);
    }
    return ErrorInfo::ok();
}

ErrorInfo synthesisModeFromWire(int32_t value, SynthesisMode& mode) {
    switch (value) {
        case 1: mode = SynthesisMode::LAZY;     return ErrorInfo::ok();
        case 2: mode = SynthesisMode::PARALLEL; return ErrorInfo::ok();
        case 3: mode = SynthesisMode::BATCHED;  return ErrorInfo::ok();
        default:
            return ErrorInfo::error(ErrorCode::INVALID_MODE, "Unspecified or unknown synthesis mode",
                "value=" + std::to_string(value));
    }
}

int32_t synthesisModeToWire(SynthesisMode mode) {
    switch (mode) {
        case SynthesisMode::LAZY:     return 1;
        case SynthesisMode::PARALLEL: return 2;
        case SynthesisMode::BATCHED:  return 3;
        default:                      return 0;
    }
}

// =============================================================================
// Synthesis Options
// =============================================================================

ErrorInfo SynthesisOptions::validate() const {
    if (length_scale) {
        if (!std::isfinite(*length_scale) || *length_scale <= 0.0f) {
            return ErrorInfo::error(ErrorCode::INVALID_OPTIONS, "length_scale must be > 0",
                "length_scale=" + std::to_string(*length_scale));
        }
    }
    if (noise_scale) {
        if (!std::isfinite(*noise_scale) || *noise_scale < 0.0f) {
            return ErrorInfo::error(ErrorCode::INVALID_OPTIONS, "noise_scale must be >= 0",
                "noise_scale=" + std::to_string(*noise_scale));
        }
    }
    if (noise_w) {
        if (!std::isfinite(*noise_w) || *noise_w < 0.0f) {
            return ErrorInfo::error(ErrorCode::INVALID_OPTIONS, "noise_w must be >= 0",
                "noise_w=" + std::to_string(*noise_w));
        }
    }
    return ErrorInfo::ok();
}

SynthesisOptions SynthesisOptions::mergedWith(const SynthesisOptions& overrides) const {
    SynthesisOptions merged = *this;
    if (overrides.speaker) merged.speaker = overrides.speaker;
    if (overrides.length_scale) merged.length_scale = overrides.length_scale;
    if (overrides.noise_scale) merged.noise_scale = overrides.noise_scale;
    if (overrides.noise_w) merged.noise_w = overrides.noise_w;
    return merged;
}

// =============================================================================
// Speech Args
// =============================================================================

float SpeechArgs::speechSpeed() const {
    // rate 0 -> 0.5x, 50 -> 1.0x, 100 -> 2.0x
    return std::pow(2.0f, (static_cast<float>(rate) - 50.0f) / 50.0f);
}

float SpeechArgs::pitchFactor() const {
    // pitch 0 -> 0.707x, 50 -> 1.0x, 100 -> 1.414x
    return std::pow(2.0f, (static_cast<float>(pitch) - 50.0f) / 100.0f);
}

// =============================================================================
// Voice Config
// =============================================================================

ErrorInfo VoiceConfig::validate() const {
    if (voice_id.empty()) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Voice id is empty", config_path);
    }
    if (!audio.isValid()) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Invalid audio info",
            "sample_rate=" + std::to_string(audio.sample_rate) +
            " channels=" + std::to_string(audio.num_channels) +
            " width=" + std::to_string(audio.sample_width));
    }
    if (!default_options.length_scale || !default_options.noise_scale || !default_options.noise_w) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
            "Default synthesis options must be fully populated", voice_id);
    }
    auto err = default_options.validate();
    if (!err.isOk()) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG, err.message, voice_id);
    }
    return ErrorInfo::ok();
}

}  // namespace sonata
