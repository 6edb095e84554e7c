#include "internal/backends/piper/piper_voice_config.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>  // NOLINT(build/c++17)
#include <fstream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "internal/text/text_utils.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace sonata {
namespace piper {

namespace {

constexpr uint32_t DEFAULT_SAMPLE_RATE = 22050;
constexpr float DEFAULT_NOISE_SCALE = 0.667f;
constexpr float DEFAULT_LENGTH_SCALE = 1.0f;
constexpr float DEFAULT_NOISE_W = 0.8f;

// Marker in a voice name for models exported for real-time streaming
constexpr const char* STREAMING_MARKER = "+RT";

/// File name without ".onnx.json" / ".json"
std::string voiceStem(const std::string& config_path) {
    std::string name = fs::path(modelPathFromConfigPath(config_path)).filename().string();
    const std::string onnx = ".onnx";
    if (name.size() > onnx.size() && name.compare(name.size() - onnx.size(), onnx.size(), onnx) == 0) {
        name.resize(name.size() - onnx.size());
    }
    return name;
}

ErrorInfo parseSpeakers(const json& root, VoiceConfig& voice, PiperSettings& settings) {
    settings.num_speakers = root.value("num_speakers", 1);

    // {"speaker_id_map": {"<name>": <id>, ...}}
    if (root.contains("speaker_id_map") && root["speaker_id_map"].is_object()) {
        for (auto& item : root["speaker_id_map"].items()) {
            int64_t id = item.value().get<int64_t>();
            if (!voice.speakers.emplace(id, item.key()).second) {
                return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Duplicate speaker id",
                    "id=" + std::to_string(id) + " name=" + item.key());
            }
        }
    }

    // Multi-speaker model without names: speakers are addressed by index
    if (voice.speakers.empty() && settings.num_speakers > 1) {
        for (int i = 0; i < settings.num_speakers; ++i) {
            voice.speakers.emplace(i, std::to_string(i));
        }
    }
    return ErrorInfo::ok();
}

ErrorInfo parsePhonemeIdMap(const json& root, PiperSettings& settings) {
    // {"phoneme_id_map": {"<phoneme>": [<id1>, <id2>, ...]}}
    if (!root.contains("phoneme_id_map") || !root["phoneme_id_map"].is_object()) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Missing phoneme_id_map");
    }

    for (auto& item : root["phoneme_id_map"].items()) {
        std::u32string phoneme = text::decodeUtf8(item.key());
        if (phoneme.size() != 1) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "Phonemes must be one codepoint (phoneme id map)", item.key());
        }
        auto& ids = settings.phoneme_id_map[phoneme[0]];
        for (auto& id : item.value()) {
            ids.push_back(id.get<int64_t>());
        }
    }

    if (settings.phoneme_id_map.find(PHONEME_PAD) == settings.phoneme_id_map.end()) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "phoneme_id_map has no pad phoneme");
    }
    return ErrorInfo::ok();
}

}  // namespace

std::string modelPathFromConfigPath(const std::string& config_path) {
    const std::string suffix = ".json";
    if (config_path.size() > suffix.size() &&
        config_path.compare(config_path.size() - suffix.size(), suffix.size(), suffix) == 0) {
        return config_path.substr(0, config_path.size() - suffix.size());
    }
    return config_path;
}

ErrorInfo parsePiperConfig(const std::string& json_text,
    const std::string& config_path,
    VoiceConfig& voice,
    PiperSettings& settings) {
    voice = VoiceConfig();
    settings = PiperSettings();
    settings.model_path = modelPathFromConfigPath(config_path);
    voice.config_path = config_path;

    try {
        json root = json::parse(json_text);
        if (!root.is_object()) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Voice config is not a JSON object", config_path);
        }

        // audio
        voice.audio.sample_rate = DEFAULT_SAMPLE_RATE;
        voice.audio.num_channels = 1;
        voice.audio.sample_width = 2;
        voice.quality = Quality::MEDIUM;
        if (root.contains("audio")) {
            const auto& audio = root["audio"];
            voice.audio.sample_rate = audio.value("sample_rate", DEFAULT_SAMPLE_RATE);
            if (audio.contains("quality") && audio["quality"].is_string()) {
                auto err = parseQuality(audio["quality"].get<std::string>(), voice.quality);
                if (!err.isOk()) {
                    return ErrorInfo::error(ErrorCode::INVALID_CONFIG, err.message, config_path);
                }
            }
        }

        // espeak / phonemes
        if (root.contains("espeak") && root["espeak"].contains("voice")) {
            settings.espeak_voice = root["espeak"]["voice"].get<std::string>();
        }
        if (root.value("phoneme_type", std::string("espeak")) == "text") {
            settings.phoneme_type = PhonemeType::TEXT;
        }
        auto err = parsePhonemeIdMap(root, settings);
        if (!err.isOk()) {
            err.detail = config_path;
            return err;
        }

        // inference defaults
        SynthesisOptions defaults;
        defaults.noise_scale = DEFAULT_NOISE_SCALE;
        defaults.length_scale = DEFAULT_LENGTH_SCALE;
        defaults.noise_w = DEFAULT_NOISE_W;
        if (root.contains("inference")) {
            const auto& inference = root["inference"];
            defaults.noise_scale = inference.value("noise_scale", DEFAULT_NOISE_SCALE);
            defaults.length_scale = inference.value("length_scale", DEFAULT_LENGTH_SCALE);
            defaults.noise_w = inference.value("noise_w", DEFAULT_NOISE_W);
        }

        err = parseSpeakers(root, voice, settings);
        if (!err.isOk()) {
            return err;
        }
        if (!voice.speakers.empty()) {
            defaults.speaker = voice.speakers.begin()->second;
        }
        voice.default_options = defaults;

        // voice id: <language>-<dataset>-<quality>, else the file name
        std::string language;
        if (root.contains("language") && root["language"].contains("code")) {
            language = root["language"]["code"].get<std::string>();
        }
        std::string dataset = root.value("dataset", std::string());
        voice.language = language;
        if (!language.empty() && !dataset.empty()) {
            std::string quality = qualityToString(voice.quality);
            voice.voice_id = language + "-" + dataset + "-" + quality;
        } else {
            voice.voice_id = voiceStem(config_path);
        }

        voice.supports_streaming_output = root.value("streaming", false) ||
            voiceStem(config_path).find(STREAMING_MARKER) != std::string::npos;
    } catch (const json::exception& e) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
            std::string("Failed to parse voice config: ") + e.what(), config_path);
    }

    return voice.validate();
}

ErrorInfo loadPiperConfig(const std::string& config_path,
    VoiceConfig& voice,
    PiperSettings& settings) {
    std::ifstream file(config_path);
    if (!file) {
        return ErrorInfo::error(ErrorCode::MODEL_NOT_FOUND, "Voice config not found", config_path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parsePiperConfig(buffer.str(), config_path, voice, settings);
}

}  // namespace piper
}  // namespace sonata
