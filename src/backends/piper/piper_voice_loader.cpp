#include "internal/backends/piper/piper_voice_loader.hpp"

#include <algorithm>
#include <filesystem>  // NOLINT(build/c++17)
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "internal/backends/piper/piper_model.hpp"
#include "internal/backends/piper/piper_voice_config.hpp"

namespace fs = std::filesystem;

namespace sonata {
namespace piper {

namespace {

bool endsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

ErrorInfo PiperVoiceLoader::loadVoice(const std::string& config_path,
    const EngineConfig& engine_config,
    VoiceConfig& voice,
    std::shared_ptr<ISpeechModel>& model) {
    PiperSettings settings;
    auto err = loadPiperConfig(config_path, voice, settings);
    if (!err.isOk()) {
        return err;
    }

    auto piper_model = std::make_shared<PiperModel>(voice, settings);
    err = piper_model->initialize(engine_config);
    if (!err.isOk()) {
        return err;
    }

    model = std::move(piper_model);
    return ErrorInfo::ok();
}

ErrorInfo PiperVoiceLoader::findVoices(const std::string& dir,
    std::vector<std::string>& config_paths) const {
    config_paths.clear();

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return ErrorInfo::error(ErrorCode::MODEL_NOT_FOUND, "Voices directory not found", dir);
    }

    std::vector<std::pair<std::string, std::string>> found;  // (voice key, config path)
    try {
        for (const auto& entry : fs::directory_iterator(dir)) {
            if (!entry.is_directory()) {
                continue;
            }
            std::string key = entry.path().filename().string();
            if (!isVoiceDirectoryName(key)) {
                continue;
            }

            // First config file in the directory
            std::vector<std::string> configs;
            for (const auto& file : fs::directory_iterator(entry.path())) {
                std::string name = file.path().filename().string();
                if (file.is_regular_file() && endsWith(name, ".onnx.json")) {
                    configs.push_back(file.path().string());
                }
            }
            if (configs.empty()) {
                std::cerr << "[PiperVoiceLoader] No voice config in " << entry.path().string() << std::endl;
                continue;
            }
            std::sort(configs.begin(), configs.end());
            found.emplace_back(key, configs.front());
        }
    } catch (const fs::filesystem_error& e) {
        return ErrorInfo::error(ErrorCode::MODEL_NOT_FOUND, "Failed to scan voices directory",
            dir + ": " + e.what());
    }

    std::sort(found.begin(), found.end());
    for (auto& item : found) {
        config_paths.push_back(std::move(item.second));
    }
    return ErrorInfo::ok();
}

bool PiperVoiceLoader::isVoiceDirectoryName(const std::string& name) {
    size_t first = name.find('-');
    if (first == std::string::npos || first == 0) {
        return false;
    }
    size_t second = name.find('-', first + 1);
    if (second == std::string::npos || second == first + 1 || second + 1 >= name.size()) {
        return false;
    }
    return name.find('-', second + 1) == std::string::npos;
}

}  // namespace piper
}  // namespace sonata
