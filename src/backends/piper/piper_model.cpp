#include "internal/backends/piper/piper_model.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <chrono>
#include <cstdint>
#include <filesystem>  // NOLINT(build/c++17)
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "internal/audio/audio_processor.hpp"

namespace fs = std::filesystem;

namespace sonata {
namespace piper {

// =============================================================================
// Construction / Destruction
// =============================================================================

PiperModel::PiperModel(const VoiceConfig& voice, const PiperSettings& settings)
    : voice_(voice)
    , settings_(settings) {
}

PiperModel::~PiperModel() {
    session_.reset();
    env_.reset();
}

// =============================================================================
// Lifecycle
// =============================================================================

ErrorInfo PiperModel::initialize(const EngineConfig& config) {
    if (initialized_) {
        return ErrorInfo::ok();
    }

    if (!fs::exists(settings_.model_path)) {
        return ErrorInfo::error(ErrorCode::MODEL_NOT_FOUND,
            "Piper model not found at: " + settings_.model_path);
    }

    if (settings_.phoneme_type == PhonemeType::ESPEAK && !PiperPhonemizer::isEspeakAvailable()) {
        std::cerr << "[Piper] espeak-ng not found, synthesis of " << voice_.voice_id
                  << " will fail" << std::endl;
    }

    phonemizer_ = std::make_unique<PiperPhonemizer>(settings_,
        EngineConfig::expandPath(config.espeak_data_dir), config.max_segment_phonemes);

    try {
        // Initialize ONNX Runtime (suppress stderr warnings)
        int stderr_fd = dup(STDERR_FILENO);
        int devnull_fd = open("/dev/null", O_WRONLY);
        dup2(devnull_fd, STDERR_FILENO);

        env_ = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "PiperModel");

        // Restore stderr
        dup2(stderr_fd, STDERR_FILENO);
        close(stderr_fd);
        close(devnull_fd);

        Ort::SessionOptions session_options;
        session_options.SetIntraOpNumThreads(config.num_threads > 0 ? config.num_threads : 1);
        session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

        #if defined(__riscv) || defined(__riscv__)
        session_options.DisableMemPattern();
        session_options.DisableCpuMemArena();
        #endif

        session_ = std::make_unique<Ort::Session>(*env_, settings_.model_path.c_str(), session_options);

        // Warm up with a small inference
        if (config.enable_warmup) {
            std::cout << "[Piper] Warming up " << voice_.voice_id << "..." << std::endl;
            auto start = std::chrono::high_resolution_clock::now();

            std::vector<int64_t> small_ids;
            phonemizer_->phonemesToIds(U"a", small_ids);
            SynthesisParams params;
            if (!voice_.speakers.empty()) {
                params.speaker_id = voice_.speakers.begin()->first;
            }
            runInference(small_ids, params);

            auto end = std::chrono::high_resolution_clock::now();
            auto dur = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
            std::cout << "[Piper] Model warmed up in " << dur.count() << "ms" << std::endl;
        }

        initialized_ = true;
        std::cout << "[Piper] Loaded voice: " << voice_.voice_id
                  << " (" << voice_.audio.sample_rate << "Hz, "
                  << voice_.speakers.size() << " speakers)" << std::endl;
        return ErrorInfo::ok();
    } catch (const Ort::Exception& e) {
        return ErrorInfo::error(ErrorCode::MODEL_NOT_FOUND,
            std::string("Failed to initialize Piper model: ") + e.what(), settings_.model_path);
    }
}

// =============================================================================
// Model Info
// =============================================================================

std::string PiperModel::getName() const {
    return "Piper VITS (" + voice_.voice_id + ")";
}

AudioInfo PiperModel::getAudioInfo() const {
    return voice_.audio;
}

// =============================================================================
// Synthesis
// =============================================================================

ErrorInfo PiperModel::synthesize(const std::string& text,
    const SynthesisParams& params,
    SegmentAudio& output) {
    if (!initialized_) {
        return ErrorInfo::error(ErrorCode::MODEL_FAILURE, "Piper model not initialized", voice_.voice_id);
    }

    std::vector<int64_t> phoneme_ids;
    auto err = phonemizer_->textToIds(text, phoneme_ids);
    if (!err.isOk()) {
        return err;
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    try {
        std::vector<float> samples = runInference(phoneme_ids, params);

        // Piper scales each utterance to its own peak
        audio::normalizePeak(samples);

        auto end_time = std::chrono::high_resolution_clock::now();

        output.samples = std::move(samples);
        output.audio = voice_.audio;
        output.infer_seconds = std::chrono::duration<double>(end_time - start_time).count();
        return ErrorInfo::ok();
    } catch (const Ort::Exception& e) {
        return ErrorInfo::error(ErrorCode::MODEL_FAILURE,
            std::string("Piper inference failed: ") + e.what(), voice_.voice_id);
    }
}

// =============================================================================
// Private Methods
// =============================================================================

std::vector<float> PiperModel::runInference(const std::vector<int64_t>& phoneme_ids,
    const SynthesisParams& params) {
    auto memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);

    // Input 1: input [1, n]
    std::vector<int64_t> ids = phoneme_ids;
    std::vector<int64_t> ids_shape = {1, static_cast<int64_t>(ids.size())};
    auto ids_tensor = Ort::Value::CreateTensor<int64_t>(
        memory_info,
        ids.data(),
        ids.size(),
        ids_shape.data(),
        ids_shape.size());

    // Input 2: input_lengths [1]
    std::vector<int64_t> lengths = {static_cast<int64_t>(ids.size())};
    std::vector<int64_t> lengths_shape = {1};
    auto lengths_tensor = Ort::Value::CreateTensor<int64_t>(
        memory_info,
        lengths.data(),
        lengths.size(),
        lengths_shape.data(),
        lengths_shape.size());

    // Input 3: scales [3] = noise_scale, length_scale, noise_w
    std::vector<float> scales = {params.noise_scale, params.effectiveLengthScale(), params.noise_w};
    std::vector<int64_t> scales_shape = {static_cast<int64_t>(scales.size())};
    auto scales_tensor = Ort::Value::CreateTensor<float>(
        memory_info,
        scales.data(),
        scales.size(),
        scales_shape.data(),
        scales_shape.size());

    std::vector<const char*> input_names = {"input", "input_lengths", "scales"};
    const char* output_names[] = {"output"};

    std::vector<Ort::Value> input_tensors;
    input_tensors.push_back(std::move(ids_tensor));
    input_tensors.push_back(std::move(lengths_tensor));
    input_tensors.push_back(std::move(scales_tensor));

    // Input 4: sid [1] (multi-speaker models only)
    std::vector<int64_t> sid = {params.speaker_id.value_or(0)};
    std::vector<int64_t> sid_shape = {1};
    if (settings_.num_speakers > 1) {
        input_tensors.push_back(Ort::Value::CreateTensor<int64_t>(
            memory_info,
            sid.data(),
            sid.size(),
            sid_shape.data(),
            sid_shape.size()));
        input_names.push_back("sid");
    }

    auto output_tensors = session_->Run(
        Ort::RunOptions{nullptr},
        input_names.data(), input_tensors.data(), input_tensors.size(),
        output_names, 1);

    // Extract audio output [1, 1, num_samples]
    const float* audio_data = output_tensors[0].GetTensorData<float>();
    auto audio_shape = output_tensors[0].GetTensorTypeAndShapeInfo().GetShape();

    size_t num_samples = 1;
    for (auto dim : audio_shape) {
        num_samples *= static_cast<size_t>(dim);
    }

    return std::vector<float>(audio_data, audio_data + num_samples);
}

}  // namespace piper
}  // namespace sonata
