#include "internal/audio/audio_processor.hpp"

#include <cmath>
#include <cstdint>

#include <algorithm>
#include <fstream>
#include <string>
#include <vector>

namespace sonata {
namespace audio {

namespace {

// 按小端序写入 num_bytes 字节
void putLittleEndian(std::vector<uint8_t>& out, uint32_t value, int num_bytes) {
    for (int i = 0; i < num_bytes; ++i) {
        out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

float clampSample(float sample) {
    if (sample > 1.0f) return 1.0f;
    if (sample < -1.0f) return -1.0f;
    return sample;
}

}  // namespace

// =============================================================================
// 归一化 / 增益
// =============================================================================

void normalizePeak(std::vector<float>& audio) {
    if (audio.empty()) return;

    float max_amplitude = 0.01f;
    for (float sample : audio) {
        max_amplitude = std::max(max_amplitude, std::abs(sample));
    }

    float scale = 1.0f / max_amplitude;
    for (float& sample : audio) {
        sample *= scale;
    }
}

void applyGain(std::vector<float>& audio, float gain) {
    if (gain == 1.0f) return;
    for (float& sample : audio) {
        sample = clampSample(sample * gain);
    }
}

// =============================================================================
// 重采样
// =============================================================================

std::vector<float> resampleByRatio(const std::vector<float>& audio, double ratio) {
    if (audio.empty() || ratio == 1.0 || ratio <= 0.0) {
        return audio;
    }

    size_t output_size = static_cast<size_t>(audio.size() * ratio);
    std::vector<float> resampled(output_size);

    for (size_t i = 0; i < output_size; ++i) {
        double src_pos = i / ratio;
        size_t src_idx = static_cast<size_t>(src_pos);
        double frac = src_pos - src_idx;

        if (src_idx + 1 < audio.size()) {
            // Linear interpolation between two adjacent samples
            resampled[i] = static_cast<float>(
                audio[src_idx] * (1.0 - frac) + audio[src_idx + 1] * frac);
        } else if (src_idx < audio.size()) {
            resampled[i] = audio[src_idx];
        } else {
            resampled[i] = 0.0f;
        }
    }

    return resampled;
}

std::vector<float> shiftPitch(const std::vector<float>& audio,
    uint32_t num_channels,
    float factor) {
    if (audio.empty() || factor == 1.0f || factor <= 0.0f || num_channels == 0) {
        return audio;
    }

    double ratio = 1.0 / factor;
    if (num_channels == 1) {
        return resampleByRatio(audio, ratio);
    }

    // 多声道: 拆分 -> 分别重采样 -> 交错
    size_t frames = audio.size() / num_channels;
    std::vector<std::vector<float>> channels(num_channels);
    for (uint32_t c = 0; c < num_channels; ++c) {
        channels[c].resize(frames);
        for (size_t f = 0; f < frames; ++f) {
            channels[c][f] = audio[f * num_channels + c];
        }
        channels[c] = resampleByRatio(channels[c], ratio);
    }

    size_t out_frames = channels[0].size();
    std::vector<float> result(out_frames * num_channels);
    for (size_t f = 0; f < out_frames; ++f) {
        for (uint32_t c = 0; c < num_channels; ++c) {
            result[f * num_channels + c] = channels[c][f];
        }
    }
    return result;
}

// =============================================================================
// 格式转换
// =============================================================================

void encodePcm(const std::vector<float>& audio, uint32_t sample_width, std::vector<uint8_t>& out) {
    out.reserve(out.size() + audio.size() * sample_width);

    for (float raw : audio) {
        float sample = clampSample(raw);
        switch (sample_width) {
            case 1: {
                // unsigned 8-bit, 128 为零点
                int value = static_cast<int>(std::lround(sample * 127.0f)) + 128;
                out.push_back(static_cast<uint8_t>(value));
                break;
            }
            case 2: {
                auto value = static_cast<int16_t>(sample * 32767.0f);
                putLittleEndian(out, static_cast<uint16_t>(value), 2);
                break;
            }
            case 3: {
                auto value = static_cast<int32_t>(sample * 8388607.0f);
                putLittleEndian(out, static_cast<uint32_t>(value), 3);
                break;
            }
            case 4: {
                auto value = static_cast<int32_t>(static_cast<double>(sample) * 2147483647.0);
                putLittleEndian(out, static_cast<uint32_t>(value), 4);
                break;
            }
            default:
                break;
        }
    }
}

// =============================================================================
// 静音
// =============================================================================

uint64_t silenceFrames(uint32_t duration_ms, uint32_t sample_rate) {
    return (static_cast<uint64_t>(duration_ms) * sample_rate + 500) / 1000;
}

void appendSilence(std::vector<uint8_t>& out, const AudioInfo& audio, uint32_t duration_ms) {
    if (duration_ms == 0) return;

    uint64_t num_bytes = silenceFrames(duration_ms, audio.sample_rate) * audio.frameBytes();
    uint8_t zero = (audio.sample_width == 1) ? 0x80 : 0x00;
    out.insert(out.end(), static_cast<size_t>(num_bytes), zero);
}

// =============================================================================
// 文件操作
// =============================================================================

ErrorInfo writeWavFile(const std::string& file_path,
    const std::vector<uint8_t>& pcm,
    const AudioInfo& audio) {
    if (pcm.empty()) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Empty audio data");
    }
    if (!audio.isValid()) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Invalid audio info");
    }

    std::ofstream file(file_path, std::ios::binary);
    if (!file) {
        return ErrorInfo::error(ErrorCode::FILE_WRITE_ERROR,
            "Failed to open file: " + file_path);
    }

    uint32_t data_size = static_cast<uint32_t>(pcm.size());
    uint32_t byte_rate = audio.sample_rate * audio.frameBytes();

    // WAV 文件头 (44 字节)
    std::vector<uint8_t> header;
    header.reserve(44);
    header.insert(header.end(), {'R', 'I', 'F', 'F'});
    putLittleEndian(header, 36 + data_size, 4);
    header.insert(header.end(), {'W', 'A', 'V', 'E', 'f', 'm', 't', ' '});
    putLittleEndian(header, 16, 4);                             // fmt chunk size
    putLittleEndian(header, 1, 2);                              // PCM
    putLittleEndian(header, audio.num_channels, 2);
    putLittleEndian(header, audio.sample_rate, 4);
    putLittleEndian(header, byte_rate, 4);
    putLittleEndian(header, audio.frameBytes(), 2);             // block align
    putLittleEndian(header, audio.sample_width * 8, 2);         // bits per sample
    header.insert(header.end(), {'d', 'a', 't', 'a'});
    putLittleEndian(header, data_size, 4);

    file.write(reinterpret_cast<const char*>(header.data()), static_cast<std::streamsize>(header.size()));
    file.write(reinterpret_cast<const char*>(pcm.data()), static_cast<std::streamsize>(pcm.size()));

    if (!file.good()) {
        return ErrorInfo::error(ErrorCode::FILE_WRITE_ERROR,
            "Failed to write file: " + file_path);
    }
    return ErrorInfo::ok();
}

}  // namespace audio
}  // namespace sonata
