#ifndef SONATA_AUDIO_PROCESSOR_HPP
#define SONATA_AUDIO_PROCESSOR_HPP

/**
 * AudioProcessor - 音频处理模块
 *
 * 提供峰值归一化、增益、变调重采样、PCM 编码、静音生成和 WAV 写出。
 */

#include <cstdint>

#include <string>
#include <vector>

#include "internal/sonata_types.hpp"

namespace sonata {
namespace audio {

// =============================================================================
// 音频处理函数
// =============================================================================

/**
 * @brief 峰值归一化 (Piper 方式: 除以 max(|x|, 0.01))
 * @param audio [in/out] 音频样本
 */
void normalizePeak(std::vector<float>& audio);

/**
 * @brief 应用增益并限幅到 [-1.0, 1.0]
 * @param audio [in/out] 音频样本
 * @param gain 增益倍率
 */
void applyGain(std::vector<float>& audio, float gain);

/**
 * @brief 按比例重采样 (线性插值, 单声道)
 * @param audio 输入音频
 * @param ratio 输出长度 / 输入长度
 * @return 重采样后的音频
 */
std::vector<float> resampleByRatio(const std::vector<float>& audio, double ratio);

/**
 * @brief 变调 (保持时长由调用方以 length_scale 补偿)
 *
 * 将时长压缩为 1/factor, 以原采样率播放时音调升高 factor 倍。
 * 多声道按声道分别处理。
 *
 * @param audio 交错音频样本
 * @param num_channels 声道数
 * @param factor 音调倍率
 * @return 处理后的音频
 */
std::vector<float> shiftPitch(const std::vector<float>& audio,
                              uint32_t num_channels,
                              float factor);

// =============================================================================
// 格式转换
// =============================================================================

/**
 * @brief float 编码为 PCM 字节并追加到 out
 *
 * 1 字节: 无符号 8-bit (128 为零点)
 * 2-4 字节: 有符号小端整数
 *
 * @param audio float 音频 [-1.0, 1.0]
 * @param sample_width 每样本字节数 [1, 4]
 * @param out [out] 追加的字节数组
 */
void encodePcm(const std::vector<float>& audio, uint32_t sample_width, std::vector<uint8_t>& out);

// =============================================================================
// 静音
// =============================================================================

/**
 * @brief 计算静音帧数: round(ms * sample_rate / 1000)
 */
uint64_t silenceFrames(uint32_t duration_ms, uint32_t sample_rate);

/**
 * @brief 追加静音字节
 * @param out [out] 字节数组
 * @param audio 音频格式
 * @param duration_ms 静音时长 (毫秒)
 */
void appendSilence(std::vector<uint8_t>& out, const AudioInfo& audio, uint32_t duration_ms);

// =============================================================================
// 文件操作
// =============================================================================

/**
 * @brief 将 PCM 字节写为 WAV 文件
 * @param file_path 文件路径
 * @param pcm PCM 字节
 * @param audio 音频格式
 * @return 错误信息
 */
ErrorInfo writeWavFile(const std::string& file_path,
                       const std::vector<uint8_t>& pcm,
                       const AudioInfo& audio);

}  // namespace audio
}  // namespace sonata

#endif  // SONATA_AUDIO_PROCESSOR_HPP
