#ifndef SONATA_TYPES_HPP
#define SONATA_TYPES_HPP

#include <cstdint>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sonata {

// =============================================================================
// Error Code (错误码)
// =============================================================================

enum class ErrorCode {
    OK = 0,

    // 请求校验错误 (1xx) - 在任何模型调用之前检出
    VOICE_NOT_FOUND = 100,
    INVALID_OPTIONS = 101,
    INVALID_TEXT = 102,
    INVALID_MODE = 103,
    STREAMING_UNSUPPORTED = 104,
    INVALID_CONFIG = 105,

    // 运行时错误 (2xx)
    SEGMENT_TOO_LARGE = 200,
    MODEL_FAILURE = 201,
    ZERO_DURATION_AUDIO = 202,
    CANCELLED = 203,
    MODEL_NOT_FOUND = 204,
    NOT_FINISHED = 205,

    // 内部错误 (4xx)
    INTERNAL_ERROR = 400,
    FILE_WRITE_ERROR = 402,
};

inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:                    return "OK";
        case ErrorCode::VOICE_NOT_FOUND:       return "VOICE_NOT_FOUND";
        case ErrorCode::INVALID_OPTIONS:       return "INVALID_OPTIONS";
        case ErrorCode::INVALID_TEXT:          return "INVALID_TEXT";
        case ErrorCode::INVALID_MODE:          return "INVALID_MODE";
        case ErrorCode::STREAMING_UNSUPPORTED: return "STREAMING_UNSUPPORTED";
        case ErrorCode::INVALID_CONFIG:        return "INVALID_CONFIG";
        case ErrorCode::SEGMENT_TOO_LARGE:     return "SEGMENT_TOO_LARGE";
        case ErrorCode::MODEL_FAILURE:         return "MODEL_FAILURE";
        case ErrorCode::ZERO_DURATION_AUDIO:   return "ZERO_DURATION_AUDIO";
        case ErrorCode::CANCELLED:             return "CANCELLED";
        case ErrorCode::MODEL_NOT_FOUND:       return "MODEL_NOT_FOUND";
        case ErrorCode::NOT_FINISHED:          return "NOT_FINISHED";
        case ErrorCode::INTERNAL_ERROR:        return "INTERNAL_ERROR";
        case ErrorCode::FILE_WRITE_ERROR:      return "FILE_WRITE_ERROR";
        default:                               return "UNKNOWN";
    }
}

// =============================================================================
// Error Info (错误信息)
// =============================================================================

struct ErrorInfo {
    ErrorCode code;
    std::string message;
    std::string detail;  // 详细信息(调试用)

    bool isOk() const { return code == ErrorCode::OK; }

    /// @brief 取消不是故障, 调用方据此区分
    bool isCancelled() const { return code == ErrorCode::CANCELLED; }

    std::string toString() const {
        std::string s = errorCodeToString(code);
        if (!message.empty()) s += ": " + message;
        if (!detail.empty()) s += " (" + detail + ")";
        return s;
    }

    static ErrorInfo ok() {
        return {ErrorCode::OK, "", ""};
    }

    static ErrorInfo error(ErrorCode code, const std::string& msg, const std::string& detail = "") {
        return {code, msg, detail};
    }

    static ErrorInfo cancelled() {
        return {ErrorCode::CANCELLED, "Synthesis cancelled", ""};
    }
};

// =============================================================================
// Quality (音色质量 - 仅作信息展示, 不影响调度)
// =============================================================================

enum class Quality {
    X_LOW,
    LOW,
    MEDIUM,
    HIGH,
};

inline const char* qualityToString(Quality quality) {
    switch (quality) {
        case Quality::X_LOW:  return "x_low";
        case Quality::LOW:    return "low";
        case Quality::MEDIUM: return "medium";
        case Quality::HIGH:   return "high";
        default:              return "unknown";
    }
}

/// @brief 解析质量字符串 ("x_low" / "x-low" / "low" / "medium" / "high")
ErrorInfo parseQuality(const std::string& str, Quality& quality);

/// @brief 线上枚举值转换, 0 (QUALITY_UNSPECIFIED) 在边界处拒绝
ErrorInfo qualityFromWire(int32_t value, Quality& quality);

/// @brief 转换为线上枚举值 (X_LOW=1 ... HIGH=4)
int32_t qualityToWire(Quality quality);

// =============================================================================
// Synthesis Mode (合成模式)
// =============================================================================

enum class SynthesisMode {
    LAZY,           // 惰性模式 - 消费者拉取一块才合成一段
    PARALLEL,       // 并行模式 - 所有分段并发合成, 按序释放
    BATCHED,        // 批处理模式 - 一次调用合成全部分段, 不支持流式
};

inline const char* synthesisModeToString(SynthesisMode mode) {
    switch (mode) {
        case SynthesisMode::LAZY:     return "lazy";
        case SynthesisMode::PARALLEL: return "parallel";
        case SynthesisMode::BATCHED:  return "batched";
        default:                      return "unknown";
    }
}

/// @brief 解析模式字符串 ("lazy" / "parallel" / "batched")
ErrorInfo parseSynthesisMode(const std::string& str, SynthesisMode& mode);

/// @brief 线上枚举值转换, 0 (MODE_UNSPECIFIED) 与未知值返回 INVALID_MODE
ErrorInfo synthesisModeFromWire(int32_t value, SynthesisMode& mode);

/// @brief 转换为线上枚举值 (LAZY=1, PARALLEL=2, BATCHED=3)
int32_t synthesisModeToWire(SynthesisMode mode);

// =============================================================================
// Audio Info (音频格式 - 每个音色唯一)
// =============================================================================

struct AudioInfo {
    uint32_t sample_rate = 22050;   ///< 采样率 (Hz)
    uint32_t num_channels = 1;      ///< 声道数
    uint32_t sample_width = 2;      ///< 每样本字节数 [1, 4]

    bool isValid() const {
        return sample_rate > 0 && num_channels > 0 &&
               sample_width >= 1 && sample_width <= 4;
    }

    /// @brief 每帧字节数 (所有声道)
    uint32_t frameBytes() const { return num_channels * sample_width; }

    bool operator==(const AudioInfo& other) const {
        return sample_rate == other.sample_rate &&
               num_channels == other.num_channels &&
               sample_width == other.sample_width;
    }

    bool operator!=(const AudioInfo& other) const { return !(*this == other); }
};

// =============================================================================
// Synthesis Options (合成参数 - 仅覆盖显式设置的字段)
// =============================================================================

struct SynthesisOptions {
    std::optional<std::string> speaker;     ///< 说话人名称或十进制索引
    std::optional<float> length_scale;      ///< 时长缩放 (> 0)
    std::optional<float> noise_scale;       ///< 噪声缩放 (>= 0)
    std::optional<float> noise_w;           ///< 时长噪声 (>= 0)

    /// @brief 校验已设置字段的取值范围
    ErrorInfo validate() const;

    /// @brief 以 overrides 中已设置的字段覆盖当前值
    SynthesisOptions mergedWith(const SynthesisOptions& overrides) const;
};

// =============================================================================
// Synthesis Params (已解析的模型参数)
// =============================================================================

struct SynthesisParams {
    std::optional<int64_t> speaker_id;      ///< 说话人ID (多说话人模型)
    std::string speaker_name;
    float length_scale = 1.0f;
    float noise_scale = 0.667f;
    float noise_w = 0.8f;

    // 由 SpeechArgs 推导的韵律参数
    float speech_speed = 1.0f;              ///< 语速倍率 (>1.0快)
    float pitch_factor = 1.0f;              ///< 音调倍率 (>1.0高)

    /// @brief 送入模型的时长缩放: length_scale * pitch / speed
    float effectiveLengthScale() const {
        return length_scale * pitch_factor / speech_speed;
    }
};

// =============================================================================
// Speech Args (语音参数)
// =============================================================================

struct SpeechArgs {
    static constexpr uint32_t DEFAULT_RATE = 50;
    static constexpr uint32_t DEFAULT_VOLUME = 100;
    static constexpr uint32_t DEFAULT_PITCH = 50;
    static constexpr uint32_t MAX_VALUE = 100;

    uint32_t rate = DEFAULT_RATE;           ///< 语速 [0, 100]
    uint32_t volume = DEFAULT_VOLUME;       ///< 音量 [0, 100]
    uint32_t pitch = DEFAULT_PITCH;         ///< 音调 [0, 100]
    uint32_t appended_silence_ms = 0;       ///< 末尾静音 (毫秒)

    ErrorInfo validate() const {
        if (rate > MAX_VALUE) {
            return ErrorInfo::error(ErrorCode::INVALID_OPTIONS, "Rate must be 0-100",
                "rate=" + std::to_string(rate));
        }
        if (volume > MAX_VALUE) {
            return ErrorInfo::error(ErrorCode::INVALID_OPTIONS, "Volume must be 0-100",
                "volume=" + std::to_string(volume));
        }
        if (pitch > MAX_VALUE) {
            return ErrorInfo::error(ErrorCode::INVALID_OPTIONS, "Pitch must be 0-100",
                "pitch=" + std::to_string(pitch));
        }
        return ErrorInfo::ok();
    }

    /// @brief 语速映射: 50 为原速, 每 ±50 翻倍/减半
    float speechSpeed() const;

    /// @brief 音调映射: 50 为原调, 每 ±50 升/降半个八度
    float pitchFactor() const;

    /// @brief 音量增益: volume / 100
    float gain() const { return static_cast<float>(volume) / 100.0f; }
};

// =============================================================================
// Utterance (合成请求)
// =============================================================================

struct Utterance {
    std::string voice_id;
    std::string text;
    SpeechArgs speech_args;
    std::optional<SynthesisMode> mode;                  ///< 必须显式指定, 未设置返回 INVALID_MODE
    std::optional<SynthesisOptions> synthesis_options;  ///< 请求级覆盖 (可选)
};

// =============================================================================
// Voice Config (音色配置记录 - 加载时一次性解析, 注册后不可变)
// =============================================================================

struct VoiceConfig {
    std::string voice_id;                           ///< 例: en_US-amy-medium
    std::string language;                           ///< 例: en_US
    Quality quality = Quality::MEDIUM;
    std::map<int64_t, std::string> speakers;        ///< 说话人索引 -> 名称
    AudioInfo audio;
    SynthesisOptions default_options;               ///< 所有字段均已设置
    bool supports_streaming_output = false;
    bool concurrency_safe = false;                  ///< 模型可被并发调用
    std::string config_path;                        ///< 来源 (可为空)

    /// @brief 校验配置记录 (ID、音频格式、默认参数)
    ErrorInfo validate() const;
};

// =============================================================================
// Voice Info (音色信息 - 对外展示)
// =============================================================================

struct VoiceInfo {
    std::string voice_id;
    SynthesisOptions synth_options;
    std::map<int64_t, std::string> speakers;
    AudioInfo audio;
    std::string language;
    Quality quality = Quality::MEDIUM;
    bool supports_streaming_output = false;

    static VoiceInfo fromConfig(const VoiceConfig& config) {
        VoiceInfo info;
        info.voice_id = config.voice_id;
        info.synth_options = config.default_options;
        info.speakers = config.speakers;
        info.audio = config.audio;
        info.language = config.language;
        info.quality = config.quality;
        info.supports_streaming_output = config.supports_streaming_output;
        return info;
    }
};

// =============================================================================
// Segment Audio (模型输出 - 单个分段)
// =============================================================================

struct SegmentAudio {
    std::vector<float> samples;     // 音频样本 (float32, [-1.0, 1.0], 多声道交错)
    AudioInfo audio;
    double infer_seconds = 0.0;     // 模型推理耗时 (秒)

    size_t getNumFrames() const {
        return audio.num_channels > 0 ? samples.size() / audio.num_channels : 0;
    }
};

// =============================================================================
// Wave Samples (音频块 - 流式输出单元)
// =============================================================================

struct WaveSamples {
    std::vector<uint8_t> wav_samples;   // 编码后的 PCM 字节
    size_t index = 0;                   // 分段序号 (与源文本顺序一致)
    bool is_final = false;              // 是否为最后一块
};

// =============================================================================
// Synthesis Result (合成结果)
// =============================================================================

struct SynthesisResult {
    std::vector<uint8_t> wav_samples;       // 完整 PCM 缓冲 (含末尾静音)
    float rtf = 0.0f;                       // Real-Time Factor (合成耗时/音频时长)
    AudioInfo audio;
    size_t num_segments = 0;

    // 性能指标
    double synthesis_seconds = 0.0;         // 合成耗时 (秒)
    double audio_seconds = 0.0;             // 语音时长 (秒, 不含末尾静音)

    bool isEmpty() const {
        return wav_samples.empty();
    }

    int64_t getDurationMs() const {
        return static_cast<int64_t>(audio_seconds * 1000.0);
    }
};

}  // namespace sonata

#endif  // SONATA_TYPES_HPP
