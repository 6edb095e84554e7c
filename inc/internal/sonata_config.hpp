#ifndef SONATA_CONFIG_HPP
#define SONATA_CONFIG_HPP

#include <cstdint>
#include <cstdlib>

#include <algorithm>
#include <string>
#include <thread>

#include "sonata_types.hpp"

namespace sonata {

// =============================================================================
// Engine Config (引擎配置)
// =============================================================================

struct EngineConfig {
    // -------------------------------------------------------------------------
    // 调度配置
    // -------------------------------------------------------------------------

    uint32_t max_parallel_inferences = 0;   ///< 并行模式最大并发推理数 (0=CPU核数)
    uint32_t stream_buffer_chunks = 4;      ///< 流式通道容量 (块)

    // -------------------------------------------------------------------------
    // 模型配置
    // -------------------------------------------------------------------------

    std::string voices_dir;                 ///< 已安装音色目录 (可为空)
    std::string espeak_data_dir;            ///< espeak-ng 数据目录 (空则使用系统默认)
    uint32_t max_segment_phonemes = 4096;   ///< 单个分段允许的最大音素ID数

    // -------------------------------------------------------------------------
    // 性能配置
    // -------------------------------------------------------------------------

    int num_threads = 1;                    ///< 单次推理线程数 (ONNX intra-op)
    bool enable_warmup = true;              ///< 加载音色时预热

    // -------------------------------------------------------------------------
    // 日志
    // -------------------------------------------------------------------------

    bool verbose = false;                   ///< 输出逐段调度日志

    // -------------------------------------------------------------------------
    // 便捷构建方法
    // -------------------------------------------------------------------------

    /// @brief 创建默认配置
    static EngineConfig Default() {
        return EngineConfig();
    }

    /// @brief 从环境变量读取配置
    ///
    /// SONATA_MAX_PARALLEL, SONATA_STREAM_BUFFER, SONATA_NUM_THREADS,
    /// SONATA_ESPEAKNG_DATA_DIRECTORY, SONATA_VOICES_DIR
    static EngineConfig FromEnvironment() {
        EngineConfig config;
        if (const char* v = getenv("SONATA_MAX_PARALLEL")) {
            config.max_parallel_inferences = static_cast<uint32_t>(std::strtoul(v, nullptr, 10));
        }
        if (const char* v = getenv("SONATA_STREAM_BUFFER")) {
            config.stream_buffer_chunks = static_cast<uint32_t>(std::strtoul(v, nullptr, 10));
        }
        if (const char* v = getenv("SONATA_NUM_THREADS")) {
            config.num_threads = static_cast<int>(std::strtol(v, nullptr, 10));
        }
        if (const char* v = getenv("SONATA_ESPEAKNG_DATA_DIRECTORY")) {
            config.espeak_data_dir = v;
        }
        if (const char* v = getenv("SONATA_VOICES_DIR")) {
            config.voices_dir = v;
        }
        return config;
    }

    // -------------------------------------------------------------------------
    // 链式配置
    // -------------------------------------------------------------------------

    EngineConfig withMaxParallel(uint32_t n) const {
        auto c = *this;
        c.max_parallel_inferences = n;
        return c;
    }

    EngineConfig withStreamBuffer(uint32_t chunks) const {
        auto c = *this;
        c.stream_buffer_chunks = chunks;
        return c;
    }

    EngineConfig withNumThreads(int n) const {
        auto c = *this;
        c.num_threads = n;
        return c;
    }

    EngineConfig withVoicesDir(const std::string& dir) const {
        auto c = *this;
        c.voices_dir = dir;
        return c;
    }

    EngineConfig withWarmup(bool enable) const {
        auto c = *this;
        c.enable_warmup = enable;
        return c;
    }

    EngineConfig withVerbose(bool enable) const {
        auto c = *this;
        c.verbose = enable;
        return c;
    }

    // -------------------------------------------------------------------------
    // 工具方法
    // -------------------------------------------------------------------------

    /// @brief 获取实际并发数 (0 表示使用 CPU 核数, 至少为 1)
    uint32_t getEffectiveParallelism() const {
        if (max_parallel_inferences > 0) {
            return max_parallel_inferences;
        }
        return std::max(1u, std::thread::hardware_concurrency());
    }

    /// @brief 展开路径中的 ~ 到 HOME 目录
    static std::string expandPath(const std::string& path) {
        if (!path.empty() && path[0] == '~') {
            const char* home = getenv("HOME");
            if (home) {
                return std::string(home) + path.substr(1);
            }
        }
        return path;
    }

    /// @brief 获取音色目录的完整路径
    std::string getExpandedVoicesDir() const {
        return expandPath(voices_dir);
    }

    /// @brief 验证配置是否有效
    /// @return 错误信息
    ErrorInfo validate() const {
        if (stream_buffer_chunks == 0) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Stream buffer must hold at least one chunk");
        }
        if (num_threads <= 0) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Invalid number of inference threads");
        }
        if (max_segment_phonemes == 0) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Invalid max segment phonemes");
        }
        return ErrorInfo::ok();
    }
};

}  // namespace sonata

#endif  // SONATA_CONFIG_HPP
