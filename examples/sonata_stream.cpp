#include <csignal>
#include <cstring>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/backends/piper/piper_voice_loader.hpp"
#include "sonata_api.hpp"

// =============================================================================
// Ctrl+C 取消
// =============================================================================

static Sonata::CancellationToken g_token;

void handleSigint(int) {
    g_token.cancel();
}

// =============================================================================
// 流式回调 - 打印每块的到达时间, 可选输出原始 PCM
// =============================================================================

class StreamPrinter : public Sonata::SynthesisCallback {
public:
    /// @param pcm_out 原始 PCM 输出流, 为空则不输出
    explicit StreamPrinter(std::ostream* pcm_out)
        : pcm_out_(pcm_out) {
    }

    void OnOpen() override {
        start_time_ = std::chrono::steady_clock::now();
        std::cout << "[流式] 开始合成" << std::endl;
    }

    void OnChunk(const Sonata::WaveSamples& chunk) override {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time_);
        if (chunk.index == 0) {
            first_chunk_ms_ = elapsed.count();
        }
        total_bytes_ += chunk.wav_samples.size();

        std::cout << "[流式] 块 #" << chunk.index << ": " << chunk.wav_samples.size() << " 字节, "
                  << elapsed.count() << " ms" << (chunk.is_final ? " (最后一块)" : "") << std::endl;

        if (pcm_out_) {
            pcm_out_->write(reinterpret_cast<const char*>(chunk.wav_samples.data()),
                static_cast<std::streamsize>(chunk.wav_samples.size()));
            pcm_out_->flush();
        }
    }

    void OnComplete(float rtf) override {
        std::cout << "[流式] 完成: 首块延迟 " << first_chunk_ms_ << " ms, 共 "
                  << total_bytes_ << " 字节, RTF=" << rtf << std::endl;
    }

    void OnError(const Sonata::ErrorInfo& error) override {
        std::cerr << "[流式] 错误: " << error.toString() << std::endl;
    }

    void OnCancelled() override {
        std::cout << "[流式] 已取消" << std::endl;
    }

    void OnClose() override {
        std::cout << "[流式] 会话关闭" << std::endl;
    }

private:
    std::ostream* pcm_out_;
    std::chrono::steady_clock::time_point start_time_;
    long long first_chunk_ms_ = 0;
    size_t total_bytes_ = 0;
};

void printUsage(const char* program) {
    std::cout << "用法: " << program << " -c <config.onnx.json> -p <text> [选项]\n"
        << "\n"
        << "选项:\n"
        << "  -c <config>    音色配置文件 (<model>.onnx.json)\n"
        << "  -p <text>      要合成的文本\n"
        << "  -m <mode>      合成模式: lazy | parallel (默认: lazy)\n"
        << "  --raw          将原始 PCM 写到标准输出 (日志写到标准错误)\n"
        << "  --verbose      输出调度日志\n"
        << "  -h             显示帮助\n"
        << "\n"
        << "示例:\n"
        << "  " << program << " -c voice.onnx.json -p \"One. Two. Three.\" -m parallel\n"
        << "  " << program << " -c voice.onnx.json -p \"Hello.\" --raw | aplay -r 22050 -f S16_LE -c 1\n"
        << std::endl;
}

int main(int argc, char* argv[]) {
    auto config = Sonata::EngineConfig::FromEnvironment();

    std::string config_path;
    Sonata::Utterance utterance;
    sonata::SynthesisMode mode = sonata::SynthesisMode::LAZY;
    bool raw_output = false;

    // 解析参数
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "--raw") == 0) {
            raw_output = true;
        } else if (strcmp(argv[i], "--verbose") == 0) {
            config.verbose = true;
        } else if (strcmp(argv[i], "-c") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (strcmp(argv[i], "-p") == 0 && i + 1 < argc) {
            utterance.text = argv[++i];
        } else if (strcmp(argv[i], "-m") == 0 && i + 1 < argc) {
            auto err = sonata::parseSynthesisMode(argv[++i], mode);
            if (!err.isOk()) {
                std::cerr << "错误: " << err.toString() << std::endl;
                return 1;
            }
        }
    }

    if (config_path.empty() || utterance.text.empty()) {
        printUsage(argv[0]);
        return 1;
    }
    utterance.mode = mode;

    // 日志不能混入 PCM 输出: --raw 时 std::cout 改写到标准错误
    std::ostream pcm_out(std::cout.rdbuf());
    if (raw_output) {
        std::cout.rdbuf(std::cerr.rdbuf());
    }

    Sonata::SonataEngine engine(config, std::make_shared<sonata::piper::PiperVoiceLoader>());

    Sonata::VoiceInfo voice;
    auto err = engine.LoadVoice(config_path, voice);
    if (!err.isOk()) {
        std::cerr << "音色加载失败: " << err.toString() << std::endl;
        return 1;
    }
    utterance.voice_id = voice.voice_id;

    std::signal(SIGINT, handleSigint);

    auto callback = std::make_shared<StreamPrinter>(raw_output ? &pcm_out : nullptr);
    err = engine.StreamingCall(utterance, callback, g_token);

    if (raw_output) {
        std::cout.rdbuf(pcm_out.rdbuf());
    }
    if (err.isCancelled()) {
        return 130;
    }
    return err.isOk() ? 0 : 1;
}
