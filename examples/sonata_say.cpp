#include <cstring>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/backends/piper/piper_voice_loader.hpp"
#include "sonata_api.hpp"

void printUsage(const char* program) {
    std::cout << "用法: " << program << " [选项]\n"
        << "\n"
        << "选项:\n"
        << "  -c <config>          音色配置文件 (<model>.onnx.json)\n"
        << "  -d <dir>             从目录加载全部已安装音色 (默认: $SONATA_VOICES_DIR)\n"
        << "  -v <voice_id>        使用的音色ID (默认: 第一个加载的音色)\n"
        << "  -p <text>            直接合成指定文本\n"
        << "  -o <file>            输出文件 (默认: output.wav)\n"
        << "  -m <mode>            合成模式: lazy | parallel | batched (默认: lazy)\n"
        << "  --rate <0-100>       语速 (默认: 50)\n"
        << "  --volume <0-100>     音量 (默认: 100)\n"
        << "  --pitch <0-100>      音调 (默认: 50)\n"
        << "  --silence <ms>       末尾静音毫秒数 (默认: 0)\n"
        << "  --speaker <name>     说话人名称或索引\n"
        << "  --length-scale <f>   时长缩放\n"
        << "  --noise-scale <f>    噪声缩放\n"
        << "  --noise-w <f>        时长噪声\n"
        << "  --list-voices        列出已加载的音色\n"
        << "  --verbose            输出调度日志\n"
        << "  -h                   显示帮助\n"
        << "\n"
        << "交互模式:\n"
        << "  不带 -p 参数时进入交互模式，输入文本后按 Enter 合成\n"
        << "  输入 'q' 或 'quit' 退出\n"
        << "\n"
        << "示例:\n"
        << "  " << program << " -c en_US-amy-medium.onnx.json -p \"Hello world.\"\n"
        << "  " << program << " -d ~/.local/share/piper-voices --list-voices\n"
        << "  " << program << " -c voice.onnx.json -m parallel --rate 70 -p \"One. Two. Three.\"\n"
        << std::endl;
}

void printVoiceList(const std::vector<Sonata::VoiceInfo>& voices) {
    std::cout << "已加载音色 (" << voices.size() << "):\n";
    for (const auto& voice : voices) {
        std::cout << "  " << voice.voice_id
            << "  [" << voice.language << ", " << sonata::qualityToString(voice.quality)
            << ", " << voice.audio.sample_rate << "Hz"
            << (voice.supports_streaming_output ? ", streaming" : "") << "]\n";
        for (const auto& speaker : voice.speakers) {
            std::cout << "      " << speaker.first << ": " << speaker.second << "\n";
        }
    }
    std::cout << std::endl;
}

bool parseUint(const char* value, uint32_t& out) {
    try {
        long parsed = std::stol(value);
        if (parsed < 0) return false;
        out = static_cast<uint32_t>(parsed);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseFloat(const char* value, float& out) {
    try {
        out = std::stof(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool synthesize(Sonata::SonataEngine& engine, const Sonata::Utterance& utterance,
                const std::string& output_file) {
    std::cout << "合成中 (" << sonata::synthesisModeToString(*utterance.mode) << "): \""
              << utterance.text << "\"" << std::endl;

    Sonata::SynthesisResult result;
    auto err = engine.Synthesize(utterance, result);
    if (!err.isOk()) {
        std::cerr << "合成失败: " << err.toString() << std::endl;
        return false;
    }

    // 显示信息
    std::cout << "采样率: " << result.audio.sample_rate << " Hz" << std::endl;
    std::cout << "分段数: " << result.num_segments << std::endl;
    std::cout << "时长: " << result.getDurationMs() << " ms" << std::endl;
    std::cout << "处理时间: " << static_cast<int>(result.synthesis_seconds * 1000.0) << " ms" << std::endl;
    std::cout << "RTF: " << result.rtf << std::endl;

    // 保存文件
    err = Sonata::SonataEngine::SaveToWav(result, output_file);
    if (err.isOk()) {
        std::cout << "已保存: " << output_file << std::endl;
        return true;
    }
    std::cerr << "保存失败: " << err.toString() << std::endl;
    return false;
}

int main(int argc, char* argv[]) {
    auto config = Sonata::EngineConfig::FromEnvironment();

    std::string config_path;
    std::string voices_dir;
    std::string text;
    std::string output_file = "output.wav";
    bool interactive = true;
    bool list_voices = false;

    Sonata::Utterance utterance;
    sonata::SynthesisMode mode = sonata::SynthesisMode::LAZY;
    Sonata::SynthesisOptions options;
    bool has_options = false;

    // 解析参数
    for (int i = 1; i < argc; i++) {
        bool ok = true;
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "--list-voices") == 0) {
            list_voices = true;
        } else if (strcmp(argv[i], "--verbose") == 0) {
            config.verbose = true;
        } else if (strcmp(argv[i], "-c") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (strcmp(argv[i], "-d") == 0 && i + 1 < argc) {
            voices_dir = argv[++i];
        } else if (strcmp(argv[i], "-v") == 0 && i + 1 < argc) {
            utterance.voice_id = argv[++i];
        } else if (strcmp(argv[i], "-p") == 0 && i + 1 < argc) {
            text = argv[++i];
            interactive = false;
        } else if (strcmp(argv[i], "-o") == 0 && i + 1 < argc) {
            output_file = argv[++i];
        } else if (strcmp(argv[i], "-m") == 0 && i + 1 < argc) {
            ok = sonata::parseSynthesisMode(argv[++i], mode).isOk();
        } else if (strcmp(argv[i], "--rate") == 0 && i + 1 < argc) {
            ok = parseUint(argv[++i], utterance.speech_args.rate);
        } else if (strcmp(argv[i], "--volume") == 0 && i + 1 < argc) {
            ok = parseUint(argv[++i], utterance.speech_args.volume);
        } else if (strcmp(argv[i], "--pitch") == 0 && i + 1 < argc) {
            ok = parseUint(argv[++i], utterance.speech_args.pitch);
        } else if (strcmp(argv[i], "--silence") == 0 && i + 1 < argc) {
            ok = parseUint(argv[++i], utterance.speech_args.appended_silence_ms);
        } else if (strcmp(argv[i], "--speaker") == 0 && i + 1 < argc) {
            options.speaker = argv[++i];
            has_options = true;
        } else if (strcmp(argv[i], "--length-scale") == 0 && i + 1 < argc) {
            float value = 0.0f;
            ok = parseFloat(argv[++i], value);
            options.length_scale = value;
            has_options = true;
        } else if (strcmp(argv[i], "--noise-scale") == 0 && i + 1 < argc) {
            float value = 0.0f;
            ok = parseFloat(argv[++i], value);
            options.noise_scale = value;
            has_options = true;
        } else if (strcmp(argv[i], "--noise-w") == 0 && i + 1 < argc) {
            float value = 0.0f;
            ok = parseFloat(argv[++i], value);
            options.noise_w = value;
            has_options = true;
        } else {
            std::cerr << "错误: 未知参数 '" << argv[i] << "'" << std::endl;
            ok = false;
        }

        if (!ok) {
            std::cerr << "错误: 参数无效 '" << argv[i] << "'" << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    utterance.mode = mode;
    if (has_options) {
        utterance.synthesis_options = options;
    }

    // 创建引擎
    Sonata::SonataEngine engine(config, std::make_shared<sonata::piper::PiperVoiceLoader>());

    std::string version;
    engine.GetVersion(version);
    std::cout << "Sonata " << version << std::endl;

    // 加载音色
    if (!config_path.empty()) {
        Sonata::VoiceInfo info;
        auto err = engine.LoadVoice(config_path, info);
        if (!err.isOk()) {
            std::cerr << "音色加载失败: " << err.toString() << std::endl;
            return 1;
        }
    } else {
        std::vector<Sonata::VoiceInfo> loaded;
        auto err = engine.LoadVoicesFromDirectory(voices_dir, loaded);
        if (!err.isOk()) {
            std::cerr << "音色加载失败: " << err.toString() << std::endl;
            return 1;
        }
    }

    std::vector<Sonata::VoiceInfo> voices;
    engine.ListVoices(voices);
    if (list_voices) {
        printVoiceList(voices);
        return 0;
    }
    if (voices.empty()) {
        std::cerr << "错误: 没有可用的音色, 请使用 -c 或 -d 指定" << std::endl;
        return 1;
    }
    if (utterance.voice_id.empty()) {
        utterance.voice_id = voices.front().voice_id;
    }
    std::cout << "音色: " << utterance.voice_id << std::endl;
    std::cout << std::endl;

    if (interactive) {
        // 交互模式
        std::cout << "进入交互模式，输入文本后按 Enter 合成 (输入 q 退出)" << std::endl;
        std::cout << "----------------------------------------" << std::endl;

        std::string line;
        int count = 0;

        while (std::cout << "> " && std::getline(std::cin, line)) {
            if (line.empty()) {
                continue;
            }

            if (line == "q" || line == "quit" || line == "exit") {
                std::cout << "再见!" << std::endl;
                break;
            }

            // 生成输出文件名
            std::string out = output_file;
            if (count > 0) {
                size_t dot = out.rfind('.');
                if (dot != std::string::npos) {
                    out = out.substr(0, dot) + "_" + std::to_string(count) + out.substr(dot);
                } else {
                    out = out + "_" + std::to_string(count);
                }
            }

            utterance.text = line;
            synthesize(engine, utterance, out);
            std::cout << std::endl;
            count++;
        }
    } else {
        utterance.text = text;
        if (!synthesize(engine, utterance, output_file)) {
            return 1;
        }
    }

    return 0;
}
