#include "internal/backends/piper/piper_phonemizer.hpp"

#include <cstdio>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/text/text_utils.hpp"

namespace sonata {
namespace piper {

namespace {

/// Quote a string for a POSIX shell
std::string shellQuote(const std::string& value) {
    std::string escaped = value;
    std::string::size_type pos = 0;
    while ((pos = escaped.find("'", pos)) != std::string::npos) {
        escaped.replace(pos, 1, "'\"'\"'");
        pos += 5;
    }
    return "'" + escaped + "'";
}

bool isZeroWidth(char32_t cp) {
    return cp == 0x200B || cp == 0x200C || cp == 0x200D || cp == 0xFEFF;
}

}  // namespace

PiperPhonemizer::PiperPhonemizer(const PiperSettings& settings,
    const std::string& espeak_data_dir,
    size_t max_phoneme_ids)
    : settings_(settings)
    , espeak_data_dir_(espeak_data_dir)
    , max_phoneme_ids_(max_phoneme_ids) {
}

bool PiperPhonemizer::isEspeakAvailable() {
    std::string command = "espeak-ng --version 2>/dev/null";
    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(command.c_str(), "r"), pclose);
    if (!pipe) return false;

    char buffer[128];
    std::string result;
    if (fgets(buffer, sizeof(buffer), pipe.get()) != nullptr) {
        result += buffer;
    }

    int exit_status = pclose(pipe.release());
    return exit_status == 0 && !result.empty();
}

ErrorInfo PiperPhonemizer::textToIds(const std::string& text, std::vector<int64_t>& ids) const {
    std::u32string phonemes;
    auto err = phonemize(text, phonemes);
    if (!err.isOk()) {
        return err;
    }

    ids.clear();
    size_t missing = phonemesToIds(phonemes, ids);
    if (missing > 0) {
        std::cerr << "[PiperPhonemizer] Skipped " << missing << " phonemes missing from id map" << std::endl;
    }

    if (ids.size() > max_phoneme_ids_) {
        return ErrorInfo::error(ErrorCode::SEGMENT_TOO_LARGE, "Segment too large for the model",
            "phoneme_ids=" + std::to_string(ids.size()) + " max=" + std::to_string(max_phoneme_ids_));
    }
    return ErrorInfo::ok();
}

ErrorInfo PiperPhonemizer::phonemize(const std::string& text, std::u32string& phonemes) const {
    if (settings_.phoneme_type == PhonemeType::TEXT) {
        phonemes = text::decodeUtf8(text);
        return ErrorInfo::ok();
    }

    std::string ipa;
    auto err = runEspeak(text, ipa);
    if (!err.isOk()) {
        return err;
    }
    phonemes = cleanEspeakIpa(ipa);
    return ErrorInfo::ok();
}

size_t PiperPhonemizer::phonemesToIds(const std::u32string& phonemes, std::vector<int64_t>& ids) const {
    size_t missing = 0;

    appendIds(PHONEME_BOS, ids);
    appendIds(PHONEME_PAD, ids);

    for (char32_t phoneme : phonemes) {
        if (settings_.phoneme_id_map.find(phoneme) == settings_.phoneme_id_map.end()) {
            missing++;
            continue;
        }
        appendIds(phoneme, ids);
        appendIds(PHONEME_PAD, ids);
    }

    appendIds(PHONEME_EOS, ids);
    return missing;
}

void PiperPhonemizer::appendIds(char32_t phoneme, std::vector<int64_t>& ids) const {
    auto it = settings_.phoneme_id_map.find(phoneme);
    if (it != settings_.phoneme_id_map.end()) {
        ids.insert(ids.end(), it->second.begin(), it->second.end());
    }
}

ErrorInfo PiperPhonemizer::runEspeak(const std::string& text, std::string& ipa) const {
    std::string command = "echo " + shellQuote(text) + " | espeak-ng -q --ipa";
    if (!espeak_data_dir_.empty()) {
        command += " --path=" + shellQuote(espeak_data_dir_);
    }
    command += " -v " + shellQuote(settings_.espeak_voice) + " 2>/dev/null";

    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(command.c_str(), "r"), pclose);
    if (!pipe) {
        return ErrorInfo::error(ErrorCode::MODEL_FAILURE, "Failed to run espeak-ng");
    }

    char buffer[4096];
    ipa.clear();
    while (fgets(buffer, sizeof(buffer), pipe.get()) != nullptr) {
        ipa += buffer;
    }

    int exit_status = pclose(pipe.release());
    if (exit_status != 0) {
        return ErrorInfo::error(ErrorCode::MODEL_FAILURE, "espeak-ng failed",
            "voice=" + settings_.espeak_voice + " status=" + std::to_string(exit_status));
    }
    return ErrorInfo::ok();
}

std::u32string PiperPhonemizer::cleanEspeakIpa(const std::string& ipa) {
    std::u32string result;
    bool last_was_space = true;

    // espeak-ng prints one clause per line; clauses are joined with a space
    for (char32_t cp : text::decodeUtf8(ipa)) {
        if (isZeroWidth(cp)) {
            continue;
        }
        if (cp == U'\n' || cp == U'\r' || cp == U' ' || cp == U'\t') {
            if (!last_was_space) {
                result.push_back(U' ');
                last_was_space = true;
            }
            continue;
        }
        result.push_back(cp);
        last_was_space = false;
    }

    if (!result.empty() && result.back() == U' ') {
        result.pop_back();
    }
    return result;
}

}  // namespace piper
}  // namespace sonata
