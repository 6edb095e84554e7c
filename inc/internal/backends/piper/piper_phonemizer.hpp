#ifndef SONATA_PIPER_PHONEMIZER_HPP
#define SONATA_PIPER_PHONEMIZER_HPP

#include <cstddef>
#include <cstdint>

#include <string>
#include <vector>

#include "internal/backends/piper/piper_voice_config.hpp"
#include "internal/sonata_types.hpp"

namespace sonata {
namespace piper {

// =============================================================================
// PiperPhonemizer - text -> phonemes -> phoneme ids
// =============================================================================
//
// espeak phonemes come from the espeak-ng command line tool (IPA output).
// Text phonemes are the codepoints of the segment itself.
//
// Id layout (Piper): ^ _ p1 _ p2 _ ... pn _ $
//

class PiperPhonemizer {
public:
    PiperPhonemizer(const PiperSettings& settings,
                    const std::string& espeak_data_dir,
                    size_t max_phoneme_ids);

    /// @brief Convert a text segment into phoneme ids
    /// @param text Segment text
    /// @param ids [out] Phoneme ids including BOS/EOS/pad
    /// @return SEGMENT_TOO_LARGE when the ids exceed the limit,
    ///         MODEL_FAILURE when espeak-ng fails
    ErrorInfo textToIds(const std::string& text, std::vector<int64_t>& ids) const;

    /// @brief Convert text into phonemes
    ErrorInfo phonemize(const std::string& text, std::u32string& phonemes) const;

    /// @brief Map phonemes to ids (unknown phonemes are skipped)
    /// @return Number of skipped phonemes
    size_t phonemesToIds(const std::u32string& phonemes, std::vector<int64_t>& ids) const;

    /// @brief Check whether the espeak-ng executable is available
    static bool isEspeakAvailable();

private:
    /// @brief Run espeak-ng and collect its IPA output
    ErrorInfo runEspeak(const std::string& text, std::string& ipa) const;

    /// @brief Drop line breaks and zero-width characters from espeak output
    static std::u32string cleanEspeakIpa(const std::string& ipa);

    void appendIds(char32_t phoneme, std::vector<int64_t>& ids) const;

    PiperSettings settings_;
    std::string espeak_data_dir_;
    size_t max_phoneme_ids_;
};

}  // namespace piper
}  // namespace sonata

#endif  // SONATA_PIPER_PHONEMIZER_HPP
