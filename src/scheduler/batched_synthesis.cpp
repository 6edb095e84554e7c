#include "internal/scheduler/batched_synthesis.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "internal/text/text_segmenter.hpp"

namespace sonata {

ErrorInfo runBatchedSynthesis(const SynthesisJob& job, SynthesisResult& result) {
    if (job.token.isCancelled()) {
        return ErrorInfo::cancelled();
    }

    auto segments = text::segmentText(job.text);

    std::vector<std::string> texts;
    texts.reserve(segments.size());
    for (const auto& segment : segments) {
        texts.push_back(segment.text);
    }

    audio::RtfTracker tracker(job.voice->audio, audio::RtfTracker::TimingPolicy::SEQUENTIAL_SUM);
    std::vector<SegmentAudio> outputs;

    if (job.model->supportsBatching()) {
        auto start_time = std::chrono::steady_clock::now();
        auto err = job.model->synthesizeBatch(texts, job.params, outputs);
        auto end_time = std::chrono::steady_clock::now();
        tracker.addSynthesisTime(std::chrono::duration<double>(end_time - start_time).count());

        if (!err.isOk()) {
            return err;
        }
        if (outputs.size() != texts.size()) {
            return ErrorInfo::error(ErrorCode::MODEL_FAILURE, "Batch output count mismatch",
                "expected=" + std::to_string(texts.size()) +
                ", got=" + std::to_string(outputs.size()));
        }
    } else {
        // 模型不支持批处理: 逐段顺序合成
        outputs.reserve(texts.size());
        for (const auto& text : texts) {
            SegmentAudio output;
            auto start_time = std::chrono::steady_clock::now();
            auto err = job.model->synthesize(text, job.params, output);
            auto end_time = std::chrono::steady_clock::now();
            tracker.addSynthesisTime(std::chrono::duration<double>(end_time - start_time).count());

            if (!err.isOk()) {
                return err;
            }
            outputs.push_back(std::move(output));
        }
    }

    audio::AudioAssembler assembler(job.voice->audio, job.speech_args);
    std::vector<WaveSamples> chunks;
    chunks.reserve(outputs.size());
    for (size_t i = 0; i < outputs.size(); ++i) {
        WaveSamples chunk;
        auto err = assembler.addSegment(std::move(outputs[i]), i, chunk);
        if (!err.isOk()) {
            return err;
        }
        chunks.push_back(std::move(chunk));
    }
    tracker.addAudioSamples(assembler.getSpeechSamples());

    float rtf = 0.0f;
    auto err = tracker.computeRtf(rtf);
    if (!err.isOk()) {
        return err;
    }

    result.wav_samples.clear();
    assembler.assemble(std::move(chunks), result.wav_samples);
    result.rtf = rtf;
    result.audio = job.voice->audio;
    result.num_segments = segments.size();
    result.synthesis_seconds = tracker.getSynthesisSeconds();
    result.audio_seconds = tracker.getAudioSeconds();

    if (job.verbose) {
        std::cout << "[Scheduler] batched done: " << segments.size() << " segments ("
                  << (job.model->supportsBatching() ? "native batch" : "sequential fallback")
                  << "), RTF=" << rtf << std::endl;
    }
    return ErrorInfo::ok();
}

}  // namespace sonata
