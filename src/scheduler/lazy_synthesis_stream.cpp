#include "internal/scheduler/lazy_synthesis_stream.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace sonata {

LazySynthesisStream::LazySynthesisStream(SynthesisJob job)
    : SynthesisStreamBase(std::move(job), audio::RtfTracker::TimingPolicy::SEQUENTIAL_SUM)
    , segments_(job_.text) {
}

bool LazySynthesisStream::next(WaveSamples& chunk) {
    if (isFinished()) {
        return false;
    }

    if (job_.token.isCancelled()) {
        finish(ErrorInfo::cancelled());
        return false;
    }

    text::Segment segment;
    if (!segments_.next(segment)) {
        finish(ErrorInfo::ok());
        return false;
    }

    auto start_time = std::chrono::steady_clock::now();

    SegmentAudio output;
    auto err = job_.model->synthesize(segment.text, job_.params, output);

    auto end_time = std::chrono::steady_clock::now();
    tracker_.addSynthesisTime(std::chrono::duration<double>(end_time - start_time).count());

    if (!err.isOk()) {
        finish(err);
        return false;
    }

    // 合成期间被取消: 丢弃该段
    if (job_.token.isCancelled()) {
        finish(ErrorInfo::cancelled());
        return false;
    }

    uint64_t samples_before = assembler_.getSpeechSamples();
    err = assembler_.addSegment(std::move(output), segment.index, chunk);
    if (!err.isOk()) {
        finish(err);
        return false;
    }
    tracker_.addAudioSamples(assembler_.getSpeechSamples() - samples_before);

    if (job_.verbose) {
        std::cout << "[Scheduler] lazy segment " << segment.index << ": "
                  << chunk.wav_samples.size() << " bytes" << std::endl;
    }

    delivered_++;
    if (!segments_.hasNext()) {
        assembler_.finishChunk(chunk);
        finish(ErrorInfo::ok());
    }
    return true;
}

void LazySynthesisStream::cancel() {
    job_.token.cancel();
}

}  // namespace sonata
