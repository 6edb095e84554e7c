#include "internal/scheduler/synthesis_scheduler.hpp"

#include <iostream>
#include <utility>
#include <vector>

#include "internal/scheduler/batched_synthesis.hpp"
#include "internal/scheduler/lazy_synthesis_stream.hpp"
#include "internal/scheduler/parallel_synthesis_stream.hpp"

namespace sonata {

SynthesisScheduler::SynthesisScheduler(const EngineConfig& config)
    : config_(config) {
}

std::unique_ptr<ISynthesisStream> SynthesisScheduler::createStream(SynthesisJob job) {
    if (job.mode == SynthesisMode::PARALLEL) {
        auto stream = std::make_unique<ParallelSynthesisStream>(std::move(job),
            config_.getEffectiveParallelism(), config_.stream_buffer_chunks);
        stream->start();
        return stream;
    }
    return std::make_unique<LazySynthesisStream>(std::move(job));
}

ErrorInfo SynthesisScheduler::openStream(SynthesisJob job, std::unique_ptr<ISynthesisStream>& stream) {
    if (job.mode == SynthesisMode::BATCHED) {
        return ErrorInfo::error(ErrorCode::STREAMING_UNSUPPORTED,
            "Batched mode does not produce a stream");
    }
    if (!job.voice->supports_streaming_output) {
        return ErrorInfo::error(ErrorCode::STREAMING_UNSUPPORTED,
            "Voice does not support streaming output", job.voice->voice_id);
    }

    if (job.verbose) {
        std::cout << "[Scheduler] Open " << synthesisModeToString(job.mode)
                  << " stream for voice " << job.voice->voice_id << std::endl;
    }

    stream = createStream(std::move(job));
    return ErrorInfo::ok();
}

ErrorInfo SynthesisScheduler::synthesize(SynthesisJob job, SynthesisResult& result) {
    if (job.mode == SynthesisMode::BATCHED) {
        return runBatchedSynthesis(job, result);
    }

    auto stream = createStream(std::move(job));

    // 流的最后一块已包含末尾静音, 直接拼接
    std::vector<uint8_t> buffer;
    WaveSamples chunk;
    while (stream->next(chunk)) {
        buffer.insert(buffer.end(), chunk.wav_samples.begin(), chunk.wav_samples.end());
    }

    auto status = stream->getStatus();
    if (!status.isOk()) {
        return status;
    }

    float rtf = 0.0f;
    auto err = stream->getRtf(rtf);
    if (!err.isOk()) {
        return err;
    }

    result.wav_samples = std::move(buffer);
    result.rtf = rtf;
    result.audio = stream->getAudioInfo();
    result.num_segments = stream->getChunksDelivered();
    result.synthesis_seconds = stream->getSynthesisSeconds();
    result.audio_seconds = stream->getAudioSeconds();
    return ErrorInfo::ok();
}

}  // namespace sonata
