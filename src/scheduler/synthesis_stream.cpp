#include "internal/scheduler/synthesis_stream.hpp"

#include <iostream>
#include <mutex>
#include <utility>

namespace sonata {

SynthesisStreamBase::SynthesisStreamBase(SynthesisJob job, audio::RtfTracker::TimingPolicy policy)
    : job_(std::move(job))
    , assembler_(job_.voice->audio, job_.speech_args)
    , tracker_(job_.voice->audio, policy) {
}

void SynthesisStreamBase::finish(const ErrorInfo& status) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (finished_) {
        return;
    }
    finished_ = true;
    synthesis_seconds_ = tracker_.getSynthesisSeconds();
    audio_seconds_ = tracker_.getAudioSeconds();

    if (!status.isOk()) {
        status_ = status;
        if (!status.isCancelled()) {
            std::cerr << "[Scheduler] " << synthesisModeToString(job_.mode)
                      << " synthesis failed after " << delivered_ << " chunks: "
                      << status.toString() << std::endl;
        }
        return;
    }

    // 最后一块交付后才计算 RTF
    status_ = tracker_.computeRtf(rtf_);
    if (job_.verbose && status_.isOk()) {
        std::cout << "[Scheduler] " << synthesisModeToString(job_.mode) << " done: "
                  << delivered_ << " chunks, audio " << audio_seconds_
                  << "s, RTF=" << rtf_ << std::endl;
    }
}

ErrorInfo SynthesisStreamBase::getStatus() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return status_;
}

bool SynthesisStreamBase::isFinished() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return finished_;
}

ErrorInfo SynthesisStreamBase::getRtf(float& rtf) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!status_.isOk()) {
        return status_;
    }
    rtf = rtf_;
    return ErrorInfo::ok();
}

double SynthesisStreamBase::getSynthesisSeconds() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return synthesis_seconds_;
}

double SynthesisStreamBase::getAudioSeconds() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return audio_seconds_;
}

}  // namespace sonata
