#include "internal/scheduler/parallel_synthesis_stream.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <limits>
#include <utility>

namespace sonata {

namespace {

constexpr size_t NO_FAILURE = std::numeric_limits<size_t>::max();

}  // namespace

ParallelSynthesisStream::ParallelSynthesisStream(SynthesisJob job, size_t max_parallel,
    size_t channel_capacity)
    : SynthesisStreamBase(std::move(job), audio::RtfTracker::TimingPolicy::WALL_CLOCK_SPAN)
    , segments_(text::segmentText(job_.text))
    , num_workers_(std::max<size_t>(1, std::min(max_parallel, segments_.size())))
    , channel_(channel_capacity)
    , failed_index_(NO_FAILURE) {
}

ParallelSynthesisStream::~ParallelSynthesisStream() {
    if (!isFinished()) {
        cancel();
    }
    if (pool_) {
        pool_->stop();
    }
    joinReleaseThread();
}

void ParallelSynthesisStream::start() {
    if (started_) {
        return;
    }
    started_ = true;

    if (segments_.empty()) {
        channel_.close();
        return;
    }

    if (job_.verbose) {
        std::cout << "[Scheduler] parallel: " << segments_.size() << " segments on "
                  << num_workers_ << " workers" << std::endl;
    }

    pool_ = std::make_unique<WorkerPool>(num_workers_);
    pool_->start();

    tracker_.markStart();
    for (size_t i = 0; i < segments_.size(); ++i) {
        if (!pool_->submit([this, i] { synthesizeSegment(i); })) {
            // 线程池未运行: 以该段失败处理, 之前的分段照常释放
            SegmentOutcome outcome;
            outcome.index = i;
            outcome.status = ErrorInfo::error(ErrorCode::INTERNAL_ERROR, "Failed to dispatch segment",
                "index=" + std::to_string(i));
            markFailed(i);
            release_buffer_.put(std::move(outcome));
            break;
        }
    }

    release_thread_ = std::thread(&ParallelSynthesisStream::releaseLoop, this);
}

void ParallelSynthesisStream::synthesizeSegment(size_t index) {
    SegmentOutcome outcome;
    outcome.index = index;

    if (job_.token.isCancelled()) {
        outcome.status = ErrorInfo::cancelled();
        release_buffer_.put(std::move(outcome));
        return;
    }

    // 之前的分段已失败, 跳过
    if (index > failed_index_.load()) {
        outcome.status = ErrorInfo::error(ErrorCode::INTERNAL_ERROR, "Segment skipped");
        release_buffer_.put(std::move(outcome));
        return;
    }

    auto start_time = std::chrono::steady_clock::now();
    outcome.status = job_.model->synthesize(segments_[index].text, job_.params, outcome.audio);
    auto end_time = std::chrono::steady_clock::now();
    outcome.synthesis_seconds = std::chrono::duration<double>(end_time - start_time).count();

    if (!outcome.status.isOk()) {
        markFailed(index);
    }

    if (job_.verbose) {
        std::cout << "[Scheduler] parallel segment " << index << " done in "
                  << outcome.synthesis_seconds << "s" << std::endl;
    }

    release_buffer_.put(std::move(outcome));
}

void ParallelSynthesisStream::markFailed(size_t index) {
    size_t current = failed_index_.load();
    while (index < current && !failed_index_.compare_exchange_weak(current, index)) {
    }
}

void ParallelSynthesisStream::releaseLoop() {
    const size_t total = segments_.size();

    for (size_t i = 0; i < total; ++i) {
        SegmentOutcome outcome;
        if (!release_buffer_.takeNext(outcome, job_.token)) {
            release_status_ = ErrorInfo::cancelled();
            channel_.cancel();
            return;
        }

        // 之前的块仍留在通道中, 由调用方取完后再结束
        if (!outcome.status.isOk()) {
            release_status_ = outcome.status;
            channel_.close();
            return;
        }

        WaveSamples chunk;
        uint64_t samples_before = assembler_.getSpeechSamples();
        auto err = assembler_.addSegment(std::move(outcome.audio), outcome.index, chunk);
        if (!err.isOk()) {
            markFailed(outcome.index);
            release_status_ = err;
            channel_.close();
            return;
        }
        tracker_.addAudioSamples(assembler_.getSpeechSamples() - samples_before);

        if (i + 1 == total) {
            assembler_.finishChunk(chunk);
            tracker_.markEnd();
        }

        if (!channel_.push(std::move(chunk), job_.token)) {
            release_status_ = ErrorInfo::cancelled();
            return;
        }
    }

    channel_.close();
}

bool ParallelSynthesisStream::next(WaveSamples& chunk) {
    if (!started_) {
        start();
    }

    if (isFinished()) {
        return false;
    }

    if (channel_.pop(chunk, job_.token)) {
        delivered_++;
        if (chunk.is_final) {
            // 最后一块交付后才计算 RTF
            joinReleaseThread();
            finish(ErrorInfo::ok());
        }
        return true;
    }

    if (job_.token.isCancelled()) {
        cancel();
        joinReleaseThread();
        finish(ErrorInfo::cancelled());
        return false;
    }

    // 通道已关闭且为空: 以释放线程记录的状态结束
    joinReleaseThread();
    finish(release_status_);
    return false;
}

void ParallelSynthesisStream::joinReleaseThread() {
    // tracker_ 与 release_status_ 只在释放线程退出后读取
    if (release_thread_.joinable()) {
        release_thread_.join();
    }
}

void ParallelSynthesisStream::cancel() {
    job_.token.cancel();
    channel_.cancel();
    release_buffer_.clear();
    if (pool_) {
        pool_->clear();
    }
}

}  // namespace sonata
