#ifndef SONATA_PARALLEL_SYNTHESIS_STREAM_HPP
#define SONATA_PARALLEL_SYNTHESIS_STREAM_HPP

#include <cstddef>

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include "internal/scheduler/chunk_channel.hpp"
#include "internal/scheduler/ordered_release_buffer.hpp"
#include "internal/scheduler/synthesis_stream.hpp"
#include "internal/scheduler/worker_pool.hpp"
#include "internal/text/text_segmenter.hpp"

namespace sonata {

// =============================================================================
// ParallelSynthesisStream (并行模式)
// =============================================================================
//
// 线程模型:
//
//   WorkerPool (N 线程)          释放线程                  调用方
//   synthesize(seg i) ──put──> OrderedReleaseBuffer ──> 拼装 ──push──> ChunkChannel ──next()──>
//
// - 每个分段一个任务, 工作线程数 = min(max_parallel_inferences, 分段数)
// - 释放线程严格按序号取出结果, 提前完成的分段在缓冲中等待
// - 某段失败后, 序号更大的未开始分段被跳过; 之前的块照常交付, 然后以该错误结束
// - 取消时清空缓冲与通道, 丢弃未开始的任务
//

class ParallelSynthesisStream : public SynthesisStreamBase {
public:
    ParallelSynthesisStream(SynthesisJob job, size_t max_parallel, size_t channel_capacity);
    ~ParallelSynthesisStream() override;

    /// @brief 启动工作线程与释放线程
    void start();

    bool next(WaveSamples& chunk) override;
    void cancel() override;

    /// @brief 实际使用的工作线程数
    size_t getNumWorkers() const { return num_workers_; }

private:
    /// 工作线程任务: 合成第 index 段
    void synthesizeSegment(size_t index);

    /// 释放线程主循环
    void releaseLoop();

    /// 记录失败的最小序号
    void markFailed(size_t index);

    /// 等待释放线程退出
    void joinReleaseThread();

    std::vector<text::Segment> segments_;
    size_t num_workers_;

    std::unique_ptr<WorkerPool> pool_;
    OrderedReleaseBuffer release_buffer_;
    ChunkChannel<WaveSamples> channel_;
    std::thread release_thread_;

    std::atomic<size_t> failed_index_;
    ErrorInfo release_status_ = ErrorInfo::ok();  ///< 释放线程写入, join 之后由调用方读取
    bool started_ = false;
};

}  // namespace sonata

#endif  // SONATA_PARALLEL_SYNTHESIS_STREAM_HPP
