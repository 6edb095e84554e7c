#ifndef SONATA_WORKER_POOL_HPP
#define SONATA_WORKER_POOL_HPP

#include <cstddef>

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace sonata {

// =============================================================================
// WorkerPool - 固定大小线程池 (并行模式, 每个请求一个)
// =============================================================================
//
// 任务按提交顺序 (FIFO) 出队。stop() 等待队列中剩余任务执行完毕后
// 回收线程; clear() 丢弃尚未开始的任务。
//

class WorkerPool {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(size_t num_threads = 2);
    ~WorkerPool();

    // 禁止拷贝
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// @brief 启动工作线程
    void start();

    /// @brief 停止并回收工作线程
    void stop();

    /// @brief 提交任务
    /// @return false 表示线程池未运行
    bool submit(Task task);

    /// @brief 丢弃尚未开始的任务
    /// @return 丢弃的任务数
    size_t clear();

    size_t getQueueSize() const;
    size_t getNumThreads() const { return num_threads_; }
    bool isRunning() const { return running_; }

private:
    void workerThread();

    std::vector<std::thread> workers_;
    size_t num_threads_;

    std::queue<Task> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
};

}  // namespace sonata

#endif  // SONATA_WORKER_POOL_HPP
