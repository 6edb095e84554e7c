#ifndef SONATA_CANCELLATION_TOKEN_HPP
#define SONATA_CANCELLATION_TOKEN_HPP

#include <atomic>
#include <chrono>
#include <memory>

namespace sonata {

// =============================================================================
// CancellationToken (取消令牌)
// =============================================================================
//
// 可拷贝的共享标志, 拷贝之间共享同一状态。
// 调用方持有一份, 调度器在每个挂起点检查:
// 惰性模式每段之前 / 并行任务开始前 / 阻塞等待中 / 批处理调用前。
//

class CancellationToken {
public:
    /// 阻塞等待时检查取消的最长间隔
    static constexpr std::chrono::milliseconds POLL_INTERVAL{10};

    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    /// @brief 请求取消 (幂等)
    void cancel() const {
        flag_->store(true, std::memory_order_release);
    }

    bool isCancelled() const {
        return flag_->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace sonata

#endif  // SONATA_CANCELLATION_TOKEN_HPP
