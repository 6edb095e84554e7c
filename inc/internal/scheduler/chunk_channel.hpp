#ifndef SONATA_CHUNK_CHANNEL_HPP
#define SONATA_CHUNK_CHANNEL_HPP

#include <cstddef>

#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>

#include "internal/cancellation_token.hpp"

namespace sonata {

// =============================================================================
// ChunkChannel - 有界通道 (调度器 -> 调用方)
// =============================================================================
//
// 生产者在通道满时阻塞, 消费者在通道空时阻塞。
// close(): 生产结束, 消费者取完剩余元素后返回 false。
// cancel(): 丢弃全部剩余元素, 双方立即返回 false。
// 所有阻塞等待都以 CancellationToken::POLL_INTERVAL 为间隔检查取消令牌。
//

template <typename T>
class ChunkChannel {
public:
    explicit ChunkChannel(size_t capacity)
        : capacity_(capacity > 0 ? capacity : 1) {
    }

    // 禁止拷贝
    ChunkChannel(const ChunkChannel&) = delete;
    ChunkChannel& operator=(const ChunkChannel&) = delete;

    /// @brief 写入元素, 通道满时阻塞
    /// @return false 表示通道已关闭/取消或令牌已取消, 元素未写入
    bool push(T item, const CancellationToken& token) {
        std::unique_lock<std::mutex> lock(mutex_);
        while (queue_.size() >= capacity_ && !closed_ && !cancelled_) {
            if (token.isCancelled()) {
                return false;
            }
            not_full_.wait_for(lock, CancellationToken::POLL_INTERVAL);
        }
        if (closed_ || cancelled_ || token.isCancelled()) {
            return false;
        }
        queue_.push_back(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    /// @brief 读取元素, 通道空时阻塞
    /// @return false 表示通道已关闭且为空, 或已取消
    bool pop(T& item, const CancellationToken& token) {
        std::unique_lock<std::mutex> lock(mutex_);
        while (queue_.empty() && !closed_ && !cancelled_) {
            if (token.isCancelled()) {
                return false;
            }
            not_empty_.wait_for(lock, CancellationToken::POLL_INTERVAL);
        }
        if (cancelled_ || token.isCancelled() || queue_.empty()) {
            return false;
        }
        item = std::move(queue_.front());
        queue_.pop_front();
        not_full_.notify_one();
        return true;
    }

    /// @brief 生产结束
    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    /// @brief 取消: 丢弃剩余元素并唤醒所有等待方
    void cancel() {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
        queue_.clear();
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    size_t capacity() const { return capacity_; }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    bool isCancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> queue_;
    bool closed_ = false;
    bool cancelled_ = false;
};

}  // namespace sonata

#endif  // SONATA_CHUNK_CHANNEL_HPP
