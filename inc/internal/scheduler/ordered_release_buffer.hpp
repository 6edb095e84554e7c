#ifndef SONATA_ORDERED_RELEASE_BUFFER_HPP
#define SONATA_ORDERED_RELEASE_BUFFER_HPP

#include <cstddef>

#include <condition_variable>
#include <map>
#include <mutex>

#include "internal/cancellation_token.hpp"
#include "internal/sonata_types.hpp"

namespace sonata {

// =============================================================================
// SegmentOutcome (单个分段的合成结果)
// =============================================================================

struct SegmentOutcome {
    size_t index = 0;
    ErrorInfo status = ErrorInfo::ok();
    SegmentAudio audio;
    double synthesis_seconds = 0.0;
};

// =============================================================================
// OrderedReleaseBuffer - 按序释放缓冲
// =============================================================================
//
// 工作线程以任意顺序写入结果, 释放方严格按分段序号取出:
// 提前完成的分段留在缓冲中, 直到之前的分段全部释放。
//

class OrderedReleaseBuffer {
public:
    OrderedReleaseBuffer() = default;

    // 禁止拷贝
    OrderedReleaseBuffer(const OrderedReleaseBuffer&) = delete;
    OrderedReleaseBuffer& operator=(const OrderedReleaseBuffer&) = delete;

    /// @brief 写入一个分段结果 (clear 之后的写入被丢弃)
    void put(SegmentOutcome&& outcome);

    /// @brief 等待并取出下一个按序的结果
    /// @param outcome [out] 结果
    /// @param token 取消令牌
    /// @return false 表示已取消或已清空
    bool takeNext(SegmentOutcome& outcome, const CancellationToken& token);

    /// @brief 丢弃所有缓冲结果并唤醒等待方
    void clear();

    /// @brief 下一个待释放的分段序号
    size_t getNextIndex() const;

    /// @brief 缓冲中 (已完成但未释放) 的结果数
    size_t size() const;

private:
    std::map<size_t, SegmentOutcome> pending_;  // 按序号存储
    size_t next_index_ = 0;
    bool cleared_ = false;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

}  // namespace sonata

#endif  // SONATA_ORDERED_RELEASE_BUFFER_HPP
