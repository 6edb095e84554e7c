#include "internal/scheduler/ordered_release_buffer.hpp"

#include <mutex>
#include <utility>

namespace sonata {

void OrderedReleaseBuffer::put(SegmentOutcome&& outcome) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cleared_ || outcome.index < next_index_) {
            return;
        }
        size_t index = outcome.index;
        pending_[index] = std::move(outcome);
    }
    cv_.notify_all();
}

bool OrderedReleaseBuffer::takeNext(SegmentOutcome& outcome, const CancellationToken& token) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!cleared_ && pending_.find(next_index_) == pending_.end()) {
        if (token.isCancelled()) {
            return false;
        }
        cv_.wait_for(lock, CancellationToken::POLL_INTERVAL);
    }
    if (cleared_ || token.isCancelled()) {
        return false;
    }

    auto it = pending_.find(next_index_);
    outcome = std::move(it->second);
    pending_.erase(it);
    next_index_++;
    return true;
}

void OrderedReleaseBuffer::clear() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cleared_ = true;
        pending_.clear();
    }
    cv_.notify_all();
}

size_t OrderedReleaseBuffer::getNextIndex() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_index_;
}

size_t OrderedReleaseBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

}  // namespace sonata
