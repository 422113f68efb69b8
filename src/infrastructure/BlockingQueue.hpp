#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace cre::infrastructure {

// FIFO handoff between a transport callback thread and the thread that
// consumes the stream. Closing wakes every waiter; items pushed after close
// are dropped.
template <typename T>
class BlockingQueue {
public:
    enum class PopStatus { Item, Timeout, Closed };

    BlockingQueue() = default;
    BlockingQueue(const BlockingQueue&) = delete;
    BlockingQueue& operator=(const BlockingQueue&) = delete;

    void push(T value) {
        {
            std::lock_guard lock(mutex_);
            if (closed_) return;
            queue_.push_back(std::move(value));
        }
        condition_.notify_one();
    }

    // Waits for an item or close(), giving up after timeout. A non-positive
    // timeout waits forever.
    PopStatus pop_for(std::chrono::milliseconds timeout, std::optional<T>& out) {
        std::unique_lock lock(mutex_);
        auto ready = [this] { return closed_ || !queue_.empty(); };
        if (timeout.count() <= 0) {
            condition_.wait(lock, ready);
        } else if (!condition_.wait_for(lock, timeout, ready)) {
            return PopStatus::Timeout;
        }
        if (queue_.empty()) return PopStatus::Closed;
        out = std::move(queue_.front());
        queue_.pop_front();
        return PopStatus::Item;
    }

    // Pending items are discarded; consumers see Closed from then on.
    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
            queue_.clear();
        }
        condition_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<T> queue_;
    bool closed_{false};
};

} // namespace cre::infrastructure
