#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace NixBlitz {

/**
 * @brief Unbounded thread-safe FIFO.
 *
 * Once closed, push() is ignored and waitPop() drains the remaining items before
 * returning std::nullopt.
 */
template <typename T>
class SynchronizedQueue {
public:
    void push(T item)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            queue_.push_back(std::move(item));
        }
        cv_.notify_one();
    }

    std::optional<T> tryPop()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return popLocked();
    }

    // Blocks until an item arrives or the queue is closed and drained.
    std::optional<T> waitPop()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty() || closed_; });
        return popLocked();
    }

    void close()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

private:
    std::optional<T> popLocked()
    {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop_front();
        return item;
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    bool closed_ = false;
};

} // namespace NixBlitz
