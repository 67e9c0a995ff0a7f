#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <variant>
#include <vector>

namespace NixBlitz {

// Returned by Subscription::receive() after events were dropped for a slow subscriber.
struct Lagged {
    uint64_t skipped = 0;
};

// Returned by Subscription::receive() once the subscription or the bus is closed.
struct Closed {};

template <typename EventT>
class EventBus;

/**
 * @brief One subscriber's view of an EventBus.
 *
 * Holds a bounded queue of events published after subscribe(). When the queue is full the
 * oldest pending event is dropped and counted; the next receive() reports Lagged{n} before
 * delivering the remaining events.
 */
template <typename EventT>
class Subscription {
public:
    using Item = std::variant<EventT, Lagged, Closed>;

    explicit Subscription(size_t capacity) : capacity_(std::max<size_t>(capacity, 1)) {}

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    // Blocks until an event, a lag notice, or close. Pending events are discarded on close.
    Item receive()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || lagged_ > 0 || !queue_.empty(); });
        return takeLocked();
    }

    // Returns std::nullopt on timeout.
    std::optional<Item> receive(std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(
                lock, timeout, [this] { return closed_ || lagged_ > 0 || !queue_.empty(); })) {
            return std::nullopt;
        }
        return takeLocked();
    }

    // Non-blocking drain used by tests and polling consumers.
    std::optional<Item> tryReceive()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!closed_ && lagged_ == 0 && queue_.empty()) {
            return std::nullopt;
        }
        return takeLocked();
    }

    void close()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool isClosed() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    // Total events this subscriber has lost since it subscribed.
    uint64_t droppedTotal() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return droppedTotal_;
    }

    size_t pending() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    friend class EventBus<EventT>;

    // Returns the number of events dropped to make room (0 or 1).
    size_t deliver(const EventT& event)
    {
        size_t dropped = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return 0;
            }
            if (queue_.size() >= capacity_) {
                queue_.pop_front();
                ++lagged_;
                ++droppedTotal_;
                dropped = 1;
            }
            queue_.push_back(event);
        }
        cv_.notify_one();
        return dropped;
    }

    Item takeLocked()
    {
        if (closed_) {
            return Closed{};
        }
        if (lagged_ > 0) {
            const uint64_t skipped = lagged_;
            lagged_ = 0;
            return Lagged{ skipped };
        }
        if (!queue_.empty()) {
            EventT event = std::move(queue_.front());
            queue_.pop_front();
            return event;
        }
        return Closed{};
    }

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<EventT> queue_;
    uint64_t lagged_ = 0;
    uint64_t droppedTotal_ = 0;
    bool closed_ = false;
};

/**
 * @brief Lossy multi-producer, multi-consumer broadcast.
 *
 * publish() never blocks on a slow subscriber and is a no-op without subscribers. A
 * subscriber only sees events published after it subscribed.
 */
template <typename EventT>
class EventBus {
public:
    static constexpr size_t kDefaultCapacity = 100;

    explicit EventBus(size_t capacity = kDefaultCapacity) : capacity_(capacity) {}

    ~EventBus() { close(); }

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    std::shared_ptr<Subscription<EventT>> subscribe()
    {
        auto subscription = std::make_shared<Subscription<EventT>>(capacity_);
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            subscription->close();
            return subscription;
        }
        subscribers_.push_back(subscription);
        return subscription;
    }

    void publish(const EventT& event)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Drop subscribers that were closed or released by their session.
        subscribers_.erase(
            std::remove_if(
                subscribers_.begin(),
                subscribers_.end(),
                [](const std::weak_ptr<Subscription<EventT>>& weak) {
                    auto sub = weak.lock();
                    return !sub || sub->isClosed();
                }),
            subscribers_.end());

        for (const auto& weak : subscribers_) {
            if (auto sub = weak.lock()) {
                droppedTotal_ += sub->deliver(event);
            }
        }
    }

    void close()
    {
        std::vector<std::weak_ptr<Subscription<EventT>>> subscribers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            subscribers.swap(subscribers_);
        }
        for (const auto& weak : subscribers) {
            if (auto sub = weak.lock()) {
                sub->close();
            }
        }
    }

    size_t subscriberCount() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = 0;
        for (const auto& weak : subscribers_) {
            auto sub = weak.lock();
            if (sub && !sub->isClosed()) {
                ++count;
            }
        }
        return count;
    }

    // Events dropped across all subscribers since the bus was created.
    uint64_t droppedTotal() const { return droppedTotal_.load(); }

    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::vector<std::weak_ptr<Subscription<EventT>>> subscribers_;
    std::atomic<uint64_t> droppedTotal_{ 0 };
    bool closed_ = false;
};

} // namespace NixBlitz
