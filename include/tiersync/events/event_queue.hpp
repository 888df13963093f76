/**
 * @file event_queue.hpp
 * @brief Thread-safe FIFO carrying watcher output to the dispatcher
 *
 * The watcher thread pushes, the event dispatcher pops with a blocking wait.
 * shutdown() wakes every waiter; items already queued are still handed out
 * before pop() reports the end of the stream with nullopt.
 *
 * EXAMPLE:
 * ThreadSafeQueue<WatchEvent> queue;
 * queue.push(event);          // Producer
 * auto event = queue.pop();   // Consumer (blocks until available)
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace tiersync::events {

template<typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() = default;

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    /**
     * @brief Push item to queue
     *
     * Items pushed after shutdown() are dropped; returns false for them.
     */
    bool push(T item) {
        {
            std::unique_lock lock(mutex_);
            if (shutdown_) {
                return false;
            }
            queue_.push(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Non-blocking pop; nullopt when empty
     */
    std::optional<T> try_pop() {
        std::unique_lock lock(mutex_);

        if (queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    /**
     * @brief Blocking pop
     *
     * RETURNS: next item, or nullopt once shut down and drained
     */
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);

        cv_.wait(lock, [this]() {
            return !queue_.empty() || shutdown_;
        });

        if (queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    /**
     * @brief Pop with timeout
     */
    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);

        if (!cv_.wait_for(lock, timeout, [this]() {
            return !queue_.empty() || shutdown_;
        })) {
            return std::nullopt;
        }

        if (queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    size_t size() const {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::unique_lock lock(mutex_);
        return queue_.empty();
    }

    bool is_shutdown() const {
        std::unique_lock lock(mutex_);
        return shutdown_;
    }

    /**
     * @brief Signal shutdown (wake up all waiting threads)
     */
    void shutdown() {
        {
            std::unique_lock lock(mutex_);
            shutdown_ = true;
        }
        cv_.notify_all();
    }

private:
    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool shutdown_ = false;
};

} // namespace tiersync::events
