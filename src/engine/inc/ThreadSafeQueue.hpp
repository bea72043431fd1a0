#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

template <typename T>
class ThreadSafeQueue {
public:
    // Add item to queue
    void enqueue(T item) {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            queue_.push(std::move(item));
        }
        cv_.notify_one();
    }

    // Remove item from queue; std::nullopt once stopped and drained
    std::optional<T> dequeue() {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait(lock, [this] { return !queue_.empty() || stop_; });
        return pop_locked();
    }

    // Like dequeue, but gives up after timeout
    std::optional<T> dequeue_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || stop_; });
        return pop_locked();
    }

    // Stop the queue
    void stop() {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            stop_ = true;
        }
        cv_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return queue_.size();
    }

private:
    std::optional<T> pop_locked() {
        if (queue_.empty()) return std::nullopt;
        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    std::queue<T> queue_;                     // Pending items
    mutable std::mutex mtx_;                  // Mutex for queue protection
    std::condition_variable cv_;              // Condition variable for synchronization
    bool stop_ = false;                       // Stop flag
};
