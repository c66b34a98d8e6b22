#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

// --- Blocking Queue ---

// Unbounded hand-off queue between one producer thread and its consumers.
// - push() is a no-op once the queue is closed.
// - pop() blocks until an item arrives or the queue is closed; it returns
//   false when the queue is closed and drained.
template <typename T>
class BlockingQueue {
   private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    bool closed_ = false;

   public:
    void push(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return;
            queue_.push_back(std::move(value));
        }
        cv_.notify_one();
    }

    bool pop(T &out) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&] { return closed_ || !queue_.empty(); });
        if (queue_.empty()) return false;

        out = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    // Non-blocking variant of pop()
    bool try_pop(T &out) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) return false;

        out = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }
};
