/**
 * @file thread_safe_queue.h
 * @brief Defines a generic, thread-safe queue for handing work to the event loop thread.
 * @details `ThreadSafeQueue` wraps a `std::deque` with a `std::mutex` and a
 *          `std::condition_variable`. Producers on any thread push; the loop thread
 *          drains the queue in batches.
 */
#ifndef SSDPTRACK_THREAD_SAFE_QUEUE_H
#define SSDPTRACK_THREAD_SAFE_QUEUE_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

namespace ssdptrack {
namespace utils {

/**
 * @class ThreadSafeQueue
 * @brief A template class for a thread-safe FIFO queue.
 * @tparam T The type of elements to be stored in the queue.
 */
template <typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() : stop_requested_(false) {}

    // Owned by a single component and shared by pointer/reference only.
    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue(ThreadSafeQueue&&) = delete;
    ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

    /**
     * @brief Pushes an item onto the queue.
     * @param item The item to push (moved into the queue).
     * @return `false` if the queue was stopped and the item was discarded.
     */
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_requested_) {
                return false;
            }
            queue_.push_back(std::move(item));
        }
        cond_.notify_one();
        return true;
    }

    /**
     * @brief Pops an item, waiting at most `timeout` for one to arrive.
     * @return `true` if an item was popped.
     */
    template <typename Rep, typename Period>
    bool pop_for(T& item, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cond_.wait_for(lock, timeout, [this] { return !queue_.empty() || stop_requested_; })) {
            return false;
        }
        if (queue_.empty()) {
            return false;
        }
        item = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    /**
     * @brief Attempts to pop an item from the queue without blocking.
     * @param item A reference to store the popped item if successful.
     * @return `true` if an item was popped, `false` if the queue was empty.
     */
    bool try_pop(T& item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return false;
        }
        item = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    /**
     * @brief Moves every queued item into `out` in FIFO order.
     * @return The number of items moved.
     */
    std::size_t drain(std::deque<T>& out) {
        std::lock_guard<std::mutex> lock(mutex_);
        const std::size_t count = queue_.size();
        while (!queue_.empty()) {
            out.push_back(std::move(queue_.front()));
            queue_.pop_front();
        }
        return count;
    }

    /**
     * @brief Stops the queue; later pushes are rejected and waiters wake up.
     */
    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_requested_ = true;
        }
        cond_.notify_all();
    }

    /** @brief Re-opens a stopped queue and discards anything left in it. */
    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.clear();
        stop_requested_ = false;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    bool is_stopped() const {
        return stop_requested_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cond_;
    std::deque<T> queue_;
    std::atomic<bool> stop_requested_;
};

} // namespace utils
} // namespace ssdptrack

#endif // SSDPTRACK_THREAD_SAFE_QUEUE_H
