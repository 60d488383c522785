/**
 * @file fair_mutex.h
 * @brief FIFO ticket mutex.
 * @details Waiters are served strictly in arrival order, so callbacks dispatched from
 *          several listener loops that share one device tracker are linearized in the
 *          order they asked for the lock. Satisfies Lockable and works with
 *          `std::lock_guard` / `std::unique_lock`.
 */
#ifndef SSDPTRACK_FAIR_MUTEX_H
#define SSDPTRACK_FAIR_MUTEX_H

#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace ssdptrack {
namespace utils {

class FairMutex {
public:
    FairMutex() = default;
    FairMutex(const FairMutex&) = delete;
    FairMutex& operator=(const FairMutex&) = delete;

    void lock() {
        std::unique_lock<std::mutex> guard(state_mutex_);
        const uint64_t ticket = next_ticket_++;
        turn_cv_.wait(guard, [this, ticket] { return now_serving_ == ticket; });
        locked_ = true;
    }

    bool try_lock() {
        std::lock_guard<std::mutex> guard(state_mutex_);
        if (locked_ || now_serving_ != next_ticket_) {
            return false;
        }
        ++next_ticket_;
        locked_ = true;
        return true;
    }

    void unlock() {
        {
            std::lock_guard<std::mutex> guard(state_mutex_);
            locked_ = false;
            ++now_serving_;
        }
        turn_cv_.notify_all();
    }

    /** @brief Snapshot of the lock state; only meaningful for diagnostics and tests. */
    bool is_locked() const {
        std::lock_guard<std::mutex> guard(state_mutex_);
        return locked_;
    }

private:
    mutable std::mutex state_mutex_;
    std::condition_variable turn_cv_;
    uint64_t next_ticket_ = 0;
    uint64_t now_serving_ = 0;
    bool locked_ = false;
};

} // namespace utils
} // namespace ssdptrack

#endif // SSDPTRACK_FAIR_MUTEX_H
