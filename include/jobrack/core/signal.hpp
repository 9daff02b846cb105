#pragma once

/**
 * @file signal.hpp
 * @brief One-shot, multi-reader notification
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace jobrack {

/**
 * @brief Fires once and stays fired
 *
 * Any number of threads may block on the signal or poll it. Setting it
 * more than once is harmless.
 */
class Signal {
public:
    Signal() = default;

    // Non-copyable, non-movable (due to synchronization primitives)
    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;
    Signal(Signal&&) = delete;
    Signal& operator=(Signal&&) = delete;

    /**
     * @brief Fire the signal and wake every waiter
     */
    void set() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (set_.load(std::memory_order_relaxed)) {
                return;
            }
            set_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool is_set() const noexcept {
        return set_.load(std::memory_order_acquire);
    }

    /**
     * @brief Block until the signal fires
     */
    void wait() const {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return set_.load(std::memory_order_relaxed); });
    }

    /**
     * @brief Block until the signal fires or the timeout elapses
     * @return true if the signal fired
     */
    template<typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] {
            return set_.load(std::memory_order_relaxed);
        });
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::atomic<bool> set_{false};
};

} // namespace jobrack
