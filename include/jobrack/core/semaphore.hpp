#pragma once

/**
 * @file semaphore.hpp
 * @brief Counting semaphore used as the worker admission limiter
 */

#include <condition_variable>
#include <cstddef>
#include <mutex>

#include "jobrack/core/signal.hpp"

namespace jobrack {

/**
 * @brief Counting semaphore with a fixed number of slots
 */
class Semaphore {
public:
    explicit Semaphore(std::size_t capacity)
        : capacity_(capacity)
        , available_(capacity) {}

    // Non-copyable, non-movable
    Semaphore(const Semaphore&) = delete;
    Semaphore& operator=(const Semaphore&) = delete;
    Semaphore(Semaphore&&) = delete;
    Semaphore& operator=(Semaphore&&) = delete;

    /**
     * @brief Take a slot, blocking until one is free
     */
    void acquire() {
        std::unique_lock<std::mutex> lock(mutex_);
        slot_free_.wait(lock, [this] { return available_ > 0; });
        available_--;
    }

    /**
     * @brief Take a slot if one is free right now
     */
    bool try_acquire() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (available_ == 0) {
            return false;
        }
        available_--;
        return true;
    }

    /**
     * @brief Take a slot unless the cancel signal fires first
     *
     * A fired signal wins over a free slot. The setter of @p cancel must
     * call notify_waiters() afterwards.
     *
     * @return true if a slot was taken
     */
    bool acquire_until(const Signal& cancel) {
        std::unique_lock<std::mutex> lock(mutex_);
        slot_free_.wait(lock, [this, &cancel] {
            return cancel.is_set() || available_ > 0;
        });
        if (cancel.is_set()) {
            return false;
        }
        available_--;
        return true;
    }

    /**
     * @brief Give a slot back
     */
    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (available_ < capacity_) {
                available_++;
            }
        }
        slot_free_.notify_one();
    }

    /**
     * @brief Wake blocked acquirers so they re-check their cancel signal
     */
    void notify_waiters() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
        }
        slot_free_.notify_all();
    }

    [[nodiscard]] std::size_t available() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return available_;
    }

    [[nodiscard]] std::size_t capacity() const noexcept {
        return capacity_;
    }

private:
    const std::size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable slot_free_;
    std::size_t available_;
};

} // namespace jobrack
