#pragma once

/**
 * @file channel.hpp
 * @brief Bounded or rendezvous MPMC channel with close semantics
 */

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

#include "jobrack/core/signal.hpp"

namespace jobrack {

/**
 * @brief Channel statistics for monitoring
 */
struct ChannelStats {
    std::uint64_t push_count{0};
    std::uint64_t pop_count{0};
    std::uint64_t push_blocked_count{0};
    std::uint64_t pop_blocked_count{0};
    std::size_t current_size{0};
    std::size_t capacity{0};
    std::size_t high_watermark{0};
};

/**
 * @brief Multi-producer multi-consumer channel
 *
 * With a non-zero capacity the channel buffers up to that many items and
 * blocks producers when full. With capacity 0 it is a rendezvous channel:
 * push() returns only once a receiver has taken the item.
 *
 * Closing the channel rejects further pushes and wakes every waiter.
 * Receivers keep draining buffered items and get nullopt once it is empty.
 *
 * @tparam T Item type (copyable or movable)
 */
template<typename T>
class Channel {
public:
    explicit Channel(std::size_t capacity = 0)
        : capacity_(capacity) {}

    // Non-copyable, non-movable (due to synchronization primitives)
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;
    Channel(Channel&&) = delete;
    Channel& operator=(Channel&&) = delete;

    /**
     * @brief Push an item, blocking while full (or until taken, for rendezvous)
     * @param item Item to push
     * @return true if pushed, false if the channel is closed
     */
    bool push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);

        stats_.push_count++;

        // Wait for space or closure
        while (buffer_.size() >= slots() && !closed_) {
            stats_.push_blocked_count++;
            not_full_.wait(lock);
        }

        if (closed_) {
            return false;
        }

        auto ticket = enqueue_locked(std::move(item));
        not_empty_.notify_one();

        if (capacity_ == 0) {
            taken_.wait(lock, [this, ticket] {
                return popped_ >= ticket || closed_;
            });
        }

        return true;
    }

    /**
     * @brief Try to push without blocking
     *
     * A rendezvous channel only accepts the item when a receiver is
     * already waiting for it.
     *
     * @return true if pushed, false if full, closed or nobody is receiving
     */
    bool try_push(T item) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (closed_ || buffer_.size() >= slots()) {
            return false;
        }
        if (capacity_ == 0 && waiting_receivers_ == 0) {
            return false;
        }

        stats_.push_count++;
        enqueue_locked(std::move(item));

        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Push with timeout
     * @param item Item to push
     * @param timeout Maximum wait duration
     * @return true if pushed (and taken, for rendezvous), false if timeout or closed
     */
    template<typename Rep, typename Period>
    bool push_for(T item, std::chrono::duration<Rep, Period> timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        std::unique_lock<std::mutex> lock(mutex_);

        stats_.push_count++;

        if (!not_full_.wait_until(lock, deadline, [this] {
            return buffer_.size() < slots() || closed_;
        })) {
            stats_.push_blocked_count++;
            return false;
        }

        if (closed_) {
            return false;
        }

        auto ticket = enqueue_locked(std::move(item));
        not_empty_.notify_one();

        if (capacity_ == 0 && !taken_.wait_until(lock, deadline, [this, ticket] {
            return popped_ >= ticket || closed_;
        })) {
            // Nobody took it; the pending item is the only one in a rendezvous channel
            buffer_.pop_back();
            pushed_--;
            stats_.current_size = buffer_.size();
            not_full_.notify_one();
            return false;
        }

        return true;
    }

    /**
     * @brief Pop an item, blocking if empty
     * @return Item if available, nullopt if the channel is closed and empty
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);

        stats_.pop_count++;

        // Wait for data or closure
        waiting_receivers_++;
        while (buffer_.empty() && !closed_) {
            stats_.pop_blocked_count++;
            not_empty_.wait(lock);
        }
        waiting_receivers_--;

        if (buffer_.empty()) {
            return std::nullopt;
        }

        return take_locked();
    }

    /**
     * @brief Try to pop without blocking
     * @return Item if available, nullopt if empty
     */
    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);

        if (buffer_.empty()) {
            return std::nullopt;
        }

        stats_.pop_count++;
        return take_locked();
    }

    /**
     * @brief Pop with timeout
     * @param timeout Maximum wait duration
     * @return Item if available, nullopt if timeout or closed and empty
     */
    template<typename Rep, typename Period>
    std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);

        stats_.pop_count++;

        waiting_receivers_++;
        bool ready = not_empty_.wait_for(lock, timeout, [this] {
            return !buffer_.empty() || closed_;
        });
        waiting_receivers_--;

        if (!ready) {
            stats_.pop_blocked_count++;
            return std::nullopt;
        }

        if (buffer_.empty()) {
            return std::nullopt;
        }

        return take_locked();
    }

    /**
     * @brief Pop an item unless the cancel signal fires first
     *
     * An item that is already available wins over a fired signal. The
     * setter of @p cancel must call notify_waiters() afterwards so blocked
     * receivers re-check it.
     *
     * @return Item if available, nullopt if cancelled or closed and empty
     */
    std::optional<T> pop_until(const Signal& cancel) {
        std::unique_lock<std::mutex> lock(mutex_);

        stats_.pop_count++;

        waiting_receivers_++;
        while (buffer_.empty() && !closed_ && !cancel.is_set()) {
            stats_.pop_blocked_count++;
            not_empty_.wait(lock);
        }
        waiting_receivers_--;

        if (buffer_.empty()) {
            return std::nullopt;
        }

        return take_locked();
    }

    /**
     * @brief Wake blocked receivers so they re-check their cancel signal
     */
    void notify_waiters() {
        {
            // Taking the lock orders this wake-up after any in-progress predicate check
            std::lock_guard<std::mutex> lock(mutex_);
        }
        not_empty_.notify_all();
    }

    /**
     * @brief Close the channel (no more pushes accepted)
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_full_.notify_all();
        not_empty_.notify_all();
        taken_.notify_all();
    }

    [[nodiscard]] bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    /**
     * @brief True once the channel is closed and every item has been taken
     */
    [[nodiscard]] bool is_drained() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_ && buffer_.empty();
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return buffer_.size();
    }

    [[nodiscard]] bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return buffer_.empty();
    }

    [[nodiscard]] std::size_t capacity() const noexcept {
        return capacity_;
    }

    [[nodiscard]] ChannelStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto s = stats_;
        s.capacity = capacity_;
        return s;
    }

private:
    [[nodiscard]] std::size_t slots() const noexcept {
        return capacity_ == 0 ? 1 : capacity_;
    }

    std::uint64_t enqueue_locked(T item) {
        buffer_.push_back(std::move(item));

        if (buffer_.size() > stats_.high_watermark) {
            stats_.high_watermark = buffer_.size();
        }
        stats_.current_size = buffer_.size();

        return ++pushed_;
    }

    T take_locked() {
        T item = std::move(buffer_.front());
        buffer_.pop_front();
        popped_++;
        stats_.current_size = buffer_.size();

        not_full_.notify_one();
        if (capacity_ == 0) {
            taken_.notify_all();
        }
        return item;
    }

    const std::size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::condition_variable taken_;

    std::deque<T> buffer_;
    std::uint64_t pushed_{0};
    std::uint64_t popped_{0};
    std::size_t waiting_receivers_{0};
    bool closed_{false};

    ChannelStats stats_;
};

} // namespace jobrack
