#pragma once

/**
 * @file metrics.hpp
 * @brief Metrics collection and reporting
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace jobrack {

/**
 * @brief Counter metric (monotonically increasing)
 */
class Counter {
public:
    void increment(std::uint64_t value = 1) noexcept {
        value_.fetch_add(value, std::memory_order_relaxed);
    }

    [[nodiscard]] std::uint64_t value() const noexcept {
        return value_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<std::uint64_t> value_{0};
};

/**
 * @brief Gauge metric (can go up and down)
 *
 * Also remembers the highest value it has held. Updates are
 * acquire/release so a reader that observes a value also observes
 * whatever the updating thread did before it.
 */
class Gauge {
public:
    /**
     * @return The value after the increment
     */
    std::int64_t increment(std::int64_t delta = 1) noexcept {
        auto now = value_.fetch_add(delta, std::memory_order_acq_rel) + delta;
        raise_peak(now);
        return now;
    }

    /**
     * @return The value after the decrement
     */
    std::int64_t decrement(std::int64_t delta = 1) noexcept {
        return value_.fetch_sub(delta, std::memory_order_acq_rel) - delta;
    }

    [[nodiscard]] std::int64_t value() const noexcept {
        return value_.load(std::memory_order_acquire);
    }

    [[nodiscard]] std::int64_t peak() const noexcept {
        return peak_.load(std::memory_order_relaxed);
    }

private:
    void raise_peak(std::int64_t candidate) noexcept {
        auto current = peak_.load(std::memory_order_relaxed);
        while (candidate > current &&
               !peak_.compare_exchange_weak(current, candidate, std::memory_order_relaxed)) {
        }
    }

    std::atomic<std::int64_t> value_{0};
    std::atomic<std::int64_t> peak_{0};
};

/**
 * @brief Histogram for latency measurements
 */
class Histogram {
public:
    explicit Histogram(std::vector<double> buckets = default_buckets())
        : buckets_(std::move(buckets))
        , counts_(buckets_.size() + 1, 0) {}

    void observe(double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        sum_ += value;
        count_++;

        for (std::size_t i = 0; i < buckets_.size(); i++) {
            if (value <= buckets_[i]) {
                counts_[i]++;
                return;
            }
        }
        counts_.back()++;  // +Inf bucket
    }

    [[nodiscard]] double sum() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sum_;
    }

    [[nodiscard]] std::uint64_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_;
    }

    [[nodiscard]] double mean() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_ > 0 ? sum_ / static_cast<double>(count_) : 0.0;
    }

    /**
     * @brief Per-bucket counts, the last entry being the +Inf bucket
     */
    [[nodiscard]] std::vector<std::uint64_t> bucket_counts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return counts_;
    }

    static std::vector<double> default_buckets() {
        return {0.001, 0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0};
    }

private:
    mutable std::mutex mutex_;
    std::vector<double> buckets_;
    std::vector<std::uint64_t> counts_;
    double sum_{0.0};
    std::uint64_t count_{0};
};

/**
 * @brief Supervisor metrics snapshot
 */
struct SupervisorStats {
    std::uint64_t workers_admitted{0};
    std::uint64_t workers_idle{0};       // exited on drain without receiving work
    std::uint64_t items_dispatched{0};
    std::int64_t live_workers{0};
    std::int64_t peak_workers{0};
    double avg_item_seconds{0.0};
    std::chrono::milliseconds uptime{0};

    /**
     * @brief Format stats as a single line
     */
    [[nodiscard]] std::string format() const {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2);
        oss << "Admitted: " << workers_admitted
            << " | Dispatched: " << items_dispatched
            << " | Idle exits: " << workers_idle
            << " | Live: " << live_workers
            << " | Peak: " << peak_workers
            << " | Avg item: " << avg_item_seconds * 1000.0 << " ms"
            << " | Uptime: " << uptime.count() << " ms";
        return oss.str();
    }
};

/**
 * @brief Metrics owned by one supervisor
 */
class SupervisorMetrics {
public:
    SupervisorMetrics() : start_time_(std::chrono::steady_clock::now()) {}

    Counter& workers_admitted() { return admitted_; }
    Counter& workers_idle() { return idle_; }
    Counter& items_dispatched() { return dispatched_; }

    // The live-worker count
    Gauge& live_workers() { return live_; }
    const Gauge& live_workers() const { return live_; }

    // Per-item execution time in seconds
    Histogram& item_duration() { return item_duration_; }

    [[nodiscard]] SupervisorStats snapshot() const {
        SupervisorStats stats;
        stats.workers_admitted = admitted_.value();
        stats.workers_idle = idle_.value();
        stats.items_dispatched = dispatched_.value();
        stats.live_workers = live_.value();
        stats.peak_workers = live_.peak();
        stats.avg_item_seconds = item_duration_.mean();
        stats.uptime = uptime();
        return stats;
    }

    [[nodiscard]] std::chrono::milliseconds uptime() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time_
        );
    }

private:
    std::chrono::steady_clock::time_point start_time_;

    Counter admitted_;
    Counter idle_;
    Counter dispatched_;
    Gauge live_;
    Histogram item_duration_;
};

} // namespace jobrack
