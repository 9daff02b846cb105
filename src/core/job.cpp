/**
 * @file job.cpp
 * @brief Supervisor and worker lifecycle implementation
 */

#include "jobrack/core/job.hpp"

#include <algorithm>
#include <stdexcept>

namespace jobrack {

const char* to_string(JobState state) noexcept {
    switch (state) {
        case JobState::Idle:
            return "idle";
        case JobState::Admitting:
            return "admitting";
        case JobState::Draining:
            return "draining";
        case JobState::Quiescent:
            return "quiescent";
    }
    return "";
}

WorkerJob::WorkerJob(WorkerFunc func, SupervisorConfig config)
    : func_(std::move(func))
    , config_(std::move(config)) {}

WorkerJob::~WorkerJob() {
    request_drain();

    if (admission_thread_.joinable()) {
        admission_thread_.join();
    }
    if (completion_thread_.joinable()) {
        completion_thread_.join();
    }
    join_workers();
}

Supervision WorkerJob::supervise(std::size_t max_workers, std::shared_ptr<WorkChannel> intake) {
    if (max_workers == 0) {
        throw std::invalid_argument("max_workers must be positive");
    }
    if (!intake) {
        throw std::invalid_argument("intake channel is required");
    }

    auto expected = JobState::Idle;
    if (!state_.compare_exchange_strong(expected, JobState::Admitting)) {
        throw std::runtime_error("Job already supervising");
    }

    intake_ = std::move(intake);
    progress_ = std::make_shared<ProgressChannel>(config_.progress_capacity);
    limiter_ = std::make_unique<Semaphore>(max_workers);

    log("supervising with ", max_workers, " workers");

    admission_thread_ = std::thread(&WorkerJob::admission_loop, this);
    completion_thread_ = std::thread(&WorkerJob::await_quiescence, this);

    return Supervision{progress_, [this] { request_drain(); }};
}

void WorkerJob::request_drain() {
    if (drain_.is_set()) {
        return;
    }
    drain_.set();

    auto expected = JobState::Admitting;
    if (state_.compare_exchange_strong(expected, JobState::Draining)) {
        log("draining, ", metrics_.live_workers().value(), " workers live");
    }

    // Blocked waiters re-check the drain signal
    if (limiter_) {
        limiter_->notify_waiters();
    }
    if (intake_) {
        intake_->notify_waiters();
    }
}

void WorkerJob::admission_loop() {
    WorkerId next_id = 0;

    while (limiter_->acquire_until(drain_)) {
        reap_retired();

        if (intake_->is_drained()) {
            // Closed and empty: nothing left to hand out
            limiter_->release();
            log("intake closed, admission stopped");
            return;
        }

        next_id++;
        metrics_.live_workers().increment();
        metrics_.workers_admitted().increment();
        spawn_worker(next_id);
    }
}

void WorkerJob::spawn_worker(WorkerId id) {
    // The worker retires itself under the same lock, so it is always
    // registered before it can be reaped
    std::lock_guard<std::mutex> lock(workers_mutex_);
    workers_.emplace(id, std::thread([this, id] {
        run_worker(id);
        retire_worker(id);
    }));
}

void WorkerJob::new_worker(WorkerId id) {
    if (!intake_) {
        throw std::runtime_error("Job is not supervising");
    }

    // Admitted like any other worker, or not at all once draining
    if (!limiter_->acquire_until(drain_)) {
        return;
    }
    metrics_.live_workers().increment();
    metrics_.workers_admitted().increment();

    run_worker(id);
}

void WorkerJob::run_worker(WorkerId id) {
    // Runs on every exit path: the slot is held for the worker's whole life
    struct SlotRelease {
        WorkerJob& job;
        ~SlotRelease() {
            job.metrics_.live_workers().decrement();
            job.limiter_->release();
        }
    } slot_release{*this};

    auto work = intake_->pop_until(drain_);
    if (!work) {
        metrics_.workers_idle().increment();
        return;
    }

    metrics_.items_dispatched().increment();

    ProgressWriter writer(progress_);
    auto start = std::chrono::steady_clock::now();

    func_(id, *work, writer);

    auto end = std::chrono::steady_clock::now();
    metrics_.item_duration().observe(std::chrono::duration<double>(end - start).count());
}

void WorkerJob::retire_worker(WorkerId id) {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    retired_.push_back(id);
}

void WorkerJob::reap_retired() {
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto id : retired_) {
            auto it = workers_.find(id);
            if (it != workers_.end()) {
                finished.push_back(std::move(it->second));
                workers_.erase(it);
            }
        }
        retired_.clear();
    }

    for (auto& t : finished) {
        if (t.joinable()) {
            t.join();
        }
    }
}

void WorkerJob::join_workers() {
    std::vector<std::thread> remaining;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto& [id, t] : workers_) {
            remaining.push_back(std::move(t));
        }
        workers_.clear();
        retired_.clear();
    }

    for (auto& t : remaining) {
        if (t.joinable()) {
            t.join();
        }
    }
}

void WorkerJob::await_quiescence() {
    // Not done before draining has been requested
    drain_.wait();

    const auto required = std::max<std::uint32_t>(config_.settle_polls, 1);
    std::uint32_t streak = 0;

    while (true) {
        if (metrics_.live_workers().value() > 0) {
            streak = 0;
        } else {
            streak++;
        }
        if (streak >= required) {
            break;
        }
        std::this_thread::sleep_for(config_.poll_interval);
    }

    state_.store(JobState::Quiescent, std::memory_order_release);
    log("all workers exited: ", metrics_.snapshot().format());
    completion_.set();
}

std::unique_ptr<WorkerJob> make_job(WorkerFunc func, SupervisorConfig config) {
    return std::make_unique<WorkerJob>(std::move(func), std::move(config));
}

} // namespace jobrack
