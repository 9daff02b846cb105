#pragma once

/**
 * @file job.hpp
 * @brief Jobs: supervised, admission-limited workers fed from a work channel
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

#include "jobrack/core/channel.hpp"
#include "jobrack/core/log.hpp"
#include "jobrack/core/metrics.hpp"
#include "jobrack/core/progress.hpp"
#include "jobrack/core/semaphore.hpp"
#include "jobrack/core/signal.hpp"
#include "jobrack/core/work.hpp"

namespace jobrack {

/**
 * @brief Identifier handed to each worker (its admission sequence number)
 */
using WorkerId = std::uint64_t;

using WorkChannel = Channel<Work>;

/**
 * @brief How to accomplish one unit of Work
 *
 * Each invocation gets a unique id, its own Work and a writer for progress
 * reports. None of them may be kept after the invocation returns.
 * Exceptions are not caught by the job: report failures as Error envelopes.
 */
using WorkerFunc = std::function<void(WorkerId id, const Work& work, ProgressWriter& progress)>;

/**
 * @brief Supervisor tuning
 */
struct SupervisorConfig {
    // Completion is declared once the live-worker count reads zero on
    // settle_polls consecutive polls, poll_interval apart
    std::chrono::milliseconds poll_interval{10};
    std::uint32_t settle_polls{5};
    std::size_t progress_capacity{0};   // 0 = rendezvous
    LogWriter* log{nullptr};            // nullptr = silent
};

/**
 * @brief Job lifecycle
 */
enum class JobState {
    Idle,           // Constructed, not supervising yet
    Admitting,      // Granting worker slots
    Draining,       // No more work; running workers finish
    Quiescent       // All workers gone, completion fired
};

[[nodiscard]] const char* to_string(JobState state) noexcept;

/**
 * @brief What supervise() hands back to the caller
 *
 * The caller must keep draining @c progress and close it once it no longer
 * reads from it. @c done signals that no more Work will be pushed; calling
 * it again has no effect. It must not be called after the job is destroyed.
 */
struct Supervision {
    std::shared_ptr<ProgressChannel> progress;
    std::function<void()> done;
};

/**
 * @brief A repetitive task run by supervised workers
 *
 * The supervisor makes sure there are workers to do the Work, that no more
 * than the allowed number run at once, and that their progress reports
 * reach the caller.
 */
class Job {
public:
    virtual ~Job() = default;

    /**
     * @brief Start admitting up to @p max_workers concurrent workers fed from @p intake
     */
    virtual Supervision supervise(std::size_t max_workers, std::shared_ptr<WorkChannel> intake) = 0;

    /**
     * @brief Run one worker: take one Work item (or give up on drain) and do it
     *
     * Runs on the calling thread and counts against the worker limit like a
     * supervised worker. Returns without doing anything once draining has
     * been requested.
     */
    virtual void new_worker(WorkerId id) = 0;

    /**
     * @brief Fires once all handed-out Work is done and every worker has left
     */
    [[nodiscard]] virtual const Signal& completion() const noexcept = 0;

    void await_completion() const {
        completion().wait();
    }

    template<typename Rep, typename Period>
    bool wait_for_completion(std::chrono::duration<Rep, Period> timeout) const {
        return completion().wait_for(timeout);
    }
};

/**
 * @brief Default Job: every worker runs the same WorkerFunc
 *
 * Threads: one admission loop, one thread per admitted worker and one
 * completion waiter. They share the channels, the admission semaphore and
 * the live-worker gauge, nothing else.
 *
 * Completion is a debounce rather than a join: after draining starts, the
 * live-worker count has to read zero for settle_polls polls in a row. That
 * absorbs the moment between one worker exiting and the admission loop
 * starting the next, at the cost of a few poll intervals of latency.
 *
 * Destroying the job requests draining and joins every thread, so any
 * worker still blocked on the progress channel must be released first.
 */
class WorkerJob : public Job {
public:
    explicit WorkerJob(WorkerFunc func, SupervisorConfig config = {});
    ~WorkerJob() override;

    // Non-copyable, non-movable
    WorkerJob(const WorkerJob&) = delete;
    WorkerJob& operator=(const WorkerJob&) = delete;

    Supervision supervise(std::size_t max_workers, std::shared_ptr<WorkChannel> intake) override;
    void new_worker(WorkerId id) override;

    [[nodiscard]] const Signal& completion() const noexcept override {
        return completion_;
    }

    /**
     * @brief Stop admitting workers (what Supervision::done calls)
     */
    void request_drain();

    [[nodiscard]] JobState state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]] SupervisorStats stats() const {
        return metrics_.snapshot();
    }

private:
    void admission_loop();
    void await_quiescence();
    void spawn_worker(WorkerId id);
    void run_worker(WorkerId id);
    void retire_worker(WorkerId id);
    void reap_retired();
    void join_workers();

    template<typename... Args>
    void log(const Args&... args) {
        if (config_.log) {
            config_.log->print(args...);
        }
    }

    WorkerFunc func_;
    SupervisorConfig config_;
    std::atomic<JobState> state_{JobState::Idle};

    std::shared_ptr<WorkChannel> intake_;
    std::shared_ptr<ProgressChannel> progress_;
    std::unique_ptr<Semaphore> limiter_;

    Signal drain_;
    Signal completion_;
    SupervisorMetrics metrics_;

    std::thread admission_thread_;
    std::thread completion_thread_;

    std::mutex workers_mutex_;
    std::unordered_map<WorkerId, std::thread> workers_;
    std::vector<WorkerId> retired_;
};

/**
 * @brief Create the default Job for @p func
 */
std::unique_ptr<WorkerJob> make_job(WorkerFunc func, SupervisorConfig config = {});

} // namespace jobrack
