/**
 * @file job_test.cpp
 * @brief Integration tests for supervised jobs
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

#include "jobrack/jobrack.hpp"

using namespace jobrack;

class JobTest : public ::testing::Test {
protected:
    void TearDown() override {
        if (logger_thread_.joinable()) {
            progress_->close();
            logger_thread_.join();
        }
    }

    /**
     * @brief Supervise @p job and drain its progress on a background thread
     */
    std::function<void()> start(WorkerJob& job, std::size_t max_workers,
                                ProgressLogger::Config logger_config = {}) {
        auto supervision = job.supervise(max_workers, intake_);
        progress_ = supervision.progress;
        logger_ = std::make_unique<ProgressLogger>(LogWriter::discard(), std::move(logger_config));
        logger_thread_ = std::thread([this]() { logger_->run(*progress_); });
        return supervision.done;
    }

    void submit(int count) {
        for (int i = 0; i < count; i++) {
            ASSERT_TRUE(intake_->push(Work(Params{{"the number", std::int64_t{i}}})));
        }
    }

    static SupervisorConfig fast_config() {
        SupervisorConfig config;
        config.poll_interval = std::chrono::milliseconds(5);
        return config;
    }

    std::shared_ptr<WorkChannel> intake_ = std::make_shared<WorkChannel>();
    std::shared_ptr<ProgressChannel> progress_;
    std::unique_ptr<ProgressLogger> logger_;
    std::thread logger_thread_;
};

TEST_F(JobTest, HundredItemsTwoWorkers) {
    std::atomic<int> count{0};

    auto job = make_job([&](WorkerId id, const Work&, ProgressWriter& progress) {
        progress.emit(Progress::message("I am ", id, "!"));
        count.fetch_add(1);
    });

    auto done = start(*job, 2);
    submit(100);
    done();

    job->await_completion();

    EXPECT_EQ(count.load(), 100);
    EXPECT_EQ(job->state(), JobState::Quiescent);

    auto stats = job->stats();
    EXPECT_EQ(stats.items_dispatched, 100);
    EXPECT_EQ(stats.live_workers, 0);
    EXPECT_LE(stats.peak_workers, 2);
    EXPECT_EQ(stats.workers_admitted, stats.items_dispatched + stats.workers_idle);

    progress_->close();
    logger_thread_.join();
    EXPECT_EQ(logger_->stats().messages, 100);
}

TEST_F(JobTest, ConcurrencyNeverExceedsLimit) {
    constexpr int limit = 3;
    constexpr int items = 30;
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    std::atomic<int> invocations{0};

    auto job = make_job([&](WorkerId, const Work&, ProgressWriter&) {
        int now = active.fetch_add(1) + 1;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(3));
        active.fetch_sub(1);
        invocations.fetch_add(1);
    }, fast_config());

    auto done = start(*job, limit);
    submit(items);
    done();

    ASSERT_TRUE(job->wait_for_completion(std::chrono::seconds(10)));

    EXPECT_EQ(invocations.load(), items);
    EXPECT_LE(peak.load(), limit);
    EXPECT_EQ(active.load(), 0);
    EXPECT_LE(job->stats().peak_workers, limit);
}

TEST_F(JobTest, SingleWorkerKeepsSubmissionOrder) {
    std::mutex mutex;
    std::vector<int> seen;

    auto job = make_job([&](WorkerId, const Work& work, ProgressWriter&) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.push_back(work.get_int("the number"));
    }, fast_config());

    auto done = start(*job, 1);
    submit(20);
    done();
    job->await_completion();

    ASSERT_EQ(seen.size(), 20);
    EXPECT_TRUE(std::is_sorted(seen.begin(), seen.end()));
}

TEST_F(JobTest, CompletionWaitsForRunningWorker) {
    Signal release;
    std::atomic<bool> finished{false};

    auto job = make_job([&](WorkerId, const Work&, ProgressWriter&) {
        release.wait();
        finished.store(true);
    }, fast_config());

    auto done = start(*job, 2);
    submit(1);
    done();

    // The worker is still busy: no completion
    EXPECT_FALSE(job->wait_for_completion(std::chrono::milliseconds(150)));
    EXPECT_EQ(job->state(), JobState::Draining);
    EXPECT_EQ(job->stats().live_workers, 1);

    release.set();
    ASSERT_TRUE(job->wait_for_completion(std::chrono::seconds(5)));
    EXPECT_TRUE(finished.load());
    EXPECT_EQ(job->stats().live_workers, 0);
}

TEST_F(JobTest, CompletionFiresWithinSettleWindow) {
    auto config = fast_config();
    auto job = make_job([](WorkerId, const Work&, ProgressWriter&) {}, config);

    auto done = start(*job, 2);
    submit(10);

    auto drained_at = std::chrono::steady_clock::now();
    done();
    job->await_completion();
    auto elapsed = std::chrono::steady_clock::now() - drained_at;

    // A handful of polls, with generous slack for slow machines
    EXPECT_LT(elapsed, config.poll_interval * (config.settle_polls + 1) + std::chrono::seconds(1));
}

TEST_F(JobTest, NoCompletionWithoutDrain) {
    auto job = make_job([](WorkerId, const Work&, ProgressWriter&) {}, fast_config());

    start(*job, 2);
    submit(5);

    EXPECT_FALSE(job->wait_for_completion(std::chrono::milliseconds(150)));
    EXPECT_EQ(job->state(), JobState::Admitting);
    EXPECT_EQ(job->stats().items_dispatched, 5);
}

TEST_F(JobTest, IdleWorkersExitOnDrain) {
    auto job = make_job([](WorkerId, const Work&, ProgressWriter&) {
        FAIL() << "no work was submitted";
    }, fast_config());

    auto done = start(*job, 4);

    // Let the admission loop fill every slot with a waiting worker
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(job->stats().live_workers, 4);

    done();
    ASSERT_TRUE(job->wait_for_completion(std::chrono::seconds(5)));

    auto stats = job->stats();
    EXPECT_EQ(stats.items_dispatched, 0);
    EXPECT_EQ(stats.workers_idle, stats.workers_admitted);
    EXPECT_EQ(stats.live_workers, 0);
}

TEST_F(JobTest, DoneIsIdempotent) {
    auto job = make_job([](WorkerId, const Work&, ProgressWriter&) {}, fast_config());

    auto done = start(*job, 2);
    submit(3);
    done();
    done();

    ASSERT_TRUE(job->wait_for_completion(std::chrono::seconds(5)));
    EXPECT_EQ(job->stats().items_dispatched, 3);
}

TEST_F(JobTest, ErrorsFlowThroughProgress) {
    std::atomic<int> errors{0};

    auto job = make_job([](WorkerId, const Work& work, ProgressWriter& progress) {
        try {
            if (work.get_int("the number") % 2 == 1) {
                throw std::runtime_error("odd number");
            }
            progress.emit(Progress::update(1));
        } catch (const std::exception& e) {
            progress.emit(Progress::error(Error::from_exception(e)));
        }
    }, fast_config());

    ProgressLogger::Config logger_config;
    logger_config.on_error = [&](const Error& e) {
        EXPECT_EQ(e, Error("odd number"));
        errors.fetch_add(1);
    };

    auto done = start(*job, 3, std::move(logger_config));
    submit(10);
    done();
    job->await_completion();

    // Close the progress channel so the logger has handled everything
    progress_->close();
    logger_thread_.join();

    EXPECT_EQ(errors.load(), 5);
    EXPECT_EQ(logger_->stats().updates, 5);
}

TEST_F(JobTest, ClosedIntakeStopsAdmission) {
    intake_ = std::make_shared<WorkChannel>(16);
    std::atomic<int> count{0};

    auto job = make_job([&](WorkerId, const Work&, ProgressWriter&) {
        count.fetch_add(1);
    }, fast_config());

    auto done = start(*job, 2);
    submit(10);
    intake_->close();

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while ((count.load() < 10 || job->stats().live_workers > 0) &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    EXPECT_EQ(count.load(), 10);
    EXPECT_EQ(job->stats().live_workers, 0);

    // Completion still needs the explicit signal
    EXPECT_FALSE(job->completion().is_set());
    done();
    ASSERT_TRUE(job->wait_for_completion(std::chrono::seconds(5)));
}

TEST_F(JobTest, SuperviseRejectsMisuse) {
    auto job = make_job([](WorkerId, const Work&, ProgressWriter&) {});

    EXPECT_THROW(job->supervise(0, intake_), std::invalid_argument);
    EXPECT_THROW(job->supervise(2, nullptr), std::invalid_argument);
    EXPECT_EQ(job->state(), JobState::Idle);

    auto done = start(*job, 2);
    EXPECT_THROW(job->supervise(2, intake_), std::runtime_error);
    done();
    job->await_completion();
}

TEST_F(JobTest, NewWorkerBeforeSuperviseThrows) {
    auto job = make_job([](WorkerId, const Work&, ProgressWriter&) {});
    EXPECT_THROW(job->new_worker(1), std::runtime_error);
}

TEST_F(JobTest, DirectWorkerAfterDrainDoesNothing) {
    Signal release;
    std::atomic<int> count{0};

    auto job = make_job([&](WorkerId, const Work&, ProgressWriter&) {
        release.wait();
        count.fetch_add(1);
    }, fast_config());

    auto done = start(*job, 1);
    submit(1);
    done();

    job->new_worker(99);

    // The supervised worker is still running and still counted
    EXPECT_EQ(job->stats().live_workers, 1);
    EXPECT_FALSE(job->wait_for_completion(std::chrono::milliseconds(150)));

    release.set();
    ASSERT_TRUE(job->wait_for_completion(std::chrono::seconds(5)));
    EXPECT_EQ(count.load(), 1);
    EXPECT_EQ(job->stats().live_workers, 0);
}

TEST_F(JobTest, DirectWorkerRespectsLimit) {
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    std::atomic<int> count{0};

    auto job = make_job([&](WorkerId, const Work&, ProgressWriter&) {
        int now = active.fetch_add(1) + 1;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        active.fetch_sub(1);
        count.fetch_add(1);
    }, fast_config());

    auto done = start(*job, 1);
    std::thread direct([&]() { job->new_worker(1000); });

    submit(5);
    done();
    direct.join();
    ASSERT_TRUE(job->wait_for_completion(std::chrono::seconds(5)));

    EXPECT_EQ(count.load(), 5);
    EXPECT_EQ(peak.load(), 1);

    auto stats = job->stats();
    EXPECT_EQ(stats.live_workers, 0);
    EXPECT_EQ(stats.peak_workers, 1);
    EXPECT_EQ(stats.workers_admitted, stats.items_dispatched + stats.workers_idle);
}

TEST_F(JobTest, LogsLifecycle) {
    std::ostringstream out;
    LogWriter log(out, "[job] ");

    auto config = fast_config();
    config.log = &log;
    auto job = make_job([](WorkerId, const Work&, ProgressWriter&) {}, config);

    auto done = start(*job, 2);
    submit(4);
    done();
    job->await_completion();

    auto text = out.str();
    EXPECT_NE(text.find("[job] supervising with 2 workers"), std::string::npos);
    EXPECT_NE(text.find("[job] draining"), std::string::npos);
    EXPECT_NE(text.find("[job] all workers exited"), std::string::npos);
}

TEST_F(JobTest, DestructionJoinsEveryThread) {
    auto token = std::make_shared<int>(0);
    std::weak_ptr<int> watch = token;
    std::atomic<int> count{0};

    {
        auto job = make_job([token, &count](WorkerId, const Work&, ProgressWriter&) {
            count.fetch_add(1);
        }, fast_config());
        token.reset();

        start(*job, 3);
        submit(6);
        // No done(): the destructor requests draining itself
    }

    EXPECT_EQ(count.load(), 6);
    EXPECT_TRUE(watch.expired());
}

TEST_F(JobTest, UsableThroughInterface) {
    std::atomic<int> count{0};
    std::unique_ptr<Job> job = make_job([&](WorkerId, const Work&, ProgressWriter&) {
        count.fetch_add(1);
    }, fast_config());

    auto supervision = job->supervise(2, intake_);
    std::thread drain([&]() {
        while (supervision.progress->pop()) {
        }
    });

    submit(8);
    supervision.done();
    job->await_completion();

    supervision.progress->close();
    drain.join();

    EXPECT_EQ(count.load(), 8);
}
