/**
 * @file basic_job.cpp
 * @brief Example: 100 units of Work shared by two workers, with progress logging
 */

#include <atomic>
#include <iostream>
#include <thread>

#include "jobrack/jobrack.hpp"

int main() {
    std::cout << "=== jobrack Example Job ===" << std::endl;
    std::cout << "Version: " << jobrack::VERSION << std::endl;
    std::cout << std::endl;

    std::atomic<int> completed{0};
    auto& out = jobrack::LogWriter::console();

    jobrack::SupervisorConfig config;
    config.log = &out;

    auto job = jobrack::make_job(
        [&](jobrack::WorkerId id, const jobrack::Work& work, jobrack::ProgressWriter& progress) {
            progress.emit(jobrack::Progress::message(
                "I am ", id, "! The work number is ", work.get_int("the number"), "!"));
            progress.emit(jobrack::Progress::update(1));
            completed.fetch_add(1);
        },
        config
    );

    auto intake = std::make_shared<jobrack::WorkChannel>();
    auto supervision = job->supervise(2, intake);

    // A bar channel that the main thread keeps draining
    auto bar = std::make_shared<jobrack::ProgressChannel>();
    std::thread bar_thread([&]() {
        std::int64_t total = 0;
        while (auto p = bar->pop()) {
            total += p->get<std::int64_t>();
        }
        std::cout << "Bar total: " << total << std::endl;
    });

    // Log messages, no special error handling
    std::thread logger_thread([&]() {
        jobrack::log_progress(out, true, nullptr, *supervision.progress, bar);
    });

    for (int i = 0; i < 100; i++) {
        intake->push(jobrack::Work(jobrack::Params{{"the number", std::int64_t{i}}}));
    }

    // Signal the supervisor and any idle workers that no more Work is coming
    supervision.done();

    // Wait until all outstanding Work is accomplished
    job->await_completion();

    // Without closing the progress channel the logger never exits
    supervision.progress->close();
    logger_thread.join();
    bar->close();
    bar_thread.join();

    std::cout << "\n=== Final Statistics ===" << std::endl;
    std::cout << "Completed: " << completed.load() << std::endl;
    std::cout << job->stats().format() << std::endl;

    return 0;
}
