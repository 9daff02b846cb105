/**
 * @file latency_benchmark.cpp
 * @brief Latency benchmarks for jobrack
 */

#include <benchmark/benchmark.h>
#include <chrono>
#include <thread>

#include "jobrack/jobrack.hpp"

using namespace jobrack;

// Time from done() to the completion signal, i.e. the settle window
static void BM_CompletionLatency(benchmark::State& state) {
    const auto poll_ms = state.range(0);

    for (auto _ : state) {
        state.PauseTiming();

        SupervisorConfig config;
        config.poll_interval = std::chrono::milliseconds(poll_ms);

        auto job = make_job([](WorkerId, const Work&, ProgressWriter&) {}, config);
        auto intake = std::make_shared<WorkChannel>();
        auto supervision = job->supervise(2, intake);

        for (int i = 0; i < 10; i++) {
            intake->push(Work{});
        }

        state.ResumeTiming();

        auto start = std::chrono::high_resolution_clock::now();
        supervision.done();
        job->await_completion();
        auto end = std::chrono::high_resolution_clock::now();

        supervision.progress->close();

        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
        state.SetIterationTime(duration.count() / 1e6);
    }
}
BENCHMARK(BM_CompletionLatency)->Arg(1)->Arg(5)->Arg(10)->UseManualTime();

// Round trip of one progress envelope from a worker to a logger
static void BM_ProgressLatency(benchmark::State& state) {
    auto progress = std::make_shared<ProgressChannel>();
    auto bar = std::make_shared<ProgressChannel>();

    ProgressLogger::Config config;
    config.bar = bar;
    ProgressLogger logger(LogWriter::discard(), config);
    std::thread logger_thread([&]() { logger.run(*progress); });

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();
        progress->push(Progress::update(1));
        auto forwarded = bar->pop();
        auto end = std::chrono::high_resolution_clock::now();
        benchmark::DoNotOptimize(forwarded);

        auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start);
        state.SetIterationTime(duration.count() / 1e9);
    }

    progress->close();
    logger_thread.join();
}
BENCHMARK(BM_ProgressLatency)->UseManualTime();

BENCHMARK_MAIN();
