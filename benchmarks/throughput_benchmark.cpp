/**
 * @file throughput_benchmark.cpp
 * @brief Throughput benchmarks for jobrack
 */

#include <benchmark/benchmark.h>
#include <atomic>
#include <thread>

#include "jobrack/jobrack.hpp"

using namespace jobrack;

static void BM_ChannelPushPop(benchmark::State& state) {
    Channel<Work> channel(4096);
    Work work(Params{{"n", std::int64_t{42}}});

    for (auto _ : state) {
        channel.push(work);
        auto result = channel.pop();
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ChannelPushPop);

static void BM_RendezvousHandoff(benchmark::State& state) {
    Channel<std::int64_t> channel;
    std::thread receiver([&]() {
        while (channel.pop()) {
        }
    });

    std::int64_t i = 0;
    for (auto _ : state) {
        channel.push(i++);
    }

    channel.close();
    receiver.join();
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_RendezvousHandoff);

static void BM_WorkCoercion(benchmark::State& state) {
    Work work(Params{
        {"int", std::int64_t{42}},
        {"text", std::string("1234")},
        {"flag", true},
    });

    for (auto _ : state) {
        benchmark::DoNotOptimize(work.get_int("text"));
        benchmark::DoNotOptimize(work.get_string("int"));
        benchmark::DoNotOptimize(work.get_bool("flag"));
    }

    state.SetItemsProcessed(state.iterations() * 3);
}
BENCHMARK(BM_WorkCoercion);

static void BM_ProgressRender(benchmark::State& state) {
    auto progress = Progress::update(1024);

    for (auto _ : state) {
        auto text = progress.to_string();
        benchmark::DoNotOptimize(text);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ProgressRender);

static void BM_JobThroughput(benchmark::State& state) {
    const auto num_workers = static_cast<std::size_t>(state.range(0));
    constexpr int items = 1000;

    for (auto _ : state) {
        std::atomic<int> count{0};
        SupervisorConfig config;
        config.poll_interval = std::chrono::milliseconds(1);

        auto job = make_job([&](WorkerId, const Work&, ProgressWriter&) {
            count.fetch_add(1, std::memory_order_relaxed);
        }, config);

        auto intake = std::make_shared<WorkChannel>();
        auto supervision = job->supervise(num_workers, intake);

        for (int i = 0; i < items; i++) {
            intake->push(Work(Params{{"n", std::int64_t{i}}}));
        }
        supervision.done();
        job->await_completion();
        supervision.progress->close();

        benchmark::DoNotOptimize(count.load());
    }

    state.SetItemsProcessed(state.iterations() * items);
}
BENCHMARK(BM_JobThroughput)->Arg(1)->Arg(2)->Arg(4)->Arg(8)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
