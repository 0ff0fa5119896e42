#include <benchmark/benchmark.h>
#include "relay.hpp"

using namespace relay;

static void BM_Signal_Dispatch_Overhead(benchmark::State& state) {
    const size_t SLOTS_NUM = state.range(0);
    relay::signal<int> tick;
    for (size_t i = 0; i < SLOTS_NUM; ++i) {
        tick.connect_with_type([](int val) { benchmark::DoNotOptimize(val); }, connection_type::direct);
    }

    for (auto _ : state) {
        tick.emit(42);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Signal_Dispatch_Overhead)
    ->Arg(10)
    ->Arg(100)
    ->Arg(1000)
    ->UseRealTime();

// Post every delivery to this thread's queue, then drain it.
static void BM_Signal_Queued_Overhead(benchmark::State& state) {
    const size_t SLOTS_NUM = state.range(0);
    dispatch_queue::attach_current();
    relay::signal<int> tick;
    for (size_t i = 0; i < SLOTS_NUM; ++i) {
        tick.connect_with_type([](int val) { benchmark::DoNotOptimize(val); }, connection_type::queued);
    }

    for (auto _ : state) {
        tick.emit(42);
        process_deferred();
    }
    state.SetItemsProcessed(state.iterations() * SLOTS_NUM);
}
BENCHMARK(BM_Signal_Queued_Overhead)
    ->Arg(10)
    ->Arg(100)
    ->Arg(1000)
    ->UseRealTime();

static void BM_Pool_Spawn_Wait(benchmark::State& state) {
    thread_pool pool{thread_pool_config::with_threads(4)};

    for (auto _ : state) {
        auto handle = pool.spawn([] { return 1; });
        benchmark::DoNotOptimize(handle.wait());
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Pool_Spawn_Wait)->UseRealTime();

BENCHMARK_MAIN();
