#include <benchmark/benchmark.h>
#include <hdr/hdr_histogram.h>
#include "relay.hpp"

#if defined(_WIN32) || defined(_WIN64)
#include <windows.h>
#include <intrin.h>
#else
#include <sched.h>
#include <pthread.h>
#include <x86intrin.h>
#endif

using namespace relay;

const double CYCLES_PER_NS = 3.992;

void pin_thread(int cpu_id) {
#if defined(_WIN32) || defined(_WIN64)
    SetThreadAffinityMask(GetCurrentThread(), (static_cast<DWORD_PTR>(1) << cpu_id));
#else
    cpu_set_t cpuset;
    CPU_ZERO(&cpuset);
    CPU_SET(cpu_id, &cpuset);
    pthread_setaffinity_np(pthread_self(), sizeof(cpu_set_t), &cpuset);
#endif
}

static void Report(benchmark::State& state, hdr_histogram* hist) {
    state.counters["P50_ns"]   = hdr_value_at_percentile(hist, 50.0) / CYCLES_PER_NS;
    state.counters["P99_ns"]   = hdr_value_at_percentile(hist, 99.0) / CYCLES_PER_NS;
    state.counters["P99.9_ns"] = hdr_value_at_percentile(hist, 99.9) / CYCLES_PER_NS;
}

static void BM_Signal_Direct_Latency_HDR(benchmark::State& state) {
    relay::signal<int> tick;
    hdr_histogram* hist;
    hdr_init(1, 1000000, 3, &hist);

    pin_thread(1);

    tick.connect_with_type([](int val) { benchmark::DoNotOptimize(val); }, connection_type::direct);

    for (auto _ : state) {
        for (int i = 0; i < 10000; ++i) {
            uint64_t start = __rdtsc();

            tick.emit(42);

            uint64_t end = __rdtsc();
            hdr_record_value(hist, end - start);
        }
    }

    Report(state, hist);
    hdr_close(hist);
}

// Round trip of a blocking delivery to a worker thread.
static void BM_Signal_BlockingQueued_Latency_HDR(benchmark::State& state) {
    worker<int> target{worker_config::with_name("bench-target")};
    relay::signal<int> tick;
    hdr_histogram* hist;
    hdr_init(1, 100000000, 3, &hist);

    pin_thread(1);

    tick.connect_with_type([](int val) { benchmark::DoNotOptimize(val); },
        connection_type::blocking_queued, target.thread_id());

    for (auto _ : state) {
        for (int i = 0; i < 1000; ++i) {
            uint64_t start = __rdtsc();

            tick.emit(42);

            uint64_t end = __rdtsc();
            hdr_record_value(hist, end - start);
        }
    }

    Report(state, hist);
    hdr_close(hist);
}

BENCHMARK(BM_Signal_Direct_Latency_HDR)->Unit(benchmark::kMicrosecond);
BENCHMARK(BM_Signal_BlockingQueued_Latency_HDR)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
