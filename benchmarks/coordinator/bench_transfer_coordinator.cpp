/**
 * @file bench_transfer_coordinator.cpp
 * @brief Benchmarks for transfer bookkeeping under contention
 */

#include <benchmark/benchmark.h>

#include <fetchd/coordinator/transfer_coordinator.h>
#include <fetchd/core/logging.h>
#include <fetchd/reporting/dashboard_snapshot.h>

#include <atomic>
#include <memory>

namespace fetchd::benchmark {

namespace {

transfer_coordinator shared_coordinator;
std::atomic<file_id> next_file{0};

}  // namespace

/**
 * @brief Record completed files on one transfer from several threads
 */
static void BM_Coordinator_RecordFileBytes(::benchmark::State& state) {
    if (state.thread_index() == 0) {
        get_logger().set_level(log_level::warn);
        shared_coordinator.register_transfer(1, "bench", 0);
    }

    for (auto _ : state) {
        auto file = next_file.fetch_add(1);
        auto res = shared_coordinator.record_file_bytes(1, file, 4096);
        ::benchmark::DoNotOptimize(res);
    }

    if (state.thread_index() == 0) {
        state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.threads());
    }
}

/**
 * @brief Build the dashboard for many active transfers
 */
static void BM_Coordinator_CollectActiveDownloads(::benchmark::State& state) {
    const auto transfers = static_cast<transfer_id>(state.range(0));

    get_logger().set_level(log_level::warn);
    transfer_coordinator coordinator;
    for (transfer_id id = 0; id < transfers; ++id) {
        coordinator.register_transfer(id, "transfer-" + std::to_string(id), 1024 * 1024, {1, 2});
        if (!coordinator.mark_file_started(id, 1) ||
            !coordinator.record_file_bytes(id, 1, 512 * 1024)) {
            state.SkipWithError("Failed to prepare transfers");
            return;
        }
    }

    for (auto _ : state) {
        auto downloads = collect_active_downloads(coordinator);
        ::benchmark::DoNotOptimize(downloads);
    }

    state.SetItemsProcessed(static_cast<int64_t>(transfers) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_Coordinator_RecordFileBytes)->Threads(1)->Threads(4)->Threads(8);
BENCHMARK(BM_Coordinator_CollectActiveDownloads)->Arg(10)->Arg(100)->Arg(1000);

}  // namespace fetchd::benchmark

BENCHMARK_MAIN();
