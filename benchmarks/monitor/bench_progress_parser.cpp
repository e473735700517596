/**
 * @file bench_progress_parser.cpp
 * @brief Benchmarks for downloader output parsing
 */

#include <benchmark/benchmark.h>

#include <fetchd/core/logging.h>
#include <fetchd/monitor/progress_monitor.h>
#include <fetchd/monitor/progress_parser.h>

#include "utils/benchmark_helpers.h"

#include <chrono>

namespace fetchd::benchmark {

/**
 * @brief Parse single summary lines
 */
static void BM_ProgressParser_ParseLine(::benchmark::State& state) {
    auto lines = output_generator::generate_progress_lines(1024, 42);

    std::size_t i = 0;
    for (auto _ : state) {
        auto sample = parse_progress_line(lines[i++ % lines.size()]);
        ::benchmark::DoNotOptimize(sample);
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Reject lines that are not progress summaries
 */
static void BM_ProgressParser_RejectNotice(::benchmark::State& state) {
    const std::string line =
        "07/01 12:00:00 [NOTICE] CUID#7 - Redirecting to https://cdn.test/x";

    for (auto _ : state) {
        auto sample = parse_progress_line(line);
        ::benchmark::DoNotOptimize(sample);
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Feed a whole console stream through a progress monitor
 */
static void BM_ProgressMonitor_Feed(::benchmark::State& state) {
    const auto line_count = static_cast<std::size_t>(state.range(0));
    auto stream = output_generator::generate_console_stream(line_count, 0.1, 42);

    get_logger().set_console_output(false);

    for (auto _ : state) {
        download_state download(download_job{1, "bench.bin", 1});
        progress_monitor monitor(download);
        auto now = std::chrono::steady_clock::now();
        auto handled = monitor.feed(stream, now);
        monitor.flush(now);
        ::benchmark::DoNotOptimize(handled);
    }

    get_logger().set_console_output(true);

    state.SetBytesProcessed(static_cast<int64_t>(stream.size()) *
                            static_cast<int64_t>(state.iterations()));
    state.SetItemsProcessed(static_cast<int64_t>(line_count) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_ProgressParser_ParseLine);
BENCHMARK(BM_ProgressParser_RejectNotice);
BENCHMARK(BM_ProgressMonitor_Feed)->Arg(100)->Arg(1000)->Arg(10000);

}  // namespace fetchd::benchmark

BENCHMARK_MAIN();
