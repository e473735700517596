/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef FETCHD_BENCHMARKS_BENCHMARK_HELPERS_H
#define FETCHD_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace fetchd::benchmark {

/**
 * @brief Generates downloader console output for benchmarks
 */
class output_generator {
public:
    /**
     * @brief Generate aria2c summary lines with increasing progress
     * @param count Number of lines
     * @param seed Random seed (0 for random)
     * @return Lines without terminators
     */
    static auto generate_progress_lines(std::size_t count, uint32_t seed = 0)
        -> std::vector<std::string>;

    /**
     * @brief Generate a console stream mixing progress and notice lines
     * @param lines Number of lines
     * @param notice_ratio Fraction of lines that are not progress lines
     * @param seed Random seed (0 for random)
     * @return Lines terminated with '\r' or '\n' as aria2c writes them
     */
    static auto generate_console_stream(std::size_t lines,
                                        double notice_ratio,
                                        uint32_t seed = 0) -> std::string;
};

}  // namespace fetchd::benchmark

#endif  // FETCHD_BENCHMARKS_BENCHMARK_HELPERS_H
