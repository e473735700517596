/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <iomanip>
#include <random>
#include <sstream>

namespace fetchd::benchmark {

namespace {

auto format_progress_line(std::mt19937& gen, std::size_t index, std::size_t count)
    -> std::string {
    std::uniform_real_distribution<double> speed_dis(0.1, 120.0);
    std::uniform_int_distribution<int> eta_dis(1, 3600);

    const double total_mib = 4096.0;
    const auto percent = static_cast<int>((index * 100) / (count == 0 ? 1 : count));
    const double done_mib = total_mib * percent / 100.0;
    const int eta = eta_dis(gen);

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);
    oss << "[#2089b0 SIZE:" << done_mib << "MiB/" << total_mib << "MiB(" << percent
        << "%) CN:16 DL:" << speed_dis(gen) << "MiB ETA:";
    if (eta >= 60) {
        oss << eta / 60 << "m";
    }
    oss << eta % 60 << "s]";
    return oss.str();
}

}  // namespace

// output_generator implementation

auto output_generator::generate_progress_lines(std::size_t count, uint32_t seed)
    -> std::vector<std::string> {
    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);

    std::vector<std::string> lines;
    lines.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        lines.push_back(format_progress_line(gen, i, count));
    }
    return lines;
}

auto output_generator::generate_console_stream(std::size_t lines,
                                               double notice_ratio,
                                               uint32_t seed) -> std::string {
    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_real_distribution<double> kind_dis(0.0, 1.0);

    std::string stream;
    for (std::size_t i = 0; i < lines; ++i) {
        if (kind_dis(gen) < notice_ratio) {
            stream += "07/01 12:00:00 [NOTICE] CUID#7 - Redirecting to https://cdn.test/x\n";
        } else {
            stream += format_progress_line(gen, i, lines);
            stream += '\r';
        }
    }
    return stream;
}

}  // namespace fetchd::benchmark
