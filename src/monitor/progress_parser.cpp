/**
 * @file progress_parser.cpp
 * @brief aria2c progress line parsing
 */

#include "fetchd/monitor/progress_parser.h"

#include <array>
#include <cmath>
#include <regex>

namespace fetchd {

namespace {

const std::regex& summary_pattern() {
    static const std::regex pattern(
        R"(\[#[0-9a-fA-F]+.*?(\d+)%.*?DL:([\d.]+)(B|KiB|MiB|GiB)(?:.*?ETA:([^\]]+))?[^\]]*\])");
    return pattern;
}

const std::regex& size_pattern() {
    static const std::regex pattern(
        R"(([\d.]+)(B|KiB|MiB|GiB)/([\d.]+)(B|KiB|MiB|GiB)\()");
    return pattern;
}

auto parse_number(const std::string& text) -> std::optional<double> {
    try {
        std::size_t consumed = 0;
        double value = std::stod(text, &consumed);
        if (consumed != text.size() || !std::isfinite(value) || value < 0.0) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}  // namespace

auto parse_size_unit(std::string_view text) -> std::optional<size_unit> {
    if (text == "B") return size_unit::bytes;
    if (text == "KiB") return size_unit::kib;
    if (text == "MiB") return size_unit::mib;
    if (text == "GiB") return size_unit::gib;
    return std::nullopt;
}

auto to_bytes(double value, size_unit unit) -> uint64_t {
    double multiplier = 1.0;
    switch (unit) {
        case size_unit::bytes: multiplier = 1.0; break;
        case size_unit::kib: multiplier = 1024.0; break;
        case size_unit::mib: multiplier = 1024.0 * 1024.0; break;
        case size_unit::gib: multiplier = 1024.0 * 1024.0 * 1024.0; break;
    }
    return static_cast<uint64_t>(std::llround(value * multiplier));
}

auto to_megabytes_per_second(double value, size_unit unit) -> double {
    switch (unit) {
        case size_unit::bytes: return value / (1024.0 * 1024.0);
        case size_unit::kib: return value / 1024.0;
        case size_unit::mib: return value;
        case size_unit::gib: return value * 1024.0;
    }
    return value;
}

auto parse_progress_line(std::string_view line) -> std::optional<progress_sample> {
    const std::string text(line);

    std::smatch match;
    if (!std::regex_search(text, match, summary_pattern())) {
        return std::nullopt;
    }

    auto percent = parse_number(match[1].str());
    auto speed = parse_number(match[2].str());
    auto speed_unit = parse_size_unit(match[3].str());
    if (!percent || !speed || !speed_unit) {
        return std::nullopt;
    }

    progress_sample sample;
    sample.percent = *percent;
    sample.speed_mbps = to_megabytes_per_second(*speed, *speed_unit);
    if (match[4].matched) {
        sample.eta = match[4].str();
        while (!sample.eta.empty() && sample.eta.back() == ' ') {
            sample.eta.pop_back();
        }
    }

    // Sizes live inside the same bracket as the percentage
    const std::string summary = match[0].str();
    std::smatch size_match;
    if (std::regex_search(summary, size_match, size_pattern())) {
        auto done = parse_number(size_match[1].str());
        auto done_unit = parse_size_unit(size_match[2].str());
        auto total = parse_number(size_match[3].str());
        auto total_unit = parse_size_unit(size_match[4].str());
        if (done && done_unit && total && total_unit) {
            sample.downloaded_bytes = to_bytes(*done, *done_unit);
            sample.total_bytes = to_bytes(*total, *total_unit);
        }
    }

    return sample;
}

auto contains_failure_marker(std::string_view line) -> bool {
    static constexpr std::array<std::string_view, 4> markers = {
        "Exception", "error", "ERROR", "failed"};

    for (auto marker : markers) {
        if (line.find(marker) != std::string_view::npos) {
            return true;
        }
    }
    return false;
}

}  // namespace fetchd
