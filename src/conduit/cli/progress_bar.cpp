// Copyright (c) 2026 changcheng967. All rights reserved.

#include <conduit/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace conduit::cli {

namespace {

constexpr std::uint64_t KB = 1024;
constexpr std::uint64_t MB = 1024 * KB;
constexpr std::uint64_t GB = 1024 * MB;
constexpr std::uint64_t TB = 1024 * GB;

std::string scaled(std::uint64_t value, std::uint64_t unit, int precision, const char* suffix) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision)
       << (static_cast<double>(value) / static_cast<double>(unit)) << suffix;
    return ss.str();
}

} // namespace

std::string format_bytes(std::uint64_t bytes) {
    if (bytes >= TB) return scaled(bytes, TB, 2, " TB");
    if (bytes >= GB) return scaled(bytes, GB, 2, " GB");
    if (bytes >= MB) return scaled(bytes, MB, 1, " MB");
    if (bytes >= KB) return scaled(bytes, KB, 0, " KB");
    return std::to_string(bytes) + " B";
}

std::string format_speed(std::uint64_t bps) {
    if (bps >= GB) return scaled(bps, GB, 1, " GB/s");
    if (bps >= MB) return scaled(bps, MB, 1, " MB/s");
    if (bps >= KB) return scaled(bps, KB, 1, " KB/s");
    return std::to_string(bps) + " B/s";
}

std::string format_time(std::uint64_t seconds) {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    if (hours > 0) {
        std::ostringstream ss;
        ss << hours << "h " << std::setfill('0') << std::setw(2) << minutes << "m "
           << std::setw(2) << secs << "s";
        return ss.str();
    }
    if (minutes > 0) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    return std::to_string(secs) + "s";
}

std::string ProgressBar::render_bar(double percent) const {
    percent = std::clamp(percent, 0.0, 100.0);
    const int filled = static_cast<int>(std::round(width_ * percent / 100.0));

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    if (filled < width_) {
        bar += '>';
        bar.append(static_cast<std::size_t>(width_ - filled - 1), ' ');
    }
    bar += ']';
    return bar;
}

std::string ProgressBar::render(std::uint64_t current,
                                std::optional<std::uint64_t> total,
                                std::uint64_t speed_bps) const {
    std::string line;

    if (total && *total > 0) {
        double percent = static_cast<double>(current) * 100.0 / static_cast<double>(*total);
        percent = std::clamp(percent, 0.0, 100.0);

        line += render_bar(percent);
        line += ' ';
        std::string pct = std::to_string(static_cast<int>(percent)) + "%";
        line.append(pct.size() < 4 ? 4 - pct.size() : 0, ' ');
        line += pct;
        line += " (" + format_bytes(current) + "/" + format_bytes(*total) + ")";
    } else {
        line += render_bar(0.0) + " " + format_bytes(current);
    }

    if (speed_bps > 0) {
        line += " @ " + format_speed(speed_bps);
        if (total && *total > current) {
            line += " ETA: " + format_time((*total - current) / speed_bps);
        }
    }
    return line;
}

} // namespace conduit::cli
