// Copyright (c) 2026 changcheng967. All rights reserved.

#include <conduit/core/segment_controller.hpp>
#include <algorithm>
#include <numeric>

namespace conduit::core {

std::uint32_t SegmentController::adjust(const std::string& task_id,
                                        double speed_bps,
                                        std::optional<std::uint64_t> total_size,
                                        std::uint32_t current) {
    current = std::clamp(current, MIN_SEGMENTS, MAX_SEGMENTS);

    auto& samples = history_[task_id];
    samples.push_back(speed_bps);
    while (samples.size() > CONTROLLER_WINDOW) {
        samples.pop_front();
    }

    if (samples.size() < CONTROLLER_MIN_SAMPLES) {
        return current;
    }

    const double avg = mean(samples);
    const double var = variance(samples);

    std::uint32_t next = current;
    if (var > CONGESTION_VARIANCE_RATIO * avg) {
        next = std::max(MIN_SEGMENTS, current * 3 / 4);
    } else if (var < STABLE_VARIANCE_RATIO * avg) {
        next = std::min(MAX_SEGMENTS, current + 1);
    }

    return std::min(next, size_ceiling(total_size));
}

void SegmentController::forget(const std::string& task_id) noexcept {
    history_.erase(task_id);
}

std::size_t SegmentController::sample_count(const std::string& task_id) const noexcept {
    auto it = history_.find(task_id);
    return it == history_.end() ? 0 : it->second.size();
}

std::uint32_t SegmentController::size_ceiling(std::optional<std::uint64_t> total_size) noexcept {
    if (!total_size || *total_size == 0) {
        return MAX_SEGMENTS;
    }
    const std::uint64_t by_size = *total_size / BYTES_PER_SEGMENT_FLOOR;
    return static_cast<std::uint32_t>(
        std::clamp<std::uint64_t>(by_size, MIN_SEGMENTS, MAX_SEGMENTS));
}

double SegmentController::mean(const std::deque<double>& samples) noexcept {
    if (samples.empty()) return 0.0;
    return std::accumulate(samples.begin(), samples.end(), 0.0)
         / static_cast<double>(samples.size());
}

double SegmentController::variance(const std::deque<double>& samples) noexcept {
    if (samples.empty()) return 0.0;
    const double avg = mean(samples);
    double sum = 0.0;
    for (double s : samples) {
        sum += (s - avg) * (s - avg);
    }
    return sum / static_cast<double>(samples.size());
}

} // namespace conduit::core
