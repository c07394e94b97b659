// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <conduit/core/config.hpp>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>

namespace conduit::core {

// Adaptive parallelism recommendation from recent throughput.
//
// Keeps the last CONTROLLER_WINDOW speed samples per task. High variance
// relative to the mean is read as congestion and shrinks parallelism to 3/4;
// low variance is read as headroom and adds one segment. The result never
// exceeds one segment per MiB of a known file size.
//
// Deterministic for a given sample sequence. Not thread-safe; the owner
// serializes access.
class SegmentController {
public:
    SegmentController() = default;

    // Feed one sample for task_id and get the recommended segment count.
    // Returns `current` (clamped to bounds) until CONTROLLER_MIN_SAMPLES
    // samples have been seen.
    [[nodiscard]] std::uint32_t adjust(const std::string& task_id,
                                       double speed_bps,
                                       std::optional<std::uint64_t> total_size,
                                       std::uint32_t current);

    // Drop the history of a task that left the active set
    void forget(const std::string& task_id) noexcept;

    [[nodiscard]] std::size_t sample_count(const std::string& task_id) const noexcept;

    // Upper bound imposed by file size; MAX_SEGMENTS when the size is unknown
    [[nodiscard]] static std::uint32_t size_ceiling(std::optional<std::uint64_t> total_size) noexcept;

    [[nodiscard]] static double mean(const std::deque<double>& samples) noexcept;
    [[nodiscard]] static double variance(const std::deque<double>& samples) noexcept;

private:
    std::unordered_map<std::string, std::deque<double>> history_;
};

} // namespace conduit::core
