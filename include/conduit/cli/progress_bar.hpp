// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace conduit::cli {

[[nodiscard]] std::string format_bytes(std::uint64_t bytes);
[[nodiscard]] std::string format_speed(std::uint64_t bps);
[[nodiscard]] std::string format_time(std::uint64_t seconds);

// Renders one progress line:
//   [=========>          ]  45% (45.0 MB/100.0 MB) @ 2.0 MB/s ETA: 27s
// An unknown total renders the byte count only.
class ProgressBar {
public:
    explicit ProgressBar(int width = 30) noexcept : width_(width) {}

    [[nodiscard]] std::string render(std::uint64_t current,
                                     std::optional<std::uint64_t> total,
                                     std::uint64_t speed_bps) const;

    [[nodiscard]] std::string render_bar(double percent) const;

    [[nodiscard]] int width() const noexcept { return width_; }

private:
    int width_;
};

} // namespace conduit::cli
