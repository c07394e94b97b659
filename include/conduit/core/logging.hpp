// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <conduit/core/error.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace conduit::core {

struct LogSettings {
    std::string level{"info"};          // trace, debug, info, warn, error, critical, off
    std::optional<std::string> file;    // Also append to this file when set
};

// Installs the default spdlog logger: colored stderr plus an optional file
// sink. Fails with config_error on an unknown level or unwritable file.
[[nodiscard]] Result<void> init_logging(const LogSettings& settings);

[[nodiscard]] bool is_valid_log_level(std::string_view level) noexcept;

} // namespace conduit::core
