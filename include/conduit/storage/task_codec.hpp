// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <conduit/core/download_task.hpp>
#include <conduit/core/error.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conduit::storage {

// ISO 8601 UTC with milliseconds: 2026-10-18T05:31:00.123Z
[[nodiscard]] std::string format_timestamp(core::TimePoint tp);
[[nodiscard]] std::optional<core::TimePoint> parse_timestamp(std::string_view s) noexcept;

// Persistent fields only; live speed, ETA and history are left out
[[nodiscard]] nlohmann::json encode_task(const core::DownloadTask& task);
[[nodiscard]] core::Result<core::DownloadTask> decode_task(const nlohmann::json& j);

[[nodiscard]] nlohmann::json encode_metadata(const core::TaskMetadata& metadata);
[[nodiscard]] core::TaskMetadata decode_metadata(const nlohmann::json& j);

[[nodiscard]] nlohmann::json encode_post_actions(const std::vector<core::PostAction>& actions);
[[nodiscard]] std::vector<core::PostAction> decode_post_actions(const nlohmann::json& j);

} // namespace conduit::storage
