// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <chrono>
#include <string_view>

namespace conduit::core {

// Transfer parallelism bounds
constexpr std::uint32_t MIN_SEGMENTS = 1;
constexpr std::uint32_t MAX_SEGMENTS = 16;
constexpr std::uint32_t DEFAULT_SEGMENTS = 8;

constexpr std::size_t CONTROLLER_WINDOW = 10;       // Samples kept per task by SegmentController
constexpr std::size_t CONTROLLER_MIN_SAMPLES = 3;
constexpr double CONGESTION_VARIANCE_RATIO = 0.3;
constexpr double STABLE_VARIANCE_RATIO = 0.1;
constexpr std::uint64_t BYTES_PER_SEGMENT_FLOOR = 1024 * 1024;  // 1 MiB

constexpr std::size_t SPEED_HISTORY_LIMIT = 60;

constexpr std::chrono::milliseconds RECONCILE_INTERVAL{2000};
constexpr std::chrono::seconds BACKUP_INTERVAL{300};

constexpr std::string_view DEFAULT_RPC_ENDPOINT = "http://localhost:6800/jsonrpc";
constexpr std::uint32_t RPC_CONNECT_TIMEOUT_SEC = 30;
constexpr std::uint32_t RPC_TIMEOUT_SEC = 60;

constexpr std::string_view DATABASE_FILENAME = "conduit.db";
constexpr std::string_view BACKUP_FILENAME = "downloads_backup.json";
constexpr std::string_view DOWNLOAD_SUBDIR = "Conduit Downloads";

} // namespace conduit::core
