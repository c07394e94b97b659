// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <conduit/core/config.hpp>
#include <conduit/core/error.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace conduit::rpc {

//=============================================================================
// Requests
//=============================================================================

// Per-task options for aria2.addUri. Rendered as the engine's option object
// where every value is a string.
struct AddOptions {
    std::string dir;
    std::string out;
    std::uint32_t split{core::DEFAULT_SEGMENTS};
    std::uint32_t max_connection_per_server{core::DEFAULT_SEGMENTS};
    std::optional<std::uint64_t> max_download_limit;
    std::optional<std::string> referer;
    std::optional<std::string> user_agent;
    std::vector<std::string> headers;  // "Name: value"

    [[nodiscard]] nlohmann::json to_json() const;
};

// Options for aria2.changeGlobalOption
struct GlobalOptions {
    std::optional<std::uint64_t> max_overall_download_limit;  // 0 = unlimited
    std::optional<std::uint32_t> max_concurrent_downloads;

    [[nodiscard]] nlohmann::json to_json() const;
};

//=============================================================================
// Responses
//=============================================================================

struct EngineUri {
    std::string uri;
    std::string status;
};

struct EngineFile {
    std::uint32_t index{0};
    std::string path;
    std::uint64_t length{0};
    std::uint64_t completed_length{0};
    bool selected{false};
    std::vector<EngineUri> uris;
};

// Result of aria2.tellStatus / one element of aria2.tellActive
struct EngineStatus {
    std::string gid;
    std::string status;  // active, waiting, paused, error, complete, removed
    std::uint64_t total_length{0};
    std::uint64_t completed_length{0};
    std::uint64_t download_speed{0};
    std::uint64_t upload_speed{0};
    std::uint32_t connections{0};
    std::optional<std::uint64_t> num_pieces;
    std::optional<std::uint64_t> piece_length;
    std::optional<std::string> error_code;
    std::optional<std::string> error_message;
    std::vector<EngineFile> files;
};

// Result of aria2.getGlobalStat
struct GlobalStat {
    std::uint64_t download_speed{0};
    std::uint64_t upload_speed{0};
    std::uint32_t num_active{0};
    std::uint32_t num_waiting{0};
    std::uint32_t num_stopped{0};
    std::uint32_t num_stopped_total{0};
};

// The one place engine payloads are decoded. The engine encodes integers as
// decimal strings; plain JSON numbers are accepted too. Absent numeric
// fields decode as 0, present-but-malformed ones as Errc::protocol_error.
[[nodiscard]] core::Result<EngineStatus> decode_status(const nlohmann::json& j);
[[nodiscard]] core::Result<GlobalStat> decode_global_stat(const nlohmann::json& j);
[[nodiscard]] core::Result<EngineFile> decode_file(const nlohmann::json& j);

// Integer field accepting "123" or 123
[[nodiscard]] core::Result<std::optional<std::uint64_t>>
read_integer(const nlohmann::json& obj, const char* key);

} // namespace conduit::rpc
