// Copyright (c) 2026 changcheng967. All rights reserved.

#include <conduit/rpc/engine_types.hpp>
#include <charconv>
#include <limits>

namespace conduit::rpc {

namespace {

core::Result<std::uint64_t> read_u64(const nlohmann::json& obj, const char* key) {
    auto value = read_integer(obj, key);
    if (!value) return std::unexpected(value.error());
    return value->value_or(0);
}

core::Result<std::uint32_t> read_u32(const nlohmann::json& obj, const char* key) {
    auto value = read_u64(obj, key);
    if (!value) return std::unexpected(value.error());
    if (*value > std::numeric_limits<std::uint32_t>::max()) {
        return core::fail(core::Errc::protocol_error, std::string(key) + " out of range");
    }
    return static_cast<std::uint32_t>(*value);
}

std::optional<std::string> read_optional_string(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

std::string read_string(const nlohmann::json& obj, const char* key) {
    return read_optional_string(obj, key).value_or(std::string{});
}

} // namespace

//=============================================================================
// Requests
//=============================================================================

nlohmann::json AddOptions::to_json() const {
    nlohmann::json j = nlohmann::json::object();
    if (!dir.empty()) j["dir"] = dir;
    if (!out.empty()) j["out"] = out;
    j["split"] = std::to_string(split);
    j["max-connection-per-server"] = std::to_string(max_connection_per_server);
    if (max_download_limit) {
        j["max-download-limit"] = std::to_string(*max_download_limit);
    }
    if (referer) j["referer"] = *referer;
    if (user_agent) j["user-agent"] = *user_agent;
    if (!headers.empty()) j["header"] = headers;
    return j;
}

nlohmann::json GlobalOptions::to_json() const {
    nlohmann::json j = nlohmann::json::object();
    if (max_overall_download_limit) {
        j["max-overall-download-limit"] = std::to_string(*max_overall_download_limit);
    }
    if (max_concurrent_downloads) {
        j["max-concurrent-downloads"] = std::to_string(*max_concurrent_downloads);
    }
    return j;
}

//=============================================================================
// Responses
//=============================================================================

core::Result<std::optional<std::uint64_t>>
read_integer(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return std::optional<std::uint64_t>{};
    }

    if (it->is_number_unsigned()) {
        return std::optional<std::uint64_t>{it->get<std::uint64_t>()};
    }
    if (it->is_number_integer()) {
        auto v = it->get<std::int64_t>();
        if (v < 0) {
            return core::fail(core::Errc::protocol_error, std::string(key) + " is negative");
        }
        return std::optional<std::uint64_t>{static_cast<std::uint64_t>(v)};
    }
    if (it->is_string()) {
        const auto& s = it->get_ref<const std::string&>();
        if (s.empty()) {
            return std::optional<std::uint64_t>{};
        }
        std::uint64_t v = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
        if (ec != std::errc{} || ptr != s.data() + s.size()) {
            return core::fail(core::Errc::protocol_error,
                              std::string(key) + " is not a decimal integer: " + s);
        }
        return std::optional<std::uint64_t>{v};
    }
    return core::fail(core::Errc::protocol_error, std::string(key) + " has unexpected type");
}

core::Result<EngineFile> decode_file(const nlohmann::json& j) {
    if (!j.is_object()) {
        return core::fail(core::Errc::protocol_error, "file entry is not an object");
    }

    EngineFile file;
    auto index = read_u32(j, "index");
    if (!index) return std::unexpected(index.error());
    file.index = *index;

    auto length = read_u64(j, "length");
    if (!length) return std::unexpected(length.error());
    file.length = *length;

    auto completed = read_u64(j, "completedLength");
    if (!completed) return std::unexpected(completed.error());
    file.completed_length = *completed;

    file.path = read_string(j, "path");
    file.selected = read_string(j, "selected") == "true";

    if (auto it = j.find("uris"); it != j.end() && it->is_array()) {
        for (const auto& u : *it) {
            if (!u.is_object()) continue;
            file.uris.push_back(EngineUri{read_string(u, "uri"), read_string(u, "status")});
        }
    }
    return file;
}

core::Result<EngineStatus> decode_status(const nlohmann::json& j) {
    if (!j.is_object()) {
        return core::fail(core::Errc::protocol_error, "status result is not an object");
    }

    EngineStatus st;
    auto gid = read_optional_string(j, "gid");
    auto status = read_optional_string(j, "status");
    if (!gid || !status) {
        return core::fail(core::Errc::protocol_error, "status result lacks gid or status");
    }
    st.gid = std::move(*gid);
    st.status = std::move(*status);

    struct U64Field { const char* key; std::uint64_t* out; };
    for (auto [key, out] : {U64Field{"totalLength", &st.total_length},
                            U64Field{"completedLength", &st.completed_length},
                            U64Field{"downloadSpeed", &st.download_speed},
                            U64Field{"uploadSpeed", &st.upload_speed}}) {
        auto v = read_u64(j, key);
        if (!v) return std::unexpected(v.error());
        *out = *v;
    }

    auto connections = read_u32(j, "connections");
    if (!connections) return std::unexpected(connections.error());
    st.connections = *connections;

    auto num_pieces = read_integer(j, "numPieces");
    if (!num_pieces) return std::unexpected(num_pieces.error());
    st.num_pieces = *num_pieces;

    auto piece_length = read_integer(j, "pieceLength");
    if (!piece_length) return std::unexpected(piece_length.error());
    st.piece_length = *piece_length;

    st.error_code = read_optional_string(j, "errorCode");
    st.error_message = read_optional_string(j, "errorMessage");

    if (auto it = j.find("files"); it != j.end() && it->is_array()) {
        for (const auto& f : *it) {
            auto file = decode_file(f);
            if (!file) return std::unexpected(file.error());
            st.files.push_back(std::move(*file));
        }
    }
    return st;
}

core::Result<GlobalStat> decode_global_stat(const nlohmann::json& j) {
    if (!j.is_object()) {
        return core::fail(core::Errc::protocol_error, "global stat result is not an object");
    }

    GlobalStat gs;
    auto download = read_u64(j, "downloadSpeed");
    if (!download) return std::unexpected(download.error());
    gs.download_speed = *download;

    auto upload = read_u64(j, "uploadSpeed");
    if (!upload) return std::unexpected(upload.error());
    gs.upload_speed = *upload;

    struct U32Field { const char* key; std::uint32_t* out; };
    for (auto [key, out] : {U32Field{"numActive", &gs.num_active},
                            U32Field{"numWaiting", &gs.num_waiting},
                            U32Field{"numStopped", &gs.num_stopped},
                            U32Field{"numStoppedTotal", &gs.num_stopped_total}}) {
        auto v = read_u32(j, key);
        if (!v) return std::unexpected(v.error());
        *out = *v;
    }
    return gs;
}

} // namespace conduit::rpc
