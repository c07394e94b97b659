// Copyright (c) 2026 changcheng967. All rights reserved.

#include <conduit/core/settings.hpp>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <type_traits>

namespace conduit::core {

namespace fs = std::filesystem;

namespace {

fs::path home_dir() {
    if (const char* home = std::getenv("HOME"); home && *home) return home;
    return fs::current_path();
}

fs::path xdg_dir(const char* var, const char* fallback) {
    if (const char* dir = std::getenv(var); dir && *dir) return dir;
    return home_dir() / fallback;
}

template<typename T>
Result<void> read_field(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return {};

    if constexpr (std::is_same_v<T, std::string> || std::is_same_v<T, fs::path>) {
        if (!it->is_string()) return fail(Errc::config_error, std::string(key) + " must be a string");
        out = it->template get<std::string>();
    } else if constexpr (std::is_same_v<T, std::optional<std::string>>) {
        if (!it->is_string()) return fail(Errc::config_error, std::string(key) + " must be a string");
        auto value = it->template get<std::string>();
        out = value.empty() ? std::nullopt : std::optional<std::string>(std::move(value));
    } else {
        static_assert(std::is_unsigned_v<T>);
        if (!it->is_number_unsigned()) {
            return fail(Errc::config_error, std::string(key) + " must be a non-negative integer");
        }
        if (it->template get<std::uint64_t>() > std::numeric_limits<T>::max()) {
            return fail(Errc::config_error, std::string(key) + " is out of range");
        }
        out = it->template get<T>();
    }
    return {};
}

} // namespace

Settings Settings::defaults() {
    Settings s;
    s.data_dir = xdg_dir("XDG_DATA_HOME", ".local/share") / "conduit";
    s.download_dir = home_dir() / "Downloads" / fs::path(DOWNLOAD_SUBDIR);
    return s;
}

fs::path Settings::default_path() {
    return xdg_dir("XDG_CONFIG_HOME", ".config") / "conduit" / "settings.json";
}

Result<Settings> Settings::load(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return fail(Errc::config_error, "cannot read " + path.string());
    }

    auto j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        return fail(Errc::config_error, path.string() + " is not valid JSON");
    }

    Settings s = defaults();
    if (auto applied = s.apply(j); !applied) {
        return std::unexpected(applied.error());
    }
    if (auto valid = s.validate(); !valid) {
        return std::unexpected(valid.error());
    }
    return s;
}

Result<void> Settings::apply(const nlohmann::json& j) {
    if (!j.is_object()) return fail(Errc::config_error, "settings must be a JSON object");

    std::uint64_t reconcile_ms = static_cast<std::uint64_t>(reconcile_interval.count());
    std::uint64_t backup_sec = static_cast<std::uint64_t>(backup_interval.count());
    std::string log_file = log.file.value_or("");

    auto result = read_field(j, "rpcEndpoint", rpc_endpoint)
        .and_then([&] { return read_field(j, "rpcSecret", rpc_secret); })
        .and_then([&] { return read_field(j, "connectTimeout", connect_timeout_sec); })
        .and_then([&] { return read_field(j, "rpcTimeout", rpc_timeout_sec); })
        .and_then([&] { return read_field(j, "dataDir", data_dir); })
        .and_then([&] { return read_field(j, "downloadDir", download_dir); })
        .and_then([&] { return read_field(j, "reconcileIntervalMs", reconcile_ms); })
        .and_then([&] { return read_field(j, "backupIntervalSec", backup_sec); })
        .and_then([&] { return read_field(j, "defaultSegments", default_segments); })
        .and_then([&] { return read_field(j, "logLevel", log.level); })
        .and_then([&] { return read_field(j, "logFile", log_file); });
    if (!result) return result;

    reconcile_interval = std::chrono::milliseconds(reconcile_ms);
    backup_interval = std::chrono::seconds(backup_sec);
    log.file = log_file.empty() ? std::nullopt : std::optional<std::string>(log_file);
    return {};
}

Result<void> Settings::validate() const {
    if (rpc_endpoint.empty()) {
        return fail(Errc::config_error, "rpcEndpoint is empty");
    }
    if (default_segments < MIN_SEGMENTS || default_segments > MAX_SEGMENTS) {
        return fail(Errc::config_error, "defaultSegments must be between "
                    + std::to_string(MIN_SEGMENTS) + " and " + std::to_string(MAX_SEGMENTS));
    }
    if (reconcile_interval.count() <= 0) {
        return fail(Errc::config_error, "reconcileIntervalMs must be positive");
    }
    if (backup_interval.count() <= 0) {
        return fail(Errc::config_error, "backupIntervalSec must be positive");
    }
    if (!is_valid_log_level(log.level)) {
        return fail(Errc::config_error, "unknown log level '" + log.level + "'");
    }
    return {};
}

} // namespace conduit::core
