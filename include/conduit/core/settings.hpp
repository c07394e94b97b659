// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <conduit/core/config.hpp>
#include <conduit/core/error.hpp>
#include <conduit/core/logging.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace conduit::core {

// Runtime configuration. Defaults come from config.hpp and the user's
// home directory; a JSON settings file and then command-line flags
// override them.
struct Settings {
    std::string rpc_endpoint{DEFAULT_RPC_ENDPOINT};
    std::optional<std::string> rpc_secret;
    std::uint32_t connect_timeout_sec{RPC_CONNECT_TIMEOUT_SEC};
    std::uint32_t rpc_timeout_sec{RPC_TIMEOUT_SEC};

    std::filesystem::path data_dir;
    std::filesystem::path download_dir;

    std::chrono::milliseconds reconcile_interval{RECONCILE_INTERVAL};
    std::chrono::seconds backup_interval{BACKUP_INTERVAL};
    std::uint32_t default_segments{DEFAULT_SEGMENTS};

    LogSettings log;

    [[nodiscard]] static Settings defaults();

    // ~/.config/conduit/settings.json (honours XDG_CONFIG_HOME)
    [[nodiscard]] static std::filesystem::path default_path();

    // Defaults overlaid with the file's values. Unknown keys are ignored;
    // a missing file, invalid JSON or a mistyped value is a config_error.
    [[nodiscard]] static Result<Settings> load(const std::filesystem::path& path);

    // Overlay an already-parsed settings object onto *this
    [[nodiscard]] Result<void> apply(const nlohmann::json& j);

    [[nodiscard]] Result<void> validate() const;
};

} // namespace conduit::core
