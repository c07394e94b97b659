// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <conduit/core/download_task.hpp>
#include <conduit/core/error.hpp>
#include <conduit/core/settings.hpp>
#include <conduit/core/task_orchestrator.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conduit::cli {

// Exit code on success
using CliResult = core::Result<int>;

enum class Command {
    none,
    add,
    list,
    stats,
    pause,
    resume,
    cancel,
    pause_all,
    resume_all,
    limit,
    watch
};

[[nodiscard]] std::optional<Command> command_from_string(std::string_view s) noexcept;

// Command line arguments
struct CliArgs {
    Command command{Command::none};
    std::vector<std::string> operands;

    std::optional<std::string> config_path;
    std::optional<std::string> rpc_endpoint;
    std::optional<std::string> secret;
    std::optional<std::string> data_dir;

    core::TaskOptions task;  // add only

    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
};

// Unknown flags, missing flag values and bad numbers are invalid_argument
[[nodiscard]] core::Result<CliArgs> parse_args(int argc, char* argv[]);

// Settings file (explicit, else the default path if present, else
// defaults) with command-line overrides applied
[[nodiscard]] core::Result<core::Settings> resolve_settings(const CliArgs& args);

// Execute args.command against the engine described by settings
[[nodiscard]] CliResult run(const CliArgs& args, const core::Settings& settings);

// Resolve a full id or a unique prefix of one
[[nodiscard]] core::Result<std::string> resolve_id(const core::TaskOrchestrator& orchestrator,
                                                   std::string_view id_or_prefix);

// One row of `list` / `watch` output
[[nodiscard]] std::string format_task_line(const core::DownloadTask& task);

// Show help message
void print_help(std::string_view program_name);

// Show version information
void print_version();

} // namespace conduit::cli
