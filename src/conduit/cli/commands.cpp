// Copyright (c) 2026 changcheng967. All rights reserved.

#include <conduit/cli/commands.hpp>
#include <conduit/cli/progress_bar.hpp>
#include <conduit/rpc/engine_client.hpp>
#include <conduit/rpc/transport.hpp>
#include <conduit/storage/task_store.hpp>
#include <conduit/version.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <charconv>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <thread>

using namespace conduit::core;

namespace chrono = std::chrono;

namespace conduit::cli {

namespace {

volatile std::sig_atomic_t interrupted = 0;

void on_interrupt(int) {
    interrupted = 1;
}

Result<std::uint64_t> parse_u64(std::string_view flag, std::string_view text) {
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
        return fail(Errc::invalid_argument,
                    std::string(flag) + " expects a number, got '" + std::string(text) + "'");
    }
    return value;
}

std::string trim(std::string_view s) {
    auto first = s.find_first_not_of(" \t");
    if (first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(" \t");
    return std::string(s.substr(first, last - first + 1));
}

Result<void> check_operands(const CliArgs& args) {
    const auto n = args.operands.size();
    switch (args.command) {
        case Command::none:
            return fail(Errc::invalid_argument, "no command given");
        case Command::add:
            if (n == 0) return fail(Errc::invalid_argument, "add needs at least one URL");
            return {};
        case Command::pause:
        case Command::resume:
        case Command::cancel:
            if (n != 1) return fail(Errc::invalid_argument, "expected exactly one task id");
            return {};
        case Command::limit:
            if (n != 1) return fail(Errc::invalid_argument, "limit expects one value in bytes/s");
            return {};
        default:
            if (n != 0) return fail(Errc::invalid_argument, "unexpected argument '" + args.operands.front() + "'");
            return {};
    }
}

int print_tasks(const std::vector<DownloadTask>& tasks) {
    if (tasks.empty()) {
        std::cout << "No downloads" << std::endl;
        return 0;
    }
    for (const auto& task : tasks) {
        std::cout << format_task_line(task) << '\n';
    }
    std::cout << std::flush;
    return 0;
}

CliResult watch(TaskOrchestrator& orchestrator, bool quiet) {
    interrupted = 0;
    auto previous = std::signal(SIGINT, on_interrupt);
    if (previous == SIG_ERR) {
        spdlog::warn("Could not install interrupt handler");
        previous = SIG_DFL;
    }

    orchestrator.start();
    std::size_t drawn = 0;
    while (!interrupted) {
        std::this_thread::sleep_for(chrono::milliseconds(500));

        auto tasks = orchestrator.tasks();
        std::erase_if(tasks, [](const DownloadTask& t) { return is_terminal(t.status); });

        if (!quiet) {
            if (drawn > 0) std::cout << "\x1b[" << drawn << "A";
            for (const auto& task : tasks) {
                std::cout << "\x1b[2K" << format_task_line(task) << '\n';
            }
            std::cout << std::flush;
            drawn = tasks.size();
        }

        bool any_running = std::any_of(tasks.begin(), tasks.end(), [](const DownloadTask& t) {
            return t.is_running() || t.status == TaskStatus::pending;
        });
        if (!any_running) break;
    }

    std::signal(SIGINT, previous);
    return 0;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

std::optional<Command> command_from_string(std::string_view s) noexcept {
    if (s == "add")        return Command::add;
    if (s == "list")       return Command::list;
    if (s == "stats")      return Command::stats;
    if (s == "pause")      return Command::pause;
    if (s == "resume")     return Command::resume;
    if (s == "cancel")     return Command::cancel;
    if (s == "pause-all")  return Command::pause_all;
    if (s == "resume-all") return Command::resume_all;
    if (s == "limit")      return Command::limit;
    if (s == "watch")      return Command::watch;
    return std::nullopt;
}

Result<CliArgs> parse_args(int argc, char* argv[]) {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        auto value = [&]() -> Result<std::string> {
            if (i + 1 >= argc) {
                return fail(Errc::invalid_argument, std::string(arg) + " needs a value");
            }
            return std::string(argv[++i]);
        };

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }
        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
            continue;
        }
        if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
            continue;
        }

        if (arg.starts_with("-") && arg.size() > 1) {
            auto v = value();
            if (!v) return std::unexpected(v.error());

            if (arg == "-c" || arg == "--config") {
                args.config_path = std::move(*v);
            } else if (arg == "--rpc") {
                args.rpc_endpoint = std::move(*v);
            } else if (arg == "--secret") {
                args.secret = std::move(*v);
            } else if (arg == "--data-dir") {
                args.data_dir = std::move(*v);
            } else if (arg == "-o" || arg == "--output") {
                args.task.filename = std::move(*v);
            } else if (arg == "-d" || arg == "--directory") {
                args.task.destination = std::move(*v);
            } else if (arg == "-n" || arg == "--segments") {
                auto n = parse_u64(arg, *v);
                if (!n) return std::unexpected(n.error());
                if (*n < MIN_SEGMENTS || *n > MAX_SEGMENTS) {
                    return fail(Errc::invalid_argument, "segments must be between 1 and 16");
                }
                args.task.segments = static_cast<std::uint32_t>(*n);
            } else if (arg == "--limit") {
                auto n = parse_u64(arg, *v);
                if (!n) return std::unexpected(n.error());
                if (*n > 0) args.task.speed_limit = *n;
            } else if (arg == "--cookie") {
                args.task.cookies = std::move(*v);
            } else if (arg == "--referer") {
                args.task.referrer = std::move(*v);
            } else if (arg == "--user-agent") {
                args.task.user_agent = std::move(*v);
            } else if (arg == "-H" || arg == "--header") {
                auto colon = v->find(':');
                if (colon == std::string::npos || colon == 0) {
                    return fail(Errc::invalid_argument, "header must look like 'Name: value'");
                }
                args.task.headers[trim(std::string_view(*v).substr(0, colon))] =
                    trim(std::string_view(*v).substr(colon + 1));
            } else {
                return fail(Errc::invalid_argument, "unknown option " + std::string(arg));
            }
            continue;
        }

        if (args.command == Command::none) {
            auto command = command_from_string(arg);
            if (!command) {
                return fail(Errc::invalid_argument, "unknown command '" + std::string(arg) + "'");
            }
            args.command = *command;
            continue;
        }
        args.operands.emplace_back(arg);
    }

    if (auto checked = check_operands(args); !checked) {
        return std::unexpected(checked.error());
    }
    return args;
}

Result<Settings> resolve_settings(const CliArgs& args) {
    Settings settings = Settings::defaults();

    if (args.config_path) {
        auto loaded = Settings::load(*args.config_path);
        if (!loaded) return std::unexpected(loaded.error());
        settings = std::move(*loaded);
    } else {
        std::error_code ec;
        auto path = Settings::default_path();
        if (std::filesystem::exists(path, ec)) {
            auto loaded = Settings::load(path);
            if (!loaded) return std::unexpected(loaded.error());
            settings = std::move(*loaded);
        }
    }

    if (args.rpc_endpoint) settings.rpc_endpoint = *args.rpc_endpoint;
    if (args.secret) settings.rpc_secret = *args.secret;
    if (args.data_dir) settings.data_dir = *args.data_dir;
    if (args.verbose) settings.log.level = "debug";
    if (args.quiet) settings.log.level = "error";

    if (auto valid = settings.validate(); !valid) {
        return std::unexpected(valid.error());
    }
    return settings;
}

//=============================================================================
// Commands
//=============================================================================

Result<std::string> resolve_id(const TaskOrchestrator& orchestrator, std::string_view id_or_prefix) {
    if (id_or_prefix.empty()) {
        return fail(Errc::invalid_argument, "empty task id");
    }

    std::optional<std::string> match;
    for (const auto& task : orchestrator.tasks()) {
        if (task.id == id_or_prefix) return task.id;
        if (task.id.starts_with(id_or_prefix)) {
            if (match) {
                return fail(Errc::invalid_argument,
                            "'" + std::string(id_or_prefix) + "' matches more than one task");
            }
            match = task.id;
        }
    }
    if (!match) return fail(Errc::not_found, std::string(id_or_prefix));
    return *match;
}

std::string format_task_line(const DownloadTask& task) {
    std::string line = task.id.substr(0, 8);
    line += "  ";

    std::string status(to_string(task.status));
    status.resize(std::max<std::size_t>(status.size(), 9), ' ');
    line += status;
    line += ' ';

    line += ProgressBar(20).render(task.completed_size, task.total_size, task.download_speed);
    line += "  ";
    line += task.filename;

    if (task.error_message) {
        line += " - ";
        line += *task.error_message;
    }
    return line;
}

CliResult run(const CliArgs& args, const Settings& settings) {
    rpc::HttpTransportOptions transport_options;
    transport_options.endpoint = settings.rpc_endpoint;
    transport_options.connect_timeout = chrono::seconds(settings.connect_timeout_sec);
    transport_options.timeout = chrono::seconds(settings.rpc_timeout_sec);

    rpc::EngineClient engine(std::make_unique<rpc::HttpTransport>(transport_options),
                             settings.rpc_secret);

    storage::TaskStore store({settings.data_dir, settings.backup_interval});
    if (auto opened = store.open(); !opened) {
        return std::unexpected(opened.error());
    }

    OrchestratorConfig config;
    config.reconcile_interval = settings.reconcile_interval;
    config.default_destination = settings.download_dir.string();
    config.default_segments = settings.default_segments;

    TaskOrchestrator orchestrator(engine, store, config);
    if (auto loaded = orchestrator.initialize(); !loaded) {
        return std::unexpected(loaded.error());
    }

    auto with_id = [&](auto&& op, const char* done) -> CliResult {
        auto id = resolve_id(orchestrator, args.operands.front());
        if (!id) return std::unexpected(id.error());
        if (auto r = op(*id); !r) return std::unexpected(r.error());
        std::cout << done << ' ' << *id << std::endl;
        return 0;
    };

    CliResult result = 0;
    switch (args.command) {
        case Command::add:
            for (const auto& url : args.operands) {
                auto task = orchestrator.add_task(url, args.task);
                if (!task) {
                    result = std::unexpected(task.error());
                    break;
                }
                std::cout << "Added " << task->id << "  " << task->filename
                          << " -> " << task->destination << std::endl;
            }
            break;

        case Command::list:
            orchestrator.reconcile();
            result = print_tasks(orchestrator.tasks());
            break;

        case Command::stats: {
            orchestrator.reconcile();
            auto stats = orchestrator.global_stats();
            if (!stats) {
                result = fail(Errc::network_error, "engine statistics unavailable");
                break;
            }
            std::cout << "Download: " << format_speed(stats->download_speed) << '\n'
                      << "Upload:   " << format_speed(stats->upload_speed) << '\n'
                      << "Active: " << stats->num_active
                      << "  Waiting: " << stats->num_waiting
                      << "  Stopped: " << stats->num_stopped
                      << " (" << stats->num_stopped_total << " total)" << std::endl;
            break;
        }

        case Command::pause:
            result = with_id([&](const std::string& id) { return orchestrator.pause(id); }, "Paused");
            break;
        case Command::resume:
            result = with_id([&](const std::string& id) { return orchestrator.resume(id); }, "Resumed");
            break;
        case Command::cancel:
            result = with_id([&](const std::string& id) { return orchestrator.cancel(id); }, "Cancelled");
            break;

        case Command::pause_all:
            std::cout << "Paused " << orchestrator.pause_all() << " task(s)" << std::endl;
            break;
        case Command::resume_all:
            std::cout << "Resumed " << orchestrator.resume_all() << " task(s)" << std::endl;
            break;

        case Command::limit: {
            auto limit = parse_u64("limit", args.operands.front());
            if (!limit) {
                result = std::unexpected(limit.error());
                break;
            }
            auto applied = orchestrator.set_global_speed_limit(
                *limit > 0 ? std::optional<std::uint64_t>(*limit) : std::nullopt);
            if (!applied) {
                result = std::unexpected(applied.error());
                break;
            }
            std::cout << (*limit > 0 ? "Global limit " + format_speed(*limit) : std::string("Global limit removed"))
                      << std::endl;
            break;
        }

        case Command::watch:
            result = watch(orchestrator, args.quiet);
            break;

        case Command::none:
            result = fail(Errc::invalid_argument, "no command given");
            break;
    }

    orchestrator.stop();
    if (!orchestrator.storage_healthy()) {
        std::cerr << "Warning: " << store.failed_writes()
                  << " task update(s) could not be saved to " << store.database_path().string()
                  << std::endl;
    }
    return result;
}

void print_help(std::string_view program_name) {
    std::cout << "Conduit " << conduit::version.to_string() << " - download orchestrator for aria2\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <COMMAND> [ARGS]\n";
    std::cout << "\n";
    std::cout << "COMMANDS:\n";
    std::cout << "  add <URL>...            Queue downloads on the engine\n";
    std::cout << "  list                    Show all downloads\n";
    std::cout << "  stats                   Show engine-wide transfer statistics\n";
    std::cout << "  pause <ID>              Pause a download (unique id prefix accepted)\n";
    std::cout << "  resume <ID>             Resume a paused or failed download\n";
    std::cout << "  cancel <ID>             Remove a download\n";
    std::cout << "  pause-all, resume-all   Pause or resume every download\n";
    std::cout << "  limit <BYTES/S>         Set the global download limit (0 removes it)\n";
    std::cout << "  watch                   Follow progress until all downloads stop\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable debug logging\n";
    std::cout << "  -q, --quiet             Only log errors, no progress display\n";
    std::cout << "  -c, --config <FILE>     Settings file (JSON)\n";
    std::cout << "      --rpc <URL>         Engine JSON-RPC endpoint\n";
    std::cout << "      --secret <TOKEN>    Engine RPC secret\n";
    std::cout << "      --data-dir <DIR>    Where the task database lives\n";
    std::cout << "\n";
    std::cout << "ADD OPTIONS:\n";
    std::cout << "  -o, --output <FILE>     Save under this name\n";
    std::cout << "  -d, --directory <DIR>   Save into this directory\n";
    std::cout << "  -n, --segments <N>      Connections per download (1-16, default 8)\n";
    std::cout << "      --limit <BYTES/S>   Per-download speed cap\n";
    std::cout << "      --cookie <C>        Send this Cookie header\n";
    std::cout << "      --referer <URL>     Send this referrer\n";
    std::cout << "      --user-agent <UA>   Send this User-Agent\n";
    std::cout << "  -H, --header <H>        Extra header, 'Name: value' (repeatable)\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " add https://example.com/file.zip\n";
    std::cout << "  " << program_name << " add -n 16 -o image.iso https://example.com/large.iso\n";
    std::cout << "  " << program_name << " --rpc http://nas:6800/jsonrpc --secret s3cret watch\n";
}

void print_version() {
    std::cout << "Conduit " << conduit::version.to_string() << std::endl;
    std::cout << "Built " << conduit::BUILD_DATE << " " << conduit::BUILD_TIME
              << " with C++23, libcurl, SQLite, spdlog\n";
}

} // namespace conduit::cli
