// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <conduit/core/config.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conduit::core {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Task lifecycle. completed and removed are terminal.
enum class TaskStatus : std::uint8_t {
    pending,    // Created, not yet accepted by the engine
    waiting,    // Queued by the engine
    active,     // Transferring
    paused,     // Paused by user, interrupted, or lost by a restarted engine
    completed,
    error,      // Unrecoverable engine failure
    removed     // Cancelled; never listed again
};

[[nodiscard]] std::string_view to_string(TaskStatus status) noexcept;
[[nodiscard]] std::optional<TaskStatus> status_from_string(std::string_view s) noexcept;

// Maps the engine's status vocabulary ("complete", "active", ...) to ours.
// Unknown words map to pending.
[[nodiscard]] TaskStatus status_from_engine(std::string_view s) noexcept;

[[nodiscard]] bool is_terminal(TaskStatus status) noexcept;

// Whether the state machine has an edge from -> to
[[nodiscard]] bool can_transition(TaskStatus from, TaskStatus to) noexcept;

enum class ChecksumType : std::uint8_t { md5, sha1, sha256, sha512 };

[[nodiscard]] std::string_view to_string(ChecksumType type) noexcept;
[[nodiscard]] std::optional<ChecksumType> checksum_type_from_string(std::string_view s) noexcept;

// Declared for the presentation layer; never verified here
struct Checksum {
    ChecksumType type{ChecksumType::sha256};
    std::string value;

    bool operator==(const Checksum&) const = default;
};

// Declared for the presentation layer; never executed here
struct PostAction {
    enum class Kind : std::uint8_t { open_folder, unzip, verify_checksum, run_script, scan_antivirus };

    Kind kind{Kind::open_folder};
    std::string argument;  // Script path for run_script

    bool operator==(const PostAction&) const = default;
};

[[nodiscard]] std::string_view to_string(PostAction::Kind kind) noexcept;
[[nodiscard]] std::optional<PostAction::Kind> post_action_from_string(std::string_view s) noexcept;

// Request provenance, usually filled in by the browser bridge
struct TaskMetadata {
    std::map<std::string, std::string> headers;
    std::optional<std::string> cookies;
    std::optional<std::string> referrer;
    std::optional<std::string> user_agent;
    std::optional<std::string> tab_url;
    std::optional<std::string> tab_title;

    bool operator==(const TaskMetadata&) const = default;
};

struct SpeedSample {
    TimePoint timestamp;
    std::uint64_t speed_bps{0};
};

struct DownloadTask {
    std::string id;
    std::optional<std::string> remote_handle;  // Engine GID once accepted
    std::string source_url;
    std::string filename;
    std::string destination;                   // Directory the engine writes into

    std::optional<std::uint64_t> total_size;
    std::uint64_t completed_size{0};
    TaskStatus status{TaskStatus::pending};
    std::uint32_t segments{DEFAULT_SEGMENTS};
    std::optional<std::uint64_t> speed_limit;  // bytes/s, engine enforced
    std::optional<std::string> error_message;

    std::optional<Checksum> checksum;
    std::vector<PostAction> post_actions;
    TaskMetadata metadata;

    TimePoint created_at;
    std::optional<TimePoint> started_at;
    std::optional<TimePoint> completed_at;

    // Live values from the last reconciliation; not persisted
    std::uint64_t download_speed{0};
    std::uint64_t upload_speed{0};
    std::uint32_t connections{0};
    std::optional<std::uint64_t> eta_seconds;
    std::deque<SpeedSample> speed_history;

    // Fraction in [0, 1]; 0 while the size is unknown
    [[nodiscard]] double progress() const noexcept;

    [[nodiscard]] bool is_running() const noexcept {
        return status == TaskStatus::active || status == TaskStatus::waiting;
    }

    // Append to speed_history, evicting the oldest beyond SPEED_HISTORY_LIMIT
    void record_speed(std::uint64_t speed_bps, TimePoint at);
};

// Random RFC 4122 version 4 identifier
[[nodiscard]] std::string generate_task_id();

// Moves task to `to` if the state machine allows it. Stamps started_at on
// the first entry into active and completed_at on completion; clears the
// error message when the task leaves error or an error-carrying pause.
// Returns false and leaves the task untouched otherwise.
[[nodiscard]] bool transition(DownloadTask& task, TaskStatus to, TimePoint now = Clock::now());

// Millisecond precision, matching what the store can round-trip
[[nodiscard]] inline TimePoint now_ms() {
    return std::chrono::floor<std::chrono::milliseconds>(Clock::now());
}

} // namespace conduit::core
