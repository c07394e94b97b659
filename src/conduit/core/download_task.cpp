// Copyright (c) 2026 changcheng967. All rights reserved.

#include <conduit/core/download_task.hpp>
#include <array>
#include <cstdio>
#include <random>

namespace conduit::core {

std::string_view to_string(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::pending:   return "pending";
        case TaskStatus::waiting:   return "waiting";
        case TaskStatus::active:    return "active";
        case TaskStatus::paused:    return "paused";
        case TaskStatus::completed: return "completed";
        case TaskStatus::error:     return "error";
        case TaskStatus::removed:   return "removed";
    }
    return "pending";
}

std::optional<TaskStatus> status_from_string(std::string_view s) noexcept {
    if (s == "pending")   return TaskStatus::pending;
    if (s == "waiting")   return TaskStatus::waiting;
    if (s == "active")    return TaskStatus::active;
    if (s == "paused")    return TaskStatus::paused;
    if (s == "completed") return TaskStatus::completed;
    if (s == "error")     return TaskStatus::error;
    if (s == "removed")   return TaskStatus::removed;
    return std::nullopt;
}

TaskStatus status_from_engine(std::string_view s) noexcept {
    if (s == "complete") return TaskStatus::completed;
    if (s == "waiting")  return TaskStatus::waiting;
    if (s == "active")   return TaskStatus::active;
    if (s == "paused")   return TaskStatus::paused;
    if (s == "error")    return TaskStatus::error;
    if (s == "removed")  return TaskStatus::removed;
    return TaskStatus::pending;
}

bool is_terminal(TaskStatus status) noexcept {
    return status == TaskStatus::completed || status == TaskStatus::removed;
}

bool can_transition(TaskStatus from, TaskStatus to) noexcept {
    if (from == to || is_terminal(from)) return false;
    if (to == TaskStatus::removed) return true;

    switch (from) {
        case TaskStatus::pending:
            return to == TaskStatus::waiting || to == TaskStatus::active
                || to == TaskStatus::error;
        case TaskStatus::waiting:
            return to == TaskStatus::active || to == TaskStatus::paused
                || to == TaskStatus::error;
        case TaskStatus::active:
            return to == TaskStatus::waiting || to == TaskStatus::paused
                || to == TaskStatus::completed || to == TaskStatus::error;
        case TaskStatus::paused:
            return to == TaskStatus::active || to == TaskStatus::waiting
                || to == TaskStatus::error;
        case TaskStatus::error:
            // Retried through resume
            return to == TaskStatus::active || to == TaskStatus::waiting;
        default:
            return false;
    }
}

std::string_view to_string(ChecksumType type) noexcept {
    switch (type) {
        case ChecksumType::md5:    return "MD5";
        case ChecksumType::sha1:   return "SHA-1";
        case ChecksumType::sha256: return "SHA-256";
        case ChecksumType::sha512: return "SHA-512";
    }
    return "SHA-256";
}

std::optional<ChecksumType> checksum_type_from_string(std::string_view s) noexcept {
    if (s == "MD5")     return ChecksumType::md5;
    if (s == "SHA-1")   return ChecksumType::sha1;
    if (s == "SHA-256") return ChecksumType::sha256;
    if (s == "SHA-512") return ChecksumType::sha512;
    return std::nullopt;
}

std::string_view to_string(PostAction::Kind kind) noexcept {
    switch (kind) {
        case PostAction::Kind::open_folder:     return "open_folder";
        case PostAction::Kind::unzip:           return "unzip";
        case PostAction::Kind::verify_checksum: return "verify_checksum";
        case PostAction::Kind::run_script:      return "run_script";
        case PostAction::Kind::scan_antivirus:  return "scan_antivirus";
    }
    return "open_folder";
}

std::optional<PostAction::Kind> post_action_from_string(std::string_view s) noexcept {
    if (s == "open_folder")     return PostAction::Kind::open_folder;
    if (s == "unzip")           return PostAction::Kind::unzip;
    if (s == "verify_checksum") return PostAction::Kind::verify_checksum;
    if (s == "run_script")      return PostAction::Kind::run_script;
    if (s == "scan_antivirus")  return PostAction::Kind::scan_antivirus;
    return std::nullopt;
}

double DownloadTask::progress() const noexcept {
    if (!total_size || *total_size == 0) return 0.0;
    return static_cast<double>(completed_size) / static_cast<double>(*total_size);
}

void DownloadTask::record_speed(std::uint64_t speed_bps, TimePoint at) {
    speed_history.push_back(SpeedSample{at, speed_bps});
    while (speed_history.size() > SPEED_HISTORY_LIMIT) {
        speed_history.pop_front();
    }
}

std::string generate_task_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> dist;

    std::array<std::uint8_t, 16> bytes{};
    std::uint64_t hi = dist(rng);
    std::uint64_t lo = dist(rng);
    for (std::size_t i = 0; i < 8; ++i) {
        bytes[i] = static_cast<std::uint8_t>(hi >> (56 - 8 * i));
        bytes[8 + i] = static_cast<std::uint8_t>(lo >> (56 - 8 * i));
    }
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

    char buf[37];
    std::snprintf(buf, sizeof(buf),
                  "%02X%02X%02X%02X-%02X%02X-%02X%02X-%02X%02X-%02X%02X%02X%02X%02X%02X",
                  bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5],
                  bytes[6], bytes[7], bytes[8], bytes[9], bytes[10], bytes[11],
                  bytes[12], bytes[13], bytes[14], bytes[15]);
    return std::string(buf, 36);
}

bool transition(DownloadTask& task, TaskStatus to, TimePoint now) {
    if (!can_transition(task.status, to)) {
        return false;
    }

    const TaskStatus from = task.status;
    task.status = to;

    if (to == TaskStatus::active && !task.started_at) {
        task.started_at = now;
    }
    if (to == TaskStatus::completed) {
        task.completed_at = now;
        if (task.total_size) {
            task.completed_size = *task.total_size;
        }
        task.eta_seconds.reset();
        task.download_speed = 0;
    }
    if ((from == TaskStatus::error || from == TaskStatus::paused)
        && (to == TaskStatus::active || to == TaskStatus::waiting)) {
        task.error_message.reset();
    }
    if (to == TaskStatus::paused || to == TaskStatus::error || to == TaskStatus::removed) {
        task.download_speed = 0;
        task.eta_seconds.reset();
    }
    return true;
}

} // namespace conduit::core
