// Copyright (c) 2026 changcheng967. All rights reserved.

#include <conduit/storage/task_codec.hpp>
#include <algorithm>
#include <cstdio>
#include <ctime>

namespace conduit::storage {

namespace {

void put_optional(nlohmann::json& j, const char* key, const std::optional<std::string>& value) {
    if (value) j[key] = *value;
}

std::optional<std::string> get_optional(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

std::optional<std::uint64_t> get_optional_u64(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_unsigned()) return std::nullopt;
    return it->get<std::uint64_t>();
}

std::optional<core::TimePoint> get_optional_time(const nlohmann::json& j, const char* key) {
    auto s = get_optional(j, key);
    if (!s) return std::nullopt;
    return parse_timestamp(*s);
}

} // namespace

std::string format_timestamp(core::TimePoint tp) {
    using namespace std::chrono;
    const auto ms_total = duration_cast<milliseconds>(tp.time_since_epoch()).count();
    auto secs = static_cast<std::time_t>(ms_total / 1000);
    auto ms = ms_total % 1000;
    if (ms < 0) {
        ms += 1000;
        --secs;
    }

    std::tm utc{};
    gmtime_r(&secs, &utc);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                  utc.tm_hour, utc.tm_min, utc.tm_sec, static_cast<int>(ms));
    return buf;
}

std::optional<core::TimePoint> parse_timestamp(std::string_view s) noexcept {
    std::tm utc{};
    int ms = 0;
    int consumed = 0;
    std::string copy(s);

    int fields = std::sscanf(copy.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                             &utc.tm_year, &utc.tm_mon, &utc.tm_mday,
                             &utc.tm_hour, &utc.tm_min, &utc.tm_sec, &consumed);
    if (fields != 6) return std::nullopt;

    std::string_view rest = s.substr(static_cast<std::size_t>(consumed));
    if (!rest.empty() && rest.front() == '.') {
        int digits = 0;
        rest.remove_prefix(1);
        while (!rest.empty() && rest.front() >= '0' && rest.front() <= '9') {
            if (digits < 3) {
                ms = ms * 10 + (rest.front() - '0');
                ++digits;
            }
            rest.remove_prefix(1);
        }
        while (digits++ < 3) ms *= 10;
    }
    if (rest != "Z" && !rest.empty()) return std::nullopt;

    utc.tm_year -= 1900;
    utc.tm_mon -= 1;
    std::time_t secs = timegm(&utc);
    if (secs == static_cast<std::time_t>(-1)) return std::nullopt;

    return core::TimePoint{std::chrono::seconds{secs} + std::chrono::milliseconds{ms}};
}

nlohmann::json encode_metadata(const core::TaskMetadata& metadata) {
    nlohmann::json j = nlohmann::json::object();
    j["headers"] = metadata.headers;
    put_optional(j, "cookies", metadata.cookies);
    put_optional(j, "referrer", metadata.referrer);
    put_optional(j, "userAgent", metadata.user_agent);
    put_optional(j, "tabUrl", metadata.tab_url);
    put_optional(j, "tabTitle", metadata.tab_title);
    return j;
}

core::TaskMetadata decode_metadata(const nlohmann::json& j) {
    core::TaskMetadata metadata;
    if (!j.is_object()) return metadata;

    if (auto it = j.find("headers"); it != j.end() && it->is_object()) {
        for (const auto& [name, value] : it->items()) {
            if (value.is_string()) {
                metadata.headers.emplace(name, value.get<std::string>());
            }
        }
    }
    metadata.cookies = get_optional(j, "cookies");
    metadata.referrer = get_optional(j, "referrer");
    metadata.user_agent = get_optional(j, "userAgent");
    metadata.tab_url = get_optional(j, "tabUrl");
    metadata.tab_title = get_optional(j, "tabTitle");
    return metadata;
}

nlohmann::json encode_post_actions(const std::vector<core::PostAction>& actions) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& action : actions) {
        nlohmann::json a = {{"kind", std::string(core::to_string(action.kind))}};
        if (!action.argument.empty()) a["argument"] = action.argument;
        list.push_back(std::move(a));
    }
    return list;
}

std::vector<core::PostAction> decode_post_actions(const nlohmann::json& j) {
    std::vector<core::PostAction> actions;
    if (!j.is_array()) return actions;

    for (const auto& a : j) {
        if (!a.is_object()) continue;
        auto kind_name = get_optional(a, "kind");
        if (!kind_name) continue;
        auto kind = core::post_action_from_string(*kind_name);
        if (!kind) continue;
        actions.push_back(core::PostAction{*kind, get_optional(a, "argument").value_or("")});
    }
    return actions;
}

nlohmann::json encode_task(const core::DownloadTask& task) {
    nlohmann::json j = {
        {"id", task.id},
        {"url", task.source_url},
        {"filename", task.filename},
        {"destination", task.destination},
        {"completedSize", task.completed_size},
        {"status", std::string(core::to_string(task.status))},
        {"segments", task.segments},
        {"createdAt", format_timestamp(task.created_at)},
        {"metadata", encode_metadata(task.metadata)},
        {"postActions", encode_post_actions(task.post_actions)},
    };
    put_optional(j, "gid", task.remote_handle);
    put_optional(j, "errorMessage", task.error_message);
    if (task.total_size) j["size"] = *task.total_size;
    if (task.speed_limit) j["speedLimit"] = *task.speed_limit;
    if (task.checksum) {
        j["checksum"] = {
            {"type", std::string(core::to_string(task.checksum->type))},
            {"value", task.checksum->value},
        };
    }
    if (task.started_at) j["startedAt"] = format_timestamp(*task.started_at);
    if (task.completed_at) j["completedAt"] = format_timestamp(*task.completed_at);
    return j;
}

core::Result<core::DownloadTask> decode_task(const nlohmann::json& j) {
    if (!j.is_object()) {
        return core::fail(core::Errc::storage_error, "task entry is not an object");
    }

    core::DownloadTask task;
    auto id = get_optional(j, "id");
    auto url = get_optional(j, "url");
    auto status_name = get_optional(j, "status");
    auto created = get_optional_time(j, "createdAt");
    if (!id || id->empty() || !url || !status_name || !created) {
        return core::fail(core::Errc::storage_error, "task entry lacks id, url, status or createdAt");
    }
    auto status = core::status_from_string(*status_name);
    if (!status) {
        return core::fail(core::Errc::storage_error, "unknown status " + *status_name);
    }

    task.id = std::move(*id);
    task.source_url = std::move(*url);
    task.status = *status;
    task.created_at = *created;
    task.remote_handle = get_optional(j, "gid");
    task.filename = get_optional(j, "filename").value_or("");
    task.destination = get_optional(j, "destination").value_or("");
    task.total_size = get_optional_u64(j, "size");
    task.completed_size = get_optional_u64(j, "completedSize").value_or(0);
    task.speed_limit = get_optional_u64(j, "speedLimit");
    task.error_message = get_optional(j, "errorMessage");
    task.started_at = get_optional_time(j, "startedAt");
    task.completed_at = get_optional_time(j, "completedAt");

    auto segments = get_optional_u64(j, "segments").value_or(core::DEFAULT_SEGMENTS);
    task.segments = static_cast<std::uint32_t>(
        std::clamp<std::uint64_t>(segments, core::MIN_SEGMENTS, core::MAX_SEGMENTS));

    if (auto it = j.find("checksum"); it != j.end() && it->is_object()) {
        auto type_name = get_optional(*it, "type");
        auto value = get_optional(*it, "value");
        if (type_name && value) {
            if (auto type = core::checksum_type_from_string(*type_name)) {
                task.checksum = core::Checksum{*type, std::move(*value)};
            }
        }
    }
    if (auto it = j.find("metadata"); it != j.end()) {
        task.metadata = decode_metadata(*it);
    }
    if (auto it = j.find("postActions"); it != j.end()) {
        task.post_actions = decode_post_actions(*it);
    }
    return task;
}

} // namespace conduit::storage
