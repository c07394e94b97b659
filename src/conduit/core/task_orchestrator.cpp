// Copyright (c) 2026 changcheng967. All rights reserved.

#include <conduit/core/task_orchestrator.hpp>
#include <conduit/core/url.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace conduit::core {

namespace {

constexpr std::string_view INTERRUPTED_MESSAGE =
    "Download interrupted: engine no longer tracks this task";
constexpr std::string_view REMOVED_REMOTELY_MESSAGE =
    "Download was removed from the engine";

bool is_queued(TaskStatus status) noexcept {
    return status == TaskStatus::pending || status == TaskStatus::waiting
        || status == TaskStatus::paused;
}

} // namespace

bool move_to(DownloadTask& task, TaskStatus to, TimePoint now) {
    if (transition(task, to, now)) return true;

    for (TaskStatus via : {TaskStatus::active, TaskStatus::waiting}) {
        if (can_transition(task.status, via) && can_transition(via, to)) {
            return transition(task, via, now) && transition(task, to, now);
        }
    }
    return false;
}

TaskOrchestrator::TaskOrchestrator(rpc::EngineClient& engine, storage::TaskStore& store,
                                   OrchestratorConfig config)
    : engine_(engine)
    , store_(store)
    , config_(std::move(config)) {}

TaskOrchestrator::~TaskOrchestrator() {
    stop_loop();
}

//=============================================================================
// Lifecycle
//=============================================================================

Result<std::size_t> TaskOrchestrator::initialize() {
    auto loaded = store_.load_all();
    if (!loaded) {
        return std::unexpected(loaded.error());
    }

    std::vector<std::pair<std::string, std::optional<std::string>>> to_check;
    std::size_t count = 0;
    {
        auto lock = std::lock_guard(mutex_);
        tasks_ = std::move(*loaded);
        count = tasks_.size();
        for (const auto& task : tasks_) {
            if (task.status == TaskStatus::active || task.status == TaskStatus::paused) {
                to_check.emplace_back(task.id, task.remote_handle);
            }
        }
        refresh_views();
    }
    spdlog::info("Loaded {} task(s), checking {} against the engine", count, to_check.size());

    for (const auto& [id, gid] : to_check) {
        Result<rpc::EngineStatus> status = gid
            ? engine_.tell_status(*gid)
            : Result<rpc::EngineStatus>(fail(Errc::not_found, "no engine handle"));

        auto lock = std::lock_guard(mutex_);
        auto* task = find_locked(id);
        if (!task) continue;

        if (status) {
            merge(*task, *status, now_ms());
            continue;
        }

        spdlog::warn("Task {} ({}) is unknown to the engine: {}", task->filename, task->id,
                     status.error().describe());
        if (task->status == TaskStatus::active && !transition(*task, TaskStatus::paused)) {
            continue;
        }
        task->error_message = std::string(INTERRUPTED_MESSAGE);
        store_.save(*task);
    }

    {
        auto lock = std::lock_guard(mutex_);
        refresh_views();
    }
    return count;
}

void TaskOrchestrator::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) return;
    worker_ = std::jthread([this](std::stop_token stoken) { run_loop(stoken); });
    spdlog::debug("Reconciliation loop started ({} ms)", config_.reconcile_interval.count());
}

void TaskOrchestrator::stop() {
    stop_loop();

    auto lock = std::lock_guard(mutex_);
    if (auto saved = store_.backup_snapshot(); !saved) {
        spdlog::warn("Final backup failed: {}", saved.error().describe());
    }
}

void TaskOrchestrator::stop_loop() {
    if (worker_.joinable()) {
        worker_.request_stop();
        wake_.notify_all();
        worker_.join();
    }
    running_.store(false, std::memory_order_release);
}

void TaskOrchestrator::run_loop(std::stop_token stoken) {
    while (!stoken.stop_requested()) {
        reconcile();

        auto lock = std::unique_lock(wake_mutex_);
        wake_.wait_for(lock, stoken, config_.reconcile_interval, [] { return false; });
    }
}

//=============================================================================
// Task operations
//=============================================================================

Result<DownloadTask> TaskOrchestrator::add_task(std::string_view url, const TaskOptions& options) {
    auto parsed = Url::parse(url);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }

    DownloadTask task;
    task.id = generate_task_id();
    task.source_url = parsed->str();
    task.filename = options.filename.value_or(parsed->filename());
    task.destination = options.destination.value_or(config_.default_destination);
    task.segments = std::clamp(options.segments.value_or(config_.default_segments),
                               MIN_SEGMENTS, MAX_SEGMENTS);
    task.speed_limit = options.speed_limit;
    task.checksum = options.checksum;
    task.post_actions = options.post_actions;
    task.metadata.headers = options.headers;
    task.metadata.cookies = options.cookies;
    task.metadata.referrer = options.referrer;
    task.metadata.user_agent = options.user_agent;
    task.metadata.tab_url = options.tab_url;
    task.metadata.tab_title = options.tab_title;
    task.created_at = now_ms();

    auto gid = engine_.add_uri({task.source_url}, engine_options(task));
    if (!gid) {
        spdlog::warn("Engine rejected {}: {}", task.source_url, gid.error().describe());
        return std::unexpected(gid.error());
    }
    task.remote_handle = *gid;

    // Seed size and state; a failed query leaves the task waiting for the next cycle
    TaskStatus target = TaskStatus::waiting;
    if (auto status = engine_.tell_status(*gid); status) {
        if (status->total_length > 0) task.total_size = status->total_length;
        task.completed_size = status->completed_length;
        if (task.total_size) task.completed_size = std::min(task.completed_size, *task.total_size);

        target = status_from_engine(status->status);
        if (target == TaskStatus::error) {
            task.error_message = status->error_message.value_or("Engine reported an error");
        }
    } else {
        spdlog::warn("Could not query new task {}: {}", *gid, status.error().describe());
    }
    if (target == TaskStatus::pending || target == TaskStatus::removed) {
        target = TaskStatus::waiting;
    }
    if (!move_to(task, target, now_ms()) && !move_to(task, TaskStatus::waiting, now_ms())) {
        spdlog::warn("Task {} stays pending after engine reported {}", task.id, to_string(target));
    }

    {
        auto lock = std::lock_guard(mutex_);
        store_.save(task);
        tasks_.insert(tasks_.begin(), task);
        refresh_views();
    }
    spdlog::info("Added {} as {} (gid {})", task.filename, task.id, *gid);
    return task;
}

Result<void> TaskOrchestrator::pause(std::string_view id) {
    std::string gid;
    {
        auto lock = std::lock_guard(mutex_);
        auto* task = find_locked(id);
        if (!task || !task->remote_handle) {
            return fail(Errc::not_found, std::string(id));
        }
        if (!can_transition(task->status, TaskStatus::paused)) {
            return fail(Errc::invalid_transition,
                        "cannot pause a " + std::string(to_string(task->status)) + " task");
        }
        gid = *task->remote_handle;
    }

    if (auto paused = engine_.pause(gid); !paused) {
        return std::unexpected(paused.error());
    }

    auto lock = std::lock_guard(mutex_);
    auto* task = find_locked(id);
    if (task && transition(*task, TaskStatus::paused)) {
        store_.save(*task);
        refresh_views();
    }
    return {};
}

Result<void> TaskOrchestrator::resume(std::string_view id) {
    std::string gid;
    {
        auto lock = std::lock_guard(mutex_);
        auto* task = find_locked(id);
        if (!task || !task->remote_handle) {
            return fail(Errc::not_found, std::string(id));
        }
        if (task->status != TaskStatus::paused && task->status != TaskStatus::error) {
            return fail(Errc::invalid_transition,
                        "cannot resume a " + std::string(to_string(task->status)) + " task");
        }
        gid = *task->remote_handle;
    }

    if (auto resumed = engine_.unpause(gid); !resumed) {
        return std::unexpected(resumed.error());
    }

    auto lock = std::lock_guard(mutex_);
    auto* task = find_locked(id);
    if (task && transition(*task, TaskStatus::active)) {
        store_.save(*task);
        refresh_views();
    }
    return {};
}

Result<void> TaskOrchestrator::cancel(std::string_view id) {
    std::optional<std::string> gid;
    {
        auto lock = std::lock_guard(mutex_);
        auto it = std::find_if(tasks_.begin(), tasks_.end(),
                               [&](const DownloadTask& t) { return t.id == id; });
        if (it == tasks_.end()) {
            return fail(Errc::not_found, std::string(id));
        }

        gid = it->remote_handle;
        controller_.forget(it->id);
        tasks_.erase(it);
        if (auto removed = store_.remove(id); !removed) {
            spdlog::warn("Could not mark task {} removed: {}", id, removed.error().describe());
        }
        refresh_views();
    }

    if (gid) {
        if (auto removed = engine_.remove(*gid); !removed) {
            spdlog::warn("Engine removal of {} failed, task dropped locally: {}", *gid,
                         removed.error().describe());
        }
    }
    spdlog::info("Cancelled task {}", id);
    return {};
}

Result<void> TaskOrchestrator::set_global_speed_limit(std::optional<std::uint64_t> bytes_per_sec) {
    rpc::GlobalOptions options;
    options.max_overall_download_limit = bytes_per_sec.value_or(0);

    auto changed = engine_.change_global_option(options);
    if (!changed) {
        return std::unexpected(changed.error());
    }
    spdlog::info("Global download limit set to {} B/s", *options.max_overall_download_limit);
    return {};
}

std::size_t TaskOrchestrator::pause_all() {
    std::vector<std::string> ids;
    {
        auto lock = std::lock_guard(mutex_);
        for (const auto& task : tasks_) {
            if (task.is_running() && task.remote_handle) ids.push_back(task.id);
        }
    }

    std::size_t changed = 0;
    for (const auto& id : ids) {
        if (auto paused = pause(id); paused) {
            ++changed;
        } else {
            spdlog::warn("Pausing {} failed: {}", id, paused.error().describe());
        }
    }
    return changed;
}

std::size_t TaskOrchestrator::resume_all() {
    std::vector<std::string> ids;
    {
        auto lock = std::lock_guard(mutex_);
        for (const auto& task : tasks_) {
            if (task.status == TaskStatus::paused && task.remote_handle) ids.push_back(task.id);
        }
    }

    std::size_t changed = 0;
    for (const auto& id : ids) {
        if (auto resumed = resume(id); resumed) {
            ++changed;
        } else {
            spdlog::warn("Resuming {} failed: {}", id, resumed.error().describe());
        }
    }
    return changed;
}

//=============================================================================
// Reconciliation
//=============================================================================

bool TaskOrchestrator::reconcile() {
    auto cycle = std::unique_lock(cycle_mutex_, std::try_to_lock);
    if (!cycle.owns_lock()) {
        spdlog::debug("Reconciliation already in flight, skipping");
        return false;
    }

    if (auto stat = engine_.get_global_stat(); stat) {
        auto lock = std::lock_guard(mutex_);
        stats_ = *stat;
    } else {
        spdlog::warn("Global stats unavailable: {}", stat.error().describe());
    }

    // Status observed when the query was issued; a reply is stale once a
    // concurrent pause/resume/cancel has moved the task on
    struct Target {
        std::string id;
        std::string gid;
        TaskStatus seen;
    };

    std::vector<Target> targets;
    {
        auto lock = std::lock_guard(mutex_);
        for (const auto& task : tasks_) {
            if (task.remote_handle && !is_terminal(task.status)) {
                targets.push_back({task.id, *task.remote_handle, task.status});
            }
        }
    }

    for (const auto& [id, gid, seen] : targets) {
        auto status = engine_.tell_status(gid);

        auto lock = std::lock_guard(mutex_);
        auto* task = find_locked(id);
        if (!task || task->remote_handle != gid) {
            spdlog::debug("Dropping status for {}, task is gone", gid);
            continue;
        }
        if (task->status != seen) {
            spdlog::debug("Dropping status for {}, task moved to {} meanwhile", task->id,
                          to_string(task->status));
            continue;
        }
        if (!status) {
            if (task->status == TaskStatus::paused && task->error_message) {
                spdlog::debug("Status of {} unavailable: {}", task->id, status.error().describe());
            } else {
                spdlog::warn("Status of {} unavailable: {}", task->id, status.error().describe());
            }
            continue;
        }
        merge(*task, *status, now_ms());
    }

    auto lock = std::lock_guard(mutex_);
    refresh_views();
    return true;
}

bool TaskOrchestrator::merge(DownloadTask& task, const rpc::EngineStatus& status, TimePoint now) {
    const auto old_size = task.total_size;
    const auto old_completed = task.completed_size;
    const auto old_status = task.status;

    if (status.total_length > 0) {
        task.total_size = status.total_length;
    }

    auto completed = status.completed_length;
    if (task.status == TaskStatus::active) {
        completed = std::max(completed, task.completed_size);
    }
    if (task.total_size) {
        completed = std::min(completed, *task.total_size);
    }
    task.completed_size = completed;

    TaskStatus target = status_from_engine(status.status);
    if (target == TaskStatus::removed) {
        target = TaskStatus::error;
        if (task.status != TaskStatus::error) {
            task.error_message = std::string(REMOVED_REMOTELY_MESSAGE);
        }
    } else if (target == TaskStatus::error && task.status != TaskStatus::error) {
        task.error_message = status.error_message.value_or(
            "Engine error " + status.error_code.value_or("unknown"));
    }

    if (target != TaskStatus::pending && target != task.status && !move_to(task, target, now)) {
        spdlog::debug("Ignoring engine status {} for {} task {}", status.status,
                      to_string(task.status), task.id);
    }

    task.upload_speed = status.upload_speed;
    task.connections = status.connections;
    if (task.status == TaskStatus::active) {
        task.download_speed = status.download_speed;
        task.record_speed(status.download_speed, now);
        if (task.download_speed > 0 && task.total_size) {
            task.eta_seconds = (*task.total_size - task.completed_size) / task.download_speed;
        } else {
            task.eta_seconds.reset();
        }

        auto recommended = controller_.adjust(task.id, static_cast<double>(task.download_speed),
                                              task.total_size, task.segments);
        if (recommended != task.segments) {
            spdlog::debug("Task {} segments {} -> {}", task.id, task.segments, recommended);
            task.segments = recommended;
        }
    } else {
        task.download_speed = 0;
        task.eta_seconds.reset();
        if (is_terminal(task.status)) controller_.forget(task.id);
    }

    const bool changed = task.total_size != old_size || task.completed_size != old_completed
        || task.status != old_status;
    if (!changed) return false;

    if (task.status != old_status) {
        spdlog::info("Task {} ({}): {} -> {}", task.filename, task.id, to_string(old_status),
                     to_string(task.status));
    }
    store_.save(task);
    return true;
}

//=============================================================================
// Views
//=============================================================================

std::vector<DownloadTask> TaskOrchestrator::tasks() const {
    auto lock = std::lock_guard(mutex_);
    return tasks_;
}

std::vector<DownloadTask> TaskOrchestrator::active_tasks() const {
    auto lock = std::lock_guard(mutex_);
    return collect(views_.active);
}

std::vector<DownloadTask> TaskOrchestrator::queued_tasks() const {
    auto lock = std::lock_guard(mutex_);
    return collect(views_.queued);
}

std::vector<DownloadTask> TaskOrchestrator::completed_tasks() const {
    auto lock = std::lock_guard(mutex_);
    return collect(views_.completed);
}

std::optional<DownloadTask> TaskOrchestrator::find(std::string_view id) const {
    auto lock = std::lock_guard(mutex_);
    if (const auto* task = find_locked(id)) return *task;
    return std::nullopt;
}

std::optional<GlobalStats> TaskOrchestrator::global_stats() const {
    auto lock = std::lock_guard(mutex_);
    return stats_;
}

bool TaskOrchestrator::storage_healthy() const {
    auto lock = std::lock_guard(mutex_);
    return store_.healthy();
}

DownloadTask* TaskOrchestrator::find_locked(std::string_view id) {
    auto it = std::find_if(tasks_.begin(), tasks_.end(),
                           [&](const DownloadTask& t) { return t.id == id; });
    return it == tasks_.end() ? nullptr : &*it;
}

const DownloadTask* TaskOrchestrator::find_locked(std::string_view id) const {
    auto it = std::find_if(tasks_.begin(), tasks_.end(),
                           [&](const DownloadTask& t) { return t.id == id; });
    return it == tasks_.end() ? nullptr : &*it;
}

std::vector<DownloadTask> TaskOrchestrator::collect(const std::vector<std::string>& ids) const {
    std::vector<DownloadTask> result;
    result.reserve(ids.size());
    for (const auto& id : ids) {
        if (const auto* task = find_locked(id)) result.push_back(*task);
    }
    return result;
}

void TaskOrchestrator::refresh_views() {
    Views views;
    for (const auto& task : tasks_) {
        if (task.status == TaskStatus::active) {
            views.active.push_back(task.id);
        } else if (is_queued(task.status)) {
            views.queued.push_back(task.id);
        } else if (task.status == TaskStatus::completed) {
            views.completed.push_back(task.id);
        }
    }
    views_ = std::move(views);
}

rpc::AddOptions TaskOrchestrator::engine_options(const DownloadTask& task) const {
    rpc::AddOptions options;
    options.dir = task.destination;
    options.out = task.filename;
    options.split = task.segments;
    options.max_connection_per_server = task.segments;
    options.max_download_limit = task.speed_limit;
    options.referer = task.metadata.referrer;
    options.user_agent = task.metadata.user_agent;
    if (task.metadata.cookies) {
        options.headers.push_back("Cookie: " + *task.metadata.cookies);
    }
    for (const auto& [name, value] : task.metadata.headers) {
        options.headers.push_back(name + ": " + value);
    }
    return options;
}

} // namespace conduit::core
