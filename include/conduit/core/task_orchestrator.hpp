// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <conduit/core/download_task.hpp>
#include <conduit/core/error.hpp>
#include <conduit/core/segment_controller.hpp>
#include <conduit/rpc/engine_client.hpp>
#include <conduit/storage/task_store.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace conduit::core {

// Per-download request, as delivered by the CLI or a browser bridge
struct TaskOptions {
    std::optional<std::string> filename;      // Derived from the URL when unset
    std::optional<std::string> destination;   // OrchestratorConfig::default_destination when unset
    std::optional<std::uint32_t> segments;
    std::optional<std::uint64_t> speed_limit;
    std::optional<std::string> cookies;
    std::optional<std::string> referrer;
    std::optional<std::string> user_agent;
    std::map<std::string, std::string> headers;
    std::optional<std::string> tab_url;
    std::optional<std::string> tab_title;
    std::optional<Checksum> checksum;
    std::vector<PostAction> post_actions;
};

using GlobalStats = rpc::GlobalStat;

struct OrchestratorConfig {
    std::chrono::milliseconds reconcile_interval{RECONCILE_INTERVAL};
    std::string default_destination;
    std::uint32_t default_segments{DEFAULT_SEGMENTS};
};

// Owns the authoritative task set and keeps it in step with the engine.
//
// All model mutation and every store write happen under one mutex; engine
// calls are made with the mutex released and their results merged back by
// task id, so a result for a task cancelled in the meantime is dropped.
// At most one reconciliation cycle runs at a time.
class TaskOrchestrator {
public:
    TaskOrchestrator(rpc::EngineClient& engine, storage::TaskStore& store,
                     OrchestratorConfig config = {});
    ~TaskOrchestrator();

    TaskOrchestrator(const TaskOrchestrator&) = delete;
    TaskOrchestrator& operator=(const TaskOrchestrator&) = delete;

    // Load persisted tasks and check every active or paused one against
    // the engine. Tasks the engine no longer knows end up paused with an
    // explanation. Returns the number of tasks loaded.
    [[nodiscard]] Result<std::size_t> initialize();

    // Run reconcile() every reconcile_interval on a background thread
    void start();

    // Halt the loop and write a final backup
    void stop();

    [[nodiscard]] bool running() const noexcept { return running_.load(std::memory_order_acquire); }

    [[nodiscard]] Result<DownloadTask> add_task(std::string_view url, const TaskOptions& options = {});

    // Status changes only after the engine confirms
    [[nodiscard]] Result<void> pause(std::string_view id);
    [[nodiscard]] Result<void> resume(std::string_view id);

    // Local removal always succeeds for a known id; engine removal is best effort
    [[nodiscard]] Result<void> cancel(std::string_view id);

    // nullopt or 0 lifts the limit
    [[nodiscard]] Result<void> set_global_speed_limit(std::optional<std::uint64_t> bytes_per_sec);

    // Returns the number of tasks that changed state
    std::size_t pause_all();
    std::size_t resume_all();

    // One reconciliation cycle. Returns false without doing anything when
    // another cycle is still in flight.
    bool reconcile();

    // Snapshots, most recently created first
    [[nodiscard]] std::vector<DownloadTask> tasks() const;
    [[nodiscard]] std::vector<DownloadTask> active_tasks() const;
    [[nodiscard]] std::vector<DownloadTask> queued_tasks() const;     // pending, waiting, paused
    [[nodiscard]] std::vector<DownloadTask> completed_tasks() const;
    [[nodiscard]] std::optional<DownloadTask> find(std::string_view id) const;

    [[nodiscard]] std::optional<GlobalStats> global_stats() const;
    [[nodiscard]] bool storage_healthy() const;

private:
    struct Views {
        std::vector<std::string> active;
        std::vector<std::string> queued;
        std::vector<std::string> completed;
    };

    [[nodiscard]] DownloadTask* find_locked(std::string_view id);
    [[nodiscard]] const DownloadTask* find_locked(std::string_view id) const;
    [[nodiscard]] std::vector<DownloadTask> collect(const std::vector<std::string>& ids) const;
    void refresh_views();

    [[nodiscard]] rpc::AddOptions engine_options(const DownloadTask& task) const;

    // Merge one engine status into the task; true when it was persisted
    bool merge(DownloadTask& task, const rpc::EngineStatus& status, TimePoint now);

    void run_loop(std::stop_token stoken);
    void stop_loop();

    rpc::EngineClient& engine_;
    storage::TaskStore& store_;
    OrchestratorConfig config_;

    std::vector<DownloadTask> tasks_;
    Views views_;
    std::optional<GlobalStats> stats_;
    SegmentController controller_;
    mutable std::mutex mutex_;

    std::mutex cycle_mutex_;

    std::jthread worker_;
    std::mutex wake_mutex_;
    std::condition_variable_any wake_;
    std::atomic<bool> running_{false};
};

// Drive `task` to `to`, stepping through active or waiting when the state
// machine has no direct edge. Returns false if no such path exists.
[[nodiscard]] bool move_to(DownloadTask& task, TaskStatus to, TimePoint now = Clock::now());

} // namespace conduit::core
