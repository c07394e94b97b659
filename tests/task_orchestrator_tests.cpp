// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <conduit/core/task_orchestrator.hpp>
#include "test_support.hpp"
#include <algorithm>
#include <thread>

using namespace conduit;
using namespace conduit::core;
using namespace std::chrono_literals;
using conduit::test::FakeEngine;
using conduit::test::TempDir;

namespace {

struct Harness {
    TempDir dir;
    FakeEngine engine;
    rpc::EngineClient client{engine.transport()};
    storage::TaskStore store{storage::StoreConfig{dir.path() / "data"}};
    std::unique_ptr<TaskOrchestrator> orchestrator;

    Harness() {
        REQUIRE(store.open().has_value());
        orchestrator = make_orchestrator();
    }

    std::unique_ptr<TaskOrchestrator> make_orchestrator() {
        OrchestratorConfig config;
        config.reconcile_interval = 50ms;
        config.default_destination = "/downloads";
        return std::make_unique<TaskOrchestrator>(client, store, config);
    }

    DownloadTask add(std::string_view url = "https://example.com/files/archive.tar.gz",
                     const TaskOptions& options = {}) {
        auto task = orchestrator->add_task(url, options);
        REQUIRE(task.has_value());
        return *task;
    }

    void set_engine(const DownloadTask& task, std::string status, std::uint64_t total,
                    std::uint64_t completed, std::uint64_t speed) {
        engine.update(*task.remote_handle, [&](FakeEngine::Download& d) {
            d.status = status;
            d.total = total;
            d.completed = completed;
            d.speed = speed;
        });
    }

    std::optional<DownloadTask> stored(const std::string& id) {
        auto all = store.load_all();
        REQUIRE(all.has_value());
        for (auto& t : *all) {
            if (t.id == id) return t;
        }
        return std::nullopt;
    }
};

} // namespace

TEST_CASE("add_task registers the download with the engine", "[orchestrator]") {
    Harness h;

    TaskOptions options;
    options.segments = 4;
    options.speed_limit = 2048;
    options.cookies = "sid=1";
    options.referrer = "https://example.com/page";
    options.headers = {{"X-Trace", "7"}};
    auto task = h.add("https://example.com/files/archive.tar.gz", options);

    CHECK(task.remote_handle.has_value());
    CHECK(task.status == TaskStatus::waiting);
    CHECK(task.filename == "archive.tar.gz");
    CHECK(task.destination == "/downloads");
    CHECK(task.segments == 4);
    CHECK(task.metadata.cookies == "sid=1");

    auto download = h.engine.download(*task.remote_handle);
    REQUIRE(download.has_value());
    CHECK(download->url == "https://example.com/files/archive.tar.gz");
    CHECK(download->options["dir"] == "/downloads");
    CHECK(download->options["out"] == "archive.tar.gz");
    CHECK(download->options["split"] == "4");
    CHECK(download->options["max-connection-per-server"] == "4");
    CHECK(download->options["max-download-limit"] == "2048");
    CHECK(download->options["referer"] == "https://example.com/page");
    CHECK(download->options["header"] == nlohmann::json::array({"Cookie: sid=1", "X-Trace: 7"}));

    CHECK(h.orchestrator->find(task.id).has_value());
    CHECK(h.orchestrator->queued_tasks().size() == 1);
    CHECK(h.stored(task.id).has_value());

    SECTION("Explicit filename wins") {
        TaskOptions named;
        named.filename = "renamed.bin";
        CHECK(h.add("https://example.com/x", named).filename == "renamed.bin");
    }

    SECTION("Percent-encoded name that is not UTF-8") {
        auto odd = h.orchestrator->add_task("https://example.com/%FF.bin");
        REQUIRE(odd.has_value());
        CHECK(odd->filename == "\xFF.bin");
        REQUIRE(odd->remote_handle.has_value());
        CHECK(h.engine.download(*odd->remote_handle)->options["out"] == "\xEF\xBF\xBD.bin");
        CHECK(h.stored(odd->id).has_value());
        CHECK(h.store.backup_snapshot().has_value());
    }

    SECTION("Newest task is listed first") {
        auto second = h.add("https://example.com/second.bin");
        CHECK(h.orchestrator->tasks().front().id == second.id);
    }
}

TEST_CASE("add_task seeds size and state from the engine", "[orchestrator]") {
    Harness h;

    SECTION("Engine already active") {
        h.engine.set_initial_status("active");
        auto task = h.add();
        CHECK(task.status == TaskStatus::active);
        CHECK(task.started_at.has_value());
    }

    SECTION("Seeding query fails, task is still added as waiting") {
        h.engine.fail_method("aria2.tellStatus");
        auto task = h.add();
        CHECK(task.status == TaskStatus::waiting);
        CHECK(h.orchestrator->tasks().size() == 1);
    }
}

TEST_CASE("add_task failures leave no trace", "[orchestrator]") {
    Harness h;

    SECTION("Engine rejects the add") {
        h.engine.fail_method("aria2.addUri");
        auto task = h.orchestrator->add_task("https://example.com/a.zip");
        REQUIRE_FALSE(task.has_value());
        CHECK(task.error().is(Errc::remote_error));
    }

    SECTION("Engine unreachable") {
        h.engine.set_offline(true);
        auto task = h.orchestrator->add_task("https://example.com/a.zip");
        REQUIRE_FALSE(task.has_value());
        CHECK(task.error().is(Errc::network_error));
    }

    SECTION("Invalid URL never reaches the engine") {
        auto task = h.orchestrator->add_task("not a url");
        REQUIRE_FALSE(task.has_value());
        CHECK(task.error().is(Errc::invalid_url));
        CHECK(h.engine.requests().empty());
    }

    CHECK(h.orchestrator->tasks().empty());
    CHECK(h.store.load_all()->empty());
}

TEST_CASE("pause and resume follow engine confirmation", "[orchestrator]") {
    Harness h;
    auto task = h.add();
    h.set_engine(task, "active", 1000, 100, 10);
    REQUIRE(h.orchestrator->reconcile());
    REQUIRE(h.orchestrator->find(task.id)->status == TaskStatus::active);

    SECTION("Pause then resume") {
        REQUIRE(h.orchestrator->pause(task.id).has_value());
        CHECK(h.engine.download(*task.remote_handle)->status == "paused");
        CHECK(h.orchestrator->find(task.id)->status == TaskStatus::paused);
        CHECK(h.stored(task.id)->status == TaskStatus::paused);

        REQUIRE(h.orchestrator->resume(task.id).has_value());
        CHECK(h.orchestrator->find(task.id)->status == TaskStatus::active);
        CHECK(h.stored(task.id)->status == TaskStatus::active);
    }

    SECTION("Engine failure propagates and changes nothing") {
        h.engine.fail_method("aria2.pause");
        auto paused = h.orchestrator->pause(task.id);
        REQUIRE_FALSE(paused.has_value());
        CHECK(paused.error().is(Errc::remote_error));
        CHECK(h.orchestrator->find(task.id)->status == TaskStatus::active);
    }

    SECTION("Resuming a running task is rejected locally") {
        auto resumed = h.orchestrator->resume(task.id);
        REQUIRE_FALSE(resumed.has_value());
        CHECK(resumed.error().is(Errc::invalid_transition));
        CHECK(h.engine.count("aria2.unpause") == 0);
    }

    SECTION("Unknown ids are not found") {
        CHECK(h.orchestrator->pause("nope").error().is(Errc::not_found));
        CHECK(h.orchestrator->resume("nope").error().is(Errc::not_found));
        CHECK(h.orchestrator->cancel("nope").error().is(Errc::not_found));
    }
}

TEST_CASE("Tasks without an engine handle cannot be paused or resumed", "[orchestrator]") {
    Harness h;

    DownloadTask orphan;
    orphan.id = generate_task_id();
    orphan.source_url = "https://example.com/orphan.bin";
    orphan.filename = "orphan.bin";
    orphan.status = TaskStatus::paused;
    orphan.created_at = now_ms();
    h.store.save(orphan);

    REQUIRE(h.orchestrator->initialize().has_value());
    CHECK(h.orchestrator->pause(orphan.id).error().is(Errc::not_found));
    CHECK(h.orchestrator->resume(orphan.id).error().is(Errc::not_found));
}

TEST_CASE("cancel is local first and best effort remotely", "[orchestrator]") {
    Harness h;
    auto task = h.add();

    SECTION("Engine reachable") {
        REQUIRE(h.orchestrator->cancel(task.id).has_value());
        CHECK(h.engine.download(*task.remote_handle)->status == "removed");
    }

    SECTION("Engine unreachable") {
        h.engine.set_offline(true);
        REQUIRE(h.orchestrator->cancel(task.id).has_value());
    }

    CHECK_FALSE(h.orchestrator->find(task.id).has_value());
    CHECK(h.orchestrator->tasks().empty());
    CHECK_FALSE(h.stored(task.id).has_value());
}

TEST_CASE("reconcile merges engine status", "[orchestrator]") {
    Harness h;
    auto task = h.add();
    h.set_engine(task, "active", 1000, 250, 50);

    REQUIRE(h.orchestrator->reconcile());
    auto merged = *h.orchestrator->find(task.id);
    CHECK(merged.status == TaskStatus::active);
    CHECK(merged.total_size == 1000);
    CHECK(merged.completed_size == 250);
    CHECK(merged.download_speed == 50);
    CHECK(merged.eta_seconds == 15);
    CHECK(merged.speed_history.size() == 1);
    CHECK(h.orchestrator->active_tasks().size() == 1);
    CHECK(h.orchestrator->queued_tasks().empty());

    auto saved = h.stored(task.id);
    REQUIRE(saved.has_value());
    CHECK(saved->completed_size == 250);
    CHECK(saved->status == TaskStatus::active);

    SECTION("Completed size never goes backwards while active") {
        h.set_engine(task, "active", 1000, 200, 50);
        REQUIRE(h.orchestrator->reconcile());
        CHECK(h.orchestrator->find(task.id)->completed_size == 250);
    }

    SECTION("Completed size is clamped to the total") {
        h.set_engine(task, "active", 1000, 5000, 50);
        REQUIRE(h.orchestrator->reconcile());
        CHECK(h.orchestrator->find(task.id)->completed_size == 1000);
    }

    SECTION("Completion moves the task to the completed view and stops polling") {
        h.set_engine(task, "complete", 1000, 1000, 0);
        REQUIRE(h.orchestrator->reconcile());
        auto done = *h.orchestrator->find(task.id);
        CHECK(done.status == TaskStatus::completed);
        CHECK(done.completed_at.has_value());
        CHECK(h.orchestrator->completed_tasks().size() == 1);
        CHECK(h.orchestrator->active_tasks().empty());
        CHECK(h.stored(task.id)->status == TaskStatus::completed);

        const auto polls = h.engine.count("aria2.tellStatus");
        REQUIRE(h.orchestrator->reconcile());
        CHECK(h.engine.count("aria2.tellStatus") == polls);
    }

    SECTION("Engine-side error carries its message") {
        h.engine.update(*task.remote_handle, [](FakeEngine::Download& d) {
            d.status = "error";
            d.error_message = "Resource not found";
        });
        REQUIRE(h.orchestrator->reconcile());
        auto failed = *h.orchestrator->find(task.id);
        CHECK(failed.status == TaskStatus::error);
        CHECK(failed.error_message == "Resource not found");
    }

    SECTION("Removal behind our back is an error") {
        h.set_engine(task, "removed", 1000, 250, 0);
        REQUIRE(h.orchestrator->reconcile());
        auto failed = *h.orchestrator->find(task.id);
        CHECK(failed.status == TaskStatus::error);
        CHECK(failed.error_message.has_value());
    }

    SECTION("Global stats are refreshed") {
        auto stats = h.orchestrator->global_stats();
        REQUIRE(stats.has_value());
        CHECK(stats->num_active == 1);
        CHECK(stats->download_speed == 50);
    }
}

TEST_CASE("reconcile persists only meaningful changes", "[orchestrator]") {
    Harness h;
    auto task = h.add();
    h.set_engine(task, "active", 1000, 100, 10);
    REQUIRE(h.orchestrator->reconcile());

    // Out-of-band marker: any save by the orchestrator would overwrite it
    auto marker = *h.stored(task.id);
    marker.filename = "marker";
    h.store.save(marker);

    h.set_engine(task, "active", 1000, 100, 99);
    REQUIRE(h.orchestrator->reconcile());
    CHECK(h.orchestrator->find(task.id)->download_speed == 99);
    CHECK(h.stored(task.id)->filename == "marker");

    h.set_engine(task, "active", 1000, 400, 99);
    REQUIRE(h.orchestrator->reconcile());
    CHECK(h.stored(task.id)->filename == task.filename);
    CHECK(h.stored(task.id)->completed_size == 400);
}

TEST_CASE("Storage health follows failed writes", "[orchestrator]") {
    Harness h;
    auto task = h.add();
    REQUIRE(h.orchestrator->storage_healthy());

    conduit::test::reject_task_writes(h.store.database_path());
    conduit::test::DisplacedDir displaced(h.dir.path() / "data");

    h.set_engine(task, "active", 1000, 10, 1);
    REQUIRE(h.orchestrator->reconcile());

    CHECK_FALSE(h.orchestrator->storage_healthy());
    CHECK(h.store.failed_writes() == 1);
    CHECK(h.orchestrator->find(task.id)->status == TaskStatus::active);
    CHECK(h.orchestrator->find(task.id)->completed_size == 10);

    displaced.restore();
    h.set_engine(task, "active", 1000, 20, 1);
    REQUIRE(h.orchestrator->reconcile());
    CHECK(h.orchestrator->storage_healthy());
    CHECK(h.stored(task.id)->completed_size == 20);
}

TEST_CASE("reconcile isolates per-task failures", "[orchestrator]") {
    Harness h;
    auto broken = h.add("https://example.com/broken.bin");
    auto healthy = h.add("https://example.com/healthy.bin");
    h.set_engine(broken, "active", 1000, 10, 1);
    h.set_engine(healthy, "active", 2000, 20, 2);
    h.engine.fail_gid(*broken.remote_handle);

    SECTION("Status failure for one task") {
        REQUIRE(h.orchestrator->reconcile());
    }

    SECTION("Global stats failure as well") {
        h.engine.fail_method("aria2.getGlobalStat");
        REQUIRE(h.orchestrator->reconcile());
        CHECK_FALSE(h.orchestrator->global_stats().has_value());
    }

    CHECK(h.orchestrator->find(broken.id)->status == TaskStatus::waiting);
    CHECK(h.orchestrator->find(healthy.id)->status == TaskStatus::active);
    CHECK(h.orchestrator->find(healthy.id)->completed_size == 20);
}

TEST_CASE("reconcile adapts segments from throughput", "[orchestrator]") {
    Harness h;
    auto task = h.add("https://example.com/big.iso");
    h.set_engine(task, "active", 1ull << 32, 0, 1'000'000);

    for (int i = 0; i < 3; ++i) {
        REQUIRE(h.orchestrator->reconcile());
    }
    CHECK(h.orchestrator->find(task.id)->segments == DEFAULT_SEGMENTS + 1);
}

TEST_CASE("Results for cancelled tasks are discarded", "[orchestrator]") {
    Harness h;
    auto task = h.add();
    h.set_engine(task, "active", 1000, 500, 10);

    bool cancelled = false;
    h.engine.on_request = [&](const std::string& method, const nlohmann::json&) {
        if (method == "aria2.tellStatus" && !cancelled) {
            cancelled = true;
            REQUIRE(h.orchestrator->cancel(task.id).has_value());
        }
    };

    REQUIRE(h.orchestrator->reconcile());
    CHECK(cancelled);
    CHECK_FALSE(h.orchestrator->find(task.id).has_value());
    CHECK_FALSE(h.stored(task.id).has_value());
}

TEST_CASE("Status fetched before a concurrent pause does not undo it", "[orchestrator]") {
    Harness h;
    auto task = h.add();
    h.set_engine(task, "active", 1000, 100, 10);
    REQUIRE(h.orchestrator->reconcile());

    bool paused = false;
    h.engine.on_request = [&](const std::string& method, const nlohmann::json&) {
        if (method == "aria2.tellStatus" && !paused) {
            paused = true;
            REQUIRE(h.orchestrator->pause(task.id).has_value());
            // Reply reflects the engine before it processed the pause
            h.engine.update(*task.remote_handle, [](FakeEngine::Download& d) {
                d.status = "active";
                d.completed = 200;
            });
        }
    };

    REQUIRE(h.orchestrator->reconcile());
    CHECK(paused);
    auto after = *h.orchestrator->find(task.id);
    CHECK(after.status == TaskStatus::paused);
    CHECK(after.completed_size == 100);
    CHECK(h.stored(task.id)->status == TaskStatus::paused);
}

TEST_CASE("Only one reconciliation cycle runs at a time", "[orchestrator]") {
    Harness h;
    (void)h.add();

    std::optional<bool> nested;
    h.engine.on_request = [&](const std::string& method, const nlohmann::json&) {
        if (method == "aria2.getGlobalStat" && !nested) {
            std::thread([&] { nested = h.orchestrator->reconcile(); }).join();
        }
    };

    CHECK(h.orchestrator->reconcile());
    REQUIRE(nested.has_value());
    CHECK_FALSE(*nested);
}

TEST_CASE("Startup reconciliation pauses tasks the engine forgot", "[orchestrator]") {
    Harness h;
    auto active = h.add("https://example.com/active.bin");
    auto paused = h.add("https://example.com/paused.bin");
    auto done = h.add("https://example.com/done.bin");
    h.set_engine(active, "active", 1000, 300, 10);
    h.set_engine(paused, "active", 1000, 100, 10);
    h.set_engine(done, "complete", 1000, 1000, 0);
    REQUIRE(h.orchestrator->reconcile());
    REQUIRE(h.orchestrator->pause(paused.id).has_value());

    h.engine.restart();

    auto restarted = h.make_orchestrator();
    auto loaded = restarted->initialize();
    REQUIRE(loaded.has_value());
    CHECK(*loaded == 3);

    auto after = *restarted->find(active.id);
    CHECK(after.status == TaskStatus::paused);
    REQUIRE(after.error_message.has_value());
    CHECK_THAT(*after.error_message, Catch::Matchers::ContainsSubstring("interrupted"));
    CHECK(after.remote_handle == active.remote_handle);
    CHECK(after.completed_size == 300);

    CHECK(restarted->find(paused.id)->status == TaskStatus::paused);
    CHECK(restarted->find(paused.id)->error_message == after.error_message);
    CHECK(restarted->find(done.id)->status == TaskStatus::completed);
    CHECK_FALSE(restarted->find(done.id)->error_message.has_value());

    auto persisted = *h.stored(active.id);
    CHECK(persisted.status == TaskStatus::paused);
    CHECK(persisted.error_message == after.error_message);

    CHECK(restarted->queued_tasks().size() == 2);
    CHECK(restarted->active_tasks().empty());
    CHECK(restarted->completed_tasks().size() == 1);

    SECTION("Interrupted tasks stay quiet until resumed") {
        REQUIRE(restarted->reconcile());
        CHECK(restarted->find(active.id)->status == TaskStatus::paused);
    }
}

TEST_CASE("Global speed limit is forwarded to the engine", "[orchestrator]") {
    Harness h;

    REQUIRE(h.orchestrator->set_global_speed_limit(1024).has_value());
    CHECK(h.engine.global_options()["max-overall-download-limit"] == "1024");

    REQUIRE(h.orchestrator->set_global_speed_limit(std::nullopt).has_value());
    CHECK(h.engine.global_options()["max-overall-download-limit"] == "0");

    h.engine.fail_method("aria2.changeGlobalOption");
    CHECK(h.orchestrator->set_global_speed_limit(1).error().is(Errc::remote_error));
}

TEST_CASE("pause_all and resume_all", "[orchestrator]") {
    Harness h;
    auto a = h.add("https://example.com/a.bin");
    auto b = h.add("https://example.com/b.bin");
    h.set_engine(a, "active", 100, 1, 1);
    REQUIRE(h.orchestrator->reconcile());

    CHECK(h.orchestrator->pause_all() == 2);
    CHECK(h.orchestrator->find(a.id)->status == TaskStatus::paused);
    CHECK(h.orchestrator->find(b.id)->status == TaskStatus::paused);
    CHECK(h.orchestrator->pause_all() == 0);

    h.engine.fail_gid(*b.remote_handle);
    CHECK(h.orchestrator->resume_all() == 1);
    CHECK(h.orchestrator->find(a.id)->status == TaskStatus::active);
    CHECK(h.orchestrator->find(b.id)->status == TaskStatus::paused);
}

TEST_CASE("Background loop polls until stopped", "[orchestrator]") {
    Harness h;
    auto task = h.add();
    h.set_engine(task, "active", 1000, 10, 5);

    h.orchestrator->start();
    CHECK(h.orchestrator->running());

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (h.orchestrator->find(task.id)->status != TaskStatus::active
           && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }

    h.orchestrator->stop();
    CHECK_FALSE(h.orchestrator->running());
    CHECK(h.orchestrator->find(task.id)->status == TaskStatus::active);
    CHECK(std::filesystem::exists(h.store.backup_path()));

    const auto polls = h.engine.count("aria2.tellStatus");
    std::this_thread::sleep_for(150ms);
    CHECK(h.engine.count("aria2.tellStatus") == polls);
}
