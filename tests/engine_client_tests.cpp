// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <conduit/rpc/engine_client.hpp>
#include "test_support.hpp"

using namespace conduit;
using namespace conduit::rpc;
using conduit::test::ScriptedTransport;

namespace {

struct Fixture {
    std::shared_ptr<ScriptedTransport::Shared> shared = std::make_shared<ScriptedTransport::Shared>();

    EngineClient client(std::optional<std::string> secret = std::nullopt) {
        return EngineClient(std::make_unique<ScriptedTransport>(shared), std::move(secret));
    }

    void push(std::string body, std::int32_t status = 200) {
        shared->replies.push_back(HttpReply{status, std::move(body)});
    }

    void push_result(const nlohmann::json& result) {
        push(nlohmann::json{{"jsonrpc", "2.0"}, {"id", "1"}, {"result", result}}.dump());
    }
};

} // namespace

TEST_CASE("EngineClient request envelope", "[rpc]") {
    Fixture f;

    SECTION("Secret is the first positional parameter") {
        auto client = f.client("s3cret");
        f.push_result("2089b05ecca3d829");
        REQUIRE(client.pause("2089b05ecca3d829").has_value());

        const auto& req = f.shared->requests.at(0);
        CHECK(req["jsonrpc"] == "2.0");
        CHECK(req["method"] == "aria2.pause");
        REQUIRE(req["params"].size() == 2);
        CHECK(req["params"][0] == "token:s3cret");
        CHECK(req["params"][1] == "2089b05ecca3d829");
    }

    SECTION("An already prefixed secret is used as is") {
        auto client = f.client("token:abc");
        REQUIRE(client.shutdown().has_value());
        CHECK(f.shared->requests.at(0)["params"][0] == "token:abc");
    }

    SECTION("No secret, no token") {
        auto client = f.client();
        CHECK_FALSE(client.has_secret());
        REQUIRE(client.shutdown().has_value());
        CHECK(f.shared->requests.at(0)["params"].empty());
    }

    SECTION("Empty secret counts as none") {
        auto client = f.client("");
        CHECK_FALSE(client.has_secret());
    }

    SECTION("Ids increase per call and are strings") {
        auto client = f.client();
        for (int i = 0; i < 3; ++i) {
            REQUIRE(client.unpause("g").has_value());
        }
        CHECK(f.shared->requests.at(0)["id"] == "1");
        CHECK(f.shared->requests.at(1)["id"] == "2");
        CHECK(f.shared->requests.at(2)["id"] == "3");
        CHECK(client.last_request_id() == 3);
    }

    SECTION("addUri carries the URI list and string-valued options") {
        auto client = f.client();
        f.push_result("0000000000000001");

        AddOptions options;
        options.dir = "/downloads";
        options.out = "file.iso";
        options.split = 4;
        options.max_connection_per_server = 4;
        options.max_download_limit = 1048576;
        options.referer = "https://example.com/";
        options.headers = {"Cookie: a=b"};

        auto gid = client.add_uri({"https://example.com/file.iso"}, options);
        REQUIRE(gid.has_value());
        CHECK(*gid == "0000000000000001");

        const auto& params = f.shared->requests.at(0)["params"];
        CHECK(params[0] == nlohmann::json::array({"https://example.com/file.iso"}));
        CHECK(params[1]["dir"] == "/downloads");
        CHECK(params[1]["out"] == "file.iso");
        CHECK(params[1]["split"] == "4");
        CHECK(params[1]["max-connection-per-server"] == "4");
        CHECK(params[1]["max-download-limit"] == "1048576");
        CHECK(params[1]["referer"] == "https://example.com/");
        CHECK(params[1]["header"] == nlohmann::json::array({"Cookie: a=b"}));
    }

    SECTION("Options that are not valid UTF-8 are sent with replacement characters") {
        auto client = f.client();
        f.push_result("0000000000000002");

        AddOptions options;
        options.out = "\xFF.bin";
        options.headers = {"Cookie: id=\xC3"};

        auto gid = client.add_uri({"https://example.com/%FF.bin"}, options);
        REQUIRE(gid.has_value());

        const auto& params = f.shared->requests.at(0)["params"];
        CHECK(params[1]["out"] == "\xEF\xBF\xBD.bin");
        CHECK(params[1]["header"][0] == "Cookie: id=\xEF\xBF\xBD");
    }

    SECTION("tellStatus key filter is appended") {
        auto client = f.client();
        f.push_result({{"gid", "g"}, {"status", "active"}});
        REQUIRE(client.tell_status("g", {"gid", "status"}).has_value());
        CHECK(f.shared->requests.at(0)["params"][1] == nlohmann::json::array({"gid", "status"}));
    }
}

TEST_CASE("EngineClient decodes typed results", "[rpc]") {
    Fixture f;
    auto client = f.client();

    SECTION("Status with string-encoded numbers") {
        f.push_result({
            {"gid", "2089b05ecca3d829"},
            {"status", "active"},
            {"totalLength", "34896138"},
            {"completedLength", "34896138"},
            {"downloadSpeed", "1024"},
            {"uploadSpeed", "0"},
            {"connections", "16"},
            {"files", nlohmann::json::array({{
                {"index", "1"}, {"path", "/d/file"}, {"length", "34896138"},
                {"completedLength", "100"}, {"selected", "true"},
                {"uris", nlohmann::json::array({{{"uri", "http://x/file"}, {"status", "used"}}})},
            }})},
        });

        auto st = client.tell_status("2089b05ecca3d829");
        REQUIRE(st.has_value());
        CHECK(st->status == "active");
        CHECK(st->total_length == 34896138);
        CHECK(st->completed_length == 34896138);
        CHECK(st->download_speed == 1024);
        CHECK(st->connections == 16);
        REQUIRE(st->files.size() == 1);
        CHECK(st->files[0].selected);
        CHECK(st->files[0].uris.at(0).uri == "http://x/file");
    }

    SECTION("Plain JSON numbers are accepted too") {
        f.push_result({{"gid", "g"}, {"status", "waiting"}, {"totalLength", 42}});
        auto st = client.tell_status("g");
        REQUIRE(st.has_value());
        CHECK(st->total_length == 42);
        CHECK(st->completed_length == 0);
    }

    SECTION("Global stats") {
        f.push_result({
            {"downloadSpeed", "2048"}, {"uploadSpeed", "0"}, {"numActive", "2"},
            {"numWaiting", "1"}, {"numStopped", "3"}, {"numStoppedTotal", "7"},
        });
        auto stat = client.get_global_stat();
        REQUIRE(stat.has_value());
        CHECK(stat->download_speed == 2048);
        CHECK(stat->num_active == 2);
        CHECK(stat->num_stopped_total == 7);
    }

    SECTION("tellActive returns every entry") {
        f.push_result(nlohmann::json::array({
            {{"gid", "a"}, {"status", "active"}},
            {{"gid", "b"}, {"status", "active"}},
        }));
        auto active = client.tell_active();
        REQUIRE(active.has_value());
        REQUIRE(active->size() == 2);
        CHECK(active->at(1).gid == "b");
    }

    SECTION("changeGlobalOption sends the limit as a string") {
        GlobalOptions options;
        options.max_overall_download_limit = 0;
        REQUIRE(client.change_global_option(options).has_value());
        CHECK(f.shared->requests.at(0)["params"][0]["max-overall-download-limit"] == "0");
    }
}

TEST_CASE("EngineClient error mapping", "[rpc]") {
    Fixture f;
    auto client = f.client();

    SECTION("Transport failure is a network error") {
        f.shared->replies.push_back(core::fail(core::Errc::network_error, "Connection refused"));
        auto r = client.pause("g");
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().is(core::Errc::network_error));
    }

    SECTION("Non-200 status is a network error carrying the remote message") {
        f.push(R"({"jsonrpc":"2.0","id":"1","error":{"code":1,"message":"Unauthorized"}})", 400);
        auto r = client.pause("g");
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().is(core::Errc::network_error));
        CHECK_THAT(r.error().message, Catch::Matchers::ContainsSubstring("Unauthorized"));
        CHECK_THAT(r.error().message, Catch::Matchers::ContainsSubstring("400"));
    }

    SECTION("Error object is a remote error with code and message") {
        f.push(R"({"jsonrpc":"2.0","id":"1","error":{"code":1,"message":"GID g is not found"}})");
        auto r = client.tell_status("g");
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().is(core::Errc::remote_error));
        CHECK(r.error().remote_code == 1);
        CHECK(r.error().message == "GID g is not found");
    }

    SECTION("Garbage body is a protocol error") {
        f.push("<html>not json</html>");
        auto r = client.pause("g");
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().is(core::Errc::protocol_error));
    }

    SECTION("Missing result is a protocol error") {
        f.push(R"({"jsonrpc":"2.0","id":"1"})");
        CHECK(client.pause("g").error().is(core::Errc::protocol_error));
    }

    SECTION("Wrong result shape is a protocol error") {
        f.push_result(nlohmann::json::array());
        CHECK(client.add_uri({"http://x/y"}, {}).error().is(core::Errc::protocol_error));
    }

    SECTION("Malformed number is a protocol error") {
        f.push_result({{"gid", "g"}, {"status", "active"}, {"totalLength", "12abc"}});
        CHECK(client.tell_status("g").error().is(core::Errc::protocol_error));
    }

    SECTION("Status without gid is a protocol error") {
        f.push_result({{"status", "active"}});
        CHECK(client.tell_status("g").error().is(core::Errc::protocol_error));
    }
}
