// Copyright (c) 2026 changcheng967. All rights reserved.

#include <conduit/rpc/engine_client.hpp>
#include <spdlog/spdlog.h>
#include <utility>

namespace conduit::rpc {

namespace {

constexpr std::string_view TOKEN_PREFIX = "token:";

// Error object of a JSON-RPC reply, if the body carries one
std::optional<core::Error> remote_error_from(const nlohmann::json& reply) {
    auto it = reply.find("error");
    if (it == reply.end() || !it->is_object()) {
        return std::nullopt;
    }
    std::int64_t code = -1;
    if (auto c = it->find("code"); c != it->end() && c->is_number_integer()) {
        code = c->get<std::int64_t>();
    }
    std::string message = "Unknown error";
    if (auto m = it->find("message"); m != it->end() && m->is_string()) {
        message = m->get<std::string>();
    }
    return core::Error::remote(code, std::move(message));
}

} // namespace

EngineClient::EngineClient(std::unique_ptr<Transport> transport, std::optional<std::string> secret)
    : transport_(std::move(transport)) {
    if (secret && !secret->empty()) {
        secret_ = secret->starts_with(TOKEN_PREFIX) ? *secret : std::string(TOKEN_PREFIX) + *secret;
    }
}

nlohmann::json EngineClient::params(std::initializer_list<nlohmann::json> args) const {
    nlohmann::json list = nlohmann::json::array();
    if (secret_) {
        list.push_back(*secret_);
    }
    for (const auto& arg : args) {
        list.push_back(arg);
    }
    return list;
}

core::Result<nlohmann::json> EngineClient::call(std::string_view method, nlohmann::json params) {
    const auto id = request_id_.fetch_add(1, std::memory_order_relaxed) + 1;

    nlohmann::json envelope = {
        {"jsonrpc", "2.0"},
        {"id", std::to_string(id)},
        {"method", std::string(method)},
        {"params", std::move(params)},
    };

    // Percent-decoded names and browser-supplied headers may not be UTF-8
    auto reply = transport_->post(
        envelope.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    if (!reply) {
        return std::unexpected(reply.error());
    }

    nlohmann::json body = nlohmann::json::parse(reply->body, nullptr, false);

    if (reply->status_code != 200) {
        std::string detail = "HTTP " + std::to_string(reply->status_code);
        if (!body.is_discarded()) {
            if (auto remote = remote_error_from(body)) {
                detail += ": " + remote->message;
            }
        }
        spdlog::debug("{} #{} rejected: {}", method, id, detail);
        return core::fail(core::Errc::network_error, std::move(detail));
    }

    if (body.is_discarded() || !body.is_object()) {
        return core::fail(core::Errc::protocol_error,
                          std::string(method) + ": response is not a JSON object");
    }

    if (auto remote = remote_error_from(body)) {
        spdlog::debug("{} #{} failed remotely: {}", method, id, remote->message);
        return std::unexpected(std::move(*remote));
    }

    auto result = body.find("result");
    if (result == body.end()) {
        return core::fail(core::Errc::protocol_error,
                          std::string(method) + ": response lacks result");
    }
    return std::move(*result);
}

core::Result<std::string> EngineClient::call_for_string(std::string_view method, nlohmann::json params) {
    auto result = call(method, std::move(params));
    if (!result) {
        return std::unexpected(result.error());
    }
    if (!result->is_string()) {
        return core::fail(core::Errc::protocol_error,
                          std::string(method) + ": result is not a string");
    }
    return result->get<std::string>();
}

core::Result<std::string>
EngineClient::add_uri(const std::vector<std::string>& uris, const AddOptions& options) {
    return call_for_string("aria2.addUri", params({nlohmann::json(uris), options.to_json()}));
}

core::Result<EngineStatus>
EngineClient::tell_status(std::string_view gid, const std::vector<std::string>& keys) {
    auto p = params({std::string(gid)});
    if (!keys.empty()) {
        p.push_back(keys);
    }

    auto result = call("aria2.tellStatus", std::move(p));
    if (!result) {
        return std::unexpected(result.error());
    }
    return decode_status(*result);
}

core::Result<std::string> EngineClient::pause(std::string_view gid) {
    return call_for_string("aria2.pause", params({std::string(gid)}));
}

core::Result<std::string> EngineClient::unpause(std::string_view gid) {
    return call_for_string("aria2.unpause", params({std::string(gid)}));
}

core::Result<std::string> EngineClient::remove(std::string_view gid) {
    return call_for_string("aria2.remove", params({std::string(gid)}));
}

core::Result<GlobalStat> EngineClient::get_global_stat() {
    auto result = call("aria2.getGlobalStat", params({}));
    if (!result) {
        return std::unexpected(result.error());
    }
    return decode_global_stat(*result);
}

core::Result<std::string> EngineClient::change_global_option(const GlobalOptions& options) {
    return call_for_string("aria2.changeGlobalOption", params({options.to_json()}));
}

core::Result<std::vector<EngineStatus>>
EngineClient::tell_active(const std::vector<std::string>& keys) {
    auto p = params({});
    if (!keys.empty()) {
        p.push_back(keys);
    }

    auto result = call("aria2.tellActive", std::move(p));
    if (!result) {
        return std::unexpected(result.error());
    }
    if (!result->is_array()) {
        return core::fail(core::Errc::protocol_error, "aria2.tellActive: result is not an array");
    }

    std::vector<EngineStatus> statuses;
    statuses.reserve(result->size());
    for (const auto& entry : *result) {
        auto st = decode_status(entry);
        if (!st) {
            return std::unexpected(st.error());
        }
        statuses.push_back(std::move(*st));
    }
    return statuses;
}

core::Result<std::string> EngineClient::shutdown() {
    return call_for_string("aria2.shutdown", params({}));
}

} // namespace conduit::rpc
