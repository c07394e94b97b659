// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <conduit/core/error.hpp>
#include <conduit/rpc/engine_types.hpp>
#include <conduit/rpc/transport.hpp>
#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conduit::rpc {

// JSON-RPC 2.0 client for the aria2 download engine.
//
// Holds no task state. Every call builds an envelope with the next request
// id, prepends "token:<secret>" to the parameters when a secret is set, and
// maps the outcome onto the error taxonomy:
//   transport failure or non-200 status -> Errc::network_error
//   unparseable or mis-shaped response  -> Errc::protocol_error
//   well-formed "error" member          -> Errc::remote_error {code, message}
//
// Calls may be issued from several threads concurrently.
class EngineClient {
public:
    explicit EngineClient(std::unique_ptr<Transport> transport,
                          std::optional<std::string> secret = std::nullopt);

    EngineClient(const EngineClient&) = delete;
    EngineClient& operator=(const EngineClient&) = delete;

    // aria2.addUri; returns the GID the engine assigned
    [[nodiscard]] core::Result<std::string>
    add_uri(const std::vector<std::string>& uris, const AddOptions& options);

    // aria2.tellStatus; `keys` limits the returned fields when non-empty
    [[nodiscard]] core::Result<EngineStatus>
    tell_status(std::string_view gid, const std::vector<std::string>& keys = {});

    [[nodiscard]] core::Result<std::string> pause(std::string_view gid);
    [[nodiscard]] core::Result<std::string> unpause(std::string_view gid);
    [[nodiscard]] core::Result<std::string> remove(std::string_view gid);

    [[nodiscard]] core::Result<GlobalStat> get_global_stat();

    [[nodiscard]] core::Result<std::string> change_global_option(const GlobalOptions& options);

    [[nodiscard]] core::Result<std::vector<EngineStatus>>
    tell_active(const std::vector<std::string>& keys = {});

    [[nodiscard]] core::Result<std::string> shutdown();

    [[nodiscard]] bool has_secret() const noexcept { return secret_.has_value(); }

    // Id of the most recently issued request (0 before the first call)
    [[nodiscard]] std::uint64_t last_request_id() const noexcept {
        return request_id_.load(std::memory_order_relaxed);
    }

private:
    // Secret-prefixed positional parameter list
    [[nodiscard]] nlohmann::json params(std::initializer_list<nlohmann::json> args) const;

    // Send the envelope and return the "result" member
    [[nodiscard]] core::Result<nlohmann::json> call(std::string_view method, nlohmann::json params);

    // For methods answering with a bare confirmation string ("OK" or a GID)
    [[nodiscard]] core::Result<std::string> call_for_string(std::string_view method, nlohmann::json params);

    std::unique_ptr<Transport> transport_;
    std::optional<std::string> secret_;
    std::atomic<std::uint64_t> request_id_{0};
};

} // namespace conduit::rpc
