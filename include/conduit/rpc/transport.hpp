// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <conduit/core/config.hpp>
#include <conduit/core/error.hpp>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace conduit::rpc {

struct HttpReply {
    std::int32_t status_code{0};
    std::string body;
};

// One request, one response. Implementations must be safe to call from
// several threads at once.
class Transport {
public:
    virtual ~Transport() = default;

    // Fails only with Errc::network_error; any HTTP status is a reply
    [[nodiscard]] virtual core::Result<HttpReply> post(std::string_view body) = 0;
};

struct HttpTransportOptions {
    std::string endpoint{core::DEFAULT_RPC_ENDPOINT};
    std::chrono::seconds connect_timeout{core::RPC_CONNECT_TIMEOUT_SEC};
    std::chrono::seconds timeout{core::RPC_TIMEOUT_SEC};
};

// JSON POST over libcurl. A fresh easy handle per call keeps calls
// independent across threads.
class HttpTransport final : public Transport {
public:
    explicit HttpTransport(HttpTransportOptions options);

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    [[nodiscard]] core::Result<HttpReply> post(std::string_view body) override;

    [[nodiscard]] const std::string& endpoint() const noexcept { return options_.endpoint; }

    // Global initialization (call once at startup)
    [[nodiscard]] static core::Result<void> global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    HttpTransportOptions options_;
};

} // namespace conduit::rpc
