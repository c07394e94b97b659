// Copyright (c) 2026 changcheng967. All rights reserved.

#include <conduit/rpc/transport.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <utility>

namespace conduit::rpc {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

struct HeaderList {
    curl_slist* ptr = nullptr;

    HeaderList() = default;
    ~HeaderList() { if (ptr) curl_slist_free_all(ptr); }

    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;

    void append(const char* header) noexcept { ptr = curl_slist_append(ptr, header); }
};

std::size_t write_callback(char* data, std::size_t size, std::size_t nitems, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    std::size_t total = size * nitems;
    body->append(data, total);
    return total;
}

} // namespace

HttpTransport::HttpTransport(HttpTransportOptions options)
    : options_(std::move(options)) {}

core::Result<HttpReply> HttpTransport::post(std::string_view body) {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return core::fail(core::Errc::network_error, "curl_easy_init failed");
    }

    HttpReply reply;
    HeaderList headers;
    headers.append("Content-Type: application/json");
    headers.append("Accept: application/json");

    curl_easy_setopt(curl.ptr, CURLOPT_URL, options_.endpoint.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_POST, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_POSTFIELDS, body.data());
    curl_easy_setopt(curl.ptr, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(curl.ptr, CURLOPT_HTTPHEADER, headers.ptr);
    curl_easy_setopt(curl.ptr, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connect_timeout.count()));
    curl_easy_setopt(curl.ptr, CURLOPT_TIMEOUT, static_cast<long>(options_.timeout.count()));
    curl_easy_setopt(curl.ptr, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &reply.body);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        spdlog::debug("RPC POST to {} failed: {}", options_.endpoint, curl_easy_strerror(result));
        return core::fail(core::Errc::network_error, curl_easy_strerror(result));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    reply.status_code = static_cast<std::int32_t>(http_code);

    return reply;
}

//=============================================================================
// Global CURL initialization
//=============================================================================

core::Result<void> HttpTransport::global_init() noexcept {
    if (CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT); rc != CURLE_OK) {
        return core::fail(core::Errc::network_error, curl_easy_strerror(rc));
    }
    return {};
}

void HttpTransport::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace conduit::rpc
