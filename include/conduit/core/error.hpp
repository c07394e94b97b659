// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace conduit::core {

enum class Errc {
    success = 0,
    network_error,       // transport failure, retryable
    protocol_error,      // malformed or shape-mismatched engine response
    remote_error,        // engine-reported failure object
    not_found,           // unknown task id or missing remote handle
    storage_error,       // persistence failure after recovery
    invalid_url,
    invalid_transition,
    invalid_argument,
    config_error,
};

} // namespace conduit::core

namespace std {

template<>
struct is_error_code_enum<conduit::core::Errc> : true_type {};

} // namespace std

namespace conduit::core {

namespace detail {

struct ErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "conduit";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<Errc>(ev)) {
            case Errc::success:            return "Success";
            case Errc::network_error:      return "Network error";
            case Errc::protocol_error:     return "Malformed engine response";
            case Errc::remote_error:       return "Engine reported an error";
            case Errc::not_found:          return "Task not found";
            case Errc::storage_error:      return "Storage error";
            case Errc::invalid_url:        return "Invalid URL";
            case Errc::invalid_transition: return "Invalid state transition";
            case Errc::invalid_argument:   return "Invalid argument";
            case Errc::config_error:       return "Invalid configuration";
            default:                       return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::ErrcCategory& errc_category() noexcept {
    static detail::ErrcCategory category;
    return category;
}

inline std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), errc_category()};
}

// Error value carried by every fallible operation.
// remote_code is only meaningful for Errc::remote_error.
struct Error {
    std::error_code code;
    std::string message;
    std::int64_t remote_code{0};

    Error() = default;
    Error(Errc e, std::string msg = {})
        : code(make_error_code(e)), message(std::move(msg)) {}
    Error(std::error_code ec, std::string msg = {})
        : code(ec), message(std::move(msg)) {}

    [[nodiscard]] static Error remote(std::int64_t code, std::string msg) {
        Error err(Errc::remote_error, std::move(msg));
        err.remote_code = code;
        return err;
    }

    [[nodiscard]] bool is(Errc e) const noexcept { return code == make_error_code(e); }

    [[nodiscard]] std::string describe() const {
        if (message.empty()) return code.message();
        if (is(Errc::remote_error)) {
            return code.message() + " (" + std::to_string(remote_code) + "): " + message;
        }
        return code.message() + ": " + message;
    }
};

template<typename T>
using Result = std::expected<T, Error>;

inline std::unexpected<Error> fail(Errc e, std::string msg = {}) {
    return std::unexpected(Error(e, std::move(msg)));
}

} // namespace conduit::core
