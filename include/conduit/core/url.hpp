// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <conduit/core/error.hpp>
#include <string>
#include <string_view>

namespace conduit::core {

// Source URL of a task. Only the pieces the orchestrator needs: validation
// before a task is submitted and the default output name.
class Url {
public:
    [[nodiscard]] static Result<Url> parse(std::string_view url_str);

    [[nodiscard]] std::string_view scheme() const noexcept { return scheme_; }
    [[nodiscard]] std::string_view host() const noexcept { return host_; }
    [[nodiscard]] std::string_view port() const noexcept { return port_; }
    [[nodiscard]] std::string_view path() const noexcept { return path_; }
    [[nodiscard]] std::string_view query() const noexcept { return query_; }
    [[nodiscard]] std::string_view fragment() const noexcept { return fragment_; }

    // The URL exactly as given to parse()
    [[nodiscard]] const std::string& str() const noexcept { return str_; }

    // Last path component, percent-decoded; "index.html" for directory URLs
    [[nodiscard]] std::string filename() const;

    Url() = default;

private:
    std::string str_;
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
};

} // namespace conduit::core
