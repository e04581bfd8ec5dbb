// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/core/error.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <expected>

namespace folio::core {

class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] std::string_view scheme() const noexcept { return scheme_; }
    [[nodiscard]] std::string_view host() const noexcept { return host_; }
    [[nodiscard]] std::string_view port() const noexcept { return port_; }
    [[nodiscard]] std::string_view path() const noexcept { return path_; }
    [[nodiscard]] std::string_view query() const noexcept { return query_; }
    [[nodiscard]] std::string_view fragment() const noexcept { return fragment_; }

    [[nodiscard]] std::string full() const;
    [[nodiscard]] std::string base() const;  // scheme://host[:port]
    [[nodiscard]] bool is_secure() const noexcept { return scheme_ == "https"; }
    [[nodiscard]] bool is_http() const noexcept { return scheme_ == "http" || scheme_ == "https"; }

    [[nodiscard]] std::uint16_t default_port() const noexcept;

    // Last path segment, empty for directory URLs
    [[nodiscard]] std::string filename() const;

    // Last path segment without its extension
    [[nodiscard]] std::string stem() const;

    Url() = default;

private:
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
};

// True when the string starts with http:// or https:// (case-insensitive)
[[nodiscard]] bool looks_like_http_url(std::string_view s) noexcept;

} // namespace folio::core
