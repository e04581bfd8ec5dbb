// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace folio::core {

// HTTP response headers
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;   // Lower-cased names
    std::optional<std::uint64_t> content_length;
    std::string content_type;

    [[nodiscard]] bool ok() const noexcept { return status_code >= 200 && status_code < 300; }
};

// Called once the status line and headers of a GET are known
using HeadersCallback = std::function<void(const HttpResponse&)>;

// Called for every body chunk of a successful GET; return false to abort
using ChunkCallback = std::function<bool(std::span<const std::byte>)>;

// Transport seam; one request in flight at a time per client
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // HEAD request. Transport failures are errors; any HTTP status is a value.
    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    head(const std::string& url) noexcept = 0;

    // Streaming GET. Body chunks are delivered only for 2xx responses.
    // An aborted chunk callback yields DownloadErrc::cancelled.
    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    get(const std::string& url,
        const HeadersCallback& on_headers,
        const ChunkCallback& on_chunk) noexcept = 0;

    // Convenience: GET the whole body into a string
    [[nodiscard]] std::expected<std::string, std::error_code>
    get_text(const std::string& url) noexcept;
};

// Parse a Content-Length header value, nullopt when malformed
[[nodiscard]] std::optional<std::uint64_t> parse_content_length(std::string_view value) noexcept;

// Map a non-2xx status onto the download category
[[nodiscard]] DownloadErrc classify_status(std::int32_t status) noexcept;

} // namespace folio::core
