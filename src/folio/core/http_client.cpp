// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/core/http_client.hpp>
#include <charconv>
#include <exception>

namespace folio::core {

std::expected<std::string, std::error_code>
HttpClient::get_text(const std::string& url) noexcept {
    std::string body;
    auto response = get(url, {}, [&body](std::span<const std::byte> chunk) {
        try {
            body.append(reinterpret_cast<const char*>(chunk.data()), chunk.size());
        } catch (const std::exception&) {
            return false;
        }
        return true;
    });
    if (!response) {
        return std::unexpected(response.error());
    }
    if (!response->ok()) {
        return std::unexpected(make_error_code(classify_status(response->status_code)));
    }
    return body;
}

std::optional<std::uint64_t> parse_content_length(std::string_view value) noexcept {
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == ' ' || value.back() == '\r' || value.back() == '\n')) {
        value.remove_suffix(1);
    }
    if (value.empty()) {
        return std::nullopt;
    }

    std::uint64_t result = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc{} || ptr != value.data() + value.size()) {
        return std::nullopt;
    }
    return result;
}

DownloadErrc classify_status(std::int32_t status) noexcept {
    if (status == 429 || status == 503) return DownloadErrc::throttled;
    if (status == 404 || status == 410) return DownloadErrc::not_found;
    if (status == 401 || status == 403) return DownloadErrc::forbidden;
    if (status >= 500) return DownloadErrc::server_error;
    return DownloadErrc::http_status;
}

} // namespace folio::core
