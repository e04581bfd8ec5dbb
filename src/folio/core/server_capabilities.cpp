// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/core/server_capabilities.hpp>
#include <folio/core/naming.hpp>
#include <spdlog/spdlog.h>
#include <exception>

namespace folio::core {

bool is_format_rejection(std::int32_t status) noexcept {
    return status == 400 || status == 404 || status == 415;
}

std::string with_format(std::string_view url, std::string_view format) {
    // Only the image API quality/format segment is rewritten
    constexpr std::string_view marker = "/default.";
    auto query = url.find_first_of("?#");
    auto path = url.substr(0, query);
    auto pos = path.rfind(marker);
    if (pos == std::string_view::npos) {
        return std::string(url);
    }

    std::string out(url.substr(0, pos + marker.size()));
    out += format;
    if (query != std::string_view::npos) {
        out += url.substr(query);
    }
    return out;
}

ServerCapabilities ServerCapabilities::probe(HttpClient& client, const std::string& url) noexcept {
    ServerCapabilities caps;
    caps.probed = true;

    try {
        auto resp = client.head(url);
        if (!resp) {
            spdlog::info("Capability probe failed ({}), using defaults", resp.error().message());
            return caps;
        }

        if (resp->ok()) {
            caps.head_supported = resp->content_length.has_value();
            auto ext = extension_from_url(url);
            if (ext == "jpg") {
                caps.preferred_format = "jpg";
            }
        } else if (is_format_rejection(resp->status_code) && extension_from_url(url) == "jpeg") {
            auto alt = with_format(url, "jpg");
            auto alt_resp = client.head(alt);
            if (alt_resp && alt_resp->ok()) {
                caps.preferred_format = "jpg";
                caps.head_supported = alt_resp->content_length.has_value();
            }
        }

        spdlog::info("Server capabilities: format={}, head={}",
                     caps.preferred_format, caps.head_supported ? "yes" : "no");
    } catch (const std::exception& e) {
        spdlog::debug("Capability probe aborted: {}", e.what());
    }
    return caps;
}

} // namespace folio::core
