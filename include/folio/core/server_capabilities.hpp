// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/core/config.hpp>
#include <folio/core/http_client.hpp>
#include <cstdint>
#include <string>
#include <string_view>

namespace folio::core {

// What the image server supports, probed once per run
struct ServerCapabilities {
    bool probed{false};
    bool head_supported{false};                  // HEAD answers 2xx with a Content-Length
    std::string preferred_format{DEFAULT_EXTENSION};

    // HEAD the first URL that will be fetched. Never fails: anything the
    // probe cannot establish keeps its default.
    [[nodiscard]] static ServerCapabilities probe(HttpClient& client, const std::string& url) noexcept;
};

// True for the statuses IIIF servers use to reject an unsupported format
[[nodiscard]] bool is_format_rejection(std::int32_t status) noexcept;

// Swap the extension of a ".../default.{ext}" request, unchanged otherwise
[[nodiscard]] std::string with_format(std::string_view url, std::string_view format);

} // namespace folio::core
