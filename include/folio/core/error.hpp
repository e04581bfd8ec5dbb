// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string_view>

namespace folio::core {

enum class DownloadErrc {
    success = 0,
    network_error,
    timeout,
    connection_lost,
    dns_error,
    ssl_error,
    too_many_redirects,
    http_status,
    throttled,
    not_found,
    server_error,
    forbidden,
    cancelled,
    invalid_url,
    out_of_range,
    no_canvases,
    manifest_error,
    lock_held,
    migration_conflict,
    ledger_io,
    retries_exhausted,
    callback_failed,
    already_running,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "folio::download";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:              return "Success";
            case DownloadErrc::network_error:        return "Network error";
            case DownloadErrc::timeout:              return "Operation timed out";
            case DownloadErrc::connection_lost:      return "Connection lost";
            case DownloadErrc::dns_error:            return "DNS resolution failed";
            case DownloadErrc::ssl_error:            return "SSL/TLS error";
            case DownloadErrc::too_many_redirects:   return "Too many redirects";
            case DownloadErrc::http_status:          return "Unexpected HTTP status";
            case DownloadErrc::throttled:            return "Server is throttling requests (429/503)";
            case DownloadErrc::not_found:            return "Resource not found (404)";
            case DownloadErrc::server_error:         return "Server error (5xx)";
            case DownloadErrc::forbidden:            return "Access forbidden (401/403)";
            case DownloadErrc::cancelled:            return "Download cancelled";
            case DownloadErrc::invalid_url:          return "Invalid URL";
            case DownloadErrc::out_of_range:         return "Canvas index out of range";
            case DownloadErrc::no_canvases:          return "Manifest contains no canvases";
            case DownloadErrc::manifest_error:       return "Manifest could not be loaded";
            case DownloadErrc::lock_held:            return "Output directory is locked by another run";
            case DownloadErrc::migration_conflict:   return "Migration target exists with different content";
            case DownloadErrc::ledger_io:            return "Resume ledger could not be written";
            case DownloadErrc::retries_exhausted:    return "Retry attempts exhausted";
            case DownloadErrc::callback_failed:      return "Transfer callback failed";
            case DownloadErrc::already_running:      return "A run is already in progress";
            default:                                 return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DownloadErrcCategory& download_errc_category() noexcept {
    static detail::DownloadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_errc_category()};
}

} // namespace folio::core

namespace std {

template<>
struct is_error_code_enum<folio::core::DownloadErrc> : true_type {};

} // namespace std
