// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/core/config.hpp>
#include <folio/core/http_client.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace folio::core {

struct HttpOptions {
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t stall_timeout_sec{STALL_TIMEOUT_SEC};
    std::size_t buffer_size{READ_BUFFER_SIZE};
    std::string user_agent{USER_AGENT};
};

// libcurl-backed client. Keeps one easy handle alive so consecutive
// requests to the same image server reuse the connection.
class HttpSession final : public HttpClient {
public:
    HttpSession();
    explicit HttpSession(HttpOptions options);
    ~HttpSession() override;

    // Non-copyable, movable
    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;
    HttpSession(HttpSession&&) noexcept;
    HttpSession& operator=(HttpSession&&) noexcept;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const std::string& url) noexcept override;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    get(const std::string& url,
        const HeadersCallback& on_headers,
        const ChunkCallback& on_chunk) noexcept override;

    [[nodiscard]] const HttpOptions& options() const noexcept { return options_; }

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    // Reset the shared handle and apply common options
    [[nodiscard]] void* prepare_handle(const std::string& url) noexcept;

    HttpOptions options_;
    void* handle_{nullptr}; // CURL*
};

} // namespace folio::core
