// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/core/http_session.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <cctype>
#include <exception>
#include <span>
#include <string>
#include <utility>

namespace folio::core {

namespace {

// RAII header list
struct HeaderList {
    curl_slist* ptr = nullptr;

    HeaderList() = default;
    ~HeaderList() { if (ptr) curl_slist_free_all(ptr); }

    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;

    void append(const char* line) noexcept {
        if (auto* next = curl_slist_append(ptr, line)) {
            ptr = next;
        }
    }
};

struct GetContext {
    CURL* curl{nullptr};
    HttpResponse* response{nullptr};
    const HeadersCallback* on_headers{nullptr};
    const ChunkCallback* on_chunk{nullptr};
    bool headers_delivered{false};
    bool aborted{false};
    std::string callback_error;   // Set when a caller callback threw
};

void finalize_headers(CURL* curl, HttpResponse& response) noexcept {
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<std::int32_t>(http_code);

    auto cl_it = response.headers.find("content-length");
    if (cl_it != response.headers.end()) {
        response.content_length = parse_content_length(cl_it->second);
    }

    auto ct_it = response.headers.find("content-type");
    if (ct_it != response.headers.end()) {
        response.content_type = ct_it->second;
    }
}

// Parse one header line into the response
std::size_t store_header(HttpResponse& response, std::string_view header) {
    std::size_t total = header.size();

    // A new status line starts a new header block (redirects, 100-continue)
    if (header.starts_with("HTTP/")) {
        response.headers.clear();
        response.content_length.reset();
        response.content_type.clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    response.headers[lower_name] = std::string(value);
    return total;
}

// Header callback for HEAD/GET responses
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) noexcept {
    std::size_t total = size * nitems;
    auto* response = static_cast<HttpResponse*>(userdata);
    if (!response) return total;

    // Exceptions must not unwind through libcurl; returning short aborts the transfer
    try {
        return store_header(*response, std::string_view(buffer, total));
    } catch (const std::exception& e) {
        spdlog::debug("Header callback failed: {}", e.what());
        return 0;
    }
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) noexcept {
    auto* ctx = static_cast<GetContext*>(userdata);
    std::size_t total = size * nitems;
    if (!ctx) return 0;

    try {
        if (!ctx->headers_delivered) {
            finalize_headers(ctx->curl, *ctx->response);
            ctx->headers_delivered = true;
            if (ctx->on_headers && *ctx->on_headers) {
                (*ctx->on_headers)(*ctx->response);
            }
        }

        // Error bodies are drained, never delivered
        if (!ctx->response->ok()) {
            return total;
        }

        if (ctx->on_chunk && *ctx->on_chunk) {
            std::span<const std::byte> chunk(reinterpret_cast<const std::byte*>(ptr), total);
            if (!(*ctx->on_chunk)(chunk)) {
                ctx->aborted = true;
                return 0;  // Abort the transfer
            }
        }
    } catch (const std::exception& e) {
        ctx->callback_error = e.what();
        if (ctx->callback_error.empty()) {
            ctx->callback_error = "unknown";
        }
        return 0;
    }
    return total;
}

DownloadErrc map_curl_error(CURLcode code) noexcept {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return DownloadErrc::dns_error;
        case CURLE_OPERATION_TIMEDOUT:
            return DownloadErrc::timeout;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return DownloadErrc::ssl_error;
        case CURLE_TOO_MANY_REDIRECTS:
            return DownloadErrc::too_many_redirects;
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            return DownloadErrc::connection_lost;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return DownloadErrc::invalid_url;
        default:
            return DownloadErrc::network_error;
    }
}

} // namespace

//=============================================================================
// HttpSession
//=============================================================================

HttpSession::HttpSession() = default;

HttpSession::HttpSession(HttpOptions options)
    : options_(std::move(options)) {}

HttpSession::~HttpSession() {
    if (handle_) {
        curl_easy_cleanup(static_cast<CURL*>(handle_));
    }
}

HttpSession::HttpSession(HttpSession&& other) noexcept
    : options_(std::move(other.options_))
    , handle_(std::exchange(other.handle_, nullptr)) {}

HttpSession& HttpSession::operator=(HttpSession&& other) noexcept {
    if (this != &other) {
        if (handle_) {
            curl_easy_cleanup(static_cast<CURL*>(handle_));
        }
        options_ = std::move(other.options_);
        handle_ = std::exchange(other.handle_, nullptr);
    }
    return *this;
}

void* HttpSession::prepare_handle(const std::string& url) noexcept {
    if (!handle_) {
        handle_ = curl_easy_init();
        if (!handle_) return nullptr;
    } else {
        curl_easy_reset(static_cast<CURL*>(handle_));
    }

    auto* curl = static_cast<CURL*>(handle_);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connect_timeout_sec));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(options_.stall_timeout_sec));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if constexpr (FOLLOW_REDIRECTS) {
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    }

    curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, static_cast<long>(options_.buffer_size));
    return curl;
}

std::expected<HttpResponse, std::error_code>
HttpSession::head(const std::string& url) noexcept {
    auto* curl = static_cast<CURL*>(prepare_handle(url));
    if (!curl) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    HttpResponse response{};

    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response);

    CURLcode result = curl_easy_perform(curl);
    if (result != CURLE_OK) {
        spdlog::debug("HEAD {} failed: {}", url, curl_easy_strerror(result));
        return std::unexpected(make_error_code(map_curl_error(result)));
    }

    // CURLINFO_CONTENT_LENGTH_DOWNLOAD_T doesn't work for HEAD, use the header
    finalize_headers(curl, response);
    spdlog::debug("HEAD {} -> {}", url, response.status_code);
    return response;
}

std::expected<HttpResponse, std::error_code>
HttpSession::get(const std::string& url,
                 const HeadersCallback& on_headers,
                 const ChunkCallback& on_chunk) noexcept {
    auto* curl = static_cast<CURL*>(prepare_handle(url));
    if (!curl) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    HttpResponse response{};
    GetContext ctx;
    ctx.curl = curl;
    ctx.response = &response;
    ctx.on_headers = &on_headers;
    ctx.on_chunk = &on_chunk;

    HeaderList request_headers;
    request_headers.append("Accept: image/*,application/json;q=0.9,*/*;q=0.8");

    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, request_headers.ptr);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);

    CURLcode result = curl_easy_perform(curl);

    // Header list dies with this scope
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, nullptr);

    if (!ctx.callback_error.empty()) {
        spdlog::warn("GET {} aborted: callback threw: {}", url, ctx.callback_error);
        return std::unexpected(make_error_code(DownloadErrc::callback_failed));
    }
    if (ctx.aborted) {
        return std::unexpected(make_error_code(DownloadErrc::cancelled));
    }
    if (result != CURLE_OK) {
        spdlog::debug("GET {} failed: {}", url, curl_easy_strerror(result));
        return std::unexpected(make_error_code(map_curl_error(result)));
    }

    // Empty bodies never reach the write callback
    if (!ctx.headers_delivered) {
        finalize_headers(curl, response);
        if (on_headers) {
            try {
                on_headers(response);
            } catch (const std::exception& e) {
                spdlog::warn("GET {}: headers callback threw: {}", url, e.what());
                return std::unexpected(make_error_code(DownloadErrc::callback_failed));
            }
        }
    }

    spdlog::debug("GET {} -> {}", url, response.status_code);
    return response;
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace folio::core
