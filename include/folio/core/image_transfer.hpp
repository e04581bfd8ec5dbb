// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/core/canvas.hpp>
#include <folio/core/config.hpp>
#include <folio/core/http_client.hpp>
#include <folio/core/http_session.hpp>
#include <folio/core/rate_limiter.hpp>
#include <folio/core/server_capabilities.hpp>
#include <folio/core/size_estimate.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <stop_token>
#include <utility>
#include <string>

namespace folio::core {

enum class TransferErrorKind : std::uint8_t {
    http_status,     // Server answered with a non-2xx status
    transport,       // Reset, timeout, DNS, empty body
    partial_write,   // Local disk refused the data
    cancelled        // Stop requested mid-transfer
};

[[nodiscard]] std::string_view to_string(TransferErrorKind kind) noexcept;

struct TransferError {
    TransferErrorKind kind{TransferErrorKind::transport};
    bool retryable{false};
    std::int32_t http_status{0};   // Only for http_status
    std::error_code code;
    std::string message;

    // How this failure should be reported to the rate limiter
    [[nodiscard]] ResponseOutcome outcome() const noexcept;
};

struct TransferResult {
    std::uint64_t bytes_written{0};
    SizeSource size_source{SizeSource::unknown};
    std::string filename;        // Final name inside the output directory
    std::string content_type;    // As served
};

// Bounded attempts; the rate limiter supplies the spacing between them
struct RetryPolicy {
    std::uint32_t max_attempts{RETRY_COUNT + 1};

    [[nodiscard]] bool is_retryable(const TransferError& error) const noexcept { return error.retryable; }
    [[nodiscard]] bool should_retry(const TransferError& error, std::uint32_t attempt) const noexcept {
        return is_retryable(error) && attempt < max_attempts;
    }
};

struct TransferConfig {
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t io_timeout_sec{IO_TIMEOUT_SEC};
    std::size_t chunk_size{READ_BUFFER_SIZE};
    SizeMultipliers multipliers{};
    double estimate_growth{ESTIMATE_GROWTH_FACTOR};
    std::string user_agent{USER_AGENT};

    [[nodiscard]] HttpOptions http_options() const {
        return HttpOptions{connect_timeout_sec, io_timeout_sec, chunk_size, user_agent};
    }
};

struct TransferProgress {
    std::uint32_t canvas_index{0};
    std::uint64_t received{0};
    std::optional<std::uint64_t> total;   // nullopt: raw byte counter only
    SizeSource source{SizeSource::unknown};
};

using TransferProgressCallback = std::function<void(const TransferProgress&)>;

// Downloads one canvas image into the output directory. One attempt per
// fetch() call: retries are the caller's business. The body is streamed
// into a hidden ".{name}.part" file that is renamed into place only after
// the whole body arrived; on any failure it is removed.
class ImageTransfer {
public:
    ImageTransfer(HttpClient& client, std::filesystem::path output_dir, TransferConfig config = {});

    void capabilities(ServerCapabilities caps) noexcept { caps_ = std::move(caps); }
    [[nodiscard]] const ServerCapabilities& capabilities() const noexcept { return caps_; }

    void progress_callback(TransferProgressCallback cb) noexcept { on_progress_ = std::move(cb); }

    // URL actually requested for the canvas once the preferred format is applied
    [[nodiscard]] std::string request_url(const Canvas& canvas) const;

    // Fetch canvas into output_dir/filename. The extension of the final
    // name follows the served Content-Type when it maps to another format.
    [[nodiscard]] std::expected<TransferResult, TransferError>
    fetch(const Canvas& canvas, const std::string& filename, std::stop_token stoken = {}) noexcept;

    [[nodiscard]] static std::filesystem::path partial_path(const std::filesystem::path& dir,
                                                            const std::string& filename);

private:
    // Expected size before the GET answers
    [[nodiscard]] std::pair<std::optional<std::uint64_t>, SizeSource>
    presize(const Canvas& canvas, const std::string& url, std::string_view ext) noexcept;

    [[nodiscard]] std::expected<TransferResult, TransferError>
    attempt(const Canvas& canvas, const std::string& url, const std::string& filename,
            std::stop_token stoken);

    HttpClient& client_;
    std::filesystem::path output_dir_;
    TransferConfig config_;
    ServerCapabilities caps_;
    TransferProgressCallback on_progress_;
};

} // namespace folio::core
