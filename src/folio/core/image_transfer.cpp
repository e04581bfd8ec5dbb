// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/core/image_transfer.hpp>
#include <folio/core/naming.hpp>
#include <folio/disk/file_writer.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <exception>

namespace folio::core {

namespace {

bool is_retryable_status(std::int32_t status) noexcept {
    return status == 429 || status == 503 || status >= 500;
}

bool same_format(std::string_view a, std::string_view b) noexcept {
    auto norm = [](std::string_view e) {
        if (e == "jpg") return std::string_view{"jpeg"};
        if (e == "tif") return std::string_view{"tiff"};
        return e;
    };
    return norm(a) == norm(b);
}

std::string_view extension_of(std::string_view filename) noexcept {
    auto dot = filename.rfind('.');
    return dot == std::string_view::npos ? std::string_view{} : filename.substr(dot + 1);
}

TransferError make_error(TransferErrorKind kind, std::error_code code, std::string message,
                         std::int32_t status = 0) {
    TransferError err;
    err.kind = kind;
    err.code = code;
    err.http_status = status;
    err.message = std::move(message);
    switch (kind) {
        case TransferErrorKind::http_status:
            err.retryable = is_retryable_status(status);
            break;
        case TransferErrorKind::transport:
            err.retryable = code != make_error_code(DownloadErrc::invalid_url)
                && code != make_error_code(DownloadErrc::callback_failed);
            break;
        case TransferErrorKind::partial_write:
        case TransferErrorKind::cancelled:
            err.retryable = false;
            break;
    }
    return err;
}

} // namespace

std::string_view to_string(TransferErrorKind kind) noexcept {
    switch (kind) {
        case TransferErrorKind::http_status:   return "http-status";
        case TransferErrorKind::transport:     return "transport";
        case TransferErrorKind::partial_write: return "partial-write";
        case TransferErrorKind::cancelled:     return "cancelled";
    }
    return "unknown";
}

ResponseOutcome TransferError::outcome() const noexcept {
    switch (kind) {
        case TransferErrorKind::http_status:
            return (http_status == 429 || http_status == 503)
                ? ResponseOutcome::throttled
                : ResponseOutcome::other_error_code;
        case TransferErrorKind::transport:
            return ResponseOutcome::transport_failure;
        default:
            return ResponseOutcome::other_error_code;
    }
}

//=============================================================================
// ImageTransfer
//=============================================================================

ImageTransfer::ImageTransfer(HttpClient& client, std::filesystem::path output_dir, TransferConfig config)
    : client_(client)
    , output_dir_(std::move(output_dir))
    , config_(std::move(config)) {}

std::filesystem::path ImageTransfer::partial_path(const std::filesystem::path& dir,
                                                  const std::string& filename) {
    std::string name = ".";
    name += filename;
    name += PARTIAL_SUFFIX;
    return dir / name;
}

std::string ImageTransfer::request_url(const Canvas& canvas) const {
    if (caps_.probed && caps_.preferred_format != DEFAULT_EXTENSION
        && extension_from_url(canvas.url) == DEFAULT_EXTENSION) {
        return with_format(canvas.url, caps_.preferred_format);
    }
    return canvas.url;
}

std::pair<std::optional<std::uint64_t>, SizeSource>
ImageTransfer::presize(const Canvas& canvas, const std::string& url, std::string_view ext) noexcept {
    if (caps_.head_supported) {
        auto resp = client_.head(url);
        if (resp && resp->ok() && resp->content_length) {
            return {resp->content_length, SizeSource::head_request};
        }
    }

    if (auto estimate = estimate_from_dimensions(canvas, ext, config_.multipliers)) {
        return {estimate, SizeSource::dimension_estimate};
    }
    return {std::nullopt, SizeSource::unknown};
}

std::expected<TransferResult, TransferError>
ImageTransfer::fetch(const Canvas& canvas, const std::string& filename, std::stop_token stoken) noexcept {
    try {
        if (stoken.stop_requested()) {
            return std::unexpected(make_error(TransferErrorKind::cancelled,
                                              make_error_code(DownloadErrc::cancelled),
                                              "cancelled before start"));
        }

        auto url = request_url(canvas);
        auto result = attempt(canvas, url, filename, stoken);

        // Some servers only know ".jpg"; try it once unless a probe already decided
        if (!result
            && result.error().kind == TransferErrorKind::http_status
            && is_format_rejection(result.error().http_status)
            && !caps_.probed
            && extension_from_url(url) == "jpeg") {
            auto alt = with_format(url, "jpg");
            spdlog::debug("Canvas {}: {} rejected, retrying as {}", canvas.index, url, alt);
            result = attempt(canvas, alt, filename, stoken);
        }
        return result;
    } catch (const std::exception& e) {
        return std::unexpected(make_error(TransferErrorKind::transport,
                                          make_error_code(DownloadErrc::network_error), e.what()));
    }
}

std::expected<TransferResult, TransferError>
ImageTransfer::attempt(const Canvas& canvas, const std::string& url, const std::string& filename,
                       std::stop_token stoken) {
    auto [pre_total, pre_source] = presize(canvas, url, extension_of(filename));
    AdaptiveTotal total(pre_total, pre_source, config_.estimate_growth);

    disk::FileWriter writer;
    auto temp = partial_path(output_dir_, filename);
    if (auto ec = writer.open(temp)) {
        return std::unexpected(make_error(TransferErrorKind::partial_write, ec,
                                          "cannot create " + temp.filename().string()));
    }

    std::error_code write_ec;
    std::string content_type;
    auto last_emit = std::chrono::steady_clock::time_point{};

    auto emit = [&](bool force) {
        if (!on_progress_) return;
        auto now = std::chrono::steady_clock::now();
        if (!force && now - last_emit < PROGRESS_INTERVAL) return;
        last_emit = now;
        // A failing observer never fails the transfer
        try {
            on_progress_(TransferProgress{canvas.index, total.received(), total.total(), total.source()});
        } catch (const std::exception& e) {
            spdlog::debug("Canvas {}: progress callback threw: {}", canvas.index, e.what());
        }
    };

    auto on_headers = [&](const HttpResponse& resp) {
        content_type = resp.content_type;
        // A real Content-Length beats any pre-flight figure
        if (resp.ok() && resp.content_length && *resp.content_length > 0) {
            total = AdaptiveTotal(resp.content_length, SizeSource::content_length, config_.estimate_growth);
        }
        if (resp.ok()) emit(true);
    };

    auto on_chunk = [&](std::span<const std::byte> chunk) {
        if (stoken.stop_requested()) {
            return false;
        }
        if (auto ec = writer.write(chunk.data(), chunk.size())) {
            write_ec = ec;
            return false;
        }
        total.advance(chunk.size());
        emit(false);
        return true;
    };

    spdlog::debug("Canvas {}: GET {}", canvas.index, url);
    auto resp = client_.get(url, on_headers, on_chunk);

    if (write_ec) {
        return std::unexpected(make_error(TransferErrorKind::partial_write, write_ec,
                                          "write failed: " + write_ec.message()));
    }
    if (stoken.stop_requested()) {
        return std::unexpected(make_error(TransferErrorKind::cancelled,
                                          make_error_code(DownloadErrc::cancelled), "cancelled"));
    }
    if (!resp) {
        return std::unexpected(make_error(TransferErrorKind::transport, resp.error(),
                                          resp.error().message()));
    }
    if (!resp->ok()) {
        auto status = resp->status_code;
        return std::unexpected(make_error(TransferErrorKind::http_status,
                                          make_error_code(classify_status(status)),
                                          "HTTP " + std::to_string(status), status));
    }
    if (writer.bytes_written() == 0) {
        return std::unexpected(make_error(TransferErrorKind::transport,
                                          make_error_code(DownloadErrc::connection_lost),
                                          "empty response body"));
    }

    // Let the served format decide the extension
    std::string final_name = filename;
    auto served_ext = extension_for_content_type(content_type);
    auto current_ext = extension_of(filename);
    if (!served_ext.empty() && !same_format(served_ext, current_ext)) {
        auto stem_len = current_ext.empty() ? filename.size() : filename.size() - current_ext.size() - 1;
        final_name = filename.substr(0, stem_len) + "." + served_ext;
    }

    auto bytes = writer.bytes_written();
    if (auto ec = writer.commit(output_dir_ / final_name)) {
        return std::unexpected(make_error(TransferErrorKind::partial_write, ec,
                                          "cannot finalize " + final_name + ": " + ec.message()));
    }

    emit(true);
    spdlog::debug("Canvas {}: {} bytes -> {} (size from {})",
                  canvas.index, bytes, final_name, to_string(total.source()));

    TransferResult result;
    result.bytes_written = bytes;
    result.size_source = total.source();
    result.filename = std::move(final_name);
    result.content_type = std::move(content_type);
    return result;
}

} // namespace folio::core
