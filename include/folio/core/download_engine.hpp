// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/core/canvas.hpp>
#include <folio/core/error.hpp>
#include <folio/core/file_tracker.hpp>
#include <folio/core/http_client.hpp>
#include <folio/core/image_transfer.hpp>
#include <folio/core/rate_limiter.hpp>
#include <folio/core/server_capabilities.hpp>
#include <folio/core/size_estimate.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace folio::core {

// Overall run state
enum class EngineState : std::uint8_t {
    idle,          // Not started
    initializing,  // Validating input, taking the lock, loading the ledger
    iterating,     // Processing canvases
    completed,     // Every canvas processed, individual failures included
    aborted        // Cancelled or setup error
};

[[nodiscard]] std::string_view to_string(EngineState state) noexcept;

enum class CanvasEventKind : std::uint8_t {
    started,
    progress,
    downloaded,
    skipped,
    migrated,
    failed,
    retrying
};

// Per-canvas notification for presentation layers
struct CanvasEvent {
    CanvasEventKind kind{CanvasEventKind::started};
    std::uint32_t canvas_index{0};
    std::string filename;
    std::uint64_t bytes{0};
    std::optional<std::uint64_t> total_bytes;
    SizeSource size_source{SizeSource::unknown};
    std::string reason;   // failed / retrying only
};

using EventCallback = std::function<void(const CanvasEvent&)>;

struct CanvasFailure {
    std::uint32_t canvas_index{0};
    std::string reason;
};

struct RunStatistics {
    std::uint32_t total{0};
    std::uint32_t downloaded{0};
    std::uint32_t skipped{0};
    std::uint32_t failed{0};
    std::uint32_t remaining{0};
    std::uint64_t bytes_downloaded{0};
    std::chrono::duration<double> elapsed{0.0};
    double current_rate{0.0};   // Requests per minute
    std::vector<CanvasFailure> failures;

    // Nothing succeeded and something failed
    [[nodiscard]] bool all_failed() const noexcept {
        return failed > 0 && downloaded == 0 && skipped == 0;
    }
};

struct EngineOptions {
    std::filesystem::path output_dir{std::string(DEFAULT_OUTPUT_DIR)};
    bool resume{false};
    std::optional<std::uint32_t> single_canvas;   // Canvas::index to fetch alone
    bool probe_capabilities{true};
    RateLimitConfig rate{};
    RetryPolicy retry{};
    TransferConfig transfer{};
};

// Waits for the given time unless the stop token fires first
using SleepFn = std::function<void(std::chrono::duration<double>, std::stop_token)>;

// Drives one manifest through skip / migrate / fetch, strictly one
// canvas at a time. The engine thread is the only writer of the rate
// limiter, the tracker and the statistics.
class DownloadEngine {
public:
    DownloadEngine(std::vector<Canvas> canvases,
                   HttpClient& client,
                   EngineOptions options,
                   RateLimiter::ClockFn clock = {},
                   SleepFn sleep = {});
    ~DownloadEngine();

    // Non-copyable, non-movable (worker thread refers to this)
    DownloadEngine(const DownloadEngine&) = delete;
    DownloadEngine& operator=(const DownloadEngine&) = delete;
    DownloadEngine(DownloadEngine&&) = delete;
    DownloadEngine& operator=(DownloadEngine&&) = delete;

    // Synchronous run. Returns a setup error, cancelled, or success; per
    // canvas failures only show up in the statistics.
    [[nodiscard]] std::error_code run(std::stop_token stoken = {}) noexcept;

    // Run on a worker thread. A finished earlier run is joined first;
    // one still in flight yields already_running.
    [[nodiscard]] std::error_code start() noexcept;

    // Request cooperative cancellation of a started run
    void cancel() noexcept;

    // Block until a started run finishes and return its result
    [[nodiscard]] std::error_code wait() noexcept;

    // Set event callback (thread-safe)
    void callback(EventCallback cb) noexcept {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(cb);
    }

    [[nodiscard]] EngineState state() const noexcept { return state_.load(std::memory_order_acquire); }

    // Thread-safe snapshot
    [[nodiscard]] RunStatistics stats() const;

    // Engine-thread state; read only while no run is active
    [[nodiscard]] const RateLimiter& rate_limiter() const noexcept { return limiter_; }
    [[nodiscard]] const FileTracker& tracker() const noexcept { return tracker_; }
    [[nodiscard]] const ServerCapabilities& capabilities() const noexcept { return transfer_.capabilities(); }
    [[nodiscard]] const std::vector<Canvas>& canvases() const noexcept { return canvases_; }
    [[nodiscard]] const EngineOptions& options() const noexcept { return options_; }

    // Global initialization
    static void global_init() noexcept { HttpSession::global_init(); }
    static void global_cleanup() noexcept { HttpSession::global_cleanup(); }

private:
    enum class CanvasOutcome : std::uint8_t { done, cancelled };

    [[nodiscard]] std::error_code validate() const noexcept;
    [[nodiscard]] std::error_code prepare_output() noexcept;
    void init_tracker() noexcept;
    [[nodiscard]] std::vector<const Canvas*> work_list() const;
    [[nodiscard]] const Canvas* find_canvas(std::uint32_t index) const noexcept;

    [[nodiscard]] CanvasOutcome process(const Canvas& canvas, std::stop_token stoken);
    [[nodiscard]] bool try_skip(const Canvas& canvas, std::string_view ext);
    [[nodiscard]] CanvasOutcome fetch_with_retry(const Canvas& canvas, std::string_view ext,
                                                 std::stop_token stoken);

    // Honor the rate limiter; false when cancelled while waiting
    [[nodiscard]] bool wait_turn(std::stop_token stoken);
    void ensure_probed(const Canvas& canvas, std::stop_token stoken);

    void record_failure(const Canvas& canvas, std::string reason);
    void finish_canvas() noexcept;
    void emit(CanvasEvent event);
    [[nodiscard]] std::error_code abort_with(std::error_code ec) noexcept;

    std::vector<Canvas> canvases_;
    HttpClient& client_;
    EngineOptions options_;
    SleepFn sleep_;

    RateLimiter limiter_;
    FileTracker tracker_;
    ImageTransfer transfer_;

    std::atomic<EngineState> state_{EngineState::idle};
    RunStatistics stats_;
    std::chrono::steady_clock::time_point start_time_;
    mutable std::mutex stats_mutex_;

    EventCallback callback_;
    std::mutex callback_mutex_;  // Protects callback_ access

    std::jthread worker_;
    std::error_code worker_result_;
};

} // namespace folio::core
