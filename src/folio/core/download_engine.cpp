// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/core/download_engine.hpp>
#include <folio/core/config.hpp>
#include <folio/core/naming.hpp>
#include <folio/disk/lock_file.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <condition_variable>
#include <exception>

namespace folio::core {

namespace {

// Interruptible sleep used outside tests
void default_sleep(std::chrono::duration<double> d, std::stop_token stoken) {
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock lock(m);
    (void)cv.wait_for(lock, stoken, d, [] { return false; });
}

std::string describe(const TransferError& err) {
    if (err.kind == TransferErrorKind::http_status) {
        return "HTTP " + std::to_string(err.http_status);
    }
    return err.message.empty() ? err.code.message() : err.message;
}

} // namespace

std::string_view to_string(EngineState state) noexcept {
    switch (state) {
        case EngineState::idle:         return "idle";
        case EngineState::initializing: return "initializing";
        case EngineState::iterating:    return "iterating";
        case EngineState::completed:    return "completed";
        case EngineState::aborted:      return "aborted";
    }
    return "unknown";
}

//=============================================================================
// DownloadEngine
//=============================================================================

DownloadEngine::DownloadEngine(std::vector<Canvas> canvases,
                               HttpClient& client,
                               EngineOptions options,
                               RateLimiter::ClockFn clock,
                               SleepFn sleep)
    : canvases_(std::move(canvases))
    , client_(client)
    , options_(std::move(options))
    , sleep_(sleep ? std::move(sleep) : SleepFn{default_sleep})
    , limiter_(options_.rate, std::move(clock))
    , tracker_(options_.output_dir)
    , transfer_(client_, options_.output_dir, options_.transfer) {
    transfer_.progress_callback([this](const TransferProgress& p) {
        CanvasEvent ev;
        ev.kind = CanvasEventKind::progress;
        ev.canvas_index = p.canvas_index;
        ev.bytes = p.received;
        ev.total_bytes = p.total;
        ev.size_source = p.source;
        emit(std::move(ev));
    });
}

DownloadEngine::~DownloadEngine() {
    // Stop and join the worker before members it touches go away
    if (worker_.joinable()) {
        worker_.request_stop();
        worker_.join();
    }
}

std::error_code DownloadEngine::start() noexcept {
    if (worker_.joinable()) {
        auto s = state();
        if (s != EngineState::completed && s != EngineState::aborted) {
            return make_error_code(DownloadErrc::already_running);
        }
        // Previous run finished but nobody waited for it
        worker_.join();
    }
    // Leave the terminal state before the thread exists so a second
    // start() can never mistake this run for a finished one
    state_.store(EngineState::initializing, std::memory_order_release);
    try {
        worker_ = std::jthread([this](std::stop_token stoken) {
            worker_result_ = run(stoken);
        });
    } catch (const std::system_error& e) {
        state_.store(EngineState::aborted, std::memory_order_release);
        return e.code();
    }
    return {};
}

void DownloadEngine::cancel() noexcept {
    if (worker_.joinable()) {
        worker_.request_stop();
    }
}

std::error_code DownloadEngine::wait() noexcept {
    if (worker_.joinable()) {
        worker_.join();
    }
    return worker_result_;
}

RunStatistics DownloadEngine::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    RunStatistics snapshot = stats_;
    auto s = state();
    if (s == EngineState::initializing || s == EngineState::iterating) {
        snapshot.elapsed = std::chrono::steady_clock::now() - start_time_;
    }
    return snapshot;
}

std::error_code DownloadEngine::validate() const noexcept {
    if (canvases_.empty()) {
        return make_error_code(DownloadErrc::no_canvases);
    }
    if (options_.single_canvas && !find_canvas(*options_.single_canvas)) {
        return make_error_code(DownloadErrc::out_of_range);
    }
    return {};
}

const Canvas* DownloadEngine::find_canvas(std::uint32_t index) const noexcept {
    auto it = std::find_if(canvases_.begin(), canvases_.end(),
                           [index](const Canvas& c) { return c.index == index; });
    return it == canvases_.end() ? nullptr : &*it;
}

std::error_code DownloadEngine::prepare_output() noexcept {
    std::error_code ec;
    std::filesystem::create_directories(options_.output_dir, ec);
    return ec;
}

void DownloadEngine::init_tracker() noexcept {
    if (options_.resume) {
        if (auto load_ec = tracker_.load()) {
            spdlog::warn("Resume ledger unreadable ({}), verifying from disk only", load_ec.message());
        } else {
            spdlog::info("Resuming: {} canvases recorded complete", tracker_.completed_count());
        }
        return;
    }

    if (auto reset_ec = tracker_.reset()) {
        spdlog::warn("Could not clear resume ledger: {}", reset_ec.message());
    }
}

std::vector<const Canvas*> DownloadEngine::work_list() const {
    std::vector<const Canvas*> list;
    if (options_.single_canvas) {
        if (const auto* canvas = find_canvas(*options_.single_canvas)) {
            list.push_back(canvas);
        }
        return list;
    }
    list.reserve(canvases_.size());
    for (const auto& c : canvases_) {
        list.push_back(&c);
    }
    return list;
}

std::error_code DownloadEngine::abort_with(std::error_code ec) noexcept {
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.elapsed = std::chrono::steady_clock::now() - start_time_;
    }
    state_.store(EngineState::aborted, std::memory_order_release);
    return ec;
}

std::error_code DownloadEngine::run(std::stop_token stoken) noexcept {
    try {
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_ = RunStatistics{};
            start_time_ = std::chrono::steady_clock::now();
        }
        state_.store(EngineState::initializing, std::memory_order_release);

        // Setup errors surface before any file or network I/O
        if (auto ec = validate()) {
            spdlog::error("{}", ec.message());
            return abort_with(ec);
        }

        if (auto ec = prepare_output()) {
            spdlog::error("Cannot use output directory {}: {}", options_.output_dir.string(), ec.message());
            return abort_with(ec);
        }

        auto lock = disk::LockFile::acquire(options_.output_dir / LOCK_FILENAME);
        if (!lock) {
            auto ec = lock.error() == make_error_code(disk::DiskErrc::lock_error)
                ? make_error_code(DownloadErrc::lock_held)
                : lock.error();
            spdlog::error("Cannot lock {}: {}", options_.output_dir.string(), ec.message());
            return abort_with(ec);
        }

        init_tracker();

        auto work = work_list();
        {
            std::lock_guard<std::mutex> guard(stats_mutex_);
            stats_.total = static_cast<std::uint32_t>(work.size());
            stats_.remaining = stats_.total;
            stats_.current_rate = limiter_.current_rate();
        }

        state_.store(EngineState::iterating, std::memory_order_release);
        spdlog::info("Processing {} canvas{} into {}", work.size(), work.size() == 1 ? "" : "es",
                     options_.output_dir.string());

        for (const auto* canvas : work) {
            if (stoken.stop_requested() || process(*canvas, stoken) == CanvasOutcome::cancelled) {
                spdlog::warn("Run cancelled");
                return abort_with(make_error_code(DownloadErrc::cancelled));
            }
        }

        {
            std::lock_guard<std::mutex> guard(stats_mutex_);
            stats_.elapsed = std::chrono::steady_clock::now() - start_time_;
            spdlog::info("Done: {} downloaded, {} skipped, {} failed in {:.1f}s",
                         stats_.downloaded, stats_.skipped, stats_.failed, stats_.elapsed.count());
        }
        state_.store(EngineState::completed, std::memory_order_release);
        return {};
    } catch (const std::exception& e) {
        spdlog::error("Run aborted: {}", e.what());
        return abort_with(make_error_code(DownloadErrc::network_error));
    }
}

DownloadEngine::CanvasOutcome DownloadEngine::process(const Canvas& canvas, std::stop_token stoken) {
    std::string ext = transfer_.capabilities().probed
        ? transfer_.capabilities().preferred_format
        : std::string(DEFAULT_EXTENSION);

    if (options_.resume && try_skip(canvas, ext)) {
        finish_canvas();
        return CanvasOutcome::done;
    }

    auto outcome = fetch_with_retry(canvas, ext, stoken);
    if (outcome == CanvasOutcome::done) {
        finish_canvas();
    }
    return outcome;
}

bool DownloadEngine::try_skip(const Canvas& canvas, std::string_view ext) {
    auto found = tracker_.detect(canvas, ext);
    if (found.scheme == FileScheme::missing) {
        return false;
    }

    std::string filename = found.filename;

    // A legacy file left beside the current one is migrated too, so a
    // canvas never ends up with two files on disk
    auto legacy = found.scheme == FileScheme::legacy
        ? found.filename
        : tracker_.find_legacy(canvas, ext);
    if (!legacy.empty()) {
        auto migrated = tracker_.migrate(canvas, ext);
        if (!migrated) {
            record_failure(canvas, "cannot migrate " + legacy + ": " + migrated.error().message());
            return true;
        }
        filename = *migrated;

        CanvasEvent ev;
        ev.kind = CanvasEventKind::migrated;
        ev.canvas_index = canvas.index;
        ev.filename = filename;
        ev.reason = std::move(legacy);
        emit(std::move(ev));
    }

    // Pre-existing files join the ledger too
    const auto* recorded = tracker_.entry(canvas.index);
    if (!recorded || recorded->filename != filename) {
        std::error_code size_ec;
        auto size = std::filesystem::file_size(options_.output_dir / filename, size_ec);
        (void)tracker_.record_complete(canvas, filename, size_ec ? 0 : size);
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.skipped;
    }
    spdlog::debug("Canvas {}: already present as {}", canvas.index, filename);

    CanvasEvent ev;
    ev.kind = CanvasEventKind::skipped;
    ev.canvas_index = canvas.index;
    ev.filename = std::move(filename);
    emit(std::move(ev));
    return true;
}

bool DownloadEngine::wait_turn(std::stop_token stoken) {
    auto delay = limiter_.next_delay();
    if (delay.count() > 0.0) {
        sleep_(delay, stoken);
    }
    if (stoken.stop_requested()) {
        return false;
    }
    limiter_.on_request();
    return true;
}

void DownloadEngine::ensure_probed(const Canvas& canvas, std::stop_token stoken) {
    if (!options_.probe_capabilities || transfer_.capabilities().probed) {
        return;
    }
    if (!wait_turn(stoken)) {
        return;
    }
    transfer_.capabilities(ServerCapabilities::probe(client_, canvas.url));
}

DownloadEngine::CanvasOutcome
DownloadEngine::fetch_with_retry(const Canvas& canvas, std::string_view ext, std::stop_token stoken) {
    ensure_probed(canvas, stoken);
    if (stoken.stop_requested()) {
        return CanvasOutcome::cancelled;
    }

    // The probe may have settled on another format
    std::string format = transfer_.capabilities().probed
        ? transfer_.capabilities().preferred_format
        : std::string(ext);
    auto filename = canvas_filename(canvas, format);

    CanvasEvent started;
    started.kind = CanvasEventKind::started;
    started.canvas_index = canvas.index;
    started.filename = filename;
    emit(std::move(started));

    for (std::uint32_t attempt = 1;; ++attempt) {
        if (!wait_turn(stoken)) {
            return CanvasOutcome::cancelled;
        }

        auto result = transfer_.fetch(canvas, filename, stoken);
        if (result) {
            limiter_.on_response(ResponseOutcome::success);

            // Ledger failures degrade to memory-only tracking inside the tracker
            (void)tracker_.record_complete(canvas, result->filename, result->bytes_written);

            {
                std::lock_guard<std::mutex> lock(stats_mutex_);
                ++stats_.downloaded;
                stats_.bytes_downloaded += result->bytes_written;
                stats_.current_rate = limiter_.current_rate();
            }

            CanvasEvent ev;
            ev.kind = CanvasEventKind::downloaded;
            ev.canvas_index = canvas.index;
            ev.filename = result->filename;
            ev.bytes = result->bytes_written;
            ev.total_bytes = result->bytes_written;
            ev.size_source = result->size_source;
            emit(std::move(ev));
            return CanvasOutcome::done;
        }

        const auto& err = result.error();
        if (err.kind == TransferErrorKind::cancelled) {
            return CanvasOutcome::cancelled;
        }

        limiter_.on_response(err.outcome());
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.current_rate = limiter_.current_rate();
        }

        if (options_.retry.should_retry(err, attempt)) {
            spdlog::warn("Canvas {}: {} (attempt {}/{}), retrying in {:.1f}s",
                         canvas.index, describe(err), attempt, options_.retry.max_attempts,
                         limiter_.current_delay().count());
            CanvasEvent ev;
            ev.kind = CanvasEventKind::retrying;
            ev.canvas_index = canvas.index;
            ev.filename = filename;
            ev.reason = describe(err);
            emit(std::move(ev));
            continue;
        }

        auto reason = describe(err);
        if (options_.retry.is_retryable(err)) {
            reason = make_error_code(DownloadErrc::retries_exhausted).message() + ": " + reason;
        }
        record_failure(canvas, std::move(reason));
        return CanvasOutcome::done;
    }
}

void DownloadEngine::record_failure(const Canvas& canvas, std::string reason) {
    spdlog::error("Canvas {} failed: {}", canvas.index, reason);
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.failed;
        stats_.failures.push_back(CanvasFailure{canvas.index, reason});
    }

    CanvasEvent ev;
    ev.kind = CanvasEventKind::failed;
    ev.canvas_index = canvas.index;
    ev.reason = std::move(reason);
    emit(std::move(ev));
}

void DownloadEngine::finish_canvas() noexcept {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    if (stats_.remaining > 0) {
        --stats_.remaining;
    }
    stats_.elapsed = std::chrono::steady_clock::now() - start_time_;
}

void DownloadEngine::emit(CanvasEvent event) {
    EventCallback cb;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        cb = callback_;
    }
    if (!cb) {
        return;
    }
    try {
        cb(event);
    } catch (const std::exception& e) {
        spdlog::warn("Canvas {}: event callback threw: {}", event.canvas_index, e.what());
    }
}

} // namespace folio::core
