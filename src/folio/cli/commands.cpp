// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/cli/commands.hpp>
#include <folio/cli/progress_bar.hpp>
#include <folio/core/download_engine.hpp>
#include <folio/core/error.hpp>
#include <folio/core/http_session.hpp>
#include <folio/core/naming.hpp>
#include <folio/iiif/manifest.hpp>
#include <folio/version.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <thread>

using namespace folio::core;

namespace chrono = std::chrono;

namespace folio::cli {

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

// libcurl global state outlives every session created in its scope
struct CurlScope {
    CurlScope() noexcept { DownloadEngine::global_init(); }
    ~CurlScope() { DownloadEngine::global_cleanup(); }

    CurlScope(const CurlScope&) = delete;
    CurlScope& operator=(const CurlScope&) = delete;
};

std::optional<std::uint32_t> parse_uint(const char* text) noexcept {
    char* end = nullptr;
    errno = 0;
    unsigned long value = std::strtoul(text, &end, 10);
    if (end == text || *end != '\0' || errno == ERANGE || text[0] == '-' || value > UINT32_MAX) {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(value);
}

std::optional<double> parse_positive(const char* text) noexcept {
    char* end = nullptr;
    double value = std::strtod(text, &end);
    if (end == text || *end != '\0' || !(value > 0.0)) {
        return std::nullopt;
    }
    return value;
}

std::string position(std::uint32_t index, std::size_t count) {
    return "[" + std::to_string(index) + "/" + std::to_string(count) + "]";
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    auto value_of = [&](int& i, std::string_view name) -> const char* {
        if (i + 1 >= argc) {
            args.error = "missing value for " + std::string(name);
            return nullptr;
        }
        return argv[++i];
    };

    for (int i = 1; i < argc && args.error.empty(); ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-r" || arg == "--resume") {
            args.resume = true;
        } else if (arg == "-i" || arg == "--info") {
            args.list_only = true;
        } else if (arg == "-o" || arg == "--output") {
            if (const char* v = value_of(i, arg)) {
                args.output_dir = v;
            }
        } else if (arg == "-s" || arg == "--size") {
            if (const char* v = value_of(i, arg)) {
                args.width = parse_uint(v);
                if (!args.width || *args.width == 0) args.error = "invalid width: " + std::string(v);
            }
        } else if (arg == "-c" || arg == "--canvas") {
            if (const char* v = value_of(i, arg)) {
                // Range is checked by the engine against the manifest
                args.canvas = parse_uint(v);
                if (!args.canvas) args.error = "invalid canvas index: " + std::string(v);
            }
        } else if (arg == "--rate-limit") {
            if (const char* v = value_of(i, arg)) {
                args.rate_limit = parse_positive(v);
                if (!args.rate_limit) args.error = "invalid rate limit: " + std::string(v);
            }
        } else if (arg == "--delay") {
            if (const char* v = value_of(i, arg)) {
                args.delay = parse_positive(v);
                if (!args.delay) args.error = "invalid delay: " + std::string(v);
            }
        } else if (arg == "--retries") {
            if (const char* v = value_of(i, arg)) {
                args.retries = parse_uint(v);
                if (!args.retries) args.error = "invalid retry count: " + std::string(v);
            }
        } else if (arg.starts_with("-") && arg.size() > 1) {
            args.error = "unknown option: " + arg;
        } else if (args.manifest.empty()) {
            args.manifest = arg;
        } else {
            args.error = "unexpected argument: " + arg;
        }
    }

    if (args.error.empty() && args.rate_limit && args.delay) {
        args.error = "--rate-limit and --delay are mutually exclusive";
    }
    return args;
}

EngineOptions engine_options(const CliArgs& args) {
    EngineOptions options;
    options.output_dir = args.output_dir.empty()
        ? iiif::default_output_dir(args.manifest)
        : args.output_dir;
    options.resume = args.resume;
    options.single_canvas = args.canvas;

    if (args.rate_limit) {
        options.rate = RateLimitConfig::fixed_rpm(*args.rate_limit);
    } else if (args.delay) {
        options.rate = RateLimitConfig::fixed_delay_of(*args.delay);
    }
    if (args.retries) {
        options.retry.max_attempts = *args.retries + 1;
    }
    return options;
}

void configure_logging(const CliArgs& args) noexcept {
    try {
        auto logger = spdlog::stderr_color_mt("folio");
        logger->set_pattern("%^[%l]%$ %v");
        spdlog::set_default_logger(logger);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Logger setup failed: " << e.what() << std::endl;
    }

    if (args.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (args.quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

void request_interrupt() noexcept {
    g_interrupted = 1;
}

//=============================================================================
// Commands
//=============================================================================

CliResult download(const CliArgs& args) noexcept {
    try {
        CurlScope curl;

        auto options = engine_options(args);
        HttpSession session(options.transfer.http_options());

        iiif::ManifestOptions manifest_options;
        manifest_options.width = args.width;
        auto manifest = iiif::load_manifest(args.manifest, session, manifest_options);
        if (!manifest) {
            std::cerr << "Error: " << manifest.error().message() << ": " << args.manifest << std::endl;
            return std::unexpected(manifest.error());
        }

        if (!manifest->label.empty() && !args.quiet) {
            std::cout << manifest->label << " (IIIF " << iiif::to_string(manifest->version) << ", "
                      << manifest->canvases.size() << " canvases)" << std::endl;
        }

        const std::size_t count = manifest->canvases.size();
        // Declared before the engine: its worker reports into the bar
        ProgressBar bar;
        DownloadEngine engine(std::move(manifest->canvases), session, options);

        if (!args.quiet) {
            engine.callback([&](const CanvasEvent& ev) {
                auto where = position(ev.canvas_index, count);
                switch (ev.kind) {
                    case CanvasEventKind::started:
                        bar.label(where + " " + ev.filename);
                        break;
                    case CanvasEventKind::progress:
                        bar.update(ev.bytes, ev.total_bytes,
                                   ev.size_source == SizeSource::dimension_estimate);
                        break;
                    case CanvasEventKind::downloaded:
                        bar.label(where + " " + ev.filename);
                        bar.finish(ProgressBar::format_bytes(ev.bytes));
                        break;
                    case CanvasEventKind::skipped:
                        bar.clear();
                        std::cout << where << " " << ev.filename << " already present" << std::endl;
                        break;
                    case CanvasEventKind::migrated:
                        bar.clear();
                        std::cout << where << " renamed " << ev.reason << " -> " << ev.filename << std::endl;
                        break;
                    case CanvasEventKind::retrying:
                        bar.clear();
                        break;
                    case CanvasEventKind::failed:
                        bar.clear();
                        std::cout << where << " failed: " << ev.reason << std::endl;
                        break;
                }
            });
        }

        auto start_result = engine.start();
        if (start_result) {
            std::cerr << "Error: Failed to start download: " << start_result.message() << std::endl;
            return std::unexpected(start_result);
        }

        // Wait for completion
        while (true) {
            auto state = engine.state();
            if (state == EngineState::completed || state == EngineState::aborted) {
                break;
            }
            if (g_interrupted) {
                engine.cancel();
            }
            std::this_thread::sleep_for(chrono::milliseconds(100));
        }

        auto result = engine.wait();
        auto stats = engine.stats();
        bar.clear();

        if (result == make_error_code(DownloadErrc::cancelled)) {
            std::cout << "Download cancelled after " << stats.downloaded << " canvases" << std::endl;
            return 130;
        }
        if (result) {
            std::cerr << "Error: " << result.message() << std::endl;
            return std::unexpected(result);
        }

        if (!args.quiet) {
            std::cout << "\nDownloaded " << stats.downloaded
                      << ", skipped " << stats.skipped
                      << ", failed " << stats.failed
                      << " (" << ProgressBar::format_bytes(stats.bytes_downloaded)
                      << " in " << ProgressBar::format_time(
                             static_cast<std::uint64_t>(stats.elapsed.count())) << ")"
                      << std::endl;
            std::cout << "Output: " << options.output_dir.string() << std::endl;
        }
        for (const auto& failure : stats.failures) {
            std::cerr << "  canvas " << failure.canvas_index << ": " << failure.reason << std::endl;
        }

        return stats.all_failed() ? 1 : 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }
}

CliResult info(const CliArgs& args) noexcept {
    try {
        CurlScope curl;

        HttpSession session;
        iiif::ManifestOptions manifest_options;
        manifest_options.width = args.width;
        auto manifest = iiif::load_manifest(args.manifest, session, manifest_options);
        if (!manifest) {
            std::cerr << "Error: " << manifest.error().message() << ": " << args.manifest << std::endl;
            return std::unexpected(manifest.error());
        }

        std::cout << "Manifest: " << args.manifest << std::endl;
        if (!manifest->label.empty()) {
            std::cout << "Label: " << manifest->label << std::endl;
        }
        std::cout << "Version: IIIF Presentation " << iiif::to_string(manifest->version) << std::endl;
        std::cout << "Canvases: " << manifest->canvases.size() << std::endl;
        std::cout << "Output: " << iiif::default_output_dir(args.manifest) << std::endl;
        std::cout << std::endl;

        for (const auto& canvas : manifest->canvases) {
            std::cout << "  " << canvas_filename(canvas, DEFAULT_EXTENSION);
            if (canvas.has_dimensions()) {
                std::cout << "  " << *canvas.width << "x" << *canvas.height;
            }
            std::cout << "\n    " << canvas.url << "\n";
        }
        std::cout << std::flush;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(make_error_code(DownloadErrc::manifest_error));
    }
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "folio " << folio::version.to_string() << " - IIIF manifest image downloader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <MANIFEST>\n";
    std::cout << "\n";
    std::cout << "MANIFEST is a local JSON file or an http(s) URL.\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable debug logging\n";
    std::cout << "  -q, --quiet             Quiet mode (no progress, warnings only)\n";
    std::cout << "  -o, --output <DIR>      Output directory (default: manifest name)\n";
    std::cout << "  -s, --size <WIDTH>      Requested image width in pixels\n";
    std::cout << "  -r, --resume            Skip canvases already on disk\n";
    std::cout << "  -c, --canvas <N>        Download only canvas N (1-based)\n";
    std::cout << "      --rate-limit <RPM>  Fixed rate in requests per minute\n";
    std::cout << "      --delay <SECONDS>   Fixed delay between requests\n";
    std::cout << "      --retries <N>       Retries per canvas (default: " << RETRY_COUNT << ")\n";
    std::cout << "  -i, --info              List canvases without downloading\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " https://example.org/iiif/book/manifest.json\n";
    std::cout << "  " << program_name << " -r -o book -s 2000 manifest.json\n";
    std::cout << "  " << program_name << " -c 12 --delay 2 manifest.json\n";
}

void print_version() noexcept {
    std::cout << "folio " << folio::version.to_string() << std::endl;
    std::cout << "Built " << folio::BUILD_DATE << " with C++23, libcurl, nlohmann_json, spdlog\n";
}

} // namespace folio::cli
